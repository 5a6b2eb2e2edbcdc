// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "DiagnosticsEngine.h"
#include "ParallelExecutors.h"
#include "StageRunner.h"
#include <spdlog/spdlog.h>

namespace ebitdascope
{
  DiagnosticsBundle DiagnosticsEngine::run(const CanonicalPnL& pnl,
                                           const InputSnapshot& snapshot,
                                           concurrency::IParallelExecutor& executor) const
  {
    std::vector<MarginBridgeEntry> bridge;
    OutlierReport outliers;
    std::vector<Trend> trends;
    std::vector<CostSplit> costSplits;
    CompletenessReport completeness;

    const PnLSeries& series = pnl.months;

    concurrency::runStages(executor, {
        {"margin_bridge", [&]() { bridge = MarginBridgeAnalyzer().analyze(series); }},
        {"outliers", [&]() {
            outliers = OutlierDetector(mConfig.outliers).detect(series, snapshot.vendors);
          }},
        {"trends", [&]() { trends = TrendAnalyzer(mConfig.trends).analyze(series); }},
        {"cost_structure", [&]() {
            costSplits = CostStructureEstimator(mConfig.costSplits).estimate(series);
          }},
        {"completeness", [&]() {
            completeness = CompletenessScorer(mConfig.completeness).score(pnl, snapshot);
          }}
      });

    spdlog::debug("DiagnosticsEngine: {} bridge entries, {} outlier(s), completeness {:.3f}",
                  bridge.size(), outliers.totalFlagged(), completeness.completenessScore);

    return DiagnosticsBundle(std::move(bridge), std::move(outliers), std::move(trends),
                             std::move(costSplits), std::move(completeness));
  }

  DiagnosticsBundle DiagnosticsEngine::run(const CanonicalPnL& pnl,
                                           const InputSnapshot& snapshot) const
  {
    concurrency::SingleThreadExecutor inlineExecutor;
    return run(pnl, snapshot, inlineExecutor);
  }

} // namespace ebitdascope
