// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __EBITDASCOPE_DIAGNOSTICS_ENGINE_H
#define __EBITDASCOPE_DIAGNOSTICS_ENGINE_H 1

#include "CompletenessScorer.h"
#include "CostStructureEstimator.h"
#include "DiagnosticsBundle.h"
#include "IParallelExecutor.h"
#include "InputRecords.h"
#include "MarginBridgeAnalyzer.h"
#include "OutlierDetector.h"
#include "PnLReconstructor.h"
#include "TrendAnalyzer.h"

namespace ebitdascope
{
  struct DiagnosticsConfig
  {
    OutlierConfig outliers;
    TrendConfig trends;
    CostSplitThresholds costSplits;
    CompletenessWeights completeness;
  };

  /**
   * @brief Runs the margin bridge, outlier, trend, cost-structure and
   * completeness stages over one canonical P&L.
   *
   * The five stages share only read-only inputs and each writes its own
   * result, so they are submitted to the executor as independent tasks.
   */
  class DiagnosticsEngine
  {
  public:
    explicit DiagnosticsEngine(const DiagnosticsConfig& config = DiagnosticsConfig())
      : mConfig(config)
    {}

    DiagnosticsBundle run(const CanonicalPnL& pnl,
                          const InputSnapshot& snapshot,
                          concurrency::IParallelExecutor& executor) const;

    // Inline run, no executor
    DiagnosticsBundle run(const CanonicalPnL& pnl, const InputSnapshot& snapshot) const;

    const DiagnosticsConfig& getConfig() const
    {
      return mConfig;
    }

  private:
    DiagnosticsConfig mConfig;
  };

} // namespace ebitdascope

#endif // __EBITDASCOPE_DIAGNOSTICS_ENGINE_H
