// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "CostStructureEstimator.h"
#include "SeriesStatistics.h"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace ebitdascope
{
  std::vector<CostSplit> CostStructureEstimator::estimate(const PnLSeries& series) const
  {
    std::vector<CostSplit> splits;
    splits.reserve(kNumOpexCategories);
    for (OpexCategory category : allOpexCategories())
      splits.push_back(estimateCategory(series, category));

    if (series.size() < mThresholds.minPoints)
      spdlog::debug("CostStructureEstimator: {} month(s), using neutral splits", series.size());

    return splits;
  }

  CostSplit CostStructureEstimator::estimateCategory(const PnLSeries& series,
                                                     OpexCategory category) const
  {
    const std::size_t n = series.size();

    if (n < mThresholds.minPoints)
      {
        return CostSplit{category,
                         std::nullopt,
                         mThresholds.neutralVariablePct,
                         100.0 - mThresholds.neutralVariablePct,
                         mThresholds.confidenceFloor,
                         n,
                         true};
      }

    std::vector<double> revenue;
    std::vector<double> cost;
    revenue.reserve(n);
    cost.reserve(n);
    for (const auto& m : series)
      {
        revenue.push_back(m.getRevenue());
        cost.push_back(m.getOpex(category));
      }

    const std::optional<double> r = PearsonCorrelation(cost, revenue);
    const double effectiveR = r.value_or(0.0);

    const double variablePct = variablePctFor(effectiveR);
    const double coverage = std::min(1.0, static_cast<double>(n) / mThresholds.fullConfidenceMonths);
    const double confidence = std::clamp(coverage * std::fabs(effectiveR),
                                         mThresholds.confidenceFloor,
                                         mThresholds.confidenceCeiling);

    return CostSplit{category, r, variablePct, 100.0 - variablePct, confidence, n, false};
  }

  double CostStructureEstimator::variablePctFor(double r) const
  {
    if (r >= mThresholds.strongCorrelation)
      return mThresholds.strongVariablePct;
    if (r >= mThresholds.weakCorrelation)
      return mThresholds.mixedVariablePct;
    return mThresholds.weakVariablePct;
  }

} // namespace ebitdascope
