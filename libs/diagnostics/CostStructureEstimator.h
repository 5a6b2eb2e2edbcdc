// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __EBITDASCOPE_COST_STRUCTURE_ESTIMATOR_H
#define __EBITDASCOPE_COST_STRUCTURE_ESTIMATOR_H 1

#include <cstddef>
#include <vector>
#include "DiagnosticTypes.h"
#include "MonthlyFinancials.h"

namespace ebitdascope
{
  /**
   * @brief Correlation bands and split percentages used by CostStructureEstimator.
   */
  struct CostSplitThresholds
  {
    double strongCorrelation = 0.7;     ///< r >= this -> mostly variable
    double weakCorrelation = 0.3;       ///< r <  this -> mostly fixed
    double strongVariablePct = 80.0;
    double mixedVariablePct = 50.0;
    double weakVariablePct = 20.0;
    double neutralVariablePct = 50.0;   ///< used when the series is too short
    std::size_t minPoints = 3;
    double fullConfidenceMonths = 12.0;
    double confidenceFloor = 0.2;
    double confidenceCeiling = 0.9;
  };

  /**
   * @brief Heuristic fixed-vs-variable split per opex category.
   *
   * The Pearson correlation r between a category and revenue selects one of
   * three splits. Confidence is min(1, months/12) * |r| clamped to
   * [floor, ceiling]. A constant category (no variance) has no correlation
   * and is treated as r = 0.
   */
  class CostStructureEstimator
  {
  public:
    explicit CostStructureEstimator(const CostSplitThresholds& thresholds = CostSplitThresholds())
      : mThresholds(thresholds)
    {}

    std::vector<CostSplit> estimate(const PnLSeries& series) const;

    CostSplit estimateCategory(const PnLSeries& series, OpexCategory category) const;

    // Variable percentage for correlation r
    double variablePctFor(double r) const;

  private:
    CostSplitThresholds mThresholds;
  };

} // namespace ebitdascope

#endif // __EBITDASCOPE_COST_STRUCTURE_ESTIMATOR_H
