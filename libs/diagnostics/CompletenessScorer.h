// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __EBITDASCOPE_COMPLETENESS_SCORER_H
#define __EBITDASCOPE_COMPLETENESS_SCORER_H 1

#include <cstddef>
#include <vector>
#include "DiagnosticTypes.h"
#include "InputRecords.h"
#include "PnLReconstructor.h"

namespace ebitdascope
{
  struct CompletenessWeights
  {
    double monthCoverage = 1.0;
    double datasetPresence = 1.0;
    std::size_t minTrendMonths = 2;
    std::size_t minStatisticalMonths = 3;
  };

  /**
   * @brief Scores how complete the analysed snapshot is.
   *
   *   monthCoverage    = months / (months + gaps in the first..last range)
   *   datasetPresence  = mean over payroll, vendor, segment data
   *                      (payroll with missing months counts half)
   *   completeness     = weighted mean of the two
   *
   * Also reports which diagnostics ran on too few months and a list of
   * human-readable data gaps.
   */
  class CompletenessScorer
  {
  public:
    explicit CompletenessScorer(const CompletenessWeights& weights = CompletenessWeights())
      : mWeights(weights)
    {}

    CompletenessReport score(const CanonicalPnL& pnl, const InputSnapshot& snapshot) const;

  private:
    CompletenessWeights mWeights;
  };

  // Calendar months strictly between the first and last month that are not in months
  std::vector<YearMonth> findMonthGaps(const std::vector<YearMonth>& months);

} // namespace ebitdascope

#endif // __EBITDASCOPE_COMPLETENESS_SCORER_H
