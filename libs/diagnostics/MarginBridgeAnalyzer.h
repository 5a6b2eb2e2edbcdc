// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __EBITDASCOPE_MARGIN_BRIDGE_ANALYZER_H
#define __EBITDASCOPE_MARGIN_BRIDGE_ANALYZER_H 1

#include <vector>
#include "DiagnosticTypes.h"
#include "MonthlyFinancials.h"

namespace ebitdascope
{
  /**
   * @brief Month-over-month EBITDA bridge.
   *
   * For every consecutive pair (t-1, t) of the canonical series:
   *
   *   revenueImpact =  revenue_t    - revenue_t-1
   *   cogsImpact    = -(cogs_t      - cogs_t-1)
   *   opexImpact    = -(totalOpex_t - totalOpex_t-1)
   *
   * which sum to ebitda_t - ebitda_t-1. A series shorter than two months
   * yields an empty bridge.
   */
  class MarginBridgeAnalyzer
  {
  public:
    std::vector<MarginBridgeEntry> analyze(const PnLSeries& series) const;
  };

} // namespace ebitdascope

#endif // __EBITDASCOPE_MARGIN_BRIDGE_ANALYZER_H
