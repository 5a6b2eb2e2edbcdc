// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "MarginBridgeAnalyzer.h"
#include <spdlog/spdlog.h>

namespace ebitdascope
{
  std::vector<MarginBridgeEntry> MarginBridgeAnalyzer::analyze(const PnLSeries& series) const
  {
    std::vector<MarginBridgeEntry> bridge;
    if (series.size() < 2)
      return bridge;

    bridge.reserve(series.size() - 1);
    for (std::size_t i = 1; i < series.size(); ++i)
      {
        const MonthlyFinancials& prev = series[i - 1];
        const MonthlyFinancials& curr = series[i];

        const double revenueDelta = curr.getRevenue() - prev.getRevenue();

        MarginBridgeEntry entry{curr.getMonth(),
                                prev.getMonth(),
                                revenueDelta,
                                -(curr.getCogs() - prev.getCogs()),
                                -(curr.getTotalOpex() - prev.getTotalOpex()),
                                curr.getEbitda() - prev.getEbitda(),
                                revenueDelta * prev.getGrossMarginPct() / 100.0};
        bridge.push_back(entry);
      }

    spdlog::debug("MarginBridgeAnalyzer: {} bridge entries", bridge.size());
    return bridge;
  }

} // namespace ebitdascope
