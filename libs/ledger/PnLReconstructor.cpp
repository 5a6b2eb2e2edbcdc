// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "PnLReconstructor.h"
#include "LedgerException.h"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace ebitdascope
{
  CanonicalPnL PnLReconstructor::reconstruct(const std::vector<GLMonthlyRow>& rows) const
  {
    std::vector<GLMonthlyRow> sorted(rows);
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const GLMonthlyRow& lhs, const GLMonthlyRow& rhs) {
                       return lhs.month < rhs.month;
                     });

    auto dup = std::adjacent_find(sorted.begin(), sorted.end(),
                                  [](const GLMonthlyRow& lhs, const GLMonthlyRow& rhs) {
                                    return lhs.month == rhs.month;
                                  });
    if (dup != sorted.end())
      throw DuplicateMonthException("PnLReconstructor::reconstruct - duplicate month "
                                    + dup->month.toString());

    CanonicalPnL result;
    result.months.reserve(sorted.size());

    for (const auto& row : sorted)
      {
        result.months.emplace_back(row);
        if (result.months.back().hasZeroRevenue())
          result.zeroRevenueMonths.push_back(row.month);
      }

    if (!result.zeroRevenueMonths.empty())
      spdlog::debug("PnLReconstructor: {} month(s) with zero revenue, margins reported as 0.0",
                    result.zeroRevenueMonths.size());

    spdlog::debug("PnLReconstructor: reconstructed {} month(s)", result.months.size());
    return result;
  }

} // namespace ebitdascope
