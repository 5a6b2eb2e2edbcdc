// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __EBITDASCOPE_PNL_RECONSTRUCTOR_H
#define __EBITDASCOPE_PNL_RECONSTRUCTOR_H 1

#include <vector>
#include "InputRecords.h"
#include "MonthlyFinancials.h"

namespace ebitdascope
{
  /**
   * @brief Canonical P&L produced by PnLReconstructor.
   *
   * months is strictly increasing by calendar month. zeroRevenueMonths lists,
   * in the same order, every month whose margins were forced to 0.0 because
   * revenue was zero.
   */
  struct CanonicalPnL
  {
    PnLSeries months;
    std::vector<YearMonth> zeroRevenueMonths;

    bool empty() const
    {
      return months.empty();
    }

    std::size_t size() const
    {
      return months.size();
    }
  };

  /**
   * @brief Turns raw general-ledger rows into the canonical monthly P&L.
   *
   * Rows may arrive in any order; they are sorted chronologically before any
   * derived figure is consumed. Two rows for the same month are rejected.
   */
  class PnLReconstructor
  {
  public:
    PnLReconstructor() = default;
    ~PnLReconstructor() = default;

    /**
     * @throws DuplicateMonthException if two rows share a month
     */
    CanonicalPnL reconstruct(const std::vector<GLMonthlyRow>& rows) const;
  };

} // namespace ebitdascope

#endif // __EBITDASCOPE_PNL_RECONSTRUCTOR_H
