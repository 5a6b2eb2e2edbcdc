// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __EBITDASCOPE_MONTHLY_FINANCIALS_H
#define __EBITDASCOPE_MONTHLY_FINANCIALS_H 1

#include <vector>
#include "InputRecords.h"
#include "YearMonth.h"

namespace ebitdascope
{
  /**
   * @brief One month of the canonical profit-and-loss series.
   *
   * Only the ledger inputs (revenue, COGS and the opex categories) are
   * stored. Every derived figure is computed from them on each call so that
   * the derived values can never drift away from their inputs.
   *
   * Percentages are expressed on a 0-100 scale. When revenue is zero both
   * margin percentages are reported as 0.0.
   */
  class MonthlyFinancials
  {
  public:
    explicit MonthlyFinancials(const GLMonthlyRow& row)
      : mMonth(row.month),
        mRevenue(row.revenue),
        mCogs(row.cogs),
        mOpex(row.opex)
    {}

    MonthlyFinancials(const MonthlyFinancials&) = default;
    MonthlyFinancials& operator=(const MonthlyFinancials&) = default;
    ~MonthlyFinancials() noexcept = default;

    const YearMonth& getMonth() const
    {
      return mMonth;
    }

    double getRevenue() const
    {
      return mRevenue;
    }

    double getCogs() const
    {
      return mCogs;
    }

    double getOpex(OpexCategory category) const
    {
      return mOpex[static_cast<std::size_t>(category)];
    }

    double getGrossMargin() const
    {
      return mRevenue - mCogs;
    }

    double getGrossMarginPct() const
    {
      return percentOfRevenue(getGrossMargin());
    }

    double getTotalOpex() const;

    double getEbitda() const
    {
      return getGrossMargin() - getTotalOpex();
    }

    double getEbitdaMarginPct() const
    {
      return percentOfRevenue(getEbitda());
    }

    bool hasZeroRevenue() const
    {
      return mRevenue == 0.0;
    }

  private:
    double percentOfRevenue(double amount) const
    {
      if (mRevenue == 0.0)
        return 0.0;

      return (amount * 100.0) / mRevenue;
    }

  private:
    YearMonth mMonth;
    double mRevenue;
    double mCogs;
    OpexArray mOpex;
  };

  using PnLSeries = std::vector<MonthlyFinancials>;

} // namespace ebitdascope

#endif // __EBITDASCOPE_MONTHLY_FINANCIALS_H
