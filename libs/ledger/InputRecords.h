// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __EBITDASCOPE_INPUT_RECORDS_H
#define __EBITDASCOPE_INPUT_RECORDS_H 1

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "YearMonth.h"

namespace ebitdascope
{
  /**
   * @brief Operating-expense categories carried by a general-ledger row.
   */
  enum class OpexCategory
  {
    SalesMarketing = 0,
    RnD,
    GnA,
    Other
  };

  constexpr std::size_t kNumOpexCategories = 4;

  using OpexArray = std::array<double, kNumOpexCategories>;

  // All categories in column order
  const std::array<OpexCategory, kNumOpexCategories>& allOpexCategories();

  // Short name used in reports ("sales_marketing", "rnd", "gna", "other")
  std::string opexCategoryName(OpexCategory category);

  // Input column name ("opex_sales_marketing", ...)
  std::string opexColumnName(OpexCategory category);

  /**
   * @brief One raw month of general-ledger data as delivered by ingestion.
   *
   * Absent opex columns are carried as 0.
   */
  struct GLMonthlyRow
  {
    YearMonth month;
    double revenue = 0.0;
    double cogs = 0.0;
    OpexArray opex{};

    GLMonthlyRow(const YearMonth& m, double rev, double cogsAmount)
      : month(m), revenue(rev), cogs(cogsAmount)
    {}

    GLMonthlyRow(const YearMonth& m, double rev, double cogsAmount,
                 double salesMarketing, double rnd, double gna, double other)
      : month(m), revenue(rev), cogs(cogsAmount),
        opex{{salesMarketing, rnd, gna, other}}
    {}

    double getOpex(OpexCategory category) const
    {
      return opex[static_cast<std::size_t>(category)];
    }
  };

  enum class PayrollFunction
  {
    Sales,
    Marketing,
    RnD,
    GnA,
    Ops
  };

  // Accepts "Sales", "Marketing", "R&D", "G&A", "Ops"
  std::optional<PayrollFunction> parsePayrollFunction(const std::string& text);

  std::string payrollFunctionName(PayrollFunction function);

  struct PayrollRecord
  {
    YearMonth month;
    PayrollFunction function;
    unsigned int headcount;
    std::optional<double> fullyLoadedCost;
  };

  struct VendorRecord
  {
    YearMonth month;
    std::string vendor;
    std::string category;
    double amount;
  };

  struct SegmentRecord
  {
    YearMonth month;
    std::string segment;
    double revenue;
  };

  /**
   * @brief Immutable input snapshot for one analysis run.
   *
   * The optional datasets are empty when they were not supplied.
   */
  struct InputSnapshot
  {
    std::vector<GLMonthlyRow> glRows;
    std::vector<PayrollRecord> payroll;
    std::vector<VendorRecord> vendors;
    std::vector<SegmentRecord> segments;

    bool hasPayroll() const { return !payroll.empty(); }
    bool hasVendors() const { return !vendors.empty(); }
    bool hasSegments() const { return !segments.empty(); }
  };

} // namespace ebitdascope

#endif // __EBITDASCOPE_INPUT_RECORDS_H
