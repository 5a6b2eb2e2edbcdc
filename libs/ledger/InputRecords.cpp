// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "InputRecords.h"
#include <stdexcept>

namespace ebitdascope
{
  const std::array<OpexCategory, kNumOpexCategories>& allOpexCategories()
  {
    static const std::array<OpexCategory, kNumOpexCategories> categories{{
        OpexCategory::SalesMarketing,
        OpexCategory::RnD,
        OpexCategory::GnA,
        OpexCategory::Other
      }};
    return categories;
  }

  std::string opexCategoryName(OpexCategory category)
  {
    switch (category)
      {
      case OpexCategory::SalesMarketing:
        return "sales_marketing";
      case OpexCategory::RnD:
        return "rnd";
      case OpexCategory::GnA:
        return "gna";
      case OpexCategory::Other:
        return "other";
      }
    throw std::invalid_argument("opexCategoryName: unknown category");
  }

  std::string opexColumnName(OpexCategory category)
  {
    return "opex_" + opexCategoryName(category);
  }

  std::optional<PayrollFunction> parsePayrollFunction(const std::string& text)
  {
    if (text == "Sales")
      return PayrollFunction::Sales;
    if (text == "Marketing")
      return PayrollFunction::Marketing;
    if (text == "R&D")
      return PayrollFunction::RnD;
    if (text == "G&A")
      return PayrollFunction::GnA;
    if (text == "Ops")
      return PayrollFunction::Ops;
    return std::nullopt;
  }

  std::string payrollFunctionName(PayrollFunction function)
  {
    switch (function)
      {
      case PayrollFunction::Sales:
        return "Sales";
      case PayrollFunction::Marketing:
        return "Marketing";
      case PayrollFunction::RnD:
        return "R&D";
      case PayrollFunction::GnA:
        return "G&A";
      case PayrollFunction::Ops:
        return "Ops";
      }
    throw std::invalid_argument("payrollFunctionName: unknown function");
  }

} // namespace ebitdascope
