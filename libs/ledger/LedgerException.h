// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __EBITDASCOPE_LEDGER_EXCEPTION_H
#define __EBITDASCOPE_LEDGER_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace ebitdascope
{
  class LedgerException : public std::runtime_error
  {
  public:
    LedgerException(const std::string msg)
      : std::runtime_error(msg)
    {}

    virtual ~LedgerException() = default;
  };

  // Two general-ledger rows were supplied for the same calendar month
  class DuplicateMonthException : public LedgerException
  {
  public:
    explicit DuplicateMonthException(const std::string& msg)
      : LedgerException(msg) {}
  };

  // A month string was not in YYYY-MM form or named an impossible month
  class MonthFormatException : public LedgerException
  {
  public:
    explicit MonthFormatException(const std::string& msg)
      : LedgerException(msg) {}
  };

  // Raised by the CSV readers for rows that violate the input schema
  class InputRecordException : public LedgerException
  {
  public:
    explicit InputRecordException(const std::string& msg)
      : LedgerException(msg) {}
  };

} // namespace ebitdascope

#endif // __EBITDASCOPE_LEDGER_EXCEPTION_H
