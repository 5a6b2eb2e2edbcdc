// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "YearMonth.h"
#include "LedgerException.h"
#include <cctype>
#include <iomanip>
#include <sstream>

namespace ebitdascope
{
  using boost::gregorian::date;
  using boost::gregorian::months;

  namespace
  {
    date makeFirstOfMonth(int year, int month)
    {
      try
        {
          return date(static_cast<unsigned short>(year),
                      static_cast<unsigned short>(month), 1);
        }
      catch (const std::out_of_range& e)
        {
          throw MonthFormatException("YearMonth: invalid year/month "
                                     + std::to_string(year) + "-"
                                     + std::to_string(month) + " (" + e.what() + ")");
        }
    }
  }

  YearMonth::YearMonth(int year, int month)
    : mFirstOfMonth(makeFirstOfMonth(year, month))
  {}

  YearMonth::YearMonth(const boost::gregorian::date& anyDayInMonth)
    : mFirstOfMonth(makeFirstOfMonth(anyDayInMonth.year(), anyDayInMonth.month()))
  {}

  YearMonth YearMonth::fromString(const std::string& text)
  {
    // Exactly YYYY-MM
    if (text.size() != 7 || text[4] != '-')
      throw MonthFormatException("YearMonth::fromString - expected YYYY-MM, got '" + text + "'");

    for (std::string::size_type i = 0; i < text.size(); ++i)
      {
        if (i == 4)
          continue;
        if (!std::isdigit(static_cast<unsigned char>(text[i])))
          throw MonthFormatException("YearMonth::fromString - non-digit in '" + text + "'");
      }

    const int year = std::stoi(text.substr(0, 4));
    const int month = std::stoi(text.substr(5, 2));

    if (month < 1 || month > 12)
      throw MonthFormatException("YearMonth::fromString - month out of range in '" + text + "'");

    return YearMonth(year, month);
  }

  YearMonth YearMonth::next() const
  {
    return YearMonth(mFirstOfMonth + months(1));
  }

  long YearMonth::monthsUntil(const YearMonth& other) const
  {
    return (static_cast<long>(other.getYear()) - getYear()) * 12L
      + (static_cast<long>(other.getMonth()) - getMonth());
  }

  std::string YearMonth::toString() const
  {
    std::ostringstream oss;
    oss << std::setw(4) << std::setfill('0') << getYear()
        << '-'
        << std::setw(2) << std::setfill('0') << getMonth();
    return oss.str();
  }

  std::ostream& operator<<(std::ostream& os, const YearMonth& ym)
  {
    return os << ym.toString();
  }

} // namespace ebitdascope
