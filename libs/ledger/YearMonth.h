// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __EBITDASCOPE_YEAR_MONTH_H
#define __EBITDASCOPE_YEAR_MONTH_H 1

#include <string>
#include <ostream>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace ebitdascope
{
  /**
   * @brief A calendar month (year + month) used as the key of every monthly series.
   *
   * Internally the month is held as a boost::gregorian::date pinned to the
   * first day of the month, so ordering and calendar arithmetic come from
   * Boost.Date_Time. The textual form is always YYYY-MM.
   */
  class YearMonth
  {
  public:
    YearMonth(int year, int month);

    explicit YearMonth(const boost::gregorian::date& anyDayInMonth);

    YearMonth(const YearMonth&) = default;
    YearMonth& operator=(const YearMonth&) = default;
    ~YearMonth() noexcept = default;

    /**
     * @brief Parse a YYYY-MM string.
     * @throws MonthFormatException if the text is not a valid calendar month
     */
    static YearMonth fromString(const std::string& text);

    int getYear() const
    {
      return mFirstOfMonth.year();
    }

    int getMonth() const
    {
      return mFirstOfMonth.month();
    }

    const boost::gregorian::date& getFirstDay() const
    {
      return mFirstOfMonth;
    }

    YearMonth next() const;

    // Signed number of months from this month to other (other - this)
    long monthsUntil(const YearMonth& other) const;

    std::string toString() const;

  private:
    boost::gregorian::date mFirstOfMonth;
  };

  inline bool operator==(const YearMonth& lhs, const YearMonth& rhs)
  {
    return lhs.getFirstDay() == rhs.getFirstDay();
  }

  inline bool operator!=(const YearMonth& lhs, const YearMonth& rhs)
  {
    return !(lhs == rhs);
  }

  inline bool operator<(const YearMonth& lhs, const YearMonth& rhs)
  {
    return lhs.getFirstDay() < rhs.getFirstDay();
  }

  inline bool operator>(const YearMonth& lhs, const YearMonth& rhs)
  {
    return rhs < lhs;
  }

  inline bool operator<=(const YearMonth& lhs, const YearMonth& rhs)
  {
    return !(rhs < lhs);
  }

  inline bool operator>=(const YearMonth& lhs, const YearMonth& rhs)
  {
    return !(lhs < rhs);
  }

  std::ostream& operator<<(std::ostream& os, const YearMonth& ym);

} // namespace ebitdascope

#endif // __EBITDASCOPE_YEAR_MONTH_H
