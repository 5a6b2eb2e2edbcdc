#include <catch2/catch_test_macros.hpp>
#include <sstream>
#include "YearMonth.h"
#include "LedgerException.h"

using namespace ebitdascope;
using boost::gregorian::date;

TEST_CASE("YearMonth construction and parsing", "[YearMonth]")
{
  SECTION("From year and month")
  {
    YearMonth ym(2024, 3);
    REQUIRE(ym.getYear() == 2024);
    REQUIRE(ym.getMonth() == 3);
    REQUIRE(ym.getFirstDay() == date(2024, 3, 1));
  }

  SECTION("From any day in the month")
  {
    YearMonth ym(date(2023, 11, 27));
    REQUIRE(ym == YearMonth(2023, 11));
  }

  SECTION("fromString accepts YYYY-MM")
  {
    REQUIRE(YearMonth::fromString("2024-01") == YearMonth(2024, 1));
    REQUIRE(YearMonth::fromString("1999-12") == YearMonth(1999, 12));
  }

  SECTION("fromString rejects malformed text")
  {
    REQUIRE_THROWS_AS(YearMonth::fromString("2024-1"), MonthFormatException);
    REQUIRE_THROWS_AS(YearMonth::fromString("2024/01"), MonthFormatException);
    REQUIRE_THROWS_AS(YearMonth::fromString("2024-13"), MonthFormatException);
    REQUIRE_THROWS_AS(YearMonth::fromString("2024-00"), MonthFormatException);
    REQUIRE_THROWS_AS(YearMonth::fromString("20a4-01"), MonthFormatException);
    REQUIRE_THROWS_AS(YearMonth::fromString("2024-01-15"), MonthFormatException);
    REQUIRE_THROWS_AS(YearMonth::fromString(""), MonthFormatException);
  }

  SECTION("Invalid month number")
  {
    REQUIRE_THROWS_AS(YearMonth(2024, 13), MonthFormatException);
    REQUIRE_THROWS_AS(YearMonth(2024, 0), MonthFormatException);
  }

  SECTION("MonthFormatException is a LedgerException")
  {
    REQUIRE_THROWS_AS(YearMonth::fromString("bad"), LedgerException);
  }
}

TEST_CASE("YearMonth calendar arithmetic", "[YearMonth]")
{
  SECTION("next crosses the year boundary")
  {
    REQUIRE(YearMonth(2023, 12).next() == YearMonth(2024, 1));
    REQUIRE(YearMonth(2024, 5).next() == YearMonth(2024, 6));
  }

  SECTION("monthsUntil is signed")
  {
    YearMonth start(2023, 10);
    REQUIRE(start.monthsUntil(YearMonth(2023, 10)) == 0);
    REQUIRE(start.monthsUntil(YearMonth(2024, 3)) == 5);
    REQUIRE(YearMonth(2024, 3).monthsUntil(start) == -5);
    REQUIRE(start.monthsUntil(YearMonth(2025, 10)) == 24);
  }

  SECTION("Ordering")
  {
    REQUIRE(YearMonth(2023, 12) < YearMonth(2024, 1));
    REQUIRE(YearMonth(2024, 2) > YearMonth(2024, 1));
    REQUIRE(YearMonth(2024, 1) <= YearMonth(2024, 1));
    REQUIRE(YearMonth(2024, 1) >= YearMonth(2024, 1));
    REQUIRE(YearMonth(2024, 1) != YearMonth(2024, 2));
  }
}

TEST_CASE("YearMonth text form", "[YearMonth]")
{
  REQUIRE(YearMonth(2024, 7).toString() == "2024-07");
  REQUIRE(YearMonth(2024, 11).toString() == "2024-11");

  std::ostringstream oss;
  oss << YearMonth(2025, 2);
  REQUIRE(oss.str() == "2025-02");

  REQUIRE(YearMonth::fromString(YearMonth(2030, 9).toString()) == YearMonth(2030, 9));
}
