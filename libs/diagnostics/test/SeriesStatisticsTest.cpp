#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include "SeriesStatistics.h"

using namespace ebitdascope;
using Catch::Approx;

TEST_CASE("Mean and population standard deviation", "[SeriesStatistics]")
{
  REQUIRE(Mean({}) == 0.0);
  REQUIRE(Mean({2.0, 4.0, 6.0}) == Approx(4.0));

  REQUIRE(PopulationStdDev({}) == 0.0);
  REQUIRE(PopulationStdDev({5.0, 5.0, 5.0}) == 0.0);
  // population, not sample: {2,4,4,4,5,5,7,9} has sd 2
  REQUIRE(PopulationStdDev({2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0}) == Approx(2.0));
}

TEST_CASE("ZScores", "[SeriesStatistics]")
{
  SECTION("Too few points")
  {
    REQUIRE_FALSE(ZScores({1.0, 2.0}).has_value());
    REQUIRE(ZScores({1.0, 2.0}, 2).has_value());
  }

  SECTION("Zero variance")
  {
    REQUIRE_FALSE(ZScores({7.0, 7.0, 7.0, 7.0}).has_value());
    REQUIRE_FALSE(ZScores({1e9, 1e9, 1e9}).has_value());
  }

  SECTION("Values")
  {
    auto z = ZScores({2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0});
    REQUIRE(z.has_value());
    REQUIRE(z->size() == 8);
    REQUIRE((*z)[0] == Approx(-1.5));
    REQUIRE((*z)[7] == Approx(2.0));
  }
}

TEST_CASE("PearsonCorrelation", "[SeriesStatistics]")
{
  SECTION("Perfect positive and negative")
  {
    REQUIRE(*PearsonCorrelation({1.0, 2.0, 3.0, 4.0}, {10.0, 20.0, 30.0, 40.0}) == Approx(1.0));
    REQUIRE(*PearsonCorrelation({1.0, 2.0, 3.0, 4.0}, {8.0, 6.0, 4.0, 2.0}) == Approx(-1.0));
  }

  SECTION("Unavailable cases")
  {
    REQUIRE_FALSE(PearsonCorrelation({1.0, 2.0}, {1.0, 2.0, 3.0}).has_value());
    REQUIRE_FALSE(PearsonCorrelation({1.0}, {1.0}).has_value());
    REQUIRE_FALSE(PearsonCorrelation({5.0, 5.0, 5.0}, {1.0, 2.0, 3.0}).has_value());
  }

  SECTION("Result is within [-1, 1]")
  {
    auto r = PearsonCorrelation({0.1, 0.2, 0.3}, {0.3, 0.6, 0.9});
    REQUIRE(r.has_value());
    REQUIRE(*r <= 1.0);
    REQUIRE(*r >= -1.0);
  }
}

TEST_CASE("OrdinaryLeastSquares", "[SeriesStatistics]")
{
  SECTION("Fewer than two points")
  {
    REQUIRE_FALSE(OrdinaryLeastSquares({}).has_value());
    REQUIRE_FALSE(OrdinaryLeastSquares({3.0}).has_value());
  }

  SECTION("Exact line")
  {
    auto fit = OrdinaryLeastSquares({5.0, 8.0, 11.0, 14.0});
    REQUIRE(fit.has_value());
    REQUIRE(fit->slope == Approx(3.0));
    REQUIRE(fit->intercept == Approx(5.0));
    REQUIRE(fit->rSquared == Approx(1.0));
  }

  SECTION("Constant series")
  {
    auto fit = OrdinaryLeastSquares({4.0, 4.0, 4.0});
    REQUIRE(fit.has_value());
    REQUIRE(fit->slope == 0.0);
    REQUIRE(fit->intercept == Approx(4.0));
    REQUIRE(fit->rSquared == 0.0);
  }

  SECTION("Noisy series")
  {
    auto fit = OrdinaryLeastSquares({1.0, 3.0, 2.0, 4.0});
    REQUIRE(fit.has_value());
    REQUIRE(fit->slope == Approx(0.8));
    REQUIRE(fit->intercept == Approx(1.3));
    REQUIRE(fit->rSquared == Approx(0.64));
  }
}
