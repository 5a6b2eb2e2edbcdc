#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "CostStructureEstimator.h"
#include "DiagnosticsTestUtils.h"

using namespace ebitdascope;
using Catch::Approx;

namespace
{
  std::vector<double> growingRevenue(std::size_t months)
  {
    std::vector<double> revenue;
    for (std::size_t i = 0; i < months; ++i)
      revenue.push_back(1000.0 + 150.0 * static_cast<double>(i) + (i % 2 ? 40.0 : 0.0));
    return revenue;
  }

  // Sales & marketing tracks revenue, R&D moves against it, the rest are constant
  PnLSeries makeCostSeries(std::size_t months)
  {
    auto rows = makeGLRows(YearMonth(2023, 1), growingRevenue(months));
    for (auto& row : rows)
      {
        row.opex[static_cast<std::size_t>(OpexCategory::SalesMarketing)] = 0.1 * row.revenue;
        row.opex[static_cast<std::size_t>(OpexCategory::RnD)] = 5000.0 - row.revenue;
      }
    return makeSeries(rows);
  }
}

TEST_CASE("CostStructureEstimator splits", "[CostStructureEstimator]")
{
  CostStructureEstimator estimator;

  SECTION("One split per category, in category order")
  {
    auto splits = estimator.estimate(makeCostSeries(12));
    REQUIRE(splits.size() == kNumOpexCategories);
    for (std::size_t i = 0; i < kNumOpexCategories; ++i)
      {
        REQUIRE(splits[i].category == allOpexCategories()[i]);
        REQUIRE(splits[i].variablePct + splits[i].fixedPct == Approx(100.0));
        REQUIRE(splits[i].monthsAvailable == 12);
        REQUIRE_FALSE(splits[i].insufficientData);
      }
  }

  SECTION("Strong positive correlation is mostly variable")
  {
    CostSplit split = estimator.estimateCategory(makeCostSeries(12), OpexCategory::SalesMarketing);
    REQUIRE(split.correlation.has_value());
    REQUIRE(*split.correlation == Approx(1.0));
    REQUIRE(split.variablePct == 80.0);
    REQUIRE(split.fixedPct == 20.0);
    REQUIRE(split.confidence == Approx(0.9));
  }

  SECTION("Confidence scales with months available")
  {
    CostSplit split = estimator.estimateCategory(makeCostSeries(6), OpexCategory::SalesMarketing);
    REQUIRE(split.confidence == Approx(0.5));
  }

  SECTION("Negative correlation is mostly fixed")
  {
    CostSplit split = estimator.estimateCategory(makeCostSeries(12), OpexCategory::RnD);
    REQUIRE(*split.correlation == Approx(-1.0));
    REQUIRE(split.variablePct == 20.0);
    REQUIRE(split.fixedPct == 80.0);
    REQUIRE(split.confidence == Approx(0.9));
  }

  SECTION("Constant cost has no correlation and floor confidence")
  {
    CostSplit split = estimator.estimateCategory(makeCostSeries(12), OpexCategory::GnA);
    REQUIRE_FALSE(split.correlation.has_value());
    REQUIRE(split.variablePct == 20.0);
    REQUIRE(split.confidence == Approx(0.2));
    REQUIRE_FALSE(split.insufficientData);
  }

  SECTION("Fewer than three months is neutral")
  {
    auto splits = estimator.estimate(makeCostSeries(2));
    for (const auto& split : splits)
      {
        REQUIRE(split.variablePct == 50.0);
        REQUIRE(split.fixedPct == 50.0);
        REQUIRE(split.confidence == Approx(0.2));
        REQUIRE(split.insufficientData);
        REQUIRE(split.monthsAvailable == 2);
      }
  }
}

TEST_CASE("CostStructureEstimator correlation bands", "[CostStructureEstimator]")
{
  SECTION("Default bands")
  {
    CostStructureEstimator estimator;
    REQUIRE(estimator.variablePctFor(0.95) == 80.0);
    REQUIRE(estimator.variablePctFor(0.7) == 80.0);
    REQUIRE(estimator.variablePctFor(0.69) == 50.0);
    REQUIRE(estimator.variablePctFor(0.3) == 50.0);
    REQUIRE(estimator.variablePctFor(0.29) == 20.0);
    REQUIRE(estimator.variablePctFor(-0.8) == 20.0);
  }

  SECTION("Overridden thresholds")
  {
    CostSplitThresholds thresholds;
    thresholds.strongCorrelation = 0.9;
    thresholds.strongVariablePct = 90.0;
    CostStructureEstimator estimator(thresholds);

    REQUIRE(estimator.variablePctFor(0.8) == 50.0);
    REQUIRE(estimator.variablePctFor(0.95) == 90.0);
  }
}
