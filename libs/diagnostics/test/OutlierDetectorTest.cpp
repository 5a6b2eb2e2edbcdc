#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <algorithm>
#include "OutlierDetector.h"
#include "DiagnosticsTestUtils.h"

using namespace ebitdascope;
using Catch::Approx;

namespace
{
  std::vector<VendorRecord> vendorSeries(const std::string& vendor, const std::vector<double>& amounts)
  {
    std::vector<VendorRecord> records;
    YearMonth month(2024, 1);
    for (double amount : amounts)
      {
        records.push_back(VendorRecord{month, vendor, "SaaS", amount});
        month = month.next();
      }
    return records;
  }

  bool contains(const std::vector<std::string>& items, const std::string& item)
  {
    return std::find(items.begin(), items.end(), item) != items.end();
  }
}

TEST_CASE("Vendor spikes", "[OutlierDetector]")
{
  OutlierDetector detector;
  std::vector<std::string> insufficient;

  SECTION("Spike is flagged with its statistics")
  {
    auto vendors = vendorSeries("Acme", {100.0, 100.0, 100.0, 100.0, 100.0, 1000.0});
    auto spikes = detector.detectVendorSpikes(vendors, insufficient);

    REQUIRE(spikes.size() == 1);
    REQUIRE(spikes[0].subject == "Acme");
    REQUIRE(spikes[0].month == YearMonth(2024, 6));
    REQUIRE(spikes[0].value == 1000.0);
    REQUIRE(spikes[0].seriesMean == Approx(250.0));
    REQUIRE(spikes[0].zScore == Approx(750.0 / spikes[0].seriesStdDev));
    REQUIRE(spikes[0].zScore > 2.0);
    REQUIRE(insufficient.empty());
  }

  SECTION("Zero variance flags nothing")
  {
    auto vendors = vendorSeries("Flat", {500.0, 500.0, 500.0, 500.0, 500.0, 500.0});
    REQUIRE(detector.detectVendorSpikes(vendors, insufficient).empty());
    REQUIRE(contains(insufficient, "vendor:Flat"));
  }

  SECTION("Fewer than three points flags nothing")
  {
    auto vendors = vendorSeries("Short", {10.0, 10000.0});
    REQUIRE(detector.detectVendorSpikes(vendors, insufficient).empty());
    REQUIRE(contains(insufficient, "vendor:Short"));
  }

  SECTION("Vendors are scored independently and same-month lines are summed")
  {
    auto vendors = vendorSeries("Acme", {100.0, 100.0, 100.0, 100.0, 100.0, 1000.0});
    auto steady = vendorSeries("Globex", {50.0, 55.0, 45.0, 50.0, 52.0, 48.0});
    vendors.insert(vendors.end(), steady.begin(), steady.end());
    vendors.push_back(VendorRecord{YearMonth(2024, 3), "Globex", "Cloud", 0.0});

    auto spikes = detector.detectVendorSpikes(vendors, insufficient);
    REQUIRE(spikes.size() == 2);
    REQUIRE(spikes[0].subject == "Acme");
    REQUIRE(spikes[1].subject == "total");
    REQUIRE(spikes[1].value == 1048.0);
  }

  SECTION("Combined spend can spike when no single vendor does")
  {
    auto vendors = vendorSeries("Acme", {100.0, 120.0, 80.0, 120.0, 80.0, 130.0});
    auto other = vendorSeries("Globex", {100.0, 80.0, 120.0, 80.0, 120.0, 130.0});
    vendors.insert(vendors.end(), other.begin(), other.end());

    auto spikes = detector.detectVendorSpikes(vendors, insufficient);
    REQUIRE(spikes.size() == 1);
    REQUIRE(spikes[0].subject == "total");
    REQUIRE(spikes[0].month == YearMonth(2024, 6));
    REQUIRE(spikes[0].value == 260.0);
    REQUIRE(spikes[0].seriesMean == Approx(210.0));
  }

  SECTION("A single vendor has no separate total")
  {
    auto vendors = vendorSeries("Acme", {100.0, 100.0, 100.0, 100.0, 100.0, 1000.0});
    detector.detectVendorSpikes(vendors, insufficient);
    REQUIRE_FALSE(contains(insufficient, "vendor:total"));

    auto steady = vendorSeries("Globex", {50.0, 50.0, 50.0, 50.0, 50.0, 50.0});
    auto flat = vendorSeries("Initech", {50.0, 50.0, 50.0, 50.0, 50.0, 50.0});
    steady.insert(steady.end(), flat.begin(), flat.end());
    insufficient.clear();
    REQUIRE(detector.detectVendorSpikes(steady, insufficient).empty());
    REQUIRE(contains(insufficient, "vendor:total"));
  }

  SECTION("Vendor total can be excluded")
  {
    OutlierConfig config;
    config.includeTotalVendorSpend = false;
    OutlierDetector noTotal(config);

    auto vendors = vendorSeries("Acme", {100.0, 120.0, 80.0, 120.0, 80.0, 130.0});
    auto other = vendorSeries("Globex", {100.0, 80.0, 120.0, 80.0, 120.0, 130.0});
    vendors.insert(vendors.end(), other.begin(), other.end());
    REQUIRE(noTotal.detectVendorSpikes(vendors, insufficient).empty());
  }
}

TEST_CASE("Opex spikes", "[OutlierDetector]")
{
  OutlierDetector detector;
  std::vector<std::string> insufficient;

  SECTION("Category spike is attributed to the category and the total")
  {
    auto rows = makeGLRows(YearMonth(2024, 1), {1000.0, 1000.0, 1000.0, 1000.0, 1000.0, 1000.0});
    rows[5].opex[static_cast<std::size_t>(OpexCategory::RnD)] = 1000.0;

    auto spikes = detector.detectOpexSpikes(makeSeries(rows), insufficient);
    REQUIRE(spikes.size() == 2);
    REQUIRE(spikes[0].subject == "rnd");
    REQUIRE(spikes[1].subject == "total");
    REQUIRE(spikes[0].month == YearMonth(2024, 6));

    REQUIRE(contains(insufficient, "opex:sales_marketing"));
    REQUIRE_FALSE(contains(insufficient, "opex:rnd"));
  }

  SECTION("Constant opex flags nothing")
  {
    auto rows = makeGLRows(YearMonth(2024, 1), {900.0, 1000.0, 1100.0, 1200.0});
    REQUIRE(detector.detectOpexSpikes(makeSeries(rows), insufficient).empty());
    REQUIRE(insufficient.size() == kNumOpexCategories + 1);
  }

  SECTION("Total opex can be excluded")
  {
    OutlierConfig config;
    config.includeTotalOpex = false;
    OutlierDetector noTotal(config);

    auto rows = makeGLRows(YearMonth(2024, 1), {1000.0, 1000.0, 1000.0, 1000.0, 1000.0, 1000.0});
    rows[5].opex[static_cast<std::size_t>(OpexCategory::GnA)] = 1000.0;

    auto spikes = noTotal.detectOpexSpikes(makeSeries(rows), insufficient);
    REQUIRE(spikes.size() == 1);
    REQUIRE(spikes[0].subject == "gna");
  }
}

TEST_CASE("Revenue declines", "[OutlierDetector]")
{
  OutlierDetector detector;

  SECTION("More than ten percent is flagged")
  {
    auto rows = makeGLRows(YearMonth(2024, 1), {1000.0, 850.0, 800.0, 900.0});
    auto declines = detector.detectRevenueDeclines(makeSeries(rows));

    REQUIRE(declines.size() == 1);
    REQUIRE(declines[0].month == YearMonth(2024, 2));
    REQUIRE(declines[0].prevMonth == YearMonth(2024, 1));
    REQUIRE(declines[0].prevRevenue == 1000.0);
    REQUIRE(declines[0].currentRevenue == 850.0);
    REQUIRE(declines[0].declinePct == Approx(0.15));
  }

  SECTION("Exactly ten percent is not flagged")
  {
    auto rows = makeGLRows(YearMonth(2024, 1), {1000.0, 900.0});
    REQUIRE(detector.detectRevenueDeclines(makeSeries(rows)).empty());
  }

  SECTION("A month after zero revenue is never a decline")
  {
    auto rows = makeGLRows(YearMonth(2024, 1), {1000.0, 0.0, 0.0, 500.0});
    auto declines = detector.detectRevenueDeclines(makeSeries(rows));

    REQUIRE(declines.size() == 1);
    REQUIRE(declines[0].month == YearMonth(2024, 2));
    REQUIRE(declines[0].declinePct == Approx(1.0));
  }

  SECTION("Two months of data still compare the pair")
  {
    auto rows = makeGLRows(YearMonth(2024, 1), {1000.0, 500.0});
    auto report = detector.detect(makeSeries(rows), {});
    REQUIRE(report.revenueDeclines.size() == 1);
    REQUIRE(report.opexSpikes.empty());
    REQUIRE(report.totalFlagged() == 1);
  }
}
