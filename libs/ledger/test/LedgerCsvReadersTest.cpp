#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>
#include <string>
#include "LedgerCsvReaders.h"
#include "LedgerException.h"

using namespace ebitdascope;

namespace
{
  // Writes a CSV fixture and removes it when the test ends
  class TempCsvFile
  {
  public:
    TempCsvFile(const std::string& name, const std::string& contents)
      : mName(name)
    {
      std::ofstream out(mName);
      out << contents;
    }

    ~TempCsvFile()
    {
      std::remove(mName.c_str());
    }

    const std::string& name() const
    {
      return mName;
    }

  private:
    std::string mName;
  };
}

TEST_CASE("GLCsvReader", "[LedgerCsvReaders]")
{
  SECTION("Missing file")
  {
    REQUIRE_THROWS_AS(GLCsvReader("does_not_exist_gl.csv"), InputRecordException);
  }

  SECTION("Full set of columns")
  {
    TempCsvFile file("gl_full_test.csv",
                     "month,revenue,cogs,opex_sales_marketing,opex_rnd,opex_gna,opex_other\n"
                     "2024-02,2000,600,100,200,50,25\n"
                     "2024-01,2500000,750000,400000,600000,300000,200000\n");
    GLCsvReader reader(file.name());
    reader.readFile();

    const auto& rows = reader.getRows();
    REQUIRE(rows.size() == 2);
    REQUIRE(rows[0].month == YearMonth(2024, 2));
    REQUIRE(rows[1].revenue == 2500000.0);
    REQUIRE(rows[1].getOpex(OpexCategory::Other) == 200000.0);
  }

  SECTION("Optional opex columns default to zero")
  {
    TempCsvFile file("gl_partial_test.csv",
                     "month,revenue,cogs,opex_rnd\n"
                     "2024-01,1000,400,50\n"
                     "2024-02,1100,420,\n");
    GLCsvReader reader(file.name());
    reader.readFile();

    const auto& rows = reader.getRows();
    REQUIRE(rows.size() == 2);
    REQUIRE(rows[0].getOpex(OpexCategory::RnD) == 50.0);
    REQUIRE(rows[0].getOpex(OpexCategory::SalesMarketing) == 0.0);
    REQUIRE(rows[1].getOpex(OpexCategory::RnD) == 0.0);
  }

  SECTION("Negative amounts are rejected")
  {
    TempCsvFile file("gl_negative_test.csv",
                     "month,revenue,cogs\n"
                     "2024-01,-5,1\n");
    GLCsvReader reader(file.name());
    REQUIRE_THROWS_AS(reader.readFile(), InputRecordException);
  }

  SECTION("Bad month is rejected")
  {
    TempCsvFile file("gl_month_test.csv",
                     "month,revenue,cogs\n"
                     "01/2024,5,1\n");
    GLCsvReader reader(file.name());
    REQUIRE_THROWS_AS(reader.readFile(), InputRecordException);
  }

  SECTION("Required columns")
  {
    TempCsvFile file("gl_columns_test.csv",
                     "month,revenue\n"
                     "2024-01,5\n");
    GLCsvReader reader(file.name());
    REQUIRE_THROWS_AS(reader.readFile(), InputRecordException);
  }
}

TEST_CASE("PayrollCsvReader", "[LedgerCsvReaders]")
{
  SECTION("Functions and optional cost")
  {
    TempCsvFile file("payroll_test.csv",
                     "month,function,headcount,fully_loaded_cost\n"
                     "2024-01,R&D,12,180000\n"
                     "2024-01,G&A,3,\n"
                     "2024-01,Sales,5,60000\n");
    PayrollCsvReader reader(file.name());
    reader.readFile();

    const auto& records = reader.getRecords();
    REQUIRE(records.size() == 3);
    REQUIRE(records[0].function == PayrollFunction::RnD);
    REQUIRE(records[0].headcount == 12);
    REQUIRE(records[0].fullyLoadedCost == 180000.0);
    REQUIRE(records[1].function == PayrollFunction::GnA);
    REQUIRE_FALSE(records[1].fullyLoadedCost.has_value());
  }

  SECTION("Unknown function")
  {
    TempCsvFile file("payroll_function_test.csv",
                     "month,function,headcount,fully_loaded_cost\n"
                     "2024-01,Legal,2,1000\n");
    PayrollCsvReader reader(file.name());
    REQUIRE_THROWS_AS(reader.readFile(), InputRecordException);
  }

  SECTION("Fractional headcount")
  {
    TempCsvFile file("payroll_headcount_test.csv",
                     "month,function,headcount,fully_loaded_cost\n"
                     "2024-01,Ops,2.5,1000\n");
    PayrollCsvReader reader(file.name());
    REQUIRE_THROWS_AS(reader.readFile(), InputRecordException);
  }

  SECTION("Headcount too large for a count")
  {
    TempCsvFile file("payroll_headcount_range_test.csv",
                     "month,function,headcount,fully_loaded_cost\n"
                     "2024-01,Ops,1000000000000,1000\n");
    PayrollCsvReader reader(file.name());
    REQUIRE_THROWS_AS(reader.readFile(), InputRecordException);
  }

  SECTION("Largest representable headcount is accepted")
  {
    TempCsvFile file("payroll_headcount_max_test.csv",
                     "month,function,headcount,fully_loaded_cost\n"
                     "2024-01,Ops,4294967295,1000\n");
    PayrollCsvReader reader(file.name());
    reader.readFile();
    REQUIRE(reader.getRecords().size() == 1);
    REQUIRE(reader.getRecords()[0].headcount == 4294967295u);
  }
}

TEST_CASE("VendorCsvReader and SegmentCsvReader", "[LedgerCsvReaders]")
{
  SECTION("Vendor records")
  {
    TempCsvFile file("vendor_test.csv",
                     "month,vendor,category,amount\n"
                     "2024-01,\"Acme, Inc.\",SaaS,1200.50\n"
                     "2024-02,Globex,Cloud,800\n");
    VendorCsvReader reader(file.name());
    reader.readFile();

    const auto& records = reader.getRecords();
    REQUIRE(records.size() == 2);
    REQUIRE(records[0].vendor == "Acme, Inc.");
    REQUIRE(records[0].amount == 1200.5);
    REQUIRE(records[1].category == "Cloud");
  }

  SECTION("Empty vendor name")
  {
    TempCsvFile file("vendor_empty_test.csv",
                     "month,vendor,category,amount\n"
                     "2024-01,,SaaS,10\n");
    VendorCsvReader reader(file.name());
    REQUIRE_THROWS_AS(reader.readFile(), InputRecordException);
  }

  SECTION("Segment records")
  {
    TempCsvFile file("segment_test.csv",
                     "month,segment,revenue\n"
                     "2024-01,Enterprise,90000\n"
                     "2024-01,SMB,10000\n");
    SegmentCsvReader reader(file.name());
    reader.readFile();

    const auto& records = reader.getRecords();
    REQUIRE(records.size() == 2);
    REQUIRE(records[1].segment == "SMB");
    REQUIRE(records[1].revenue == 10000.0);
  }
}
