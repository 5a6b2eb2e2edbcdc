// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "LedgerCsvReaders.h"
#include "LedgerException.h"
#include <cmath>
#include <fstream>
#include <limits>
#include <spdlog/spdlog.h>
#include "csv.h"

namespace ebitdascope
{
  namespace
  {
    template <unsigned N>
    using SnapshotCsv = io::CSVReader<N,
                                      io::trim_chars<' ', '\t'>,
                                      io::double_quote_escape<',', '"'>>;
  }

  LedgerCsvReader::LedgerCsvReader(const std::string& fileName)
    : mFileName(fileName)
  {
    // ensure file exists (all readers inherit this check)
    std::ifstream fin(mFileName);
    if (!fin.is_open())
      throw InputRecordException("Cannot open file: " + mFileName);
  }

  void LedgerCsvReader::fail(unsigned int line, const std::string& message) const
  {
    throw InputRecordException(mFileName + ":" + std::to_string(line) + ": " + message);
  }

  double LedgerCsvReader::parseAmount(const std::string& field, const std::string& column,
                                      unsigned int line) const
  {
    std::size_t consumed = 0;
    double value = 0.0;

    try
      {
        value = std::stod(field, &consumed);
      }
    catch (const std::exception&)
      {
        fail(line, "column " + column + " is not a number: '" + field + "'");
      }

    if (consumed != field.size() || !std::isfinite(value))
      fail(line, "column " + column + " is not a number: '" + field + "'");

    if (value < 0.0)
      fail(line, "column " + column + " must be non-negative, got " + field);

    return value;
  }

  YearMonth LedgerCsvReader::parseMonth(const std::string& field, unsigned int line) const
  {
    try
      {
        return YearMonth::fromString(field);
      }
    catch (const MonthFormatException& e)
      {
        fail(line, e.what());
      }
  }

  void GLCsvReader::readFile()
  {
    mRows.clear();

    try
      {
        SnapshotCsv<7> csvFile(getFileName());
        csvFile.read_header(io::ignore_extra_column | io::ignore_missing_column,
                            "month", "revenue", "cogs",
                            opexColumnName(OpexCategory::SalesMarketing),
                            opexColumnName(OpexCategory::RnD),
                            opexColumnName(OpexCategory::GnA),
                            opexColumnName(OpexCategory::Other));

        if (!csvFile.has_column("month") || !csvFile.has_column("revenue")
            || !csvFile.has_column("cogs"))
          fail(1, "general ledger file requires month, revenue and cogs columns");

        std::string monthField, revenueField, cogsField;
        std::array<std::string, kNumOpexCategories> opexFields;

        while (true)
          {
            for (auto& f : opexFields)
              f = "0";

            if (!csvFile.read_row(monthField, revenueField, cogsField,
                                  opexFields[0], opexFields[1], opexFields[2], opexFields[3]))
              break;

            const unsigned int line = csvFile.get_file_line();
            GLMonthlyRow row(parseMonth(monthField, line),
                             parseAmount(revenueField, "revenue", line),
                             parseAmount(cogsField, "cogs", line));

            for (OpexCategory category : allOpexCategories())
              {
                const auto idx = static_cast<std::size_t>(category);
                const std::string& field = opexFields[idx].empty() ? std::string("0") : opexFields[idx];
                row.opex[idx] = parseAmount(field, opexColumnName(category), line);
              }

            mRows.push_back(row);
          }
      }
    catch (const io::error::base& e)
      {
        throw InputRecordException(getFileName() + ": " + e.what());
      }

    spdlog::debug("GLCsvReader: read {} row(s) from {}", mRows.size(), getFileName());
  }

  void PayrollCsvReader::readFile()
  {
    mRecords.clear();

    try
      {
        SnapshotCsv<4> csvFile(getFileName());
        csvFile.read_header(io::ignore_extra_column | io::ignore_missing_column,
                            "month", "function", "headcount", "fully_loaded_cost");

        if (!csvFile.has_column("month") || !csvFile.has_column("function")
            || !csvFile.has_column("headcount"))
          fail(1, "payroll file requires month, function and headcount columns");

        std::string monthField, functionField, headcountField, costField;
        while (true)
          {
            costField.clear();
            if (!csvFile.read_row(monthField, functionField, headcountField, costField))
              break;

            const unsigned int line = csvFile.get_file_line();
            auto function = parsePayrollFunction(functionField);
            if (!function)
              fail(line, "unknown payroll function '" + functionField
                   + "' (expected Sales, Marketing, R&D, G&A or Ops)");

            const double headcount = parseAmount(headcountField, "headcount", line);
            if (headcount != std::floor(headcount))
              fail(line, "headcount must be a whole number, got " + headcountField);
            if (headcount > static_cast<double>(std::numeric_limits<unsigned int>::max()))
              fail(line, "headcount is out of range, got " + headcountField);

            std::optional<double> cost;
            if (!costField.empty())
              cost = parseAmount(costField, "fully_loaded_cost", line);

            mRecords.push_back(PayrollRecord{parseMonth(monthField, line), *function,
                                             static_cast<unsigned int>(headcount), cost});
          }
      }
    catch (const io::error::base& e)
      {
        throw InputRecordException(getFileName() + ": " + e.what());
      }

    spdlog::debug("PayrollCsvReader: read {} record(s) from {}", mRecords.size(), getFileName());
  }

  void VendorCsvReader::readFile()
  {
    mRecords.clear();

    try
      {
        SnapshotCsv<4> csvFile(getFileName());
        csvFile.read_header(io::ignore_extra_column,
                            "month", "vendor", "category", "amount");

        std::string monthField, vendorField, categoryField, amountField;
        while (csvFile.read_row(monthField, vendorField, categoryField, amountField))
          {
            const unsigned int line = csvFile.get_file_line();
            if (vendorField.empty())
              fail(line, "vendor must not be empty");
            if (categoryField.empty())
              fail(line, "category must not be empty");

            mRecords.push_back(VendorRecord{parseMonth(monthField, line), vendorField,
                                            categoryField,
                                            parseAmount(amountField, "amount", line)});
          }
      }
    catch (const io::error::base& e)
      {
        throw InputRecordException(getFileName() + ": " + e.what());
      }

    spdlog::debug("VendorCsvReader: read {} record(s) from {}", mRecords.size(), getFileName());
  }

  void SegmentCsvReader::readFile()
  {
    mRecords.clear();

    try
      {
        SnapshotCsv<3> csvFile(getFileName());
        csvFile.read_header(io::ignore_extra_column, "month", "segment", "revenue");

        std::string monthField, segmentField, revenueField;
        while (csvFile.read_row(monthField, segmentField, revenueField))
          {
            const unsigned int line = csvFile.get_file_line();
            if (segmentField.empty())
              fail(line, "segment must not be empty");

            mRecords.push_back(SegmentRecord{parseMonth(monthField, line), segmentField,
                                             parseAmount(revenueField, "revenue", line)});
          }
      }
    catch (const io::error::base& e)
      {
        throw InputRecordException(getFileName() + ": " + e.what());
      }

    spdlog::debug("SegmentCsvReader: read {} record(s) from {}", mRecords.size(), getFileName());
  }

} // namespace ebitdascope
