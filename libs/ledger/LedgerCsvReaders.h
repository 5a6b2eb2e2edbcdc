// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __EBITDASCOPE_LEDGER_CSV_READERS_H
#define __EBITDASCOPE_LEDGER_CSV_READERS_H 1

#include <string>
#include <vector>
#include "InputRecords.h"

namespace ebitdascope
{
  /**
   * @brief Common base for the snapshot CSV readers.
   *
   * Each reader parses one file with a header row. Numeric columns must be
   * non-negative, months must be YYYY-MM. Violations raise
   * InputRecordException naming the file and line.
   */
  class LedgerCsvReader
  {
  public:
    explicit LedgerCsvReader(const std::string& fileName);

    LedgerCsvReader(const LedgerCsvReader&) = default;
    LedgerCsvReader& operator=(const LedgerCsvReader&) = default;

    virtual ~LedgerCsvReader()
    {}

    const std::string& getFileName() const
    {
      return mFileName;
    }

    virtual void readFile() = 0;

  protected:
    double parseAmount(const std::string& field, const std::string& column,
                       unsigned int line) const;

    YearMonth parseMonth(const std::string& field, unsigned int line) const;

    [[noreturn]] void fail(unsigned int line, const std::string& message) const;

  private:
    std::string mFileName;
  };

  //
  // General ledger file:
  // month, revenue, cogs, opex_sales_marketing, opex_rnd, opex_gna, opex_other
  //
  // The opex columns are optional and default to 0.
  //
  class GLCsvReader : public LedgerCsvReader
  {
  public:
    explicit GLCsvReader(const std::string& fileName)
      : LedgerCsvReader(fileName)
    {}

    void readFile() override;

    const std::vector<GLMonthlyRow>& getRows() const
    {
      return mRows;
    }

  private:
    std::vector<GLMonthlyRow> mRows;
  };

  //
  // Payroll summary file:
  // month, function, headcount, fully_loaded_cost
  //
  // fully_loaded_cost may be blank or absent.
  //
  class PayrollCsvReader : public LedgerCsvReader
  {
  public:
    explicit PayrollCsvReader(const std::string& fileName)
      : LedgerCsvReader(fileName)
    {}

    void readFile() override;

    const std::vector<PayrollRecord>& getRecords() const
    {
      return mRecords;
    }

  private:
    std::vector<PayrollRecord> mRecords;
  };

  //
  // Vendor spend file:
  // month, vendor, category, amount
  //
  class VendorCsvReader : public LedgerCsvReader
  {
  public:
    explicit VendorCsvReader(const std::string& fileName)
      : LedgerCsvReader(fileName)
    {}

    void readFile() override;

    const std::vector<VendorRecord>& getRecords() const
    {
      return mRecords;
    }

  private:
    std::vector<VendorRecord> mRecords;
  };

  //
  // Revenue by segment file:
  // month, segment, revenue
  //
  class SegmentCsvReader : public LedgerCsvReader
  {
  public:
    explicit SegmentCsvReader(const std::string& fileName)
      : LedgerCsvReader(fileName)
    {}

    void readFile() override;

    const std::vector<SegmentRecord>& getRecords() const
    {
      return mRecords;
    }

  private:
    std::vector<SegmentRecord> mRecords;
  };

} // namespace ebitdascope

#endif // __EBITDASCOPE_LEDGER_CSV_READERS_H
