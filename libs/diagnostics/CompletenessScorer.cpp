// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "CompletenessScorer.h"
#include <algorithm>
#include <map>
#include <set>
#include <spdlog/spdlog.h>

namespace ebitdascope
{
  std::vector<YearMonth> findMonthGaps(const std::vector<YearMonth>& months)
  {
    std::vector<YearMonth> gaps;
    if (months.size() < 2)
      return gaps;

    const std::set<YearMonth> present(months.begin(), months.end());
    const YearMonth& last = *present.rbegin();

    for (YearMonth m = *present.begin(); m < last; m = m.next())
      {
        if (present.find(m) == present.end())
          gaps.push_back(m);
      }

    return gaps;
  }

  CompletenessReport CompletenessScorer::score(const CanonicalPnL& pnl,
                                               const InputSnapshot& snapshot) const
  {
    CompletenessReport report;

    std::vector<YearMonth> glMonths;
    glMonths.reserve(pnl.size());
    for (const auto& m : pnl.months)
      glMonths.push_back(m.getMonth());

    report.totalMonths = glMonths.size();
    report.missingGlMonths = findMonthGaps(glMonths);
    report.zeroRevenueMonths = pnl.zeroRevenueMonths;

    report.hasPayroll = snapshot.hasPayroll();
    report.hasVendor = snapshot.hasVendors();
    report.hasSegments = snapshot.hasSegments();
    report.glRecords = snapshot.glRows.size();
    report.payrollRecords = snapshot.payroll.size();
    report.vendorRecords = snapshot.vendors.size();
    report.segmentRecords = snapshot.segments.size();

    if (report.hasPayroll)
      {
        std::set<YearMonth> payrollMonths;
        std::map<YearMonth, double> payrollCostByMonth;
        for (const auto& rec : snapshot.payroll)
          {
            payrollMonths.insert(rec.month);
            if (rec.fullyLoadedCost)
              payrollCostByMonth[rec.month] += *rec.fullyLoadedCost;
          }

        double costSum = 0.0;
        double opexSum = 0.0;
        for (const auto& m : pnl.months)
          {
            if (payrollMonths.find(m.getMonth()) == payrollMonths.end())
              report.missingPayrollMonths.push_back(m.getMonth());

            auto it = payrollCostByMonth.find(m.getMonth());
            if (it != payrollCostByMonth.end())
              {
                costSum += it->second;
                opexSum += m.getTotalOpex();
              }
          }

        report.payrollCostCoverage = (opexSum > 0.0) ? costSum / opexSum : 0.0;
      }

    const double expectedMonths = static_cast<double>(report.totalMonths + report.missingGlMonths.size());
    report.monthCoverage = (expectedMonths > 0.0)
      ? static_cast<double>(report.totalMonths) / expectedMonths
      : 0.0;

    double payrollPresence = 0.0;
    if (report.hasPayroll)
      payrollPresence = report.missingPayrollMonths.empty() ? 1.0 : 0.5;

    report.datasetPresence = (payrollPresence
                              + (report.hasVendor ? 1.0 : 0.0)
                              + (report.hasSegments ? 1.0 : 0.0)) / 3.0;

    double wCoverage = mWeights.monthCoverage;
    double wPresence = mWeights.datasetPresence;
    if (!(wCoverage >= 0.0) || !(wPresence >= 0.0) || !(wCoverage + wPresence > 0.0))
      {
        spdlog::warn("CompletenessScorer: invalid weights ({}, {}), using equal weights",
                     wCoverage, wPresence);
        wCoverage = 1.0;
        wPresence = 1.0;
      }

    report.completenessScore = (wCoverage * report.monthCoverage + wPresence * report.datasetPresence)
      / (wCoverage + wPresence);

    if (report.totalMonths < mWeights.minTrendMonths)
      report.insufficientData.push_back("trend");
    if (report.totalMonths < mWeights.minStatisticalMonths)
      {
        report.insufficientData.push_back("outlier");
        report.insufficientData.push_back("cost_structure");
      }

    if (report.totalMonths == 0)
      report.dataGaps.push_back("No GL/P&L months supplied");
    if (!report.missingGlMonths.empty())
      report.dataGaps.push_back("Missing GL/P&L data for " + std::to_string(report.missingGlMonths.size())
                                + " month(s)");
    if (!report.zeroRevenueMonths.empty())
      report.dataGaps.push_back("Zero revenue reported for " + std::to_string(report.zeroRevenueMonths.size())
                                + " month(s); margins set to 0");
    if (!report.hasPayroll)
      report.dataGaps.push_back("Payroll summary data not provided (optional)");
    else
      {
        if (!report.missingPayrollMonths.empty())
          report.dataGaps.push_back("Missing payroll data for "
                                    + std::to_string(report.missingPayrollMonths.size()) + " month(s)");
        const auto uncosted = std::count_if(snapshot.payroll.begin(), snapshot.payroll.end(),
                                            [](const PayrollRecord& rec) {
                                              return !rec.fullyLoadedCost.has_value();
                                            });
        if (uncosted > 0)
          report.dataGaps.push_back(std::to_string(uncosted)
                                    + " payroll record(s) without fully loaded cost");
      }
    if (!report.hasVendor)
      report.dataGaps.push_back("Vendor spend data not provided (optional)");
    if (!report.hasSegments)
      report.dataGaps.push_back("Revenue by segment data not provided (optional)");
    for (const auto& diagnostic : report.insufficientData)
      report.dataGaps.push_back("Insufficient months for " + diagnostic + " diagnostics");

    spdlog::debug("CompletenessScorer: score {:.3f} ({} month(s), {} gap(s))",
                  report.completenessScore, report.totalMonths, report.missingGlMonths.size());
    return report;
  }

} // namespace ebitdascope
