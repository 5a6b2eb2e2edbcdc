// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "OutlierDetector.h"
#include "SeriesStatistics.h"
#include <algorithm>
#include <cmath>
#include <map>
#include <spdlog/spdlog.h>

namespace ebitdascope
{
  namespace
  {
    void sortSpikes(std::vector<SpikeOutlier>& spikes)
    {
      std::stable_sort(spikes.begin(), spikes.end(),
                       [](const SpikeOutlier& lhs, const SpikeOutlier& rhs) {
                         if (lhs.month != rhs.month)
                           return lhs.month < rhs.month;
                         return lhs.subject < rhs.subject;
                       });
    }
  }

  OutlierReport OutlierDetector::detect(const PnLSeries& series,
                                        const std::vector<VendorRecord>& vendors) const
  {
    OutlierReport report;
    report.vendorSpikes = detectVendorSpikes(vendors, report.insufficientSeries);
    report.opexSpikes = detectOpexSpikes(series, report.insufficientSeries);
    report.revenueDeclines = detectRevenueDeclines(series);

    spdlog::debug("OutlierDetector: {} vendor spike(s), {} opex spike(s), {} revenue decline(s)",
                  report.vendorSpikes.size(), report.opexSpikes.size(),
                  report.revenueDeclines.size());
    return report;
  }

  std::vector<SpikeOutlier>
  OutlierDetector::detectVendorSpikes(const std::vector<VendorRecord>& vendors,
                                      std::vector<std::string>& insufficient) const
  {
    // vendor -> month -> summed amount, both ordered
    std::map<std::string, std::map<YearMonth, double>> spendByVendor;
    for (const auto& rec : vendors)
      spendByVendor[rec.vendor][rec.month] += rec.amount;

    std::vector<SpikeOutlier> spikes;
    for (const auto& [vendor, byMonth] : spendByVendor)
      {
        std::vector<YearMonth> months;
        std::vector<double> amounts;
        months.reserve(byMonth.size());
        amounts.reserve(byMonth.size());
        for (const auto& [month, amount] : byMonth)
          {
            months.push_back(month);
            amounts.push_back(amount);
          }

        flagSpikes(vendor, months, amounts, spikes, insufficient, "vendor:" + vendor);
      }

    // with one vendor the total is that vendor's series
    if (mConfig.includeTotalVendorSpend && spendByVendor.size() > 1)
      {
        std::map<YearMonth, double> totalByMonth;
        for (const auto& rec : vendors)
          totalByMonth[rec.month] += rec.amount;

        std::vector<YearMonth> months;
        std::vector<double> totals;
        for (const auto& [month, amount] : totalByMonth)
          {
            months.push_back(month);
            totals.push_back(amount);
          }

        flagSpikes("total", months, totals, spikes, insufficient, "vendor:total");
      }

    sortSpikes(spikes);
    return spikes;
  }

  std::vector<SpikeOutlier>
  OutlierDetector::detectOpexSpikes(const PnLSeries& series,
                                    std::vector<std::string>& insufficient) const
  {
    std::vector<YearMonth> months;
    months.reserve(series.size());
    for (const auto& m : series)
      months.push_back(m.getMonth());

    std::vector<SpikeOutlier> spikes;
    for (OpexCategory category : allOpexCategories())
      {
        std::vector<double> values;
        values.reserve(series.size());
        for (const auto& m : series)
          values.push_back(m.getOpex(category));

        const std::string name = opexCategoryName(category);
        flagSpikes(name, months, values, spikes, insufficient, "opex:" + name);
      }

    if (mConfig.includeTotalOpex)
      {
        std::vector<double> totals;
        totals.reserve(series.size());
        for (const auto& m : series)
          totals.push_back(m.getTotalOpex());

        flagSpikes("total", months, totals, spikes, insufficient, "opex:total");
      }

    sortSpikes(spikes);
    return spikes;
  }

  std::vector<RevenueDecline>
  OutlierDetector::detectRevenueDeclines(const PnLSeries& series) const
  {
    std::vector<RevenueDecline> declines;
    for (std::size_t i = 1; i < series.size(); ++i)
      {
        const double prevRevenue = series[i - 1].getRevenue();
        const double currRevenue = series[i].getRevenue();

        if (!(prevRevenue > 0.0))
          continue;

        const double declinePct = (prevRevenue - currRevenue) / prevRevenue;
        if (declinePct > mConfig.revenueDeclineThreshold)
          declines.push_back(RevenueDecline{series[i].getMonth(),
                                            series[i - 1].getMonth(),
                                            prevRevenue,
                                            currRevenue,
                                            declinePct});
      }

    return declines;
  }

  void OutlierDetector::flagSpikes(const std::string& subject,
                                   const std::vector<YearMonth>& months,
                                   const std::vector<double>& values,
                                   std::vector<SpikeOutlier>& out,
                                   std::vector<std::string>& insufficient,
                                   const std::string& seriesLabel) const
  {
    auto z = ZScores(values, mConfig.minPoints);
    if (!z)
      {
        insufficient.push_back(seriesLabel);
        return;
      }

    const double mean = Mean(values);
    const double sd = PopulationStdDev(values);
    for (std::size_t i = 0; i < values.size(); ++i)
      {
        if (std::fabs((*z)[i]) > mConfig.zThreshold)
          out.push_back(SpikeOutlier{months[i], subject, values[i], mean, sd, (*z)[i]});
      }
  }

} // namespace ebitdascope
