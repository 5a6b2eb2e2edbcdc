// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __EBITDASCOPE_OUTLIER_DETECTOR_H
#define __EBITDASCOPE_OUTLIER_DETECTOR_H 1

#include <cstddef>
#include <string>
#include <vector>
#include "DiagnosticTypes.h"
#include "InputRecords.h"
#include "MonthlyFinancials.h"

namespace ebitdascope
{
  struct OutlierConfig
  {
    double zThreshold = 2.0;                 ///< flag when |z| is strictly greater
    std::size_t minPoints = 3;               ///< shorter series are never flagged
    double revenueDeclineThreshold = 0.10;   ///< flag when the monthly drop is strictly greater
    bool includeTotalOpex = true;            ///< also scan the total opex series
    bool includeTotalVendorSpend = true;     ///< also scan monthly spend across all vendors
  };

  /**
   * @brief Flags vendor-spend spikes, opex spikes and month-over-month
   * revenue declines.
   *
   * Spikes use the population z-score of each series on its own: one series
   * per vendor (that vendor's monthly totals over the months it billed), one
   * for spend across all vendors when there are at least two, and one per
   * opex category plus total opex. A series with fewer than minPoints values or zero
   * variance produces no flags and is listed in insufficientSeries.
   *
   * Revenue declines are pairwise over consecutive months and independent of
   * any z-score. A month following zero revenue is never a decline.
   */
  class OutlierDetector
  {
  public:
    explicit OutlierDetector(const OutlierConfig& config = OutlierConfig())
      : mConfig(config)
    {}

    OutlierReport detect(const PnLSeries& series,
                         const std::vector<VendorRecord>& vendors) const;

    std::vector<SpikeOutlier> detectVendorSpikes(const std::vector<VendorRecord>& vendors,
                                                 std::vector<std::string>& insufficient) const;

    std::vector<SpikeOutlier> detectOpexSpikes(const PnLSeries& series,
                                               std::vector<std::string>& insufficient) const;

    std::vector<RevenueDecline> detectRevenueDeclines(const PnLSeries& series) const;

    const OutlierConfig& getConfig() const
    {
      return mConfig;
    }

  private:
    void flagSpikes(const std::string& subject,
                    const std::vector<YearMonth>& months,
                    const std::vector<double>& values,
                    std::vector<SpikeOutlier>& out,
                    std::vector<std::string>& insufficient,
                    const std::string& seriesLabel) const;

  private:
    OutlierConfig mConfig;
  };

} // namespace ebitdascope

#endif // __EBITDASCOPE_OUTLIER_DETECTOR_H
