// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __EBITDASCOPE_TREND_ANALYZER_H
#define __EBITDASCOPE_TREND_ANALYZER_H 1

#include <vector>
#include "DiagnosticTypes.h"
#include "MonthlyFinancials.h"

namespace ebitdascope
{
  struct TrendConfig
  {
    /// Slopes within +/- deadbandFraction * |mean| are reported as flat
    double deadbandFraction = 0.001;
  };

  /**
   * @brief Per-metric linear trend over the canonical series.
   *
   * Each tracked metric is regressed against month index 0..n-1 with the
   * closed-form least-squares estimator. Fewer than two months leaves the
   * trend unavailable rather than reporting a zero slope.
   */
  class TrendAnalyzer
  {
  public:
    explicit TrendAnalyzer(const TrendConfig& config = TrendConfig())
      : mConfig(config)
    {}

    // Metrics in report order
    static const std::vector<TrendMetric>& trackedMetrics();

    std::vector<Trend> analyze(const PnLSeries& series) const;

    Trend analyzeMetric(const PnLSeries& series, TrendMetric metric) const;

    TrendDirection classify(double slope, double meanValue) const;

  private:
    TrendConfig mConfig;
  };

  // Value of metric for one month
  double metricValue(const MonthlyFinancials& month, TrendMetric metric);

} // namespace ebitdascope

#endif // __EBITDASCOPE_TREND_ANALYZER_H
