// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "TrendAnalyzer.h"
#include "SeriesStatistics.h"
#include <cmath>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace ebitdascope
{
  std::string trendMetricName(TrendMetric metric)
  {
    switch (metric)
      {
      case TrendMetric::Revenue:
        return "revenue";
      case TrendMetric::Ebitda:
        return "ebitda";
      case TrendMetric::GrossMarginPct:
        return "gross_margin_pct";
      case TrendMetric::EbitdaMarginPct:
        return "ebitda_margin_pct";
      case TrendMetric::TotalOpex:
        return "total_opex";
      }
    throw std::invalid_argument("trendMetricName: unknown metric");
  }

  std::string trendDirectionName(TrendDirection direction)
  {
    switch (direction)
      {
      case TrendDirection::Increasing:
        return "increasing";
      case TrendDirection::Decreasing:
        return "decreasing";
      case TrendDirection::Flat:
        return "flat";
      }
    throw std::invalid_argument("trendDirectionName: unknown direction");
  }

  double metricValue(const MonthlyFinancials& month, TrendMetric metric)
  {
    switch (metric)
      {
      case TrendMetric::Revenue:
        return month.getRevenue();
      case TrendMetric::Ebitda:
        return month.getEbitda();
      case TrendMetric::GrossMarginPct:
        return month.getGrossMarginPct();
      case TrendMetric::EbitdaMarginPct:
        return month.getEbitdaMarginPct();
      case TrendMetric::TotalOpex:
        return month.getTotalOpex();
      }
    throw std::invalid_argument("metricValue: unknown metric");
  }

  const std::vector<TrendMetric>& TrendAnalyzer::trackedMetrics()
  {
    static const std::vector<TrendMetric> metrics{
      TrendMetric::Revenue,
      TrendMetric::Ebitda,
      TrendMetric::GrossMarginPct,
      TrendMetric::EbitdaMarginPct,
      TrendMetric::TotalOpex
    };
    return metrics;
  }

  std::vector<Trend> TrendAnalyzer::analyze(const PnLSeries& series) const
  {
    std::vector<Trend> trends;
    trends.reserve(trackedMetrics().size());
    for (TrendMetric metric : trackedMetrics())
      trends.push_back(analyzeMetric(series, metric));

    if (series.size() < 2)
      spdlog::debug("TrendAnalyzer: {} month(s), trends unavailable", series.size());

    return trends;
  }

  Trend TrendAnalyzer::analyzeMetric(const PnLSeries& series, TrendMetric metric) const
  {
    std::vector<double> values;
    values.reserve(series.size());
    for (const auto& m : series)
      values.push_back(metricValue(m, metric));

    Trend trend{metric, values.size(), std::nullopt};

    auto fit = OrdinaryLeastSquares(values);
    if (!fit)
      return trend;

    trend.estimate = TrendEstimate{fit->slope,
                                   fit->intercept,
                                   fit->rSquared,
                                   classify(fit->slope, Mean(values))};
    return trend;
  }

  TrendDirection TrendAnalyzer::classify(double slope, double meanValue) const
  {
    const double epsilon = mConfig.deadbandFraction * std::fabs(meanValue);

    if (slope > epsilon)
      return TrendDirection::Increasing;
    if (slope < -epsilon)
      return TrendDirection::Decreasing;
    return TrendDirection::Flat;
  }

} // namespace ebitdascope
