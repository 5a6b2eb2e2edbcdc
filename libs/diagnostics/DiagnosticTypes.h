// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __EBITDASCOPE_DIAGNOSTIC_TYPES_H
#define __EBITDASCOPE_DIAGNOSTIC_TYPES_H 1

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "InputRecords.h"
#include "YearMonth.h"

namespace ebitdascope
{
  /**
   * @brief Decomposition of the EBITDA change between two consecutive months.
   *
   * revenueImpact + cogsImpact + opexImpact == ebitdaChange (to rounding).
   * revenueFlowthrough is informational only: the revenue change carried at
   * the prior month's gross margin.
   */
  struct MarginBridgeEntry
  {
    YearMonth month;
    YearMonth prevMonth;
    double revenueImpact;
    double cogsImpact;
    double opexImpact;
    double ebitdaChange;
    double revenueFlowthrough;
  };

  /**
   * @brief A value whose population z-score exceeded the spike threshold.
   *
   * subject is the vendor name for vendor spikes and the opex category name
   * (or "total") for opex spikes.
   */
  struct SpikeOutlier
  {
    YearMonth month;
    std::string subject;
    double value;
    double seriesMean;
    double seriesStdDev;
    double zScore;
  };

  struct RevenueDecline
  {
    YearMonth month;
    YearMonth prevMonth;
    double prevRevenue;
    double currentRevenue;
    double declinePct;          ///< fraction, 0.15 == 15%
  };

  struct OutlierReport
  {
    std::vector<SpikeOutlier> vendorSpikes;
    std::vector<SpikeOutlier> opexSpikes;
    std::vector<RevenueDecline> revenueDeclines;

    /// Series skipped for too few points or zero variance ("vendor:Acme", "opex:rnd")
    std::vector<std::string> insufficientSeries;

    std::size_t totalFlagged() const
    {
      return vendorSpikes.size() + opexSpikes.size() + revenueDeclines.size();
    }
  };

  enum class TrendMetric
  {
    Revenue,
    Ebitda,
    GrossMarginPct,
    EbitdaMarginPct,
    TotalOpex
  };

  std::string trendMetricName(TrendMetric metric);

  enum class TrendDirection
  {
    Increasing,
    Decreasing,
    Flat
  };

  std::string trendDirectionName(TrendDirection direction);

  struct TrendEstimate
  {
    double slope;
    double intercept;
    double rSquared;
    TrendDirection direction;
  };

  /**
   * @brief Linear trend of one metric against month index.
   *
   * estimate is empty when fewer than two months were available.
   */
  struct Trend
  {
    TrendMetric metric;
    std::size_t points;
    std::optional<TrendEstimate> estimate;

    bool isAvailable() const
    {
      return estimate.has_value();
    }
  };

  /**
   * @brief Fixed/variable split of one opex category.
   *
   * Percentages are on a 0-100 scale and sum to 100. correlation is empty
   * when it could not be computed (short or constant series).
   */
  struct CostSplit
  {
    OpexCategory category;
    std::optional<double> correlation;
    double variablePct;
    double fixedPct;
    double confidence;
    std::size_t monthsAvailable;
    bool insufficientData;
  };

  struct CompletenessReport
  {
    std::size_t totalMonths = 0;
    std::vector<YearMonth> missingGlMonths;
    std::vector<YearMonth> missingPayrollMonths;
    std::vector<YearMonth> zeroRevenueMonths;

    double payrollCostCoverage = 0.0;   ///< fraction of opex covered by payroll cost
    double monthCoverage = 0.0;
    double datasetPresence = 0.0;
    double completenessScore = 0.0;

    bool hasPayroll = false;
    bool hasVendor = false;
    bool hasSegments = false;

    std::size_t glRecords = 0;
    std::size_t payrollRecords = 0;
    std::size_t vendorRecords = 0;
    std::size_t segmentRecords = 0;

    /// Diagnostics that could not be computed at full strength ("trend", "outlier", "cost_structure")
    std::vector<std::string> insufficientData;

    std::vector<std::string> dataGaps;
  };

} // namespace ebitdascope

#endif // __EBITDASCOPE_DIAGNOSTIC_TYPES_H
