// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __EBITDASCOPE_DIAGNOSTICS_BUNDLE_H
#define __EBITDASCOPE_DIAGNOSTICS_BUNDLE_H 1

#include <optional>
#include <vector>
#include "DiagnosticTypes.h"

namespace ebitdascope
{
  /**
   * @brief Everything stages 2-6 produced for one analysis run.
   *
   * Built once by DiagnosticsEngine and read-only afterwards.
   */
  class DiagnosticsBundle
  {
  public:
    DiagnosticsBundle(std::vector<MarginBridgeEntry> marginBridge,
                      OutlierReport outliers,
                      std::vector<Trend> trends,
                      std::vector<CostSplit> costSplits,
                      CompletenessReport completeness)
      : mMarginBridge(std::move(marginBridge)),
        mOutliers(std::move(outliers)),
        mTrends(std::move(trends)),
        mCostSplits(std::move(costSplits)),
        mCompleteness(std::move(completeness))
    {}

    const std::vector<MarginBridgeEntry>& getMarginBridge() const
    {
      return mMarginBridge;
    }

    const OutlierReport& getOutliers() const
    {
      return mOutliers;
    }

    const std::vector<Trend>& getTrends() const
    {
      return mTrends;
    }

    std::optional<Trend> findTrend(TrendMetric metric) const
    {
      for (const auto& t : mTrends)
        {
          if (t.metric == metric)
            return t;
        }
      return std::nullopt;
    }

    const std::vector<CostSplit>& getCostSplits() const
    {
      return mCostSplits;
    }

    std::optional<CostSplit> findCostSplit(OpexCategory category) const
    {
      for (const auto& split : mCostSplits)
        {
          if (split.category == category)
            return split;
        }
      return std::nullopt;
    }

    const CompletenessReport& getCompleteness() const
    {
      return mCompleteness;
    }

  private:
    std::vector<MarginBridgeEntry> mMarginBridge;
    OutlierReport mOutliers;
    std::vector<Trend> mTrends;
    std::vector<CostSplit> mCostSplits;
    CompletenessReport mCompleteness;
  };

} // namespace ebitdascope

#endif // __EBITDASCOPE_DIAGNOSTICS_BUNDLE_H
