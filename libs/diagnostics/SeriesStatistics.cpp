// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "SeriesStatistics.h"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace ebitdascope
{
  namespace
  {
    // Spread below this fraction of the level is treated as no variance at all
    constexpr double kRelativeSpreadFloor = 1e-12;

    bool hasSpread(double spread, double level)
    {
      return spread > kRelativeSpreadFloor * std::max(1.0, std::fabs(level));
    }
  }

  double Mean(const std::vector<double>& series)
  {
    if (series.empty())
      return 0.0;

    const double sum = std::accumulate(series.begin(), series.end(), 0.0);
    return sum / static_cast<double>(series.size());
  }

  double PopulationStdDev(const std::vector<double>& series)
  {
    if (series.empty())
      return 0.0;

    const double mean = Mean(series);
    double sumSq = 0.0;
    for (double v : series)
      {
        const double d = v - mean;
        sumSq += d * d;
      }

    return std::sqrt(sumSq / static_cast<double>(series.size()));
  }

  std::optional<std::vector<double>> ZScores(const std::vector<double>& series,
                                             std::size_t minPoints)
  {
    if (series.size() < minPoints || series.size() < 2)
      return std::nullopt;

    const double mean = Mean(series);
    const double sd = PopulationStdDev(series);

    // Constant series: every deviation is rounding noise
    if (!hasSpread(sd, mean))
      return std::nullopt;

    std::vector<double> z;
    z.reserve(series.size());
    for (double v : series)
      z.push_back((v - mean) / sd);

    return z;
  }

  std::optional<double> PearsonCorrelation(const std::vector<double>& x,
                                           const std::vector<double>& y)
  {
    if (x.size() != y.size() || x.size() < 2)
      return std::nullopt;

    const double xbar = Mean(x);
    const double ybar = Mean(y);

    double sxy = 0.0;
    double sxx = 0.0;
    double syy = 0.0;
    for (std::size_t i = 0; i < x.size(); ++i)
      {
        const double dx = x[i] - xbar;
        const double dy = y[i] - ybar;
        sxy += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
      }

    const double n = static_cast<double>(x.size());
    if (!hasSpread(std::sqrt(sxx / n), xbar) || !hasSpread(std::sqrt(syy / n), ybar))
      return std::nullopt;

    const double r = sxy / std::sqrt(sxx * syy);
    return std::max(-1.0, std::min(1.0, r));
  }

  std::optional<LinearFit> OrdinaryLeastSquares(const std::vector<double>& y)
  {
    const std::size_t n = y.size();
    if (n < 2)
      return std::nullopt;

    const double xbar = static_cast<double>(n - 1) / 2.0;
    const double ybar = Mean(y);

    double sxy = 0.0;
    double sxx = 0.0;
    for (std::size_t i = 0; i < n; ++i)
      {
        const double dx = static_cast<double>(i) - xbar;
        sxy += dx * (y[i] - ybar);
        sxx += dx * dx;
      }

    LinearFit fit{};
    fit.slope = sxy / sxx;
    fit.intercept = ybar - fit.slope * xbar;

    double ssRes = 0.0;
    double ssTot = 0.0;
    for (std::size_t i = 0; i < n; ++i)
      {
        const double predicted = fit.intercept + fit.slope * static_cast<double>(i);
        const double resid = y[i] - predicted;
        const double dev = y[i] - ybar;
        ssRes += resid * resid;
        ssTot += dev * dev;
      }

    fit.rSquared = (ssTot > 0.0) ? std::max(0.0, 1.0 - ssRes / ssTot) : 0.0;
    return fit;
  }

} // namespace ebitdascope
