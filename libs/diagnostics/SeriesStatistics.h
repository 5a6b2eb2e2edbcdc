// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __EBITDASCOPE_SERIES_STATISTICS_H
#define __EBITDASCOPE_SERIES_STATISTICS_H 1

#include <optional>
#include <vector>

namespace ebitdascope
{
  /**
   * @brief Arithmetic mean. Returns 0.0 for an empty series.
   */
  double Mean(const std::vector<double>& series);

  /**
   * @brief Population standard deviation (divides by N). Returns 0.0 for an
   * empty series.
   */
  double PopulationStdDev(const std::vector<double>& series);

  /**
   * @brief Population z-score of every element.
   *
   * Returns an empty optional when the series has fewer than minPoints values
   * or zero variance; in both cases no value can be called an outlier.
   */
  std::optional<std::vector<double>> ZScores(const std::vector<double>& series,
                                             std::size_t minPoints = 3);

  /**
   * @brief Pearson correlation of two equally sized series.
   *
   * Empty when the series differ in length, have fewer than two points, or
   * either has zero variance.
   */
  std::optional<double> PearsonCorrelation(const std::vector<double>& x,
                                           const std::vector<double>& y);

  struct LinearFit
  {
    double slope;
    double intercept;
    double rSquared;
  };

  /**
   * @brief Closed-form ordinary least squares of y against x = 0..n-1.
   *
   *   slope     = sum((x - xbar)(y - ybar)) / sum((x - xbar)^2)
   *   intercept = ybar - slope * xbar
   *   r^2       = 1 - SSres / SStot, 0 when SStot is 0
   *
   * Empty for fewer than two points.
   */
  std::optional<LinearFit> OrdinaryLeastSquares(const std::vector<double>& y);

} // namespace ebitdascope

#endif // __EBITDASCOPE_SERIES_STATISTICS_H
