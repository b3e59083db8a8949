// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ABTESTING_POWER_ANALYSIS_CALCULATOR_H
#define __ABTESTING_POWER_ANALYSIS_CALCULATOR_H 1

#include <cstddef>
#include <optional>
#include "MetricType.h"

namespace abtesting
{
  struct PowerAnalysisParameters
  {
    double baselineRate = 0.5;
    double minimumDetectableEffect = 0.05;   // absolute difference
    double confidenceLevel = 0.95;
    double power = 0.8;
    std::size_t numVariants = 2;
    MetricType metricType = MetricType::Binary;
    std::optional<double> estimatedStdDev;   // continuous metrics; defaults to baselineRate / 2
    double usersPerDay = 1000.0;
  };

  struct PowerAnalysisResult
  {
    std::size_t sampleSizePerVariant = 0;
    std::size_t totalSampleSize = 0;
    std::size_t minRunTimeDays = 0;
    double zAlpha = 0.0;
    double zBeta = 0.0;
    PowerAnalysisParameters parameters;
  };

  /**
   * @class PowerAnalysisCalculator
   * @brief Fixed-horizon sample size for a two-sided test comparing each
   *        treatment against control.
   *
   * Binary metrics (p1 = baseline, p2 = baseline + MDE):
   *   n = (z_{1-a/2} sqrt(2 pbar (1 - pbar)) + z_{1-b} sqrt(p1 (1 - p1) + p2 (1 - p2)))^2 / (p2 - p1)^2
   *
   * Continuous metrics (sigma estimated):
   *   n = 2 sigma^2 (z_{1-a/2} + z_{1-b})^2 / MDE^2
   *
   * The per-variant size is rounded up, multiplied by the number of variants,
   * and the run time is the total divided by the daily traffic, rounded up to
   * whole days.
   */
  class PowerAnalysisCalculator
  {
  public:
    /**
     * @throws std::invalid_argument on out-of-range parameters
     */
    static PowerAnalysisResult calculate(const PowerAnalysisParameters& params);

    /**
     * @brief Power achieved by a binary-metric test with the given per-variant size.
     */
    static double achievedPower(const PowerAnalysisParameters& params, std::size_t sampleSizePerVariant);

  private:
    static void validate(const PowerAnalysisParameters& params);
    static double rawSampleSize(const PowerAnalysisParameters& params, double zAlpha, double zBeta);
  };
}

#endif
