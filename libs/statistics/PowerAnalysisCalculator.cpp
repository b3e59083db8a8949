// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "PowerAnalysisCalculator.h"
#include <cmath>
#include <stdexcept>
#include "NormalQuantile.h"

namespace abtesting
{
  void PowerAnalysisCalculator::validate(const PowerAnalysisParameters& params)
  {
    if (!(params.confidenceLevel > 0.0 && params.confidenceLevel < 1.0))
      throw std::invalid_argument("PowerAnalysisCalculator: confidence level must be in (0, 1)");
    if (!(params.power > 0.0 && params.power < 1.0))
      throw std::invalid_argument("PowerAnalysisCalculator: power must be in (0, 1)");
    if (!(params.minimumDetectableEffect > 0.0))
      throw std::invalid_argument("PowerAnalysisCalculator: minimum detectable effect must be positive");
    if (params.numVariants < 2)
      throw std::invalid_argument("PowerAnalysisCalculator: at least two variants are required");
    if (!(params.usersPerDay > 0.0))
      throw std::invalid_argument("PowerAnalysisCalculator: traffic must be positive");

    if (params.metricType == MetricType::Binary)
      {
        if (!(params.baselineRate > 0.0 && params.baselineRate < 1.0))
          throw std::invalid_argument("PowerAnalysisCalculator: baseline rate must be in (0, 1)");
        if (!(params.baselineRate + params.minimumDetectableEffect < 1.0))
          throw std::invalid_argument("PowerAnalysisCalculator: baseline + effect must stay below 1");
      }
    else
      {
        const double sigma = params.estimatedStdDev.value_or(params.baselineRate * 0.5);
        if (!(sigma > 0.0))
          throw std::invalid_argument("PowerAnalysisCalculator: standard deviation estimate must be positive");
      }
  }

  double PowerAnalysisCalculator::rawSampleSize(const PowerAnalysisParameters& params,
                                                double zAlpha, double zBeta)
  {
    const double delta = params.minimumDetectableEffect;

    if (params.metricType == MetricType::Binary)
      {
        const double p1 = params.baselineRate;
        const double p2 = p1 + delta;
        const double pBar = 0.5 * (p1 + p2);
        const double term = zAlpha * std::sqrt(2.0 * pBar * (1.0 - pBar)) +
          zBeta * std::sqrt(p1 * (1.0 - p1) + p2 * (1.0 - p2));
        return term * term / (delta * delta);
      }

    const double sigma = params.estimatedStdDev.value_or(params.baselineRate * 0.5);
    const double zSum = zAlpha + zBeta;
    return 2.0 * sigma * sigma * zSum * zSum / (delta * delta);
  }

  PowerAnalysisResult PowerAnalysisCalculator::calculate(const PowerAnalysisParameters& params)
  {
    validate(params);

    PowerAnalysisResult result;
    result.parameters = params;
    result.zAlpha = detail::compute_normal_critical_value(params.confidenceLevel);
    result.zBeta = detail::compute_normal_quantile(params.power);

    const double n = rawSampleSize(params, result.zAlpha, result.zBeta);
    result.sampleSizePerVariant = static_cast<std::size_t>(std::ceil(n));
    result.totalSampleSize = result.sampleSizePerVariant * params.numVariants;
    result.minRunTimeDays =
      static_cast<std::size_t>(std::ceil(static_cast<double>(result.totalSampleSize) / params.usersPerDay));

    return result;
  }

  double PowerAnalysisCalculator::achievedPower(const PowerAnalysisParameters& params,
                                                std::size_t sampleSizePerVariant)
  {
    validate(params);
    if (sampleSizePerVariant == 0)
      return 0.0;

    const double zAlpha = detail::compute_normal_critical_value(params.confidenceLevel);
    const double n = static_cast<double>(sampleSizePerVariant);
    const double delta = params.minimumDetectableEffect;

    if (params.metricType == MetricType::Binary)
      {
        const double p1 = params.baselineRate;
        const double p2 = p1 + delta;
        const double pBar = 0.5 * (p1 + p2);
        const double sd0 = std::sqrt(2.0 * pBar * (1.0 - pBar));
        const double sd1 = std::sqrt(p1 * (1.0 - p1) + p2 * (1.0 - p2));
        return detail::compute_normal_cdf((delta * std::sqrt(n) - zAlpha * sd0) / sd1);
      }

    const double sigma = params.estimatedStdDev.value_or(params.baselineRate * 0.5);
    return detail::compute_normal_cdf(delta * std::sqrt(n / 2.0) / sigma - zAlpha);
  }
}
