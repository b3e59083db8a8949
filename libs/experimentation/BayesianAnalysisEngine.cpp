// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "BayesianAnalysisEngine.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include "ExperimentExceptions.h"
#include "HypothesisTests.h"
#include "NormalQuantile.h"
#include "StatUtils.h"

namespace abtesting
{
  namespace
  {
    constexpr double kMinVariance = 1.0e-12;
    constexpr double kLargeSampleShape = 30.0;
  }

  BayesianAnalysisEngine::BayesianAnalysisEngine(RandomSource& random,
                                                 std::size_t simulations,
                                                 double credibleLevel)
    : mRandom(random),
      mSimulations(std::max(simulations, kMinSimulations)),
      mCredibleLevel(credibleLevel)
  {
    if (!(credibleLevel > 0.0 && credibleLevel < 1.0))
      throw std::invalid_argument("BayesianAnalysisEngine: credible level must be in (0, 1)");
  }

  PosteriorDistribution BayesianAnalysisEngine::betaPosterior(const std::vector<double>& values)
  {
    const double successes = static_cast<double>(std::count(values.begin(), values.end(), 1.0));
    const double failures = static_cast<double>(values.size()) - successes;

    PosteriorDistribution posterior;
    posterior.type = MetricType::Binary;
    posterior.sampleSize = values.size();
    posterior.alpha = 1.0 + successes;
    posterior.beta = 1.0 + failures;

    const double ab = posterior.alpha + posterior.beta;
    posterior.mean = posterior.alpha / ab;
    posterior.variance = posterior.alpha * posterior.beta / (ab * ab * (ab + 1.0));
    return posterior;
  }

  PosteriorDistribution BayesianAnalysisEngine::normalPosterior(const std::vector<double>& values)
  {
    if (values.size() < 2)
      throw InsufficientDataException("Normal posterior needs at least two observations");

    const auto [sampleMean, sampleVar] = StatUtils::computeMeanAndVariance(values);
    const double dataPrecision = static_cast<double>(values.size()) / std::max(sampleVar, kMinVariance);

    PosteriorDistribution posterior;
    posterior.type = MetricType::Continuous;
    posterior.sampleSize = values.size();
    posterior.tau = kPriorPrecision + dataPrecision;
    posterior.mu = (kPriorPrecision * kPriorMean + dataPrecision * sampleMean) / posterior.tau;
    posterior.mean = posterior.mu;
    posterior.variance = 1.0 / posterior.tau;
    return posterior;
  }

  CredibleInterval BayesianAnalysisEngine::credibleInterval(const PosteriorDistribution& posterior) const
  {
    const double z = detail::compute_normal_critical_value(mCredibleLevel);
    CredibleInterval interval;
    interval.level = mCredibleLevel;

    if (posterior.type == MetricType::Binary)
      {
        if (posterior.alpha > kLargeSampleShape && posterior.beta > kLargeSampleShape)
          {
            const double sd = std::sqrt(posterior.variance);
            interval.lower = std::max(0.0, posterior.mean - z * sd);
            interval.upper = std::min(1.0, posterior.mean + z * sd);
          }
        else
          {
            interval.lower = posterior.mean;
            interval.upper = posterior.mean;
            interval.degraded = true;
          }
        return interval;
      }

    const double halfWidth = z / std::sqrt(posterior.tau);
    interval.lower = posterior.mu - halfWidth;
    interval.upper = posterior.mu + halfWidth;
    return interval;
  }

  void BayesianAnalysisEngine::simulate(BayesianMetricResult& result,
                                        const std::vector<std::string>& order) const
  {
    const std::size_t k = order.size();
    std::vector<const PosteriorDistribution*> posteriors;
    for (const auto& name : order)
      posteriors.push_back(&result.posteriors.at(name));

    std::vector<std::size_t> wins(k, 0);
    std::vector<double> lossSums(k, 0.0);
    std::vector<double> draws(k, 0.0);

    mRandom.withEngine([&](auto& engine) {
      for (std::size_t sim = 0; sim < mSimulations; ++sim)
        {
          std::size_t best = 0;
          double bestValue = -std::numeric_limits<double>::infinity();
          for (std::size_t i = 0; i < k; ++i)
            {
              const PosteriorDistribution& p = *posteriors[i];
              draws[i] = (p.type == MetricType::Binary)
                ? rng_utils::get_random_beta(engine, p.alpha, p.beta)
                : rng_utils::get_random_normal(engine, p.mu, 1.0 / std::sqrt(p.tau));

              if (draws[i] > bestValue)
                {
                  bestValue = draws[i];
                  best = i;
                }
            }

          ++wins[best];
          for (std::size_t i = 0; i < k; ++i)
            lossSums[i] += bestValue - draws[i];
        }
    });

    const double n = static_cast<double>(mSimulations);
    for (std::size_t i = 0; i < k; ++i)
      {
        result.probabilityOfBeingBest[order[i]] = static_cast<double>(wins[i]) / n;
        result.expectedLoss[order[i]] = lossSums[i] / n;
      }
  }

  BayesianMetricResult
  BayesianAnalysisEngine::analyzeMetric(const std::string& metricName,
                                        const std::vector<std::pair<std::string, std::vector<double>>>& samples) const
  {
    if (samples.size() < 2)
      throw InsufficientDataException("Metric '" + metricName + "' needs at least two variants");

    bool anyData = false;
    bool allBinary = true;
    for (const auto& [variant, values] : samples)
      {
        if (values.empty())
          continue;
        anyData = true;
        allBinary = allBinary && isBinarySample(values);
      }

    if (!anyData)
      throw InsufficientDataException("Metric '" + metricName + "' has no observations");

    BayesianMetricResult result;
    result.metricName = metricName;
    result.type = allBinary ? MetricType::Binary : MetricType::Continuous;
    result.simulations = mSimulations;

    std::vector<std::string> order;
    for (const auto& [variant, values] : samples)
      {
        if (result.type == MetricType::Continuous && values.size() < 2)
          throw InsufficientDataException("Metric '" + metricName + "' needs at least two observations in variant '" +
                                          variant + "'");

        const PosteriorDistribution posterior =
          (result.type == MetricType::Binary) ? betaPosterior(values) : normalPosterior(values);

        result.posteriors[variant] = posterior;
        result.credibleIntervals[variant] = credibleInterval(posterior);
        order.push_back(variant);
      }

    simulate(result, order);
    return result;
  }

  BayesianResult BayesianAnalysisEngine::analyze(const AnalysisData& data) const
  {
    const auto samplesFor = [&data](const std::string& metric) {
      std::vector<std::pair<std::string, std::vector<double>>> samples;
      for (const auto& v : data.getVariants())
        samples.emplace_back(v.name, v.getValues(metric));
      return samples;
    };

    BayesianResult result;
    result.primary = analyzeMetric(data.getPrimaryMetric(), samplesFor(data.getPrimaryMetric()));

    for (const auto& metric : data.getSecondaryMetrics())
      {
        try
          {
            result.secondary.push_back(analyzeMetric(metric, samplesFor(metric)));
          }
        catch (const InsufficientDataException& e)
          {
            result.skippedMetrics.emplace_back(metric, e.what());
          }
      }

    return result;
  }
}
