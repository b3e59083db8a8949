// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ABTESTING_BAYESIAN_ANALYSIS_ENGINE_H
#define __ABTESTING_BAYESIAN_ANALYSIS_ENGINE_H 1

#include <map>
#include <string>
#include <vector>
#include "AnalysisData.h"
#include "AnalysisResult.h"
#include "RngUtils.h"

namespace abtesting
{
  /**
   * @class BayesianAnalysisEngine
   * @brief Conjugate posterior inference across all variants.
   *
   * Binary metrics use a Beta(1, 1) prior, continuous metrics a Normal prior
   * (mean 0, precision 0.001) updated with the sample mean at precision
   * n / s^2. Probability of being best and expected loss (E[max_j X_j - X_v])
   * are estimated from joint Monte Carlo draws of every variant's posterior.
   */
  class BayesianAnalysisEngine
  {
  public:
    static constexpr std::size_t kMinSimulations = 10000;
    static constexpr double kPriorMean = 0.0;
    static constexpr double kPriorPrecision = 0.001;

    /**
     * @param simulations Monte Carlo draws, raised to kMinSimulations if smaller
     * @param credibleLevel Coverage of the reported credible intervals
     */
    BayesianAnalysisEngine(RandomSource& random, std::size_t simulations, double credibleLevel);

    /**
     * @throws InsufficientDataException if the primary metric cannot be evaluated
     */
    BayesianResult analyze(const AnalysisData& data) const;

    /**
     * @param samples variant -> observations, in the experiment's variant order
     * @throws InsufficientDataException if the metric has no data, or a
     *         continuous metric has fewer than two values in some variant
     */
    BayesianMetricResult analyzeMetric(const std::string& metricName,
                                       const std::vector<std::pair<std::string, std::vector<double>>>& samples) const;

    static PosteriorDistribution betaPosterior(const std::vector<double>& values);
    static PosteriorDistribution normalPosterior(const std::vector<double>& values);

    /**
     * @brief Normal approximation when both Beta parameters exceed 30, otherwise
     *        the posterior mean flagged as degraded.
     */
    CredibleInterval credibleInterval(const PosteriorDistribution& posterior) const;

    std::size_t getSimulations() const
    {
      return mSimulations;
    }

  private:
    void simulate(BayesianMetricResult& result, const std::vector<std::string>& order) const;

  private:
    RandomSource& mRandom;
    std::size_t mSimulations;
    double mCredibleLevel;
  };
}

#endif
