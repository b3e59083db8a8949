// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ABTESTING_ANALYSIS_RESULT_H
#define __ABTESTING_ANALYSIS_RESULT_H 1

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "HypothesisTests.h"
#include "MetricCollectors.h"
#include "MetricType.h"
#include "MultipleTestingCorrection.h"

namespace abtesting
{
  enum class FrequentistTest
    {
      ChiSquare,
      WelchTTest,
      MannWhitneyU
    };

  enum class EffectSizeMeasure
    {
      Phi,
      CohensD,
      RankBiserial
    };

  std::string toString(FrequentistTest test);
  std::string toString(EffectSizeMeasure measure);

  /// (metric name, reason) for metrics an engine could not evaluate
  using SkippedMetrics = std::vector<std::pair<std::string, std::string>>;

  struct MetricTestResult
  {
    std::string metricName;
    FrequentistTest test = FrequentistTest::ChiSquare;
    double statistic = 0.0;
    double pValue = 1.0;
    std::optional<double> adjustedPValue;
    double effectSize = 0.0;
    EffectSizeMeasure effectSizeMeasure = EffectSizeMeasure::Phi;
    ConfidenceInterval confidenceInterval{0.0, 0.0, 0.0};
    std::size_t controlSampleSize = 0;
    std::size_t treatmentSampleSize = 0;
    double controlMean = 0.0;        // the rate for binary metrics
    double treatmentMean = 0.0;
    double difference = 0.0;         // treatment - control
    std::optional<double> relativeDifference;   // absent when the control mean is zero
    std::optional<double> degreesOfFreedom;
    std::optional<double> controlMedian;
    std::optional<double> treatmentMedian;
    bool significant = false;

    /// Adjusted p-value when a correction was applied, otherwise the raw one.
    double getEffectivePValue() const
    {
      return adjustedPValue.value_or(pValue);
    }
  };

  struct SampleRatioMismatchResult
  {
    double statistic = 0.0;
    double pValue = 1.0;
    double degreesOfFreedom = 0.0;
    bool detected = false;
    std::map<std::string, double> observed;
    std::map<std::string, double> expected;
  };

  struct FrequentistResult
  {
    std::string controlVariant;
    std::string treatmentVariant;
    double confidenceLevel = 0.95;
    MetricTestResult primary;
    std::vector<MetricTestResult> secondary;
    SkippedMetrics skippedMetrics;
    MultipleTestingCorrectionMethod correction = MultipleTestingCorrectionMethod::None;
    SampleRatioMismatchResult sampleRatioMismatch;
  };

  struct PosteriorDistribution
  {
    MetricType type = MetricType::Binary;
    double alpha = 0.0;   // Beta posterior
    double beta = 0.0;
    double mu = 0.0;      // Normal posterior mean and precision
    double tau = 0.0;
    double mean = 0.0;
    double variance = 0.0;
    std::size_t sampleSize = 0;
  };

  struct CredibleInterval
  {
    double lower = 0.0;
    double upper = 0.0;
    double level = 0.95;
    bool degraded = false;   // true when only the posterior mean is reported
  };

  struct BayesianMetricResult
  {
    std::string metricName;
    MetricType type = MetricType::Binary;
    std::size_t simulations = 0;
    std::map<std::string, PosteriorDistribution> posteriors;
    std::map<std::string, double> probabilityOfBeingBest;
    std::map<std::string, double> expectedLoss;
    std::map<std::string, CredibleInterval> credibleIntervals;

    /**
     * @brief Variant whose probability of being best reaches the threshold,
     *        for callers that stop early on a Bayesian criterion.
     */
    std::optional<std::string> recommendWinner(double threshold) const;
  };

  struct BayesianResult
  {
    BayesianMetricResult primary;
    std::vector<BayesianMetricResult> secondary;
    SkippedMetrics skippedMetrics;
  };

  struct SequentialCheckpoint
  {
    std::size_t stage = 0;
    double informationFraction = 0.0;
    std::size_t sampleSize = 0;
    double criticalValue = 0.0;
    double nominalAlpha = 0.0;
    double cumulativeAlphaSpent = 0.0;
  };

  struct SequentialDecision
  {
    bool stop = true;
    std::string winningVariant;
    std::size_t stage = 0;
    double testStatistic = 0.0;
    double adjustedPValue = 1.0;
  };

  struct SequentialResult
  {
    std::string method = "obrien-fleming";
    std::size_t numStages = 0;
    double alpha = 0.0;
    std::size_t currentStage = 0;
    std::size_t currentSampleSize = 0;
    std::size_t requiredSampleSize = 0;
    double criticalValue = 0.0;
    double testStatistic = 0.0;
    std::vector<SequentialCheckpoint> checkpoints;
    std::optional<SequentialDecision> decision;   // empty means continue
  };

  enum class AnalysisStatus
    {
      Complete,
      InsufficientData
    };

  std::string toString(AnalysisStatus status);

  /**
   * @brief Immutable snapshot of one analysis run. Later runs supersede it
   *        in the framework cache but never modify it.
   */
  struct AnalysisResult
  {
    std::string experimentId;
    AnalysisStatus status = AnalysisStatus::InsufficientData;
    std::string message;
    boost::posix_time::ptime analyzedAt;
    boost::posix_time::time_duration runtime;
    std::map<std::string, std::size_t> sampleSizes;
    std::optional<FrequentistResult> frequentist;
    std::optional<BayesianResult> bayesian;
    std::optional<SequentialResult> sequential;
    MLMetricsSummary mlMetrics;

    bool isComplete() const
    {
      return status == AnalysisStatus::Complete;
    }
  };
}

#endif
