// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ABTESTING_METRIC_COLLECTORS_H
#define __ABTESTING_METRIC_COLLECTORS_H 1

#include <array>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "Experiment.h"
#include "MetricEvent.h"
#include "ThreadSafeAccumulator.h"

namespace abtesting
{
  enum class MetricCollectorKind
    {
      Confidence,
      Convergence,
      Accuracy,
      Latency,
      Engagement
    };

  std::string toString(MetricCollectorKind kind);

  /// Collector responsible for a metric name, if any.
  std::optional<MetricCollectorKind> collectorForMetric(const std::string& metricName);

  struct ConfidenceSummary
  {
    std::size_t count = 0;
    double mean = 0.0;
    double stdDev = 0.0;
    double min = 0.0;
    double max = 0.0;
    std::array<std::size_t, 5> distribution{};   // [0,.2) [.2,.4) [.4,.6) [.6,.8) [.8,1]
  };

  struct ConvergenceSummary
  {
    std::size_t count = 0;
    bool converged = false;
    double convergenceRate = 0.0;   // relative variance decay of the moving average, in [0, 1]
    double stability = 0.0;         // 1 - recent moving-average std, floored at 0
    double finalValue = 0.0;        // last moving average, or the sample mean before the first window fills
  };

  struct AccuracySummary
  {
    std::size_t truePositives = 0;
    std::size_t trueNegatives = 0;
    std::size_t falsePositives = 0;
    std::size_t falseNegatives = 0;
    std::size_t total = 0;
    double accuracy = 0.0;
    double precision = 0.0;
    double recall = 0.0;
    double f1Score = 0.0;
  };

  struct LatencySummary
  {
    std::size_t count = 0;
    double mean = 0.0;
    double stdDev = 0.0;
    double median = 0.0;
    double p95 = 0.0;
    double p99 = 0.0;
    double min = 0.0;
    double max = 0.0;
  };

  struct EngagementSummary
  {
    std::size_t activeUsers = 0;
    std::size_t totalActions = 0;
    double avgActionsPerUser = 0.0;
    double avgSessionLengthSeconds = 0.0;
    std::map<std::string, std::size_t> actionDistribution;
  };

  /// variant -> summary, for variants that received data
  struct MLMetricsSummary
  {
    std::map<std::string, ConfidenceSummary> confidence;
    std::map<std::string, ConvergenceSummary> convergence;
    std::map<std::string, AccuracySummary> accuracy;
    std::map<std::string, LatencySummary> latency;
    std::map<std::string, EngagementSummary> engagement;
  };

  /**
   * @class ConfidenceMetricCollector
   * @brief Model confidence scores in [0, 1]: running moments plus a 5-bin histogram.
   */
  class ConfidenceMetricCollector
  {
  public:
    /**
     * @throws InvalidMetricValueException unless the value is a number in [0, 1]
     */
    void collect(const MetricEvent& event, const std::string& variant);

    std::map<std::string, ConfidenceSummary> calculate(const Experiment& experiment) const;

  private:
    struct Bucket
    {
      ThreadSafeAccumulator moments;
      std::array<std::size_t, 5> histogram{};
    };

    mutable std::mutex mMutex;
    std::map<std::pair<std::string, std::string>, std::shared_ptr<Bucket>> mBuckets;
  };

  /**
   * @class ConvergenceMetricCollector
   * @brief Moving average over a fixed window; converged when the standard
   *        deviation of the last ten moving averages falls below the threshold.
   */
  class ConvergenceMetricCollector
  {
  public:
    static constexpr std::size_t kRecentAverages = 10;

    ConvergenceMetricCollector(std::size_t windowSize, double threshold);

    void collect(const MetricEvent& event, const std::string& variant);

    std::map<std::string, ConvergenceSummary> calculate(const Experiment& experiment) const;

    ConvergenceSummary summarize(const std::vector<double>& values) const;

  private:
    std::size_t mWindowSize;
    double mThreshold;
    mutable std::mutex mMutex;
    std::map<std::pair<std::string, std::string>, std::vector<double>> mValues;
  };

  /**
   * @class AccuracyMetricCollector
   * @brief Confusion matrix of predicted/actual pairs with precision, recall and F1.
   */
  class AccuracyMetricCollector
  {
  public:
    /**
     * @throws InvalidMetricValueException unless the value is an AccuracyObservation
     */
    void collect(const MetricEvent& event, const std::string& variant);

    std::map<std::string, AccuracySummary> calculate(const Experiment& experiment) const;

  private:
    mutable std::mutex mMutex;
    std::map<std::pair<std::string, std::string>, AccuracySummary> mMatrices;
  };

  /**
   * @class LatencyMetricCollector
   * @brief Response times: moments plus median, p95 and p99 (nearest rank).
   */
  class LatencyMetricCollector
  {
  public:
    void collect(const MetricEvent& event, const std::string& variant);

    std::map<std::string, LatencySummary> calculate(const Experiment& experiment) const;

  private:
    struct Bucket
    {
      ThreadSafeAccumulator moments;
      std::vector<double> values;
    };

    mutable std::mutex mMutex;
    std::map<std::pair<std::string, std::string>, std::shared_ptr<Bucket>> mBuckets;
  };

  /**
   * @class EngagementMetricCollector
   * @brief Per-user action counts and session spans (first to last action).
   *        The action name is read from the "action" metadata entry.
   */
  class EngagementMetricCollector
  {
  public:
    void collect(const MetricEvent& event, const std::string& variant);

    std::map<std::string, EngagementSummary> calculate(const Experiment& experiment) const;

  private:
    struct UserActivity
    {
      std::size_t actions = 0;
      boost::posix_time::ptime firstAction;
      boost::posix_time::ptime lastAction;
    };

    struct Bucket
    {
      std::map<std::string, UserActivity> users;
      std::map<std::string, std::size_t> actionDistribution;
    };

    mutable std::mutex mMutex;
    std::map<std::pair<std::string, std::string>, Bucket> mBuckets;
  };

  /**
   * @class MetricCollectorSet
   * @brief Owns one collector of each kind and routes events by metric name.
   */
  class MetricCollectorSet
  {
  public:
    MetricCollectorSet(std::size_t convergenceWindow, double convergenceThreshold);

    /**
     * @return false if no collector handles the event's metric name
     * @throws InvalidMetricValueException from the target collector
     */
    bool collect(const MetricEvent& event, const std::string& variant);

    MLMetricsSummary summarize(const Experiment& experiment) const;

    const ConfidenceMetricCollector& getConfidenceCollector() const { return mConfidence; }
    const ConvergenceMetricCollector& getConvergenceCollector() const { return mConvergence; }
    const AccuracyMetricCollector& getAccuracyCollector() const { return mAccuracy; }
    const LatencyMetricCollector& getLatencyCollector() const { return mLatency; }
    const EngagementMetricCollector& getEngagementCollector() const { return mEngagement; }

  private:
    ConfidenceMetricCollector mConfidence;
    ConvergenceMetricCollector mConvergence;
    AccuracyMetricCollector mAccuracy;
    LatencyMetricCollector mLatency;
    EngagementMetricCollector mEngagement;
  };
}

#endif
