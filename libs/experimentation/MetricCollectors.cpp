// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "MetricCollectors.h"
#include <algorithm>
#include <cmath>
#include "ExperimentExceptions.h"
#include "StatUtils.h"

namespace abtesting
{
  namespace
  {
    using BucketKey = std::pair<std::string, std::string>;

    double requireNumber(const MetricEvent& event, const char* collectorName)
    {
      const double* number = std::get_if<double>(&event.value);
      if (number == nullptr)
        throw InvalidMetricValueException(std::string(collectorName) + ": metric '" + event.metricName +
                                          "' requires a numeric value");
      if (!std::isfinite(*number))
        throw InvalidMetricValueException(std::string(collectorName) + ": metric '" + event.metricName +
                                          "' value is not finite");
      return *number;
    }

    boost::posix_time::ptime eventTime(const MetricEvent& event)
    {
      return event.timestamp.value_or(boost::posix_time::microsec_clock::universal_time());
    }

    double safeRatio(double numerator, double denominator)
    {
      return denominator > 0.0 ? numerator / denominator : 0.0;
    }
  }

  std::string toString(MetricCollectorKind kind)
  {
    switch (kind)
      {
      case MetricCollectorKind::Confidence:
        return "confidence";
      case MetricCollectorKind::Convergence:
        return "convergence";
      case MetricCollectorKind::Accuracy:
        return "accuracy";
      case MetricCollectorKind::Latency:
        return "latency";
      case MetricCollectorKind::Engagement:
        return "engagement";
      }

    throw std::logic_error("toString: unhandled MetricCollectorKind");
  }

  std::optional<MetricCollectorKind> collectorForMetric(const std::string& metricName)
  {
    if (metricName == "confidence")
      return MetricCollectorKind::Confidence;
    if (metricName == "convergence")
      return MetricCollectorKind::Convergence;
    if (metricName == "accuracy")
      return MetricCollectorKind::Accuracy;
    if (metricName == "latency")
      return MetricCollectorKind::Latency;
    if (metricName == "engagement")
      return MetricCollectorKind::Engagement;

    return std::nullopt;
  }

  // --- Confidence ---

  void ConfidenceMetricCollector::collect(const MetricEvent& event, const std::string& variant)
  {
    const double value = requireNumber(event, "ConfidenceMetricCollector");
    if (value < 0.0 || value > 1.0)
      throw InvalidMetricValueException("ConfidenceMetricCollector: confidence must be in [0, 1]");

    const std::size_t bin = std::min<std::size_t>(static_cast<std::size_t>(value / 0.2), 4);

    std::lock_guard<std::mutex> lock(mMutex);
    auto& bucket = mBuckets[BucketKey(event.experimentId, variant)];
    if (!bucket)
      bucket = std::make_shared<Bucket>();

    bucket->moments.addValue(value);
    ++bucket->histogram[bin];
  }

  std::map<std::string, ConfidenceSummary>
  ConfidenceMetricCollector::calculate(const Experiment& experiment) const
  {
    std::map<std::string, ConfidenceSummary> result;

    std::lock_guard<std::mutex> lock(mMutex);
    for (const auto& variant : experiment.getVariants())
      {
        auto it = mBuckets.find(BucketKey(experiment.getId(), variant.getName()));
        if (it == mBuckets.end())
          continue;

        const Bucket& bucket = *it->second;
        ConfidenceSummary summary;
        summary.count = bucket.moments.getCount();
        summary.mean = bucket.moments.getMean().value_or(0.0);
        summary.stdDev = bucket.moments.getStdDev().value_or(0.0);
        summary.min = bucket.moments.getMin().value_or(0.0);
        summary.max = bucket.moments.getMax().value_or(0.0);
        summary.distribution = bucket.histogram;
        result.emplace(variant.getName(), summary);
      }

    return result;
  }

  // --- Convergence ---

  ConvergenceMetricCollector::ConvergenceMetricCollector(std::size_t windowSize, double threshold)
    : mWindowSize(windowSize),
      mThreshold(threshold)
  {
    if (windowSize == 0)
      throw std::invalid_argument("ConvergenceMetricCollector: window size must be positive");
    if (!(threshold > 0.0))
      throw std::invalid_argument("ConvergenceMetricCollector: threshold must be positive");
  }

  void ConvergenceMetricCollector::collect(const MetricEvent& event, const std::string& variant)
  {
    const double value = requireNumber(event, "ConvergenceMetricCollector");

    std::lock_guard<std::mutex> lock(mMutex);
    mValues[BucketKey(event.experimentId, variant)].push_back(value);
  }

  ConvergenceSummary ConvergenceMetricCollector::summarize(const std::vector<double>& values) const
  {
    ConvergenceSummary summary;
    summary.count = values.size();

    if (values.size() < mWindowSize)
      {
        summary.finalValue = StatUtils::computeMean(values);
        return summary;
      }

    std::vector<double> movingAverages;
    movingAverages.reserve(values.size() - mWindowSize + 1);
    double windowSum = 0.0;
    for (std::size_t i = 0; i < values.size(); ++i)
      {
        windowSum += values[i];
        if (i >= mWindowSize)
          windowSum -= values[i - mWindowSize];
        if (i + 1 >= mWindowSize)
          movingAverages.push_back(windowSum / static_cast<double>(mWindowSize));
      }

    summary.finalValue = movingAverages.back();

    const std::size_t recentCount = std::min(kRecentAverages, movingAverages.size());
    const std::vector<double> recent(movingAverages.end() - static_cast<std::ptrdiff_t>(recentCount),
                                     movingAverages.end());
    const double recentStd = StatUtils::computeStdDev(recent);

    summary.stability = std::max(0.0, 1.0 - recentStd);
    summary.converged = recentCount >= kRecentAverages && recentStd < mThreshold;

    // Variance of consecutive chunks of moving averages
    std::vector<double> chunkVariances;
    for (std::size_t start = 0; start + kRecentAverages <= movingAverages.size(); start += kRecentAverages)
      {
        const std::vector<double> chunk(movingAverages.begin() + static_cast<std::ptrdiff_t>(start),
                                        movingAverages.begin() + static_cast<std::ptrdiff_t>(start + kRecentAverages));
        chunkVariances.push_back(StatUtils::computeVariance(chunk));
      }

    if (chunkVariances.size() >= 2 && chunkVariances.front() > 0.0)
      {
        const double rate = (chunkVariances.front() - chunkVariances.back()) / chunkVariances.front();
        summary.convergenceRate = std::clamp(rate, 0.0, 1.0);
      }

    return summary;
  }

  std::map<std::string, ConvergenceSummary>
  ConvergenceMetricCollector::calculate(const Experiment& experiment) const
  {
    std::map<std::string, ConvergenceSummary> result;

    std::lock_guard<std::mutex> lock(mMutex);
    for (const auto& variant : experiment.getVariants())
      {
        auto it = mValues.find(BucketKey(experiment.getId(), variant.getName()));
        if (it == mValues.end())
          continue;

        result.emplace(variant.getName(), summarize(it->second));
      }

    return result;
  }

  // --- Accuracy ---

  void AccuracyMetricCollector::collect(const MetricEvent& event, const std::string& variant)
  {
    const AccuracyObservation* observation = std::get_if<AccuracyObservation>(&event.value);
    if (observation == nullptr)
      throw InvalidMetricValueException("AccuracyMetricCollector: metric '" + event.metricName +
                                        "' requires a predicted/actual pair");

    std::lock_guard<std::mutex> lock(mMutex);
    AccuracySummary& m = mMatrices[BucketKey(event.experimentId, variant)];
    if (observation->predicted && observation->actual)
      ++m.truePositives;
    else if (!observation->predicted && !observation->actual)
      ++m.trueNegatives;
    else if (observation->predicted)
      ++m.falsePositives;
    else
      ++m.falseNegatives;
    ++m.total;
  }

  std::map<std::string, AccuracySummary>
  AccuracyMetricCollector::calculate(const Experiment& experiment) const
  {
    std::map<std::string, AccuracySummary> result;

    std::lock_guard<std::mutex> lock(mMutex);
    for (const auto& variant : experiment.getVariants())
      {
        auto it = mMatrices.find(BucketKey(experiment.getId(), variant.getName()));
        if (it == mMatrices.end())
          continue;

        AccuracySummary m = it->second;
        const double tp = static_cast<double>(m.truePositives);
        const double tn = static_cast<double>(m.trueNegatives);
        const double fp = static_cast<double>(m.falsePositives);
        const double fn = static_cast<double>(m.falseNegatives);

        m.accuracy = safeRatio(tp + tn, static_cast<double>(m.total));
        m.precision = safeRatio(tp, tp + fp);
        m.recall = safeRatio(tp, tp + fn);
        m.f1Score = safeRatio(2.0 * m.precision * m.recall, m.precision + m.recall);
        result.emplace(variant.getName(), m);
      }

    return result;
  }

  // --- Latency ---

  void LatencyMetricCollector::collect(const MetricEvent& event, const std::string& variant)
  {
    const double value = requireNumber(event, "LatencyMetricCollector");
    if (value < 0.0)
      throw InvalidMetricValueException("LatencyMetricCollector: latency must not be negative");

    std::lock_guard<std::mutex> lock(mMutex);
    auto& bucket = mBuckets[BucketKey(event.experimentId, variant)];
    if (!bucket)
      bucket = std::make_shared<Bucket>();

    bucket->moments.addValue(value);
    bucket->values.push_back(value);
  }

  std::map<std::string, LatencySummary>
  LatencyMetricCollector::calculate(const Experiment& experiment) const
  {
    std::map<std::string, LatencySummary> result;

    std::lock_guard<std::mutex> lock(mMutex);
    for (const auto& variant : experiment.getVariants())
      {
        auto it = mBuckets.find(BucketKey(experiment.getId(), variant.getName()));
        if (it == mBuckets.end() || it->second->values.empty())
          continue;

        const Bucket& bucket = *it->second;
        std::vector<double> sorted(bucket.values);
        std::sort(sorted.begin(), sorted.end());

        LatencySummary summary;
        summary.count = bucket.moments.getCount();
        summary.mean = bucket.moments.getMean().value_or(0.0);
        summary.stdDev = bucket.moments.getStdDev().value_or(0.0);
        summary.min = sorted.front();
        summary.max = sorted.back();
        summary.median = StatUtils::computeMedianSorted(sorted);
        summary.p95 = StatUtils::computePercentileSorted(sorted, 0.95);
        summary.p99 = StatUtils::computePercentileSorted(sorted, 0.99);
        result.emplace(variant.getName(), summary);
      }

    return result;
  }

  // --- Engagement ---

  void EngagementMetricCollector::collect(const MetricEvent& event, const std::string& variant)
  {
    auto actionIt = event.metadata.find("action");
    const std::string action = (actionIt != event.metadata.end()) ? actionIt->second : "unknown";
    const boost::posix_time::ptime when = eventTime(event);

    std::lock_guard<std::mutex> lock(mMutex);
    Bucket& bucket = mBuckets[BucketKey(event.experimentId, variant)];

    UserActivity& activity = bucket.users[event.userId];
    if (activity.actions == 0)
      {
        activity.firstAction = when;
        activity.lastAction = when;
      }
    else
      {
        activity.firstAction = std::min(activity.firstAction, when);
        activity.lastAction = std::max(activity.lastAction, when);
      }
    ++activity.actions;
    ++bucket.actionDistribution[action];
  }

  std::map<std::string, EngagementSummary>
  EngagementMetricCollector::calculate(const Experiment& experiment) const
  {
    std::map<std::string, EngagementSummary> result;

    std::lock_guard<std::mutex> lock(mMutex);
    for (const auto& variant : experiment.getVariants())
      {
        auto it = mBuckets.find(BucketKey(experiment.getId(), variant.getName()));
        if (it == mBuckets.end() || it->second.users.empty())
          continue;

        const Bucket& bucket = it->second;
        EngagementSummary summary;
        summary.activeUsers = bucket.users.size();
        summary.actionDistribution = bucket.actionDistribution;

        double totalSessionSeconds = 0.0;
        for (const auto& [userId, activity] : bucket.users)
          {
            summary.totalActions += activity.actions;
            const auto span = activity.lastAction - activity.firstAction;
            totalSessionSeconds += static_cast<double>(span.total_microseconds()) / 1.0e6;
          }

        const double users = static_cast<double>(summary.activeUsers);
        summary.avgActionsPerUser = static_cast<double>(summary.totalActions) / users;
        summary.avgSessionLengthSeconds = totalSessionSeconds / users;
        result.emplace(variant.getName(), summary);
      }

    return result;
  }

  // --- Collector set ---

  MetricCollectorSet::MetricCollectorSet(std::size_t convergenceWindow, double convergenceThreshold)
    : mConfidence(),
      mConvergence(convergenceWindow, convergenceThreshold),
      mAccuracy(),
      mLatency(),
      mEngagement()
  {}

  bool MetricCollectorSet::collect(const MetricEvent& event, const std::string& variant)
  {
    const std::optional<MetricCollectorKind> kind = collectorForMetric(event.metricName);
    if (!kind)
      return false;

    switch (*kind)
      {
      case MetricCollectorKind::Confidence:
        mConfidence.collect(event, variant);
        break;
      case MetricCollectorKind::Convergence:
        mConvergence.collect(event, variant);
        break;
      case MetricCollectorKind::Accuracy:
        mAccuracy.collect(event, variant);
        break;
      case MetricCollectorKind::Latency:
        mLatency.collect(event, variant);
        break;
      case MetricCollectorKind::Engagement:
        mEngagement.collect(event, variant);
        break;
      }

    return true;
  }

  MLMetricsSummary MetricCollectorSet::summarize(const Experiment& experiment) const
  {
    MLMetricsSummary summary;
    summary.confidence = mConfidence.calculate(experiment);
    summary.convergence = mConvergence.calculate(experiment);
    summary.accuracy = mAccuracy.calculate(experiment);
    summary.latency = mLatency.calculate(experiment);
    summary.engagement = mEngagement.calculate(experiment);
    return summary;
  }
}
