// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "MetricStore.h"

namespace abtesting
{
  void MetricMoments::addValue(double value)
  {
    mAccumulator(value);
    if (value > 0.0)
      ++mSuccesses;
    if (value != 0.0 && value != 1.0)
      mBinary = false;
  }

  std::size_t MetricMoments::getCount() const
  {
    return boost::accumulators::count(mAccumulator);
  }

  double MetricMoments::getMean() const
  {
    if (getCount() == 0)
      return 0.0;
    return boost::accumulators::mean(mAccumulator);
  }

  double MetricMoments::getVariance() const
  {
    const std::size_t n = getCount();
    if (n < 2)
      return 0.0;

    const double populationVariance = boost::accumulators::variance(mAccumulator);
    return populationVariance * static_cast<double>(n) / static_cast<double>(n - 1);
  }

  std::shared_ptr<MetricStore::ExperimentBucket>
  MetricStore::findBucket(const std::string& experimentId) const
  {
    std::lock_guard<std::mutex> lock(mBucketsMutex);
    auto it = mBuckets.find(experimentId);
    if (it == mBuckets.end())
      return nullptr;

    return it->second;
  }

  std::shared_ptr<MetricStore::ExperimentBucket>
  MetricStore::findOrCreateBucket(const std::string& experimentId)
  {
    std::lock_guard<std::mutex> lock(mBucketsMutex);
    auto& bucket = mBuckets[experimentId];
    if (!bucket)
      bucket = std::make_shared<ExperimentBucket>();

    return bucket;
  }

  void MetricStore::append(const std::string& experimentId,
                           const std::string& variant,
                           const std::string& metricName,
                           const MetricRecord& record)
  {
    auto bucket = findOrCreateBucket(experimentId);

    std::unique_lock<std::shared_mutex> lock(bucket->mutex);
    bucket->records[variant][metricName].push_back(record);
    bucket->moments[variant][metricName].addValue(toAnalysisValue(record.value));
    bucket->users[variant].insert(record.userId);
    ++bucket->count;
  }

  bool MetricStore::hasMetrics(const std::string& experimentId) const
  {
    return getRecordCount(experimentId) > 0;
  }

  VariantMetricRecords MetricStore::snapshot(const std::string& experimentId) const
  {
    auto bucket = findBucket(experimentId);
    if (!bucket)
      return {};

    std::shared_lock<std::shared_mutex> lock(bucket->mutex);
    return bucket->records;
  }

  std::size_t MetricStore::getRecordCount(const std::string& experimentId) const
  {
    auto bucket = findBucket(experimentId);
    if (!bucket)
      return 0;

    std::shared_lock<std::shared_mutex> lock(bucket->mutex);
    return bucket->count;
  }

  std::map<std::string, MetricMoments> MetricStore::getMoments(const std::string& experimentId,
                                                               const std::string& metricName) const
  {
    std::map<std::string, MetricMoments> result;
    auto bucket = findBucket(experimentId);
    if (!bucket)
      return result;

    std::shared_lock<std::shared_mutex> lock(bucket->mutex);
    for (const auto& [variant, metrics] : bucket->moments)
      {
        auto it = metrics.find(metricName);
        if (it != metrics.end())
          result.emplace(variant, it->second);
      }
    return result;
  }

  std::map<std::string, std::size_t> MetricStore::getUserCounts(const std::string& experimentId) const
  {
    std::map<std::string, std::size_t> result;
    auto bucket = findBucket(experimentId);
    if (!bucket)
      return result;

    std::shared_lock<std::shared_mutex> lock(bucket->mutex);
    for (const auto& [variant, users] : bucket->users)
      result[variant] = users.size();
    return result;
  }
}
