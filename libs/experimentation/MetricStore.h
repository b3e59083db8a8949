// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ABTESTING_METRIC_STORE_H
#define __ABTESTING_METRIC_STORE_H 1

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/count.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include "MetricEvent.h"

namespace abtesting
{
  /// variant -> metric name -> records in arrival order
  using VariantMetricRecords = std::map<std::string, std::map<std::string, std::vector<MetricRecord>>>;

  /**
   * @class MetricMoments
   * @brief Running count, mean and variance of one metric within one variant.
   *
   * Not synchronized; MetricStore updates it under the experiment lock.
   */
  class MetricMoments
  {
  public:
    void addValue(double value);

    std::size_t getCount() const;

    /// Number of values greater than zero.
    std::size_t getSuccesses() const
    {
      return mSuccesses;
    }

    double getMean() const;

    /// Unbiased sample variance; 0 below two values.
    double getVariance() const;

    /// True when every value seen is 0 or 1.
    bool isBinary() const
    {
      return mBinary;
    }

  private:
    using AccumulatorType = boost::accumulators::accumulator_set<
      double,
      boost::accumulators::stats<
        boost::accumulators::tag::count,
        boost::accumulators::tag::mean,
        boost::accumulators::tag::variance
        >
      >;

    AccumulatorType mAccumulator;
    std::size_t mSuccesses = 0;
    bool mBinary = true;
  };

  /**
   * @class MetricStore
   * @brief Append-only raw metric storage, one lock per experiment.
   */
  class MetricStore
  {
  public:
    MetricStore() = default;
    MetricStore(const MetricStore&) = delete;
    MetricStore& operator=(const MetricStore&) = delete;

    void append(const std::string& experimentId,
                const std::string& variant,
                const std::string& metricName,
                const MetricRecord& record);

    bool hasMetrics(const std::string& experimentId) const;

    /// Copy of every record stored for the experiment.
    VariantMetricRecords snapshot(const std::string& experimentId) const;

    std::size_t getRecordCount(const std::string& experimentId) const;

    /// variant -> running moments of the metric; variants without values are absent.
    std::map<std::string, MetricMoments> getMoments(const std::string& experimentId,
                                                    const std::string& metricName) const;

    /// variant -> distinct users with at least one record.
    std::map<std::string, std::size_t> getUserCounts(const std::string& experimentId) const;

  private:
    struct ExperimentBucket
    {
      mutable std::shared_mutex mutex;
      VariantMetricRecords records;
      std::map<std::string, std::map<std::string, MetricMoments>> moments;
      std::map<std::string, std::set<std::string>> users;
      std::size_t count = 0;
    };

    std::shared_ptr<ExperimentBucket> findBucket(const std::string& experimentId) const;
    std::shared_ptr<ExperimentBucket> findOrCreateBucket(const std::string& experimentId);

    mutable std::mutex mBucketsMutex;
    std::map<std::string, std::shared_ptr<ExperimentBucket>> mBuckets;
  };
}

#endif
