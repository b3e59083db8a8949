// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ABTESTING_THREAD_SAFE_ACCUMULATOR_H
#define __ABTESTING_THREAD_SAFE_ACCUMULATOR_H 1

#include <mutex>
#include <optional>
#include <cmath>
#include <cstddef>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/min.hpp>
#include <boost/accumulators/statistics/max.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include <boost/accumulators/statistics/count.hpp>

namespace abtesting
{
  /**
   * @class ThreadSafeAccumulator
   * @brief Mutex-guarded Boost.Accumulators set for streaming metric statistics.
   *
   * Collectors keep one accumulator per (experiment, variant) bucket and
   * update it under their own lock; the framework's timing counters read it
   * from any thread.
   *
   * Statistics provided: count, min, max, mean and the unbiased standard
   * deviation (Boost reports the population variance, rescaled here by
   * n / (n - 1)).
   */
  class ThreadSafeAccumulator
  {
  private:
    using AccumulatorType = boost::accumulators::accumulator_set<
      double,
      boost::accumulators::stats<
        boost::accumulators::tag::min,
        boost::accumulators::tag::max,
        boost::accumulators::tag::mean,
        boost::accumulators::tag::variance,
        boost::accumulators::tag::count
        >
      >;

    mutable std::mutex m_mutex;
    AccumulatorType m_accumulator;

  public:
    void addValue(double value)
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_accumulator(value);
    }

    std::optional<double> getMin() const
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      if (boost::accumulators::count(m_accumulator) == 0)
        return std::nullopt;
      return boost::accumulators::min(m_accumulator);
    }

    std::optional<double> getMax() const
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      if (boost::accumulators::count(m_accumulator) == 0)
        return std::nullopt;
      return boost::accumulators::max(m_accumulator);
    }

    std::optional<double> getMean() const
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      if (boost::accumulators::count(m_accumulator) == 0)
        return std::nullopt;
      return boost::accumulators::mean(m_accumulator);
    }

    /**
     * @brief Unbiased sample standard deviation, or nullopt for fewer than 2 values.
     */
    std::optional<double> getStdDev() const
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      const std::size_t n = boost::accumulators::count(m_accumulator);
      if (n < 2)
        return std::nullopt;

      const double populationVariance = boost::accumulators::variance(m_accumulator);
      const double scale = static_cast<double>(n) / static_cast<double>(n - 1);
      return std::sqrt(populationVariance * scale);
    }

    std::size_t getCount() const
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      return boost::accumulators::count(m_accumulator);
    }

    void clear()
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_accumulator = AccumulatorType{};
    }
  };
}

#endif
