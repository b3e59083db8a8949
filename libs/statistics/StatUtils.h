// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ABTESTING_STAT_UTILS_H
#define __ABTESTING_STAT_UTILS_H 1

#include <vector>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <utility>

namespace abtesting
{
  /**
   * @brief Descriptive statistics over samples of doubles.
   *
   * All variance-type quantities use the unbiased (n - 1) denominator and a
   * single-pass Welford update.
   */
  struct StatUtils
  {
    static inline double computeMean(const std::vector<double>& data)
    {
      if (data.empty())
        return 0.0;

      double mean = 0.0;
      std::size_t k = 0;
      for (double x : data)
        {
          ++k;
          mean += (x - mean) / static_cast<double>(k);
        }

      return mean;
    }

    /**
     * @brief Mean and unbiased sample variance in one pass (Welford).
     * @return {mean, variance}; variance is 0 for fewer than two samples.
     */
    static inline std::pair<double, double> computeMeanAndVariance(const std::vector<double>& data)
    {
      double mean = 0.0;
      double m2 = 0.0;
      std::size_t k = 0;

      for (double x : data)
        {
          ++k;
          const double delta = x - mean;
          mean += delta / static_cast<double>(k);
          m2 += delta * (x - mean);
        }

      const double var = (k > 1) ? (m2 / static_cast<double>(k - 1)) : 0.0;
      return { mean, var };
    }

    static inline double computeVariance(const std::vector<double>& data)
    {
      return computeMeanAndVariance(data).second;
    }

    static inline double computeStdDev(const std::vector<double>& data)
    {
      return std::sqrt(computeVariance(data));
    }

    static inline double computeMedian(std::vector<double> data)
    {
      if (data.empty())
        return 0.0;

      std::sort(data.begin(), data.end());
      return computeMedianSorted(data);
    }

    static inline double computeMedianSorted(const std::vector<double>& sortedData)
    {
      if (sortedData.empty())
        return 0.0;

      const std::size_t n = sortedData.size();
      if (n % 2 == 0)
        return (sortedData[n / 2 - 1] + sortedData[n / 2]) / 2.0;

      return sortedData[n / 2];
    }

    /**
     * @brief Nearest-rank percentile of sorted data, index floor(q * n) clamped to n - 1.
     * @param q Fraction in [0, 1], e.g. 0.95
     */
    static inline double computePercentileSorted(const std::vector<double>& sortedData, double q)
    {
      if (sortedData.empty())
        throw std::invalid_argument("computePercentileSorted: empty sample");
      if (q < 0.0 || q > 1.0)
        throw std::invalid_argument("computePercentileSorted: q must be in [0, 1]");

      std::size_t idx = static_cast<std::size_t>(std::floor(q * static_cast<double>(sortedData.size())));
      if (idx >= sortedData.size())
        idx = sortedData.size() - 1;

      return sortedData[idx];
    }

    /**
     * @brief Sample skewness g1 (moment estimator). Returns 0 for degenerate samples.
     */
    static inline double computeSkewness(const std::vector<double>& data)
    {
      if (data.size() < 3)
        return 0.0;

      const double mean = computeMean(data);
      double m2 = 0.0, m3 = 0.0;
      for (double x : data)
        {
          const double d = x - mean;
          m2 += d * d;
          m3 += d * d * d;
        }

      const double n = static_cast<double>(data.size());
      m2 /= n;
      m3 /= n;
      if (m2 <= 0.0)
        return 0.0;

      return m3 / std::pow(m2, 1.5);
    }

    /**
     * @brief Sample excess kurtosis g2 (moment estimator). Returns 0 for degenerate samples.
     */
    static inline double computeExcessKurtosis(const std::vector<double>& data)
    {
      if (data.size() < 4)
        return 0.0;

      const double mean = computeMean(data);
      double m2 = 0.0, m4 = 0.0;
      for (double x : data)
        {
          const double d2 = (x - mean) * (x - mean);
          m2 += d2;
          m4 += d2 * d2;
        }

      const double n = static_cast<double>(data.size());
      m2 /= n;
      m4 /= n;
      if (m2 <= 0.0)
        return 0.0;

      return m4 / (m2 * m2) - 3.0;
    }
  };
}

#endif
