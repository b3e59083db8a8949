// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <mutex>
#include <random>
#include <stdexcept>
#include <type_traits>

namespace abtesting
{
  namespace rng_utils
  {
    // --- Detection: does Rng have .engine()? ---
    template <typename T, typename = void>
    struct has_engine_method : std::false_type {};

    template <typename T>
    struct has_engine_method<T, std::void_t<decltype(std::declval<T&>().engine())>> : std::true_type {};

    // Return a reference to the underlying engine, whether wrapped or direct.
    template <typename Rng>
    inline auto& get_engine(Rng& rng)
    {
      if constexpr (has_engine_method<Rng>::value)
        return rng.engine();
      else
        return rng;
    }

    /**
     * @brief Random index in [0, hiExclusive) without modulo bias.
     *
     * @pre hiExclusive > 0
     */
    template <typename Rng>
    inline std::size_t get_random_index(Rng& rng, std::size_t hiExclusive)
    {
      if (hiExclusive == 0)
        return 0;

      std::uniform_int_distribution<std::size_t> dist(0, hiExclusive - 1);
      return dist(get_engine(rng));
    }

    /**
     * @brief Random double in [0, 1).
     */
    template <typename Rng>
    inline double get_random_uniform_01(Rng& rng)
    {
      std::uniform_real_distribution<double> dist(0.0, 1.0);
      return dist(get_engine(rng));
    }

    template <typename Rng>
    inline double get_random_normal(Rng& rng, double mean, double stdDev)
    {
      std::normal_distribution<double> dist(mean, stdDev);
      return dist(get_engine(rng));
    }

    template <typename Rng>
    inline double get_random_gamma(Rng& rng, double shape)
    {
      std::gamma_distribution<double> dist(shape, 1.0);
      return dist(get_engine(rng));
    }

    /**
     * @brief Beta(a, b) draw as X / (X + Y) with X ~ Gamma(a), Y ~ Gamma(b).
     */
    template <typename Rng>
    inline double get_random_beta(Rng& rng, double a, double b)
    {
      const double x = get_random_gamma(rng, a);
      const double y = get_random_gamma(rng, b);
      const double s = x + y;
      return (s > 0.0) ? (x / s) : 0.5;
    }
  }

  /**
   * @class RandomSource
   * @brief Injectable, seedable source of randomness shared by the assignment
   *        strategies and the Bayesian engine.
   *
   * All draws are serialized by an internal mutex so one instance can be shared
   * across threads. Tests construct it with a fixed seed for reproducibility.
   */
  class RandomSource
  {
  public:
    explicit RandomSource(std::uint64_t seed)
      : mEngine(seed)
    {}

    RandomSource()
      : mEngine(std::random_device{}())
    {}

    RandomSource(const RandomSource&) = delete;
    RandomSource& operator=(const RandomSource&) = delete;

    double uniform01()
    {
      std::lock_guard<std::mutex> lock(mMutex);
      return rng_utils::get_random_uniform_01(mEngine);
    }

    std::size_t index(std::size_t hiExclusive)
    {
      std::lock_guard<std::mutex> lock(mMutex);
      return rng_utils::get_random_index(mEngine, hiExclusive);
    }

    double normal(double mean, double stdDev)
    {
      if (!(stdDev > 0.0))
        throw std::invalid_argument("RandomSource::normal: standard deviation must be positive");

      std::lock_guard<std::mutex> lock(mMutex);
      return rng_utils::get_random_normal(mEngine, mean, stdDev);
    }

    double beta(double a, double b)
    {
      if (!(a > 0.0 && b > 0.0))
        throw std::invalid_argument("RandomSource::beta: shape parameters must be positive");

      std::lock_guard<std::mutex> lock(mMutex);
      return rng_utils::get_random_beta(mEngine, a, b);
    }

    /**
     * @brief Runs fn with exclusive access to the engine, for batched draws.
     */
    template <typename Fn>
    void withEngine(Fn&& fn)
    {
      std::lock_guard<std::mutex> lock(mMutex);
      fn(mEngine);
    }

  private:
    std::mutex mMutex;
    std::mt19937_64 mEngine;
  };
}
