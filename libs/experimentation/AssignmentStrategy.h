// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ABTESTING_ASSIGNMENT_STRATEGY_H
#define __ABTESTING_ASSIGNMENT_STRATEGY_H 1

#include <array>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "AssignmentStrategyKind.h"
#include "Experiment.h"
#include "RngUtils.h"

namespace abtesting
{
  /**
   * @brief Walks the cumulative normalized weights and returns the first
   *        variant whose cumulative weight exceeds u (u in [0, 1)).
   *        Falls back to the last variant when rounding leaves u uncovered.
   */
  const std::string& selectByCumulativeWeight(const std::vector<Variant>& variants, double u);

  /**
   * @brief Platform-independent 32-bit hash: FNV-1a over the bytes followed by
   *        the MurmurHash3 finalizer so that ids differing only in their last
   *        characters still land in unrelated buckets.
   */
  std::uint32_t stableHash32(const std::string& text);

  /**
   * @class AssignmentStrategy
   * @brief Maps (user, experiment, context) to one of the experiment's variant names.
   */
  class AssignmentStrategy
  {
  public:
    virtual ~AssignmentStrategy() = default;

    virtual std::string assign(const std::string& userId,
                               const Experiment& experiment,
                               const AssignmentContext& context) = 0;

    virtual AssignmentStrategyKind getKind() const = 0;
  };

  /// Weighted sampling from the injected random source.
  class RandomAssignmentStrategy : public AssignmentStrategy
  {
  public:
    explicit RandomAssignmentStrategy(RandomSource& random)
      : mRandom(random)
    {}

    std::string assign(const std::string& userId,
                       const Experiment& experiment,
                       const AssignmentContext& context) override;

    AssignmentStrategyKind getKind() const override
    {
      return AssignmentStrategyKind::Random;
    }

  private:
    RandomSource& mRandom;
  };

  /**
   * @brief hash(userId + experimentId) % 100 mapped onto the cumulative
   *        weight buckets. Reproducible without stored state.
   */
  class DeterministicAssignmentStrategy : public AssignmentStrategy
  {
  public:
    std::string assign(const std::string& userId,
                       const Experiment& experiment,
                       const AssignmentContext& context) override;

    AssignmentStrategyKind getKind() const override
    {
      return AssignmentStrategyKind::Deterministic;
    }

    static std::string assignByKey(const std::string& key, const Experiment& experiment);
  };

  /**
   * @brief Deterministic assignment salted by the stratum (context segment, or
   *        "default"), so each stratum gets its own independent weighted split.
   *        Per-stratum allocation counts are kept for balance diagnostics.
   */
  class StratifiedAssignmentStrategy : public AssignmentStrategy
  {
  public:
    using StratumCounts = std::map<std::string, std::map<std::string, std::size_t>>;

    std::string assign(const std::string& userId,
                       const Experiment& experiment,
                       const AssignmentContext& context) override;

    AssignmentStrategyKind getKind() const override
    {
      return AssignmentStrategyKind::Stratified;
    }

    static std::string getStratum(const AssignmentContext& context);

    /// stratum -> variant -> users assigned
    StratumCounts getStratumCounts(const std::string& experimentId) const;

  private:
    mutable std::mutex mMutex;
    std::map<std::string, StratumCounts> mCounts;
  };

  struct BanditArmState
  {
    std::size_t pulls = 0;
    std::size_t rewardCount = 0;
    double cumulativeReward = 0.0;

    double getAverageReward() const
    {
      return rewardCount == 0 ? 0.0 : cumulativeReward / static_cast<double>(rewardCount);
    }
  };

  /**
   * @brief Epsilon-greedy bandit: explore uniformly with probability epsilon,
   *        otherwise pick the arm with the highest average reward (first
   *        declared variant on ties).
   */
  class MultiArmedBanditStrategy : public AssignmentStrategy
  {
  public:
    MultiArmedBanditStrategy(RandomSource& random, double epsilon);

    std::string assign(const std::string& userId,
                       const Experiment& experiment,
                       const AssignmentContext& context) override;

    AssignmentStrategyKind getKind() const override
    {
      return AssignmentStrategyKind::MultiArmedBandit;
    }

    void updateReward(const std::string& experimentId, const std::string& variant, double reward);

    std::map<std::string, BanditArmState> getArmStates(const std::string& experimentId) const;

    double getEpsilon() const
    {
      return mEpsilon;
    }

  private:
    RandomSource& mRandom;
    double mEpsilon;
    mutable std::mutex mMutex;
    std::map<std::string, std::map<std::string, BanditArmState>> mArms;
  };

  /**
   * @brief Linear contextual bandit over the features
   *        [confidence, log(file size), is power user], with uniform exploration.
   */
  class ContextualBanditStrategy : public AssignmentStrategy
  {
  public:
    static constexpr std::size_t kNumFeatures = 3;
    using FeatureVector = std::array<double, kNumFeatures>;

    ContextualBanditStrategy(RandomSource& random, double explorationRate, double learningRate);

    std::string assign(const std::string& userId,
                       const Experiment& experiment,
                       const AssignmentContext& context) override;

    AssignmentStrategyKind getKind() const override
    {
      return AssignmentStrategyKind::ContextualBandit;
    }

    static FeatureVector extractFeatures(const AssignmentContext& context);

    /// weight += learningRate * reward * feature
    void updateModel(const std::string& experimentId,
                     const std::string& variant,
                     const AssignmentContext& context,
                     double reward);

    FeatureVector getWeights(const std::string& experimentId, const std::string& variant) const;

  private:
    RandomSource& mRandom;
    double mExplorationRate;
    double mLearningRate;
    mutable std::mutex mMutex;
    std::map<std::string, std::map<std::string, FeatureVector>> mWeights;
  };

  /**
   * @class AssignmentStrategySet
   * @brief One instance of every strategy kind, dispatched by AssignmentStrategyKind.
   */
  class AssignmentStrategySet
  {
  public:
    AssignmentStrategySet(RandomSource& random,
                          double banditEpsilon,
                          double contextualExplorationRate,
                          double contextualLearningRate);

    AssignmentStrategy& get(AssignmentStrategyKind kind);

    std::string assign(AssignmentStrategyKind kind,
                       const std::string& userId,
                       const Experiment& experiment,
                       const AssignmentContext& context);

    MultiArmedBanditStrategy& getMultiArmedBandit()
    {
      return mMultiArmedBandit;
    }

    ContextualBanditStrategy& getContextualBandit()
    {
      return mContextualBandit;
    }

    StratifiedAssignmentStrategy& getStratified()
    {
      return mStratified;
    }

  private:
    RandomAssignmentStrategy mRandom;
    DeterministicAssignmentStrategy mDeterministic;
    StratifiedAssignmentStrategy mStratified;
    MultiArmedBanditStrategy mMultiArmedBandit;
    ContextualBanditStrategy mContextualBandit;
  };
}

#endif
