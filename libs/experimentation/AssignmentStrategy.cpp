// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "AssignmentStrategy.h"
#include <cmath>
#include <limits>
#include <stdexcept>
#include "ExperimentExceptions.h"

namespace abtesting
{
  const std::string& selectByCumulativeWeight(const std::vector<Variant>& variants, double u)
  {
    if (variants.empty())
      throw std::invalid_argument("selectByCumulativeWeight: experiment has no variants");

    double cumulative = 0.0;
    for (const auto& variant : variants)
      {
        cumulative += variant.getNormalizedWeight();
        if (u < cumulative)
          return variant.getName();
      }

    return variants.back().getName();
  }

  std::uint32_t stableHash32(const std::string& text)
  {
    std::uint32_t h = 2166136261u;
    for (unsigned char c : text)
      {
        h ^= c;
        h *= 16777619u;
      }

    h ^= h >> 16;
    h *= 0x85ebca6bu;
    h ^= h >> 13;
    h *= 0xc2b2ae35u;
    h ^= h >> 16;
    return h;
  }

  // --- Random ---

  std::string RandomAssignmentStrategy::assign(const std::string&,
                                               const Experiment& experiment,
                                               const AssignmentContext&)
  {
    return selectByCumulativeWeight(experiment.getVariants(), mRandom.uniform01());
  }

  // --- Deterministic ---

  std::string DeterministicAssignmentStrategy::assignByKey(const std::string& key,
                                                           const Experiment& experiment)
  {
    const std::uint32_t bucket = stableHash32(key) % 100u;
    return selectByCumulativeWeight(experiment.getVariants(), static_cast<double>(bucket) / 100.0);
  }

  std::string DeterministicAssignmentStrategy::assign(const std::string& userId,
                                                      const Experiment& experiment,
                                                      const AssignmentContext&)
  {
    return assignByKey(userId + experiment.getId(), experiment);
  }

  // --- Stratified ---

  std::string StratifiedAssignmentStrategy::getStratum(const AssignmentContext& context)
  {
    if (context.segment.has_value() && !context.segment->empty())
      return *context.segment;

    return "default";
  }

  std::string StratifiedAssignmentStrategy::assign(const std::string& userId,
                                                   const Experiment& experiment,
                                                   const AssignmentContext& context)
  {
    const std::string stratum = getStratum(context);
    std::string variant =
      DeterministicAssignmentStrategy::assignByKey(userId + experiment.getId() + "#" + stratum, experiment);

    std::lock_guard<std::mutex> lock(mMutex);
    ++mCounts[experiment.getId()][stratum][variant];
    return variant;
  }

  StratifiedAssignmentStrategy::StratumCounts
  StratifiedAssignmentStrategy::getStratumCounts(const std::string& experimentId) const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    auto it = mCounts.find(experimentId);
    if (it == mCounts.end())
      return {};

    return it->second;
  }

  // --- Multi-armed bandit ---

  MultiArmedBanditStrategy::MultiArmedBanditStrategy(RandomSource& random, double epsilon)
    : mRandom(random),
      mEpsilon(epsilon)
  {
    if (epsilon < 0.0 || epsilon > 1.0)
      throw std::invalid_argument("MultiArmedBanditStrategy: epsilon must be in [0, 1]");
  }

  std::string MultiArmedBanditStrategy::assign(const std::string&,
                                               const Experiment& experiment,
                                               const AssignmentContext&)
  {
    const auto& variants = experiment.getVariants();
    if (variants.empty())
      throw std::invalid_argument("MultiArmedBanditStrategy: experiment has no variants");

    const bool explore = mRandom.uniform01() < mEpsilon;
    const std::size_t exploreIndex = explore ? mRandom.index(variants.size()) : 0;

    std::lock_guard<std::mutex> lock(mMutex);
    auto& arms = mArms[experiment.getId()];
    for (const auto& v : variants)
      arms[v.getName()];

    std::string chosen;
    if (explore)
      chosen = variants[exploreIndex].getName();
    else
      {
        double best = -std::numeric_limits<double>::infinity();
        for (const auto& v : variants)
          {
            const double avg = arms[v.getName()].getAverageReward();
            if (avg > best)
              {
                best = avg;
                chosen = v.getName();
              }
          }
      }

    ++arms[chosen].pulls;
    return chosen;
  }

  void MultiArmedBanditStrategy::updateReward(const std::string& experimentId,
                                              const std::string& variant,
                                              double reward)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    auto& arm = mArms[experimentId][variant];
    arm.cumulativeReward += reward;
    ++arm.rewardCount;
  }

  std::map<std::string, BanditArmState>
  MultiArmedBanditStrategy::getArmStates(const std::string& experimentId) const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    auto it = mArms.find(experimentId);
    if (it == mArms.end())
      return {};

    return it->second;
  }

  // --- Contextual bandit ---

  ContextualBanditStrategy::ContextualBanditStrategy(RandomSource& random,
                                                     double explorationRate,
                                                     double learningRate)
    : mRandom(random),
      mExplorationRate(explorationRate),
      mLearningRate(learningRate)
  {
    if (explorationRate < 0.0 || explorationRate > 1.0)
      throw std::invalid_argument("ContextualBanditStrategy: exploration rate must be in [0, 1]");
    if (!(learningRate > 0.0))
      throw std::invalid_argument("ContextualBanditStrategy: learning rate must be positive");
  }

  ContextualBanditStrategy::FeatureVector
  ContextualBanditStrategy::extractFeatures(const AssignmentContext& context)
  {
    const double fileSize = context.fileSize.value_or(1.0);

    return FeatureVector{
      context.confidence.value_or(0.0),
      fileSize > 0.0 ? std::log(fileSize) : 0.0,
      (context.segment.has_value() && *context.segment == "power_user") ? 1.0 : 0.0
    };
  }

  std::string ContextualBanditStrategy::assign(const std::string&,
                                               const Experiment& experiment,
                                               const AssignmentContext& context)
  {
    const auto& variants = experiment.getVariants();
    if (variants.empty())
      throw std::invalid_argument("ContextualBanditStrategy: experiment has no variants");

    if (mRandom.uniform01() < mExplorationRate)
      return variants[mRandom.index(variants.size())].getName();

    const FeatureVector features = extractFeatures(context);

    std::lock_guard<std::mutex> lock(mMutex);
    auto& weights = mWeights[experiment.getId()];

    std::string chosen;
    double bestScore = -std::numeric_limits<double>::infinity();
    for (const auto& v : variants)
      {
        const FeatureVector& w = weights[v.getName()];
        double score = 0.0;
        for (std::size_t i = 0; i < kNumFeatures; ++i)
          score += w[i] * features[i];

        if (score > bestScore)
          {
            bestScore = score;
            chosen = v.getName();
          }
      }

    return chosen;
  }

  void ContextualBanditStrategy::updateModel(const std::string& experimentId,
                                             const std::string& variant,
                                             const AssignmentContext& context,
                                             double reward)
  {
    const FeatureVector features = extractFeatures(context);

    std::lock_guard<std::mutex> lock(mMutex);
    FeatureVector& w = mWeights[experimentId][variant];
    for (std::size_t i = 0; i < kNumFeatures; ++i)
      w[i] += mLearningRate * reward * features[i];
  }

  ContextualBanditStrategy::FeatureVector
  ContextualBanditStrategy::getWeights(const std::string& experimentId, const std::string& variant) const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    auto expIt = mWeights.find(experimentId);
    if (expIt == mWeights.end())
      return FeatureVector{};

    auto it = expIt->second.find(variant);
    if (it == expIt->second.end())
      return FeatureVector{};

    return it->second;
  }

  // --- Strategy set ---

  AssignmentStrategySet::AssignmentStrategySet(RandomSource& random,
                                               double banditEpsilon,
                                               double contextualExplorationRate,
                                               double contextualLearningRate)
    : mRandom(random),
      mDeterministic(),
      mStratified(),
      mMultiArmedBandit(random, banditEpsilon),
      mContextualBandit(random, contextualExplorationRate, contextualLearningRate)
  {}

  AssignmentStrategy& AssignmentStrategySet::get(AssignmentStrategyKind kind)
  {
    switch (kind)
      {
      case AssignmentStrategyKind::Random:
        return mRandom;
      case AssignmentStrategyKind::Deterministic:
        return mDeterministic;
      case AssignmentStrategyKind::Stratified:
        return mStratified;
      case AssignmentStrategyKind::MultiArmedBandit:
        return mMultiArmedBandit;
      case AssignmentStrategyKind::ContextualBandit:
        return mContextualBandit;
      }

    throw UnknownAssignmentStrategyException("Unhandled assignment strategy kind");
  }

  std::string AssignmentStrategySet::assign(AssignmentStrategyKind kind,
                                            const std::string& userId,
                                            const Experiment& experiment,
                                            const AssignmentContext& context)
  {
    return get(kind).assign(userId, experiment, context);
  }
}
