// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ABTESTING_EXPERIMENT_H
#define __ABTESTING_EXPERIMENT_H 1

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "AssignmentStrategyKind.h"
#include "MetricType.h"
#include "PowerAnalysisCalculator.h"

namespace abtesting
{
  enum class ExperimentStatus
    {
      Active,
      Stopped
    };

  std::string toString(ExperimentStatus status);

  /// Caller-supplied facts about the user at assignment time.
  struct AssignmentContext
  {
    std::optional<std::string> segment;
    std::optional<double> confidence;
    std::optional<double> fileSize;
    std::map<std::string, std::string> attributes;
  };

  using TargetingPredicate = std::function<bool(const std::string& userId, const AssignmentContext& context)>;
  using TargetingRules = std::map<std::string, TargetingPredicate>;

  namespace targeting
  {
    /// Rule key "userSegment": the context segment must equal the given value.
    TargetingPredicate userSegment(const std::string& segment);

    /// Rule key "minConfidence": the context confidence must be present and at least the threshold.
    TargetingPredicate minConfidence(double threshold);

    /// True when every rule accepts the user.
    bool evaluate(const TargetingRules& rules, const std::string& userId, const AssignmentContext& context);
  }

  struct VariantConfig
  {
    std::string name;
    double weight = 1.0;
  };

  class Variant
  {
  public:
    Variant(const std::string& name, double weight, double normalizedWeight)
      : mName(name),
        mWeight(weight),
        mNormalizedWeight(normalizedWeight)
    {}

    const std::string& getName() const
    {
      return mName;
    }

    double getWeight() const
    {
      return mWeight;
    }

    double getNormalizedWeight() const
    {
      return mNormalizedWeight;
    }

  private:
    std::string mName;
    double mWeight;
    double mNormalizedWeight;
  };

  /// Definition submitted to createExperiment.
  struct ExperimentConfig
  {
    std::optional<std::string> id;
    std::string name;
    std::string description;
    std::vector<VariantConfig> variants;
    std::string primaryMetric;
    std::vector<std::string> secondaryMetrics;
    std::string assignmentStrategy = "random";
    TargetingRules targetingRules;
    std::optional<MetricType> primaryMetricType;
    double baselineRate = 0.5;
    double minimumDetectableEffect = 0.05;
    std::optional<double> estimatedStdDev;
    bool shadowMode = false;
  };

  /**
   * @brief Validates a definition.
   * @return One message per problem; empty when the definition is acceptable.
   */
  std::vector<std::string> validateExperimentConfig(const ExperimentConfig& config);

  /**
   * @brief Variants with weights scaled to sum to one, in declaration order.
   * @throws ExperimentValidationException if any weight is not positive
   */
  std::vector<Variant> normalizeVariants(const std::vector<VariantConfig>& variants);

  /**
   * @class Experiment
   * @brief Immutable definition of an experiment plus its lifecycle state.
   *
   * Instances handed to callers are snapshots; the repository owns the live
   * copy and is the only place the status changes.
   */
  class Experiment
  {
  public:
    Experiment(const std::string& id,
               const ExperimentConfig& config,
               std::vector<Variant> variants,
               AssignmentStrategyKind strategy,
               MetricType primaryMetricType,
               const PowerAnalysisResult& powerAnalysis,
               boost::posix_time::ptime createdAt);

    const std::string& getId() const { return mId; }
    const std::string& getName() const { return mName; }
    const std::string& getDescription() const { return mDescription; }
    ExperimentStatus getStatus() const { return mStatus; }
    bool isActive() const { return mStatus == ExperimentStatus::Active; }
    const std::vector<Variant>& getVariants() const { return mVariants; }
    const std::string& getPrimaryMetric() const { return mPrimaryMetric; }
    const std::vector<std::string>& getSecondaryMetrics() const { return mSecondaryMetrics; }
    AssignmentStrategyKind getAssignmentStrategy() const { return mAssignmentStrategy; }
    const TargetingRules& getTargetingRules() const { return mTargetingRules; }
    MetricType getPrimaryMetricType() const { return mPrimaryMetricType; }
    const PowerAnalysisResult& getPowerAnalysis() const { return mPowerAnalysis; }
    bool isShadowMode() const { return mShadowMode; }
    boost::posix_time::ptime getCreatedAt() const { return mCreatedAt; }
    boost::posix_time::ptime getStartedAt() const { return mStartedAt; }
    const std::optional<boost::posix_time::ptime>& getEndedAt() const { return mEndedAt; }
    const std::optional<std::string>& getStopReason() const { return mStopReason; }

    std::size_t getRequiredSampleSize() const
    {
      return mPowerAnalysis.totalSampleSize;
    }

    boost::posix_time::time_duration getMinRunTime() const
    {
      return boost::posix_time::hours(static_cast<long>(24 * mPowerAnalysis.minRunTimeDays));
    }

    /// Primary followed by secondary metric names.
    std::vector<std::string> getAllMetrics() const;

    bool tracksMetric(const std::string& metricName) const;

    std::optional<Variant> findVariant(const std::string& name) const;

    /**
     * @brief Active -> Stopped transition; returns false if already stopped.
     */
    bool markStopped(const std::string& reason, boost::posix_time::ptime endedAt);

  private:
    std::string mId;
    std::string mName;
    std::string mDescription;
    ExperimentStatus mStatus;
    std::vector<Variant> mVariants;
    std::string mPrimaryMetric;
    std::vector<std::string> mSecondaryMetrics;
    AssignmentStrategyKind mAssignmentStrategy;
    TargetingRules mTargetingRules;
    MetricType mPrimaryMetricType;
    PowerAnalysisResult mPowerAnalysis;
    bool mShadowMode;
    boost::posix_time::ptime mCreatedAt;
    boost::posix_time::ptime mStartedAt;
    std::optional<boost::posix_time::ptime> mEndedAt;
    std::optional<std::string> mStopReason;
  };
}

#endif
