// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "Experiment.h"
#include <algorithm>
#include <cmath>
#include <set>
#include "ExperimentExceptions.h"

namespace abtesting
{
  std::string toString(ExperimentStatus status)
  {
    switch (status)
      {
      case ExperimentStatus::Active:
        return "active";
      case ExperimentStatus::Stopped:
        return "stopped";
      }

    throw std::logic_error("toString: unhandled ExperimentStatus");
  }

  namespace targeting
  {
    TargetingPredicate userSegment(const std::string& segment)
    {
      return [segment](const std::string&, const AssignmentContext& context) {
        return context.segment.has_value() && *context.segment == segment;
      };
    }

    TargetingPredicate minConfidence(double threshold)
    {
      return [threshold](const std::string&, const AssignmentContext& context) {
        return context.confidence.has_value() && *context.confidence >= threshold;
      };
    }

    bool evaluate(const TargetingRules& rules, const std::string& userId, const AssignmentContext& context)
    {
      for (const auto& [key, predicate] : rules)
        {
          if (!predicate || !predicate(userId, context))
            return false;
        }

      return true;
    }
  }

  std::vector<std::string> validateExperimentConfig(const ExperimentConfig& config)
  {
    std::vector<std::string> errors;

    if (config.name.empty())
      errors.push_back("Experiment name is required");

    if (config.variants.size() < 2)
      errors.push_back("Experiment must have at least 2 variants");

    std::set<std::string> names;
    for (const auto& variant : config.variants)
      {
        if (variant.name.empty())
          errors.push_back("Each variant must have a name");
        else if (!names.insert(variant.name).second)
          errors.push_back("Duplicate variant name: " + variant.name);

        if (!(variant.weight > 0.0) || !std::isfinite(variant.weight))
          errors.push_back("Variant '" + variant.name + "' must have a positive weight");
      }

    if (config.primaryMetric.empty())
      errors.push_back("Primary metric is required");

    if (config.id.has_value() && config.id->empty())
      errors.push_back("Explicit experiment id must not be empty");

    return errors;
  }

  std::vector<Variant> normalizeVariants(const std::vector<VariantConfig>& variants)
  {
    double total = 0.0;
    for (const auto& v : variants)
      {
        if (!(v.weight > 0.0))
          throw ExperimentValidationException("Variant '" + v.name + "' must have a positive weight");
        total += v.weight;
      }

    std::vector<Variant> normalized;
    normalized.reserve(variants.size());
    for (const auto& v : variants)
      normalized.emplace_back(v.name, v.weight, v.weight / total);

    return normalized;
  }

  Experiment::Experiment(const std::string& id,
                         const ExperimentConfig& config,
                         std::vector<Variant> variants,
                         AssignmentStrategyKind strategy,
                         MetricType primaryMetricType,
                         const PowerAnalysisResult& powerAnalysis,
                         boost::posix_time::ptime createdAt)
    : mId(id),
      mName(config.name),
      mDescription(config.description),
      mStatus(ExperimentStatus::Active),
      mVariants(std::move(variants)),
      mPrimaryMetric(config.primaryMetric),
      mSecondaryMetrics(config.secondaryMetrics),
      mAssignmentStrategy(strategy),
      mTargetingRules(config.targetingRules),
      mPrimaryMetricType(primaryMetricType),
      mPowerAnalysis(powerAnalysis),
      mShadowMode(config.shadowMode),
      mCreatedAt(createdAt),
      mStartedAt(createdAt),
      mEndedAt(),
      mStopReason()
  {}

  std::vector<std::string> Experiment::getAllMetrics() const
  {
    std::vector<std::string> metrics;
    metrics.reserve(1 + mSecondaryMetrics.size());
    metrics.push_back(mPrimaryMetric);
    metrics.insert(metrics.end(), mSecondaryMetrics.begin(), mSecondaryMetrics.end());
    return metrics;
  }

  bool Experiment::tracksMetric(const std::string& metricName) const
  {
    return mPrimaryMetric == metricName ||
      std::find(mSecondaryMetrics.begin(), mSecondaryMetrics.end(), metricName) != mSecondaryMetrics.end();
  }

  std::optional<Variant> Experiment::findVariant(const std::string& name) const
  {
    for (const auto& v : mVariants)
      if (v.getName() == name)
        return v;

    return std::nullopt;
  }

  bool Experiment::markStopped(const std::string& reason, boost::posix_time::ptime endedAt)
  {
    if (mStatus != ExperimentStatus::Active)
      return false;

    mStatus = ExperimentStatus::Stopped;
    mStopReason = reason;
    mEndedAt = endedAt;
    return true;
  }
}
