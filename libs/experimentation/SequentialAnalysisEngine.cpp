// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "SequentialAnalysisEngine.h"
#include <algorithm>
#include <cmath>
#include "ExperimentExceptions.h"
#include "HypothesisTests.h"

namespace abtesting
{
  SequentialAnalysisEngine::SequentialAnalysisEngine(std::size_t numStages, double alpha)
    : mDesign(numStages, alpha)
  {}

  std::size_t SequentialAnalysisEngine::computeStage(std::size_t currentSampleSize,
                                                     std::size_t requiredSampleSize) const
  {
    const std::size_t k = mDesign.getNumStages();
    if (requiredSampleSize == 0)
      return k;

    const double fraction = static_cast<double>(currentSampleSize) / static_cast<double>(requiredSampleSize);
    const double stage = std::ceil(fraction * static_cast<double>(k));
    if (stage < 1.0)
      return 1;

    return std::min(k, static_cast<std::size_t>(stage));
  }

  SequentialResult SequentialAnalysisEngine::evaluate(std::size_t stage,
                                                      double zStatistic,
                                                      std::size_t currentSampleSize,
                                                      std::size_t requiredSampleSize,
                                                      const std::string& controlVariant,
                                                      const std::string& treatmentVariant) const
  {
    SequentialResult result;
    result.numStages = mDesign.getNumStages();
    result.alpha = mDesign.getAlpha();
    result.currentStage = stage;
    result.currentSampleSize = currentSampleSize;
    result.requiredSampleSize = requiredSampleSize;
    result.testStatistic = zStatistic;
    result.criticalValue = mDesign.getCriticalValue(stage);

    for (std::size_t k = 1; k <= mDesign.getNumStages(); ++k)
      {
        SequentialCheckpoint checkpoint;
        checkpoint.stage = k;
        checkpoint.informationFraction = mDesign.getInformationFraction(k);
        checkpoint.sampleSize = static_cast<std::size_t>(
          std::floor(checkpoint.informationFraction * static_cast<double>(requiredSampleSize)));
        checkpoint.criticalValue = mDesign.getCriticalValue(k);
        checkpoint.nominalAlpha = mDesign.getNominalAlpha(k);
        checkpoint.cumulativeAlphaSpent = mDesign.getCumulativeAlphaSpent(k);
        result.checkpoints.push_back(checkpoint);
      }

    if (std::fabs(zStatistic) >= result.criticalValue)
      {
        SequentialDecision decision;
        decision.stop = true;
        decision.winningVariant = (zStatistic > 0.0) ? treatmentVariant : controlVariant;
        decision.stage = stage;
        decision.testStatistic = zStatistic;
        decision.adjustedPValue = mDesign.stagewisePValue(stage, zStatistic);
        result.decision = decision;
      }

    return result;
  }

  double SequentialAnalysisEngine::computeStatistic(MetricType type,
                                                    const MetricMoments& control,
                                                    const MetricMoments& treatment) const
  {
    if (type == MetricType::Binary || (control.isBinary() && treatment.isBinary()))
      return twoProportionZStatistic(control.getSuccesses(), control.getCount(),
                                     treatment.getSuccesses(), treatment.getCount());

    if (control.getCount() < 2 || treatment.getCount() < 2)
      throw InsufficientDataException("Sequential check needs at least two values in each arm");

    const double se = std::sqrt(control.getVariance() / static_cast<double>(control.getCount()) +
                                treatment.getVariance() / static_cast<double>(treatment.getCount()));
    if (se == 0.0)
      throw InsufficientDataException("Sequential check has zero standard error");

    return (treatment.getMean() - control.getMean()) / se;
  }

  SequentialResult SequentialAnalysisEngine::analyze(const AnalysisData& data,
                                                     const std::string& controlVariant,
                                                     const std::string& treatmentVariant) const
  {
    const VariantData& control = data.getVariant(controlVariant);
    const VariantData& treatment = data.getVariant(treatmentVariant);

    const std::string& metric = data.getPrimaryMetric();
    MetricMoments controlMoments;
    for (double value : control.getValues(metric))
      controlMoments.addValue(value);

    MetricMoments treatmentMoments;
    for (double value : treatment.getValues(metric))
      treatmentMoments.addValue(value);

    return analyze(data.getPrimaryMetricType(), controlMoments, treatmentMoments,
                   data.getTotalSampleSize(), data.getRequiredSampleSize(),
                   controlVariant, treatmentVariant);
  }

  SequentialResult SequentialAnalysisEngine::analyze(MetricType primaryMetricType,
                                                     const MetricMoments& control,
                                                     const MetricMoments& treatment,
                                                     std::size_t currentSampleSize,
                                                     std::size_t requiredSampleSize,
                                                     const std::string& controlVariant,
                                                     const std::string& treatmentVariant) const
  {
    if (control.getCount() == 0 || treatment.getCount() == 0)
      throw InsufficientDataException("Sequential check needs primary metric data in both arms");

    const double z = computeStatistic(primaryMetricType, control, treatment);
    const std::size_t stage = computeStage(currentSampleSize, requiredSampleSize);

    return evaluate(stage, z, currentSampleSize, requiredSampleSize, controlVariant, treatmentVariant);
  }
}
