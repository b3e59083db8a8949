// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ABTESTING_SEQUENTIAL_ANALYSIS_ENGINE_H
#define __ABTESTING_SEQUENTIAL_ANALYSIS_ENGINE_H 1

#include <string>
#include "AnalysisData.h"
#include "AnalysisResult.h"
#include "GroupSequentialDesign.h"

namespace abtesting
{
  /**
   * @class SequentialAnalysisEngine
   * @brief Interim monitoring of the primary metric against O'Brien-Fleming
   *        boundaries at equally spaced fractions of the required sample size.
   *
   * The current stage is ceil(K * n / N) clamped to [1, K], where n is the
   * number of users with metric data and N the required sample size. The
   * statistic is the pooled two-proportion z for binary metrics and the
   * difference in means over its unpooled standard error otherwise.
   */
  class SequentialAnalysisEngine
  {
  public:
    SequentialAnalysisEngine(std::size_t numStages, double alpha);

    /**
     * @throws AnalysisException if either variant name is missing
     * @throws InsufficientDataException if either arm lacks primary-metric data
     */
    SequentialResult analyze(const AnalysisData& data,
                             const std::string& controlVariant,
                             const std::string& treatmentVariant) const;

    /**
     * @brief Same check from running moments of the primary metric, for
     *        callers that evaluate after every event.
     *
     * @param currentSampleSize Distinct users with metric data across all variants
     * @throws InsufficientDataException if either arm lacks primary-metric data
     */
    SequentialResult analyze(MetricType primaryMetricType,
                             const MetricMoments& control,
                             const MetricMoments& treatment,
                             std::size_t currentSampleSize,
                             std::size_t requiredSampleSize,
                             const std::string& controlVariant,
                             const std::string& treatmentVariant) const;

    /**
     * @brief Boundary comparison for an already computed statistic. A stop
     *        decision names the treatment when z > 0 and the control otherwise.
     */
    SequentialResult evaluate(std::size_t stage,
                              double zStatistic,
                              std::size_t currentSampleSize,
                              std::size_t requiredSampleSize,
                              const std::string& controlVariant,
                              const std::string& treatmentVariant) const;

    std::size_t computeStage(std::size_t currentSampleSize, std::size_t requiredSampleSize) const;

    const GroupSequentialDesign& getDesign() const
    {
      return mDesign;
    }

  private:
    double computeStatistic(MetricType type,
                            const MetricMoments& control,
                            const MetricMoments& treatment) const;

  private:
    GroupSequentialDesign mDesign;
  };
}

#endif
