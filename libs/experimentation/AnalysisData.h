// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ABTESTING_ANALYSIS_DATA_H
#define __ABTESTING_ANALYSIS_DATA_H 1

#include <map>
#include <string>
#include <vector>
#include "Experiment.h"
#include "MetricStore.h"

namespace abtesting
{
  struct VariantData
  {
    std::string name;
    double normalizedWeight = 0.0;
    std::size_t assignedUsers = 0;
    std::size_t sampleSize = 0;   // distinct users with at least one metric event
    std::map<std::string, std::vector<double>> metrics;

    /// Values recorded for the metric, or an empty vector.
    const std::vector<double>& getValues(const std::string& metricName) const;
  };

  /**
   * @class AnalysisData
   * @brief Per-variant numeric samples prepared once and shared by all engines
   *        within one analysis run.
   */
  class AnalysisData
  {
  public:
    /**
     * @param records Raw records from the metric store
     * @param assignmentCounts Users assigned per variant
     */
    static AnalysisData prepare(const Experiment& experiment,
                                const VariantMetricRecords& records,
                                const std::map<std::string, std::size_t>& assignmentCounts);

    const std::string& getExperimentId() const { return mExperimentId; }
    const std::string& getPrimaryMetric() const { return mPrimaryMetric; }
    MetricType getPrimaryMetricType() const { return mPrimaryMetricType; }
    const std::vector<std::string>& getSecondaryMetrics() const { return mSecondaryMetrics; }
    std::size_t getRequiredSampleSize() const { return mRequiredSampleSize; }
    const std::vector<VariantData>& getVariants() const { return mVariants; }

    /**
     * @throws AnalysisException if the experiment has no variant with that name
     */
    const VariantData& getVariant(const std::string& name) const;

    bool hasVariant(const std::string& name) const;

    /// Sum of per-variant sample sizes.
    std::size_t getTotalSampleSize() const;

    std::map<std::string, std::size_t> getSampleSizes() const;

  private:
    std::string mExperimentId;
    std::string mPrimaryMetric;
    MetricType mPrimaryMetricType = MetricType::Binary;
    std::vector<std::string> mSecondaryMetrics;
    std::size_t mRequiredSampleSize = 0;
    std::vector<VariantData> mVariants;
  };
}

#endif
