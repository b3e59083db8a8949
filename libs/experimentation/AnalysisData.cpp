// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "AnalysisData.h"
#include <set>
#include "ExperimentExceptions.h"

namespace abtesting
{
  const std::vector<double>& VariantData::getValues(const std::string& metricName) const
  {
    static const std::vector<double> kEmpty;

    auto it = metrics.find(metricName);
    return (it == metrics.end()) ? kEmpty : it->second;
  }

  AnalysisData AnalysisData::prepare(const Experiment& experiment,
                                     const VariantMetricRecords& records,
                                     const std::map<std::string, std::size_t>& assignmentCounts)
  {
    AnalysisData data;
    data.mExperimentId = experiment.getId();
    data.mPrimaryMetric = experiment.getPrimaryMetric();
    data.mPrimaryMetricType = experiment.getPrimaryMetricType();
    data.mSecondaryMetrics = experiment.getSecondaryMetrics();
    data.mRequiredSampleSize = experiment.getRequiredSampleSize();

    for (const auto& variant : experiment.getVariants())
      {
        VariantData vd;
        vd.name = variant.getName();
        vd.normalizedWeight = variant.getNormalizedWeight();

        auto countIt = assignmentCounts.find(vd.name);
        vd.assignedUsers = (countIt == assignmentCounts.end()) ? 0 : countIt->second;

        auto recIt = records.find(vd.name);
        if (recIt != records.end())
          {
            std::set<std::string> users;
            for (const auto& [metricName, metricRecords] : recIt->second)
              {
                std::vector<double>& values = vd.metrics[metricName];
                values.reserve(metricRecords.size());
                for (const auto& record : metricRecords)
                  {
                    values.push_back(toAnalysisValue(record.value));
                    users.insert(record.userId);
                  }
              }
            vd.sampleSize = users.size();
          }

        data.mVariants.push_back(std::move(vd));
      }

    return data;
  }

  const VariantData& AnalysisData::getVariant(const std::string& name) const
  {
    for (const auto& v : mVariants)
      if (v.name == name)
        return v;

    throw AnalysisException("Experiment " + mExperimentId + " has no variant named '" + name + "'");
  }

  bool AnalysisData::hasVariant(const std::string& name) const
  {
    for (const auto& v : mVariants)
      if (v.name == name)
        return true;

    return false;
  }

  std::size_t AnalysisData::getTotalSampleSize() const
  {
    std::size_t total = 0;
    for (const auto& v : mVariants)
      total += v.sampleSize;

    return total;
  }

  std::map<std::string, std::size_t> AnalysisData::getSampleSizes() const
  {
    std::map<std::string, std::size_t> sizes;
    for (const auto& v : mVariants)
      sizes[v.name] = v.sampleSize;

    return sizes;
  }
}
