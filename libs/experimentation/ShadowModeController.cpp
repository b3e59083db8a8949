// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "ShadowModeController.h"

namespace abtesting
{
  void ShadowModeController::setupExperiment(const std::string& experimentId)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    mStores.emplace(experimentId, ShadowMetrics{});
  }

  void ShadowModeController::teardownExperiment(const std::string& experimentId)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    mStores.erase(experimentId);
  }

  bool ShadowModeController::isShadowed(const std::string& experimentId) const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return mStores.find(experimentId) != mStores.end();
  }

  bool ShadowModeController::trackMetric(const MetricEvent& event, const std::string& variant)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    auto it = mStores.find(event.experimentId);
    if (it == mStores.end())
      return false;

    it->second[variant].push_back(ShadowMetricRecord{
        event.userId,
        event.metricName,
        event.value,
        event.timestamp.value_or(boost::posix_time::microsec_clock::universal_time()),
        true });
    return true;
  }

  std::optional<ShadowMetrics> ShadowModeController::getShadowMetrics(const std::string& experimentId) const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    auto it = mStores.find(experimentId);
    if (it == mStores.end())
      return std::nullopt;

    return it->second;
  }
}
