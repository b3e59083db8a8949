// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ABTESTING_SHADOW_MODE_CONTROLLER_H
#define __ABTESTING_SHADOW_MODE_CONTROLLER_H 1

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "MetricEvent.h"

namespace abtesting
{
  struct ShadowMetricRecord
  {
    std::string userId;
    std::string metricName;
    MetricValue value;
    boost::posix_time::ptime timestamp;
    bool shadow = true;
  };

  /// variant -> shadow records in arrival order
  using ShadowMetrics = std::map<std::string, std::vector<ShadowMetricRecord>>;

  /**
   * @class ShadowModeController
   * @brief Isolated metric store for experiments running in shadow mode.
   *
   * Records written here are never read by the analysis engines.
   */
  class ShadowModeController
  {
  public:
    void setupExperiment(const std::string& experimentId);

    void teardownExperiment(const std::string& experimentId);

    bool isShadowed(const std::string& experimentId) const;

    /**
     * @return false if the experiment has no shadow store
     */
    bool trackMetric(const MetricEvent& event, const std::string& variant);

    std::optional<ShadowMetrics> getShadowMetrics(const std::string& experimentId) const;

  private:
    mutable std::mutex mMutex;
    std::map<std::string, ShadowMetrics> mStores;
  };
}

#endif
