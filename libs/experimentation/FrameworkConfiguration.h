// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ABTESTING_FRAMEWORK_CONFIGURATION_H
#define __ABTESTING_FRAMEWORK_CONFIGURATION_H 1

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "MultipleTestingCorrection.h"

namespace abtesting
{
  /**
   * @brief Settings shared by every experiment run through one framework instance.
   */
  struct FrameworkConfiguration
  {
    // Statistical targets
    double confidenceLevel = 0.95;
    double power = 0.8;
    std::size_t minSampleSize = 100;
    MultipleTestingCorrectionMethod multipleTestingCorrection = MultipleTestingCorrectionMethod::Bonferroni;
    double srmThreshold = 0.001;

    // Engines
    bool enableBayesian = true;
    bool enableSequentialTesting = true;
    std::size_t monteCarloSimulations = 10000;
    std::size_t sequentialStages = 5;
    double sequentialAlpha = 0.05;

    // Power analysis
    double expectedUsersPerDay = 1000.0;

    // Monitoring
    boost::posix_time::time_duration maxExperimentDuration = boost::posix_time::hours(24 * 30);
    boost::posix_time::time_duration monitorInterval = boost::posix_time::seconds(60);
    bool startMonitor = true;

    // Assignment
    double banditEpsilon = 0.1;
    double contextualExplorationRate = 0.1;
    double contextualLearningRate = 0.01;
    std::optional<std::uint64_t> randomSeed;

    // Collectors
    std::size_t convergenceWindow = 100;
    double convergenceThreshold = 0.01;

    /**
     * @return One message per invalid setting; empty when the configuration is usable.
     */
    std::vector<std::string> validate() const;

    static FrameworkConfiguration createDefault()
    {
      return FrameworkConfiguration{};
    }
  };
}

#endif
