// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "FrameworkConfiguration.h"

namespace abtesting
{
  namespace
  {
    bool inOpenUnitInterval(double value)
    {
      return value > 0.0 && value < 1.0;
    }

    bool inClosedUnitInterval(double value)
    {
      return value >= 0.0 && value <= 1.0;
    }
  }

  std::vector<std::string> FrameworkConfiguration::validate() const
  {
    std::vector<std::string> errors;

    if (!inOpenUnitInterval(confidenceLevel))
      errors.push_back("confidenceLevel must be in (0, 1)");
    if (!inOpenUnitInterval(power))
      errors.push_back("power must be in (0, 1)");
    if (!inOpenUnitInterval(srmThreshold))
      errors.push_back("srmThreshold must be in (0, 1)");
    if (!inOpenUnitInterval(sequentialAlpha))
      errors.push_back("sequentialAlpha must be in (0, 1)");
    if (sequentialStages < 1)
      errors.push_back("sequentialStages must be at least 1");
    if (!(expectedUsersPerDay > 0.0))
      errors.push_back("expectedUsersPerDay must be positive");
    if (maxExperimentDuration.is_negative())
      errors.push_back("maxExperimentDuration must not be negative");
    if (monitorInterval.total_milliseconds() <= 0)
      errors.push_back("monitorInterval must be positive");
    if (!inClosedUnitInterval(banditEpsilon))
      errors.push_back("banditEpsilon must be in [0, 1]");
    if (!inClosedUnitInterval(contextualExplorationRate))
      errors.push_back("contextualExplorationRate must be in [0, 1]");
    if (!(contextualLearningRate > 0.0))
      errors.push_back("contextualLearningRate must be positive");
    if (convergenceWindow == 0)
      errors.push_back("convergenceWindow must be positive");
    if (!(convergenceThreshold > 0.0))
      errors.push_back("convergenceThreshold must be positive");

    return errors;
  }
}
