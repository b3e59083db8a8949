// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ABTESTING_ASSIGNMENT_STRATEGY_KIND_H
#define __ABTESTING_ASSIGNMENT_STRATEGY_KIND_H 1

#include <string>
#include <stdexcept>
#include "ExperimentExceptions.h"

namespace abtesting
{
  /// Closed set of assignment strategies; switch statements over it must stay exhaustive.
  enum class AssignmentStrategyKind
    {
      Random,
      Deterministic,
      Stratified,
      MultiArmedBandit,
      ContextualBandit
    };

  inline std::string toString(AssignmentStrategyKind kind)
  {
    switch (kind)
      {
      case AssignmentStrategyKind::Random:
        return "random";
      case AssignmentStrategyKind::Deterministic:
        return "deterministic";
      case AssignmentStrategyKind::Stratified:
        return "stratified";
      case AssignmentStrategyKind::MultiArmedBandit:
        return "multi_armed_bandit";
      case AssignmentStrategyKind::ContextualBandit:
        return "contextual_bandit";
      }

    throw std::logic_error("toString: unhandled AssignmentStrategyKind");
  }

  /**
   * @throws UnknownAssignmentStrategyException if name is not a registered strategy
   */
  inline AssignmentStrategyKind parseAssignmentStrategyKind(const std::string& name)
  {
    if (name == "random")
      return AssignmentStrategyKind::Random;
    if (name == "deterministic")
      return AssignmentStrategyKind::Deterministic;
    if (name == "stratified")
      return AssignmentStrategyKind::Stratified;
    if (name == "multi_armed_bandit")
      return AssignmentStrategyKind::MultiArmedBandit;
    if (name == "contextual_bandit")
      return AssignmentStrategyKind::ContextualBandit;

    throw UnknownAssignmentStrategyException("Unknown assignment strategy: " + name);
  }

  inline bool isBanditStrategy(AssignmentStrategyKind kind)
  {
    return kind == AssignmentStrategyKind::MultiArmedBandit ||
      kind == AssignmentStrategyKind::ContextualBandit;
  }
}

#endif
