// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ABTESTING_EXPERIMENT_EXCEPTIONS_H
#define __ABTESTING_EXPERIMENT_EXCEPTIONS_H 1

#include <stdexcept>
#include <string>

namespace abtesting
{
  /// Malformed experiment definition; creation is rejected and nothing is stored.
  class ExperimentValidationException : public std::runtime_error
  {
  public:
    ExperimentValidationException(const std::string msg)
      : std::runtime_error(msg)
    {}

    ~ExperimentValidationException()
    {}
  };

  class ExperimentNotFoundException : public std::runtime_error
  {
  public:
    ExperimentNotFoundException(const std::string msg)
      : std::runtime_error(msg)
    {}

    ~ExperimentNotFoundException()
    {}
  };

  /// Operation not permitted in the experiment's current status (e.g. stopping twice).
  class InvalidExperimentStateException : public std::runtime_error
  {
  public:
    InvalidExperimentStateException(const std::string msg)
      : std::runtime_error(msg)
    {}

    ~InvalidExperimentStateException()
    {}
  };

  class UnknownAssignmentStrategyException : public std::runtime_error
  {
  public:
    UnknownAssignmentStrategyException(const std::string msg)
      : std::runtime_error(msg)
    {}

    ~UnknownAssignmentStrategyException()
    {}
  };

  /// Not enough observations for an engine to produce a statistic.
  class InsufficientDataException : public std::runtime_error
  {
  public:
    InsufficientDataException(const std::string msg)
      : std::runtime_error(msg)
    {}

    ~InsufficientDataException()
    {}
  };

  /// Engine precondition failure such as a missing control or treatment variant.
  class AnalysisException : public std::runtime_error
  {
  public:
    AnalysisException(const std::string msg)
      : std::runtime_error(msg)
    {}

    ~AnalysisException()
    {}
  };

  /// Metric value of the wrong shape for the collector it was routed to.
  class InvalidMetricValueException : public std::runtime_error
  {
  public:
    InvalidMetricValueException(const std::string msg)
      : std::runtime_error(msg)
    {}

    ~InvalidMetricValueException()
    {}
  };

  class FrameworkConfigurationException : public std::runtime_error
  {
  public:
    FrameworkConfigurationException(const std::string msg)
      : std::runtime_error(msg)
    {}

    ~FrameworkConfigurationException()
    {}
  };
}

#endif
