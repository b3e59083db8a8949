// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ABTESTING_EXPERIMENT_EVENT_OBSERVER_H
#define __ABTESTING_EXPERIMENT_EVENT_OBSERVER_H 1

#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "AnalysisResult.h"
#include "Experiment.h"

namespace abtesting
{
  enum class ExperimentEventType
    {
      ExperimentCreated,
      UserAssigned,
      ExperimentAnalyzed,
      ExperimentStopped,
      ExperimentAlert
    };

  /// Event name as seen by sinks, e.g. "experiment-created".
  inline std::string getEventName(ExperimentEventType type)
  {
    switch (type)
      {
      case ExperimentEventType::ExperimentCreated:
        return "experiment-created";
      case ExperimentEventType::UserAssigned:
        return "user-assigned";
      case ExperimentEventType::ExperimentAnalyzed:
        return "experiment-analyzed";
      case ExperimentEventType::ExperimentStopped:
        return "experiment-stopped";
      case ExperimentEventType::ExperimentAlert:
        return "experiment-alert";
      }

    throw std::logic_error("getEventName: unhandled ExperimentEventType");
  }

  enum class AlertType
    {
      SampleRatioMismatch,
      SampleSizeReached,
      MaxDurationReached
    };

  enum class AlertSeverity
    {
      Info,
      Medium,
      High
    };

  inline std::string toString(AlertType type)
  {
    switch (type)
      {
      case AlertType::SampleRatioMismatch:
        return "sample_ratio_mismatch";
      case AlertType::SampleSizeReached:
        return "sample_size_reached";
      case AlertType::MaxDurationReached:
        return "max_duration_reached";
      }

    throw std::logic_error("toString: unhandled AlertType");
  }

  inline std::string toString(AlertSeverity severity)
  {
    switch (severity)
      {
      case AlertSeverity::Info:
        return "info";
      case AlertSeverity::Medium:
        return "medium";
      case AlertSeverity::High:
        return "high";
      }

    throw std::logic_error("toString: unhandled AlertSeverity");
  }

  struct ExperimentAlert
  {
    std::string experimentId;
    AlertType type;
    AlertSeverity severity;
    std::string message;
    boost::posix_time::ptime raisedAt;
    std::map<std::string, double> details;
  };

  /**
   * @brief Payload delivered to observers. Only the members relevant to the
   *        event type are set.
   */
  struct ExperimentEvent
  {
    ExperimentEventType type;
    std::string experimentId;
    boost::posix_time::ptime timestamp;
    std::optional<Experiment> experiment;           // created, stopped
    std::shared_ptr<const AnalysisResult> results;  // analyzed, stopped
    std::optional<ExperimentAlert> alert;           // alert
    std::optional<std::string> userId;              // user assigned
    std::optional<std::string> variant;             // user assigned

    std::string getName() const
    {
      return getEventName(type);
    }
  };

  /**
   * @class ExperimentEventObserver
   * @brief Caller-supplied sink for framework events.
   *
   * update() is called synchronously on the thread that produced the event
   * (a caller thread or the monitor thread) and must not attach or detach
   * observers.
   */
  class ExperimentEventObserver
  {
  public:
    virtual ~ExperimentEventObserver() = default;

    virtual void update(const ExperimentEvent& event) = 0;
  };
}

#endif
