// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ABTESTING_METRIC_EVENT_H
#define __ABTESTING_METRIC_EVENT_H 1

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <boost/date_time/posix_time/posix_time.hpp>

namespace abtesting
{
  /// Prediction outcome reported to the accuracy collector.
  struct AccuracyObservation
  {
    bool predicted;
    bool actual;

    bool isCorrect() const
    {
      return predicted == actual;
    }
  };

  using MetricValue = std::variant<double, AccuracyObservation>;
  using MetricMetadata = std::map<std::string, std::string>;

  /**
   * @brief Numeric view of a metric value used by the analysis engines:
   *        the number itself, or 1/0 for a correct/incorrect prediction.
   */
  inline double toAnalysisValue(const MetricValue& value)
  {
    if (const double* number = std::get_if<double>(&value))
      return *number;

    return std::get<AccuracyObservation>(value).isCorrect() ? 1.0 : 0.0;
  }

  struct MetricEvent
  {
    std::string userId;
    std::string experimentId;
    std::string metricName;
    MetricValue value = 0.0;
    MetricMetadata metadata;
    std::optional<boost::posix_time::ptime> timestamp;   // stamped on ingestion when absent
  };

  /// One stored observation in the per-(experiment, variant, metric) sequence.
  struct MetricRecord
  {
    std::string userId;
    MetricValue value;
    MetricMetadata metadata;
    boost::posix_time::ptime timestamp;
  };
}

#endif
