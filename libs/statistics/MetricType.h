// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ABTESTING_METRIC_TYPE_H
#define __ABTESTING_METRIC_TYPE_H 1

#include <string>
#include <stdexcept>

namespace abtesting
{
  /// Shape of a metric's observations.
  enum class MetricType
    {
      Binary,     // 0/1 outcomes, e.g. conversion
      Continuous  // real-valued outcomes, e.g. latency
    };

  inline std::string toString(MetricType type)
  {
    switch (type)
      {
      case MetricType::Binary:
        return "binary";
      case MetricType::Continuous:
        return "continuous";
      }

    throw std::logic_error("toString: unhandled MetricType");
  }

  /**
   * @brief Default classification of a metric by name: conversion, success,
   *        click and purchase are binary, everything else continuous.
   */
  inline MetricType inferMetricType(const std::string& metricName)
  {
    if (metricName == "conversion" || metricName == "success" ||
        metricName == "click" || metricName == "purchase")
      return MetricType::Binary;

    return MetricType::Continuous;
  }
}

#endif
