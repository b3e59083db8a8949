// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ABTESTING_EXPERIMENT_LOG_H
#define __ABTESTING_EXPERIMENT_LOG_H 1

#include <mutex>
#include <ostream>
#include <string>
#include <boost/date_time/posix_time/posix_time.hpp>

namespace abtesting
{
  /**
   * @class ExperimentLog
   * @brief Serializes single-line records onto a caller-owned output stream:
   *
   *   2026-10-19T12:00:00.000123 INFO [ABTestingFramework] Created experiment exp_...
   */
  class ExperimentLog
  {
  public:
    explicit ExperimentLog(std::ostream& outputStream)
      : mOutputStream(outputStream)
    {}

    ExperimentLog(const ExperimentLog&) = delete;
    ExperimentLog& operator=(const ExperimentLog&) = delete;

    void info(const std::string& component, const std::string& message)
    {
      write("INFO", component, message);
    }

    void warn(const std::string& component, const std::string& message)
    {
      write("WARN", component, message);
    }

    void error(const std::string& component, const std::string& message)
    {
      write("ERROR", component, message);
    }

  private:
    void write(const char* level, const std::string& component, const std::string& message)
    {
      const auto now = boost::posix_time::microsec_clock::universal_time();

      std::lock_guard<std::mutex> lock(mMutex);
      mOutputStream << boost::posix_time::to_iso_extended_string(now) << ' ' << level
                    << " [" << component << "] " << message << std::endl;
    }

    std::mutex mMutex;
    std::ostream& mOutputStream;
  };
}

#endif
