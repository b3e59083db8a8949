// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ABTESTING_EXPERIMENT_MONITOR_H
#define __ABTESTING_EXPERIMENT_MONITOR_H 1

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/thread/thread.hpp>
#include "Experiment.h"
#include "ExperimentEventObserver.h"
#include "ExperimentLog.h"

namespace abtesting
{
  /**
   * @class MonitoredExperimentSource
   * @brief What the monitor needs from the experiment owner.
   */
  class MonitoredExperimentSource
  {
  public:
    virtual ~MonitoredExperimentSource() = default;

    virtual std::optional<Experiment> findExperiment(const std::string& experimentId) const = 0;

    virtual std::map<std::string, std::size_t> getAssignmentCounts(const std::string& experimentId) const = 0;

    /// Distinct users with at least one metric event.
    virtual std::size_t getObservedSampleSize(const std::string& experimentId) const = 0;

    /**
     * @throws InvalidExperimentStateException if the experiment was already stopped
     */
    virtual void forceStop(const std::string& experimentId, const std::string& reason) = 0;

    virtual void raiseAlert(const ExperimentAlert& alert) = 0;
  };

  struct MonitorSettings
  {
    boost::posix_time::time_duration maxExperimentDuration = boost::posix_time::hours(24 * 30);
    boost::posix_time::time_duration interval = boost::posix_time::seconds(60);
    double srmThreshold = 0.001;
  };

  /**
   * @class ExperimentMonitor
   * @brief Periodic health checks over tracked experiments.
   *
   * Each pass raises, at most once per experiment, a sample-ratio-mismatch
   * alert (assignment counts against weights), a sample-size-reached alert,
   * and a max-duration alert followed by a force-stop. The periodic task runs
   * on a dedicated thread driving a Boost.Asio steady timer.
   */
  class ExperimentMonitor
  {
  public:
    ExperimentMonitor(MonitoredExperimentSource& source,
                      const MonitorSettings& settings,
                      ExperimentLog& log);

    ~ExperimentMonitor();

    ExperimentMonitor(const ExperimentMonitor&) = delete;
    ExperimentMonitor& operator=(const ExperimentMonitor&) = delete;

    void trackExperiment(const std::string& experimentId, boost::posix_time::ptime startTime);

    void stopTracking(const std::string& experimentId);

    bool isTracking(const std::string& experimentId) const;

    std::size_t getTrackedCount() const;

    std::vector<ExperimentAlert> getAlerts(const std::string& experimentId) const;

    /**
     * @brief Runs one pass synchronously.
     * @return Alerts raised by this pass
     */
    std::vector<ExperimentAlert> checkExperiments(boost::posix_time::ptime now);

    std::vector<ExperimentAlert> checkExperiments();

    void start();

    void stop();

    bool isRunning() const;

  private:
    struct Tracking
    {
      boost::posix_time::ptime startTime;
      boost::posix_time::ptime lastCheck;
      std::set<AlertType> raised;
      std::vector<ExperimentAlert> alerts;
    };

    std::vector<ExperimentAlert> checkExperiment(const std::string& experimentId,
                                                 const Tracking& tracking,
                                                 boost::posix_time::ptime now);

    ExperimentAlert makeAlert(const std::string& experimentId, AlertType type, AlertSeverity severity,
                              const std::string& message, boost::posix_time::ptime now) const;

    bool recordAlert(const ExperimentAlert& alert, boost::posix_time::ptime now);

    void scheduleNext();

  private:
    MonitoredExperimentSource& mSource;
    MonitorSettings mSettings;
    ExperimentLog& mLog;

    mutable std::mutex mMutex;
    std::map<std::string, Tracking> mTracked;

    mutable std::mutex mRunMutex;
    boost::asio::io_context mIoContext;
    std::unique_ptr<boost::asio::steady_timer> mTimer;
    boost::thread mThread;
    bool mRunning = false;
  };
}

#endif
