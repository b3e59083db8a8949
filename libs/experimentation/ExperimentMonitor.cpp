// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "ExperimentMonitor.h"
#include <chrono>
#include <sstream>
#include "ExperimentExceptions.h"
#include "FrequentistAnalysisEngine.h"

namespace abtesting
{
  namespace
  {
    const char* const kComponent = "ExperimentMonitor";
  }

  ExperimentMonitor::ExperimentMonitor(MonitoredExperimentSource& source,
                                       const MonitorSettings& settings,
                                       ExperimentLog& log)
    : mSource(source),
      mSettings(settings),
      mLog(log)
  {}

  ExperimentMonitor::~ExperimentMonitor()
  {
    stop();
  }

  void ExperimentMonitor::trackExperiment(const std::string& experimentId, boost::posix_time::ptime startTime)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    Tracking& tracking = mTracked[experimentId];
    tracking.startTime = startTime;
    tracking.lastCheck = startTime;
  }

  void ExperimentMonitor::stopTracking(const std::string& experimentId)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    mTracked.erase(experimentId);
  }

  bool ExperimentMonitor::isTracking(const std::string& experimentId) const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return mTracked.find(experimentId) != mTracked.end();
  }

  std::size_t ExperimentMonitor::getTrackedCount() const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return mTracked.size();
  }

  std::vector<ExperimentAlert> ExperimentMonitor::getAlerts(const std::string& experimentId) const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    auto it = mTracked.find(experimentId);
    if (it == mTracked.end())
      return {};

    return it->second.alerts;
  }

  ExperimentAlert ExperimentMonitor::makeAlert(const std::string& experimentId,
                                               AlertType type,
                                               AlertSeverity severity,
                                               const std::string& message,
                                               boost::posix_time::ptime now) const
  {
    return ExperimentAlert{ experimentId, type, severity, message, now, {} };
  }

  bool ExperimentMonitor::recordAlert(const ExperimentAlert& alert, boost::posix_time::ptime now)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    auto it = mTracked.find(alert.experimentId);
    if (it == mTracked.end())
      return false;

    if (!it->second.raised.insert(alert.type).second)
      return false;

    it->second.alerts.push_back(alert);
    it->second.lastCheck = now;
    return true;
  }

  std::vector<ExperimentAlert> ExperimentMonitor::checkExperiment(const std::string& experimentId,
                                                                  const Tracking& tracking,
                                                                  boost::posix_time::ptime now)
  {
    std::vector<ExperimentAlert> raised;

    const std::optional<Experiment> experiment = mSource.findExperiment(experimentId);
    if (!experiment || !experiment->isActive())
      {
        stopTracking(experimentId);
        return raised;
      }

    const auto emit = [&](ExperimentAlert alert) {
      if (tracking.raised.count(alert.type) != 0 || !recordAlert(alert, now))
        return false;

      mSource.raiseAlert(alert);
      raised.push_back(alert);
      return true;
    };

    const SampleRatioMismatchResult srm =
      FrequentistAnalysisEngine::checkSampleRatioMismatch(experiment->getVariants(),
                                                          mSource.getAssignmentCounts(experimentId),
                                                          mSettings.srmThreshold);
    if (srm.detected)
      {
        std::ostringstream msg;
        msg << "Sample ratio mismatch detected (chi-square " << srm.statistic << ", p = " << srm.pValue << ")";
        ExperimentAlert alert = makeAlert(experimentId, AlertType::SampleRatioMismatch, AlertSeverity::High,
                                          msg.str(), now);
        alert.details["chiSquare"] = srm.statistic;
        alert.details["pValue"] = srm.pValue;
        emit(alert);
      }

    const std::size_t observed = mSource.getObservedSampleSize(experimentId);
    const std::size_t required = experiment->getRequiredSampleSize();
    if (observed >= required)
      {
        ExperimentAlert alert = makeAlert(experimentId, AlertType::SampleSizeReached, AlertSeverity::Info,
                                          "Required sample size reached", now);
        alert.details["currentSampleSize"] = static_cast<double>(observed);
        alert.details["requiredSampleSize"] = static_cast<double>(required);
        emit(alert);
      }

    const boost::posix_time::time_duration runtime = now - tracking.startTime;
    if (runtime >= mSettings.maxExperimentDuration)
      {
        ExperimentAlert alert = makeAlert(experimentId, AlertType::MaxDurationReached, AlertSeverity::Medium,
                                          "Maximum experiment duration reached", now);
        alert.details["runtimeSeconds"] = static_cast<double>(runtime.total_seconds());
        alert.details["maxDurationSeconds"] = static_cast<double>(mSettings.maxExperimentDuration.total_seconds());

        if (emit(alert))
          {
            try
              {
                mSource.forceStop(experimentId, "max_duration_reached");
              }
            catch (const InvalidExperimentStateException& e)
              {
                mLog.info(kComponent, "Experiment " + experimentId + " already stopped: " + e.what());
              }
            catch (const ExperimentNotFoundException& e)
              {
                mLog.warn(kComponent, e.what());
              }
            stopTracking(experimentId);
          }
      }

    return raised;
  }

  std::vector<ExperimentAlert> ExperimentMonitor::checkExperiments(boost::posix_time::ptime now)
  {
    std::map<std::string, Tracking> tracked;
    {
      std::lock_guard<std::mutex> lock(mMutex);
      tracked = mTracked;
    }

    std::vector<ExperimentAlert> raised;
    for (const auto& [experimentId, tracking] : tracked)
      {
        try
          {
            std::vector<ExperimentAlert> alerts = checkExperiment(experimentId, tracking, now);
            raised.insert(raised.end(), alerts.begin(), alerts.end());
          }
        catch (const std::exception& e)
          {
            mLog.error(kComponent, "Check failed for experiment " + experimentId + ": " + e.what());
          }

        std::lock_guard<std::mutex> lock(mMutex);
        auto it = mTracked.find(experimentId);
        if (it != mTracked.end())
          it->second.lastCheck = now;
      }

    return raised;
  }

  std::vector<ExperimentAlert> ExperimentMonitor::checkExperiments()
  {
    return checkExperiments(boost::posix_time::microsec_clock::universal_time());
  }

  void ExperimentMonitor::scheduleNext()
  {
    mTimer->expires_after(std::chrono::milliseconds(mSettings.interval.total_milliseconds()));
    mTimer->async_wait([this](const boost::system::error_code& ec) {
      if (ec)
        return;

      checkExperiments();
      scheduleNext();
    });
  }

  void ExperimentMonitor::start()
  {
    std::lock_guard<std::mutex> lock(mRunMutex);
    if (mRunning)
      return;

    mIoContext.restart();
    mTimer = std::make_unique<boost::asio::steady_timer>(mIoContext);
    scheduleNext();
    mThread = boost::thread([this]() { mIoContext.run(); });
    mRunning = true;
    mLog.info(kComponent, "Monitoring started");
  }

  void ExperimentMonitor::stop()
  {
    std::lock_guard<std::mutex> lock(mRunMutex);
    if (!mRunning)
      return;

    mIoContext.stop();
    if (mThread.joinable())
      mThread.join();

    mTimer.reset();
    mRunning = false;
    mLog.info(kComponent, "Monitoring stopped");
  }

  bool ExperimentMonitor::isRunning() const
  {
    std::lock_guard<std::mutex> lock(mRunMutex);
    return mRunning;
  }
}
