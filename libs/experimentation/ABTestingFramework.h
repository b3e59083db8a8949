// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ABTESTING_AB_TESTING_FRAMEWORK_H
#define __ABTESTING_AB_TESTING_FRAMEWORK_H 1

#include <atomic>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "AnalysisResult.h"
#include "AssignmentStrategy.h"
#include "AssignmentTable.h"
#include "BayesianAnalysisEngine.h"
#include "Experiment.h"
#include "ExperimentEventSubject.h"
#include "ExperimentLog.h"
#include "ExperimentMonitor.h"
#include "ExperimentRepository.h"
#include "FrameworkConfiguration.h"
#include "FrequentistAnalysisEngine.h"
#include "MetricCollectors.h"
#include "MetricEvent.h"
#include "MetricStore.h"
#include "RngUtils.h"
#include "SequentialAnalysisEngine.h"
#include "ShadowModeController.h"
#include "ThreadSafeAccumulator.h"

namespace abtesting
{
  /**
   * @brief Which arms an analysis compares. Unset names resolve to "control"
   *        and "treatment" when the experiment has them, otherwise to its first
   *        and second variants.
   */
  struct AnalysisOptions
  {
    std::optional<std::string> controlVariant;
    std::optional<std::string> treatmentVariant;
  };

  struct StopOptions
  {
    std::string reason = "manual";
    AnalysisOptions analysis;
  };

  struct StopResult
  {
    Experiment experiment;
    std::shared_ptr<const AnalysisResult> results;   // null if the final analysis failed
  };

  struct PerformanceMetrics
  {
    std::size_t experimentsCreated = 0;
    std::size_t assignmentsMade = 0;
    std::size_t metricsCollected = 0;
    std::size_t analysesPerformed = 0;
    double avgAssignmentTimeMicros = 0.0;
    double avgAnalysisTimeMicros = 0.0;
  };

  struct FrameworkStatus
  {
    std::size_t totalExperiments = 0;
    std::size_t activeExperiments = 0;
    std::size_t stoppedExperiments = 0;
    PerformanceMetrics performance;
    bool bayesianEnabled = false;
    bool sequentialEnabled = false;
    bool monitorRunning = false;
    std::size_t monitoredExperiments = 0;
  };

  /**
   * @class ABTestingFramework
   * @brief Owns the experiment registry and ties assignment, metric
   *        ingestion, analysis and monitoring together.
   *
   * assignUserToExperiment and trackMetric are hot paths and never throw;
   * failures are logged and the call degrades to std::nullopt or a no-op.
   * Events are delivered synchronously to attached observers.
   */
  class ABTestingFramework : public ExperimentEventSubject,
                             public MonitoredExperimentSource
  {
  public:
    /**
     * @param logStream Destination of the framework log
     * @throws FrameworkConfigurationException if the configuration is invalid
     */
    explicit ABTestingFramework(const FrameworkConfiguration& config,
                                std::ostream& logStream = std::cout);

    ~ABTestingFramework() override;

    ABTestingFramework(const ABTestingFramework&) = delete;
    ABTestingFramework& operator=(const ABTestingFramework&) = delete;

    /**
     * @brief Validates the definition, runs power analysis and registers the
     *        experiment as active.
     *
     * @throws ExperimentValidationException on a malformed definition or a duplicate id
     * @throws UnknownAssignmentStrategyException on an unregistered strategy name
     */
    Experiment createExperiment(const ExperimentConfig& config);

    /**
     * @return The user's variant, or std::nullopt when the experiment is
     *         unknown or stopped, or the user fails targeting.
     */
    std::optional<std::string> assignUserToExperiment(const std::string& userId,
                                                      const std::string& experimentId,
                                                      const AssignmentContext& context = AssignmentContext());

    /**
     * @brief Records a metric event for an assigned user of an active
     *        experiment; any other event is ignored.
     */
    void trackMetric(const MetricEvent& event);

    /**
     * @throws ExperimentNotFoundException for an unknown id
     * @throws AnalysisException if a requested variant does not exist
     */
    std::shared_ptr<const AnalysisResult> analyzeExperiment(const std::string& experimentId,
                                                            const AnalysisOptions& options = AnalysisOptions());

    /**
     * @throws ExperimentNotFoundException for an unknown id
     * @throws InvalidExperimentStateException if the experiment is already stopped
     */
    StopResult stopExperiment(const std::string& experimentId,
                              const StopOptions& options = StopOptions());

    FrameworkStatus getStatus() const;

    std::optional<Experiment> getExperiment(const std::string& experimentId) const;

    std::vector<Experiment> getExperiments() const;

    /// Most recent analysis snapshot, or null if none has run.
    std::shared_ptr<const AnalysisResult> getLatestAnalysis(const std::string& experimentId) const;

    std::optional<Assignment> getAssignment(const std::string& userId, const std::string& experimentId) const;

    std::optional<ShadowMetrics> getShadowMetrics(const std::string& experimentId) const;

    /**
     * @brief Credits a reward to the arm the user was assigned to.
     *
     * @return false if the user is unassigned or the experiment does not use a bandit strategy
     * @throws ExperimentNotFoundException for an unknown id
     */
    bool updateBanditReward(const std::string& experimentId, const std::string& userId, double reward);

    /// Tracks "confidence" for every active experiment declaring that metric.
    void handleConfidenceUpdate(const std::string& userId,
                                double confidence,
                                const MetricMetadata& metadata = MetricMetadata());

    /// Tracks "engagement" = 1 for every active experiment declaring that metric.
    void handleUserAction(const std::string& userId,
                          const std::string& action,
                          const MetricMetadata& metadata = MetricMetadata());

    void startMonitor();

    void stopMonitor();

    /// Stops the monitor, then every active experiment with reason "framework_shutdown".
    void shutdown();

    ExperimentMonitor& getMonitor()
    {
      return mMonitor;
    }

    const FrameworkConfiguration& getConfiguration() const
    {
      return mConfig;
    }

    AssignmentStrategySet& getAssignmentStrategies()
    {
      return mStrategies;
    }

    const MetricCollectorSet& getMetricCollectors() const
    {
      return mCollectors;
    }

    // MonitoredExperimentSource
    std::optional<Experiment> findExperiment(const std::string& experimentId) const override;
    std::map<std::string, std::size_t> getAssignmentCounts(const std::string& experimentId) const override;
    std::size_t getObservedSampleSize(const std::string& experimentId) const override;
    void forceStop(const std::string& experimentId, const std::string& reason) override;
    void raiseAlert(const ExperimentAlert& alert) override;

  private:
    static FrameworkConfiguration validatedConfiguration(const FrameworkConfiguration& config);
    static std::unique_ptr<RandomSource> makeRandomSource(const FrameworkConfiguration& config);

    std::pair<std::string, std::string> resolveComparison(const Experiment& experiment,
                                                          const AnalysisOptions& options) const;

    std::shared_ptr<const AnalysisResult> storeAnalysis(const std::string& experimentId,
                                                        std::shared_ptr<AnalysisResult> result);

    void applyBanditReward(const Experiment& experiment, const Assignment& assignment, double reward);

    void checkSequentialBoundary(const Experiment& experiment);

    ExperimentEvent makeEvent(ExperimentEventType type, const std::string& experimentId) const;

    /// Delivers to every observer; an observer that throws is logged and skipped.
    void notifyObservers(const ExperimentEvent& event) override;

  private:
    FrameworkConfiguration mConfig;
    ExperimentLog mLog;
    std::unique_ptr<RandomSource> mRandom;

    ExperimentRepository mRepository;
    AssignmentTable mAssignments;
    MetricStore mMetrics;

    AssignmentStrategySet mStrategies;
    MetricCollectorSet mCollectors;
    FrequentistAnalysisEngine mFrequentist;
    std::unique_ptr<BayesianAnalysisEngine> mBayesian;
    std::unique_ptr<SequentialAnalysisEngine> mSequential;
    ShadowModeController mShadow;

    mutable std::mutex mResultsMutex;
    std::map<std::string, std::shared_ptr<const AnalysisResult>> mLatestResults;

    std::atomic<std::size_t> mExperimentsCreated{0};
    std::atomic<std::size_t> mAssignmentsMade{0};
    std::atomic<std::size_t> mMetricsCollected{0};
    std::atomic<std::size_t> mAnalysesPerformed{0};
    ThreadSafeAccumulator mAssignmentTimes;
    ThreadSafeAccumulator mAnalysisTimes;

    ExperimentMonitor mMonitor;
  };
}

#endif
