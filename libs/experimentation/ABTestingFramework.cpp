// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "ABTestingFramework.h"
#include <cmath>
#include <shared_mutex>
#include <sstream>
#include <stdexcept>
#include "AnalysisData.h"
#include "ExperimentExceptions.h"

namespace abtesting
{
  namespace
  {
    const char* const kComponent = "ABTestingFramework";

    boost::posix_time::ptime now()
    {
      return boost::posix_time::microsec_clock::universal_time();
    }

    double elapsedMicros(boost::posix_time::ptime start)
    {
      return static_cast<double>((now() - start).total_microseconds());
    }

    std::string joinMessages(const std::vector<std::string>& messages)
    {
      std::ostringstream joined;
      for (std::size_t i = 0; i < messages.size(); ++i)
        {
          if (i > 0)
            joined << "; ";
          joined << messages[i];
        }
      return joined.str();
    }
  }

  FrameworkConfiguration ABTestingFramework::validatedConfiguration(const FrameworkConfiguration& config)
  {
    const std::vector<std::string> errors = config.validate();
    if (!errors.empty())
      throw FrameworkConfigurationException("Invalid framework configuration: " + joinMessages(errors));

    return config;
  }

  std::unique_ptr<RandomSource> ABTestingFramework::makeRandomSource(const FrameworkConfiguration& config)
  {
    if (config.randomSeed)
      return std::make_unique<RandomSource>(*config.randomSeed);

    return std::make_unique<RandomSource>();
  }

  ABTestingFramework::ABTestingFramework(const FrameworkConfiguration& config, std::ostream& logStream)
    : ExperimentEventSubject(),
      MonitoredExperimentSource(),
      mConfig(validatedConfiguration(config)),
      mLog(logStream),
      mRandom(makeRandomSource(mConfig)),
      mRepository(),
      mAssignments(),
      mMetrics(),
      mStrategies(*mRandom, mConfig.banditEpsilon, mConfig.contextualExplorationRate, mConfig.contextualLearningRate),
      mCollectors(mConfig.convergenceWindow, mConfig.convergenceThreshold),
      mFrequentist(mConfig.confidenceLevel, mConfig.multipleTestingCorrection, mConfig.srmThreshold),
      mBayesian(),
      mSequential(),
      mShadow(),
      mResultsMutex(),
      mLatestResults(),
      mAssignmentTimes(),
      mAnalysisTimes(),
      mMonitor(*this,
               MonitorSettings{ mConfig.maxExperimentDuration, mConfig.monitorInterval, mConfig.srmThreshold },
               mLog)
  {
    if (mConfig.enableBayesian)
      mBayesian = std::make_unique<BayesianAnalysisEngine>(*mRandom, mConfig.monteCarloSimulations,
                                                           mConfig.confidenceLevel);

    if (mConfig.enableSequentialTesting)
      mSequential = std::make_unique<SequentialAnalysisEngine>(mConfig.sequentialStages, mConfig.sequentialAlpha);

    if (mConfig.startMonitor)
      mMonitor.start();

    mLog.info(kComponent, "A/B testing framework initialized");
  }

  ABTestingFramework::~ABTestingFramework()
  {
    mMonitor.stop();
  }

  void ABTestingFramework::notifyObservers(const ExperimentEvent& event)
  {
    std::shared_lock<std::shared_mutex> lock(m_observersMutex);
    for (auto* observer : m_observers)
      {
        if (!observer)
          continue;

        try
          {
            observer->update(event);
          }
        catch (const std::exception& e)
          {
            mLog.error(kComponent, "Observer failed on " + getEventName(event.type) + " for experiment " +
                       event.experimentId + ": " + e.what());
          }
      }
  }

  ExperimentEvent ABTestingFramework::makeEvent(ExperimentEventType type, const std::string& experimentId) const
  {
    ExperimentEvent event;
    event.type = type;
    event.experimentId = experimentId;
    event.timestamp = now();
    return event;
  }

  Experiment ABTestingFramework::createExperiment(const ExperimentConfig& config)
  {
    const std::vector<std::string> errors = validateExperimentConfig(config);
    if (!errors.empty())
      throw ExperimentValidationException("Invalid experiment configuration: " + joinMessages(errors));

    const AssignmentStrategyKind strategy = parseAssignmentStrategyKind(config.assignmentStrategy);
    const MetricType metricType = config.primaryMetricType.value_or(inferMetricType(config.primaryMetric));

    PowerAnalysisParameters params;
    params.baselineRate = config.baselineRate;
    params.minimumDetectableEffect = config.minimumDetectableEffect;
    params.confidenceLevel = mConfig.confidenceLevel;
    params.power = mConfig.power;
    params.numVariants = config.variants.size();
    params.metricType = metricType;
    params.estimatedStdDev = config.estimatedStdDev;
    params.usersPerDay = mConfig.expectedUsersPerDay;

    PowerAnalysisResult powerAnalysis;
    try
      {
        powerAnalysis = PowerAnalysisCalculator::calculate(params);
      }
    catch (const std::invalid_argument& e)
      {
        throw ExperimentValidationException(std::string("Power analysis rejected the experiment: ") + e.what());
      }

    // The configured minimum sample size is a floor on the total.
    if (powerAnalysis.totalSampleSize < mConfig.minSampleSize)
      {
        const std::size_t numVariants = params.numVariants;
        powerAnalysis.sampleSizePerVariant = (mConfig.minSampleSize + numVariants - 1) / numVariants;
        powerAnalysis.totalSampleSize = powerAnalysis.sampleSizePerVariant * numVariants;
        powerAnalysis.minRunTimeDays =
          static_cast<std::size_t>(std::ceil(static_cast<double>(powerAnalysis.totalSampleSize) / params.usersPerDay));
      }

    const std::string id = config.id ? *config.id : mRepository.generateId();
    const boost::posix_time::ptime createdAt = now();
    Experiment experiment(id, config, normalizeVariants(config.variants), strategy, metricType,
                          powerAnalysis, createdAt);

    if (!mRepository.insert(experiment))
      throw ExperimentValidationException("Experiment id already exists: " + id);

    if (experiment.isShadowMode())
      mShadow.setupExperiment(id);

    mMonitor.trackExperiment(id, experiment.getStartedAt());
    ++mExperimentsCreated;

    std::ostringstream msg;
    msg << "Created experiment " << id << " (" << experiment.getName() << ") with "
        << experiment.getVariants().size() << " variants, strategy " << toString(strategy)
        << ", required sample size " << experiment.getRequiredSampleSize();
    mLog.info(kComponent, msg.str());

    ExperimentEvent event = makeEvent(ExperimentEventType::ExperimentCreated, id);
    event.experiment = experiment;
    notifyObservers(event);

    return experiment;
  }

  std::optional<std::string> ABTestingFramework::assignUserToExperiment(const std::string& userId,
                                                                        const std::string& experimentId,
                                                                        const AssignmentContext& context)
  {
    const boost::posix_time::ptime start = now();

    try
      {
        const std::optional<Experiment> experiment = mRepository.find(experimentId);
        if (!experiment || !experiment->isActive())
          return std::nullopt;

        if (!targeting::evaluate(experiment->getTargetingRules(), userId, context))
          return std::nullopt;

        const auto [assignment, created] =
          mAssignments.assignIfAbsent(userId, experimentId, context, [&]() {
            return mStrategies.assign(experiment->getAssignmentStrategy(), userId, *experiment, context);
          });

        if (created)
          {
            ++mAssignmentsMade;
            mAssignmentTimes.addValue(elapsedMicros(start));

            ExperimentEvent event = makeEvent(ExperimentEventType::UserAssigned, experimentId);
            event.userId = userId;
            event.variant = assignment.variant;
            notifyObservers(event);
          }

        return assignment.variant;
      }
    catch (const std::exception& e)
      {
        mLog.error(kComponent, "Failed to assign user " + userId + " to experiment " + experimentId + ": " + e.what());
        return std::nullopt;
      }
  }

  void ABTestingFramework::trackMetric(const MetricEvent& event)
  {
    try
      {
        const std::optional<Experiment> experiment = mRepository.find(event.experimentId);
        if (!experiment || !experiment->isActive())
          return;

        const std::optional<Assignment> assignment = mAssignments.find(event.userId, event.experimentId);
        if (!assignment)
          return;

        MetricEvent stamped = event;
        if (!stamped.timestamp)
          stamped.timestamp = now();

        mCollectors.collect(stamped, assignment->variant);

        if (experiment->isShadowMode())
          mShadow.trackMetric(stamped, assignment->variant);

        mMetrics.append(event.experimentId, assignment->variant, event.metricName,
                        MetricRecord{ event.userId, event.value, event.metadata, *stamped.timestamp });
        ++mMetricsCollected;

        if (event.metricName == experiment->getPrimaryMetric() &&
            isBanditStrategy(experiment->getAssignmentStrategy()))
          applyBanditReward(*experiment, *assignment, toAnalysisValue(event.value));

        if (mSequential && event.metricName == experiment->getPrimaryMetric())
          checkSequentialBoundary(*experiment);
      }
    catch (const std::exception& e)
      {
        mLog.error(kComponent, "Failed to track metric '" + event.metricName + "' for user " + event.userId +
                   " in experiment " + event.experimentId + ": " + e.what());
      }
  }

  void ABTestingFramework::applyBanditReward(const Experiment& experiment,
                                             const Assignment& assignment,
                                             double reward)
  {
    switch (experiment.getAssignmentStrategy())
      {
      case AssignmentStrategyKind::MultiArmedBandit:
        mStrategies.getMultiArmedBandit().updateReward(experiment.getId(), assignment.variant, reward);
        break;
      case AssignmentStrategyKind::ContextualBandit:
        mStrategies.getContextualBandit().updateModel(experiment.getId(), assignment.variant,
                                                      assignment.context, reward);
        break;
      case AssignmentStrategyKind::Random:
      case AssignmentStrategyKind::Deterministic:
      case AssignmentStrategyKind::Stratified:
        break;
      }
  }

  bool ABTestingFramework::updateBanditReward(const std::string& experimentId,
                                              const std::string& userId,
                                              double reward)
  {
    const std::optional<Experiment> experiment = mRepository.find(experimentId);
    if (!experiment)
      throw ExperimentNotFoundException("Experiment not found: " + experimentId);

    if (!isBanditStrategy(experiment->getAssignmentStrategy()))
      return false;

    const std::optional<Assignment> assignment = mAssignments.find(userId, experimentId);
    if (!assignment)
      return false;

    applyBanditReward(*experiment, *assignment, reward);
    return true;
  }

  void ABTestingFramework::checkSequentialBoundary(const Experiment& experiment)
  {
    const auto [control, treatment] = resolveComparison(experiment, AnalysisOptions());
    const std::map<std::string, MetricMoments> moments =
      mMetrics.getMoments(experiment.getId(), experiment.getPrimaryMetric());

    auto controlIt = moments.find(control);
    auto treatmentIt = moments.find(treatment);
    if (controlIt == moments.end() || treatmentIt == moments.end())
      return;

    SequentialResult result;
    try
      {
        result = mSequential->analyze(experiment.getPrimaryMetricType(), controlIt->second, treatmentIt->second,
                                      getObservedSampleSize(experiment.getId()),
                                      experiment.getRequiredSampleSize(), control, treatment);
      }
    catch (const InsufficientDataException&)
      {
        return;
      }

    if (!result.decision)
      return;

    std::ostringstream msg;
    msg << "Sequential boundary crossed for experiment " << experiment.getId() << " at stage "
        << result.decision->stage << " (z = " << result.decision->testStatistic << "), winner "
        << result.decision->winningVariant;
    mLog.info(kComponent, msg.str());

    try
      {
        stopExperiment(experiment.getId(), StopOptions{ "sequential_boundary_reached", AnalysisOptions() });
      }
    catch (const InvalidExperimentStateException& e)
      {
        mLog.info(kComponent, e.what());
      }
  }

  std::pair<std::string, std::string> ABTestingFramework::resolveComparison(const Experiment& experiment,
                                                                            const AnalysisOptions& options) const
  {
    const std::vector<Variant>& variants = experiment.getVariants();

    std::string control = options.controlVariant.value_or("control");
    if (!options.controlVariant && !experiment.findVariant(control))
      control = variants[0].getName();

    std::string treatment = options.treatmentVariant.value_or("treatment");
    if (!options.treatmentVariant && !experiment.findVariant(treatment))
      {
        for (const auto& variant : variants)
          {
            if (variant.getName() != control)
              {
                treatment = variant.getName();
                break;
              }
          }
      }

    if (control == treatment)
      throw AnalysisException("Experiment " + experiment.getId() + " compares variant '" + control +
                              "' with itself");

    return { control, treatment };
  }

  std::shared_ptr<const AnalysisResult> ABTestingFramework::storeAnalysis(const std::string& experimentId,
                                                                          std::shared_ptr<AnalysisResult> result)
  {
    std::shared_ptr<const AnalysisResult> snapshot = std::move(result);

    std::lock_guard<std::mutex> lock(mResultsMutex);
    mLatestResults[experimentId] = snapshot;
    return snapshot;
  }

  std::shared_ptr<const AnalysisResult> ABTestingFramework::analyzeExperiment(const std::string& experimentId,
                                                                              const AnalysisOptions& options)
  {
    const boost::posix_time::ptime start = now();

    const std::optional<Experiment> experiment = mRepository.find(experimentId);
    if (!experiment)
      throw ExperimentNotFoundException("Experiment not found: " + experimentId);

    auto result = std::make_shared<AnalysisResult>();
    result->experimentId = experimentId;
    result->analyzedAt = start;
    result->runtime = start - experiment->getStartedAt();

    if (!mMetrics.hasMetrics(experimentId))
      {
        result->status = AnalysisStatus::InsufficientData;
        result->message = "No metrics collected yet";
        return storeAnalysis(experimentId, result);
      }

    try
      {
        const AnalysisData data = AnalysisData::prepare(*experiment,
                                                        mMetrics.snapshot(experimentId),
                                                        mAssignments.getVariantCounts(experimentId));
        const auto [control, treatment] = resolveComparison(*experiment, options);
        result->sampleSizes = data.getSampleSizes();

        try
          {
            result->frequentist = mFrequentist.analyze(data, control, treatment);
          }
        catch (const InsufficientDataException& e)
          {
            result->status = AnalysisStatus::InsufficientData;
            result->message = e.what();
            mLog.info(kComponent, "Experiment " + experimentId + " has insufficient data: " + e.what());
            return storeAnalysis(experimentId, result);
          }

        if (mBayesian)
          {
            try
              {
                result->bayesian = mBayesian->analyze(data);
              }
            catch (const InsufficientDataException& e)
              {
                mLog.warn(kComponent, "Bayesian analysis skipped for " + experimentId + ": " + e.what());
              }
          }

        if (mSequential)
          {
            try
              {
                result->sequential = mSequential->analyze(data, control, treatment);
              }
            catch (const InsufficientDataException& e)
              {
                mLog.warn(kComponent, "Sequential analysis skipped for " + experimentId + ": " + e.what());
              }
          }

        result->mlMetrics = mCollectors.summarize(*experiment);
      }
    catch (const std::exception& e)
      {
        mLog.error(kComponent, "Failed to analyze experiment " + experimentId + ": " + e.what());
        throw;
      }

    result->status = AnalysisStatus::Complete;
    result->message = "Analysis complete";

    ++mAnalysesPerformed;
    mAnalysisTimes.addValue(elapsedMicros(start));

    std::shared_ptr<const AnalysisResult> snapshot = storeAnalysis(experimentId, result);

    ExperimentEvent event = makeEvent(ExperimentEventType::ExperimentAnalyzed, experimentId);
    event.results = snapshot;
    notifyObservers(event);

    return snapshot;
  }

  StopResult ABTestingFramework::stopExperiment(const std::string& experimentId, const StopOptions& options)
  {
    Experiment stopped = mRepository.stop(experimentId, options.reason, now());

    mMonitor.stopTracking(experimentId);
    if (stopped.isShadowMode())
      mShadow.teardownExperiment(experimentId);

    std::shared_ptr<const AnalysisResult> results;
    try
      {
        results = analyzeExperiment(experimentId, options.analysis);
      }
    catch (const std::exception& e)
      {
        mLog.error(kComponent, "Final analysis failed for experiment " + experimentId + ": " + e.what());
      }

    mLog.info(kComponent, "Stopped experiment " + experimentId + " (" + options.reason + ")");

    ExperimentEvent event = makeEvent(ExperimentEventType::ExperimentStopped, experimentId);
    event.experiment = stopped;
    event.results = results;
    notifyObservers(event);

    return StopResult{ stopped, results };
  }

  FrameworkStatus ABTestingFramework::getStatus() const
  {
    FrameworkStatus status;
    status.totalExperiments = mRepository.size();
    status.activeExperiments = mRepository.countWithStatus(ExperimentStatus::Active);
    status.stoppedExperiments = mRepository.countWithStatus(ExperimentStatus::Stopped);

    status.performance.experimentsCreated = mExperimentsCreated.load();
    status.performance.assignmentsMade = mAssignmentsMade.load();
    status.performance.metricsCollected = mMetricsCollected.load();
    status.performance.analysesPerformed = mAnalysesPerformed.load();
    status.performance.avgAssignmentTimeMicros = mAssignmentTimes.getMean().value_or(0.0);
    status.performance.avgAnalysisTimeMicros = mAnalysisTimes.getMean().value_or(0.0);

    status.bayesianEnabled = static_cast<bool>(mBayesian);
    status.sequentialEnabled = static_cast<bool>(mSequential);
    status.monitorRunning = mMonitor.isRunning();
    status.monitoredExperiments = mMonitor.getTrackedCount();
    return status;
  }

  std::optional<Experiment> ABTestingFramework::getExperiment(const std::string& experimentId) const
  {
    return mRepository.find(experimentId);
  }

  std::vector<Experiment> ABTestingFramework::getExperiments() const
  {
    return mRepository.getAll();
  }

  std::shared_ptr<const AnalysisResult> ABTestingFramework::getLatestAnalysis(const std::string& experimentId) const
  {
    std::lock_guard<std::mutex> lock(mResultsMutex);
    auto it = mLatestResults.find(experimentId);
    return it == mLatestResults.end() ? nullptr : it->second;
  }

  std::optional<Assignment> ABTestingFramework::getAssignment(const std::string& userId,
                                                              const std::string& experimentId) const
  {
    return mAssignments.find(userId, experimentId);
  }

  std::optional<ShadowMetrics> ABTestingFramework::getShadowMetrics(const std::string& experimentId) const
  {
    return mShadow.getShadowMetrics(experimentId);
  }

  void ABTestingFramework::handleConfidenceUpdate(const std::string& userId,
                                                  double confidence,
                                                  const MetricMetadata& metadata)
  {
    for (const Experiment& experiment : mRepository.getActive())
      {
        if (!experiment.tracksMetric("confidence"))
          continue;

        trackMetric(MetricEvent{ userId, experiment.getId(), "confidence", confidence, metadata, std::nullopt });
      }
  }

  void ABTestingFramework::handleUserAction(const std::string& userId,
                                            const std::string& action,
                                            const MetricMetadata& metadata)
  {
    MetricMetadata tagged = metadata;
    tagged["action"] = action;

    for (const Experiment& experiment : mRepository.getActive())
      {
        if (!experiment.tracksMetric("engagement"))
          continue;

        trackMetric(MetricEvent{ userId, experiment.getId(), "engagement", 1.0, tagged, std::nullopt });
      }
  }

  void ABTestingFramework::startMonitor()
  {
    mMonitor.start();
  }

  void ABTestingFramework::stopMonitor()
  {
    mMonitor.stop();
  }

  void ABTestingFramework::shutdown()
  {
    mMonitor.stop();

    for (const Experiment& experiment : mRepository.getActive())
      {
        try
          {
            stopExperiment(experiment.getId(), StopOptions{ "framework_shutdown", AnalysisOptions() });
          }
        catch (const InvalidExperimentStateException& e)
          {
            mLog.info(kComponent, e.what());
          }
      }

    mLog.info(kComponent, "A/B testing framework shut down");
  }

  std::optional<Experiment> ABTestingFramework::findExperiment(const std::string& experimentId) const
  {
    return mRepository.find(experimentId);
  }

  std::map<std::string, std::size_t> ABTestingFramework::getAssignmentCounts(const std::string& experimentId) const
  {
    return mAssignments.getVariantCounts(experimentId);
  }

  std::size_t ABTestingFramework::getObservedSampleSize(const std::string& experimentId) const
  {
    std::size_t total = 0;
    for (const auto& [variant, users] : mMetrics.getUserCounts(experimentId))
      total += users;
    return total;
  }

  void ABTestingFramework::forceStop(const std::string& experimentId, const std::string& reason)
  {
    stopExperiment(experimentId, StopOptions{ reason, AnalysisOptions() });
  }

  void ABTestingFramework::raiseAlert(const ExperimentAlert& alert)
  {
    mLog.warn(kComponent, "Alert " + toString(alert.type) + " (" + toString(alert.severity) + ") for experiment " +
              alert.experimentId + ": " + alert.message);

    ExperimentEvent event = makeEvent(ExperimentEventType::ExperimentAlert, alert.experimentId);
    event.alert = alert;
    notifyObservers(event);
  }
}
