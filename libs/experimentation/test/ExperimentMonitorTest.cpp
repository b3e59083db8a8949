#include <catch2/catch.hpp>
#include <chrono>
#include <map>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include "ExperimentExceptions.h"
#include "ExperimentMonitor.h"
#include "ExperimentTestHelpers.h"

using namespace abtesting;
using namespace abtesting::testing;

namespace
{
    class FakeExperimentSource : public MonitoredExperimentSource
    {
    public:
        explicit FakeExperimentSource(const Experiment& experiment)
            : mExperiment(experiment)
        {}

        std::optional<Experiment> findExperiment(const std::string& experimentId) const override
        {
            if (experimentId != mExperiment.getId())
                return std::nullopt;
            return mExperiment;
        }

        std::map<std::string, std::size_t> getAssignmentCounts(const std::string&) const override
        {
            return counts;
        }

        std::size_t getObservedSampleSize(const std::string&) const override
        {
            return observed;
        }

        void forceStop(const std::string& experimentId, const std::string& reason) override
        {
            ++forceStops;
            if (rejectStop)
                throw InvalidExperimentStateException("Experiment " + experimentId + " is not active");
            mExperiment.markStopped(reason, boost::posix_time::microsec_clock::universal_time());
        }

        void raiseAlert(const ExperimentAlert& alert) override
        {
            raised.push_back(alert);
        }

        std::map<std::string, std::size_t> counts;
        std::size_t observed = 0;
        bool rejectStop = false;
        int forceStops = 0;
        std::vector<ExperimentAlert> raised;

    private:
        Experiment mExperiment;
    };

    MonitorSettings makeSettings(boost::posix_time::time_duration maxDuration)
    {
        MonitorSettings settings;
        settings.maxExperimentDuration = maxDuration;
        settings.interval = boost::posix_time::milliseconds(10);
        return settings;
    }
}

TEST_CASE("ExperimentMonitor: tracking", "[ExperimentMonitor]")
{
    std::ostringstream out;
    ExperimentLog log(out);
    FakeExperimentSource source(makeExperiment("exp_mon"));
    ExperimentMonitor monitor(source, makeSettings(boost::posix_time::hours(1)), log);

    const auto start = boost::posix_time::microsec_clock::universal_time();
    monitor.trackExperiment("exp_mon", start);
    REQUIRE(monitor.isTracking("exp_mon"));
    REQUIRE(monitor.getTrackedCount() == 1);

    monitor.stopTracking("exp_mon");
    REQUIRE_FALSE(monitor.isTracking("exp_mon"));

    SECTION("Unknown experiments are dropped on the next pass")
    {
        monitor.trackExperiment("exp_gone", start);
        REQUIRE(monitor.checkExperiments(start).empty());
        REQUIRE_FALSE(monitor.isTracking("exp_gone"));
    }
}

TEST_CASE("ExperimentMonitor: sample size alert fires once", "[ExperimentMonitor][alerts]")
{
    std::ostringstream out;
    ExperimentLog log(out);
    FakeExperimentSource source(makeExperiment("exp_mon"));
    ExperimentMonitor monitor(source, makeSettings(boost::posix_time::hours(1)), log);

    const auto start = boost::posix_time::microsec_clock::universal_time();
    monitor.trackExperiment("exp_mon", start);

    REQUIRE(monitor.checkExperiments(start).empty());

    source.observed = 5000;
    const std::vector<ExperimentAlert> alerts = monitor.checkExperiments(start + boost::posix_time::minutes(1));
    REQUIRE(alerts.size() == 1);
    REQUIRE(alerts[0].type == AlertType::SampleSizeReached);
    REQUIRE(alerts[0].severity == AlertSeverity::Info);
    REQUIRE(alerts[0].details.at("currentSampleSize") == 5000.0);
    REQUIRE(toString(alerts[0].type) == "sample_size_reached");

    REQUIRE(monitor.checkExperiments(start + boost::posix_time::minutes(2)).empty());
    REQUIRE(source.raised.size() == 1);
    REQUIRE(monitor.getAlerts("exp_mon").size() == 1);
}

TEST_CASE("ExperimentMonitor: max duration forces a stop", "[ExperimentMonitor][alerts]")
{
    std::ostringstream out;
    ExperimentLog log(out);
    FakeExperimentSource source(makeExperiment("exp_mon"));
    ExperimentMonitor monitor(source, makeSettings(boost::posix_time::hours(1)), log);

    const auto start = boost::posix_time::microsec_clock::universal_time();
    monitor.trackExperiment("exp_mon", start);

    REQUIRE(monitor.checkExperiments(start + boost::posix_time::minutes(59)).empty());

    SECTION("Stop succeeds")
    {
        const auto alerts = monitor.checkExperiments(start + boost::posix_time::hours(2));
        REQUIRE(alerts.size() == 1);
        REQUIRE(alerts[0].type == AlertType::MaxDurationReached);
        REQUIRE(alerts[0].details.at("runtimeSeconds") == 7200.0);
        REQUIRE(source.forceStops == 1);
        REQUIRE_FALSE(source.findExperiment("exp_mon")->isActive());
        REQUIRE_FALSE(monitor.isTracking("exp_mon"));
    }

    SECTION("An experiment stopped concurrently is left alone")
    {
        source.rejectStop = true;
        monitor.checkExperiments(start + boost::posix_time::hours(2));
        REQUIRE(source.forceStops == 1);
        REQUIRE_FALSE(monitor.isTracking("exp_mon"));
        REQUIRE(out.str().find("already stopped") != std::string::npos);
    }
}

TEST_CASE("ExperimentMonitor: periodic checks run on the timer thread", "[ExperimentMonitor][timer]")
{
    std::ostringstream out;
    ExperimentLog log(out);
    FakeExperimentSource source(makeExperiment("exp_mon"));
    ExperimentMonitor monitor(source, makeSettings(boost::posix_time::seconds(0)), log);

    monitor.trackExperiment("exp_mon", boost::posix_time::microsec_clock::universal_time());
    monitor.start();
    REQUIRE(monitor.isRunning());

    for (int i = 0; i < 200 && monitor.isTracking("exp_mon"); ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

    monitor.stop();
    REQUIRE_FALSE(monitor.isRunning());
    REQUIRE_FALSE(monitor.isTracking("exp_mon"));
    REQUIRE(source.forceStops == 1);

    // Restartable after a stop
    monitor.start();
    REQUIRE(monitor.isRunning());
    monitor.stop();
}
