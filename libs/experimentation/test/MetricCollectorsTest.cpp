#include <catch2/catch.hpp>
#include <stdexcept>
#include <string>
#include <vector>
#include "ExperimentExceptions.h"
#include "MetricCollectors.h"
#include "ExperimentTestHelpers.h"

using Catch::Detail::Approx;
using namespace abtesting;
using namespace abtesting::testing;

TEST_CASE("collectorForMetric routes by name", "[MetricCollectors]")
{
    REQUIRE(collectorForMetric("confidence") == MetricCollectorKind::Confidence);
    REQUIRE(collectorForMetric("latency") == MetricCollectorKind::Latency);
    REQUIRE(collectorForMetric("engagement") == MetricCollectorKind::Engagement);
    REQUIRE_FALSE(collectorForMetric("conversion").has_value());
    REQUIRE(toString(MetricCollectorKind::Accuracy) == "accuracy");
}

TEST_CASE("ConfidenceMetricCollector", "[MetricCollectors][confidence]")
{
    const Experiment experiment = makeExperiment("exp_conf");
    ConfidenceMetricCollector collector;

    for (double value : { 0.1, 0.5, 0.95, 1.0 })
        collector.collect(makeEvent("u1", "exp_conf", "confidence", value), "control");

    const auto summaries = collector.calculate(experiment);
    REQUIRE(summaries.size() == 1);

    const ConfidenceSummary& summary = summaries.at("control");
    REQUIRE(summary.count == 4);
    REQUIRE(summary.mean == Approx(0.6375));
    REQUIRE(summary.min == Approx(0.1));
    REQUIRE(summary.max == Approx(1.0));
    REQUIRE(summary.distribution[0] == 1);
    REQUIRE(summary.distribution[1] == 0);
    REQUIRE(summary.distribution[2] == 1);
    REQUIRE(summary.distribution[4] == 2);

    SECTION("Out of range and non numeric values are rejected")
    {
        REQUIRE_THROWS_AS(collector.collect(makeEvent("u1", "exp_conf", "confidence", 1.5), "control"),
                          InvalidMetricValueException);
        REQUIRE_THROWS_AS(collector.collect(makeEvent("u1", "exp_conf", "confidence",
                                                      AccuracyObservation{ true, true }), "control"),
                          InvalidMetricValueException);
        REQUIRE(collector.calculate(experiment).at("control").count == 4);
    }
}

TEST_CASE("ConvergenceMetricCollector", "[MetricCollectors][convergence]")
{
    ConvergenceMetricCollector collector(5, 0.01);

    SECTION("A flat series converges")
    {
        const ConvergenceSummary summary = collector.summarize(std::vector<double>(20, 1.0));
        REQUIRE(summary.count == 20);
        REQUIRE(summary.converged);
        REQUIRE(summary.stability == Approx(1.0));
        REQUIRE(summary.finalValue == Approx(1.0));
    }

    SECTION("Fewer values than the window report the mean only")
    {
        const ConvergenceSummary summary = collector.summarize({ 1.0, 2.0, 3.0 });
        REQUIRE_FALSE(summary.converged);
        REQUIRE(summary.finalValue == Approx(2.0));
        REQUIRE(summary.stability == 0.0);
    }

    SECTION("A series that settles down reports a positive convergence rate")
    {
        std::vector<double> values;
        for (int i = 0; i < 25; ++i)
            values.push_back((i % 2 == 0) ? 0.0 : 10.0);
        for (int i = 0; i < 25; ++i)
            values.push_back(5.0);

        const ConvergenceSummary summary = collector.summarize(values);
        REQUIRE(summary.convergenceRate > 0.0);
        REQUIRE(summary.convergenceRate <= 1.0);
        REQUIRE(summary.converged);
    }

    SECTION("Bad parameters")
    {
        REQUIRE_THROWS_AS(ConvergenceMetricCollector(0, 0.01), std::invalid_argument);
        REQUIRE_THROWS_AS(ConvergenceMetricCollector(5, 0.0), std::invalid_argument);
    }
}

TEST_CASE("AccuracyMetricCollector builds a confusion matrix", "[MetricCollectors][accuracy]")
{
    const Experiment experiment = makeExperiment("exp_acc");
    AccuracyMetricCollector collector;

    const std::vector<AccuracyObservation> observations = {
        { true, true }, { true, true }, { true, false }, { false, true }, { false, false }
    };
    for (const auto& observation : observations)
        collector.collect(makeEvent("u1", "exp_acc", "accuracy", observation), "treatment");

    const AccuracySummary summary = collector.calculate(experiment).at("treatment");
    REQUIRE(summary.truePositives == 2);
    REQUIRE(summary.falsePositives == 1);
    REQUIRE(summary.falseNegatives == 1);
    REQUIRE(summary.trueNegatives == 1);
    REQUIRE(summary.total == 5);
    REQUIRE(summary.accuracy == Approx(0.6));
    REQUIRE(summary.precision == Approx(2.0 / 3.0));
    REQUIRE(summary.recall == Approx(2.0 / 3.0));
    REQUIRE(summary.f1Score == Approx(2.0 / 3.0));

    REQUIRE_THROWS_AS(collector.collect(makeEvent("u1", "exp_acc", "accuracy", 1.0), "treatment"),
                      InvalidMetricValueException);
}

TEST_CASE("LatencyMetricCollector", "[MetricCollectors][latency]")
{
    const Experiment experiment = makeExperiment("exp_lat");
    LatencyMetricCollector collector;

    for (int i = 100; i >= 1; --i)
        collector.collect(makeEvent("u1", "exp_lat", "latency", static_cast<double>(i)), "control");

    const LatencySummary summary = collector.calculate(experiment).at("control");
    REQUIRE(summary.count == 100);
    REQUIRE(summary.min == 1.0);
    REQUIRE(summary.max == 100.0);
    REQUIRE(summary.mean == Approx(50.5));
    REQUIRE(summary.median == Approx(50.5));
    REQUIRE(summary.p95 >= 95.0);
    REQUIRE(summary.p95 <= 96.0);
    REQUIRE(summary.p99 >= 99.0);
    REQUIRE(summary.p99 <= 100.0);
    REQUIRE(collector.calculate(experiment).count("treatment") == 0);

    REQUIRE_THROWS_AS(collector.collect(makeEvent("u1", "exp_lat", "latency", -1.0), "control"),
                      InvalidMetricValueException);
}

TEST_CASE("EngagementMetricCollector", "[MetricCollectors][engagement]")
{
    using namespace boost::posix_time;

    const Experiment experiment = makeExperiment("exp_eng");
    EngagementMetricCollector collector;
    const ptime start(boost::gregorian::date(2026, 1, 5), hours(9));

    const auto action = [&](const std::string& user, const std::string& name, ptime when) {
        MetricEvent event = makeEvent(user, "exp_eng", "engagement", 1.0);
        event.metadata["action"] = name;
        event.timestamp = when;
        collector.collect(event, "treatment");
    };

    action("u1", "click", start);
    action("u1", "click", start + seconds(10));
    action("u2", "view", start);

    const EngagementSummary summary = collector.calculate(experiment).at("treatment");
    REQUIRE(summary.activeUsers == 2);
    REQUIRE(summary.totalActions == 3);
    REQUIRE(summary.avgActionsPerUser == Approx(1.5));
    REQUIRE(summary.avgSessionLengthSeconds == Approx(5.0));
    REQUIRE(summary.actionDistribution.at("click") == 2);
    REQUIRE(summary.actionDistribution.at("view") == 1);
}

TEST_CASE("MetricCollectorSet fans events out", "[MetricCollectors][set]")
{
    const Experiment experiment = makeExperiment("exp_set");
    MetricCollectorSet collectors(5, 0.01);

    REQUIRE(collectors.collect(makeEvent("u1", "exp_set", "latency", 12.0), "control"));
    REQUIRE(collectors.collect(makeEvent("u1", "exp_set", "confidence", 0.9), "control"));
    REQUIRE_FALSE(collectors.collect(makeEvent("u1", "exp_set", "conversion", 1.0), "control"));

    const MLMetricsSummary summary = collectors.summarize(experiment);
    REQUIRE(summary.latency.at("control").count == 1);
    REQUIRE(summary.confidence.at("control").count == 1);
    REQUIRE(summary.accuracy.empty());
    REQUIRE(summary.engagement.empty());
}
