#include <catch2/catch.hpp>
#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include <vector>
#include "AnalysisData.h"
#include "BayesianAnalysisEngine.h"
#include "ExperimentExceptions.h"
#include "FrequentistAnalysisEngine.h"
#include "MetricStore.h"
#include "SequentialAnalysisEngine.h"
#include "ExperimentTestHelpers.h"

using Catch::Detail::Approx;
using namespace abtesting;
using namespace abtesting::testing;

namespace
{
    std::vector<double> binarySample(std::size_t n, std::size_t successes)
    {
        std::vector<double> values(n, 0.0);
        for (std::size_t i = 0; i < successes; ++i)
            values[i] = 1.0;
        return values;
    }

    std::vector<double> sequence(double from, double to)
    {
        std::vector<double> values;
        for (double x = from; x <= to; x += 1.0)
            values.push_back(x);
        return values;
    }

    void appendValues(MetricStore& store,
                      const std::string& experimentId,
                      const std::string& variant,
                      const std::string& metric,
                      const std::vector<double>& values)
    {
        const auto now = boost::posix_time::microsec_clock::universal_time();
        for (std::size_t i = 0; i < values.size(); ++i)
            store.append(experimentId, variant, metric,
                         MetricRecord{ variant + "_user_" + std::to_string(i), values[i], {}, now });
    }
}

TEST_CASE("FrequentistAnalysisEngine: test selection", "[Analysis][frequentist]")
{
    FrequentistAnalysisEngine engine(0.95, MultipleTestingCorrectionMethod::Bonferroni, 0.001);

    SECTION("Identical continuous samples")
    {
        const std::vector<double> values = sequence(1.0, 40.0);
        const MetricTestResult result = engine.testMetric("revenue", values, values);

        REQUIRE(result.test == FrequentistTest::WelchTTest);
        REQUIRE(result.effectSizeMeasure == EffectSizeMeasure::CohensD);
        REQUIRE(result.pValue == Approx(1.0).margin(1e-9));
        REQUIRE(result.effectSize == Approx(0.0).margin(1e-12));
        REQUIRE(result.difference == Approx(0.0).margin(1e-12));
        REQUIRE_FALSE(result.significant);
        REQUIRE(result.controlSampleSize == 40);
    }

    SECTION("Binary samples use the chi-square test")
    {
        const MetricTestResult result = engine.testMetric("conversion", binarySample(100, 20), binarySample(100, 28));

        REQUIRE(result.test == FrequentistTest::ChiSquare);
        REQUIRE(result.effectSizeMeasure == EffectSizeMeasure::Phi);
        REQUIRE(result.statistic == Approx(1.754386).margin(1e-5));
        REQUIRE(result.pValue == Approx(0.18533).margin(1e-4));
        REQUIRE(result.controlMean == Approx(0.20));
        REQUIRE(result.treatmentMean == Approx(0.28));
        REQUIRE(result.difference == Approx(0.08));
        REQUIRE(result.relativeDifference.has_value());
        REQUIRE(*result.relativeDifference == Approx(0.4));
        REQUIRE_FALSE(result.significant);
        REQUIRE(result.confidenceInterval.lower < 0.08);
        REQUIRE(result.confidenceInterval.upper > 0.08);
    }

    SECTION("Skewed samples use the Mann-Whitney test")
    {
        std::vector<double> control(35, 1.0);
        control.insert(control.end(), 5, 100.0);
        std::vector<double> treatment(35, 2.0);
        treatment.insert(treatment.end(), 5, 200.0);

        const MetricTestResult result = engine.testMetric("latency", control, treatment);

        REQUIRE(result.test == FrequentistTest::MannWhitneyU);
        REQUIRE(result.effectSizeMeasure == EffectSizeMeasure::RankBiserial);
        REQUIRE(result.controlMedian == 1.0);
        REQUIRE(result.treatmentMedian == 2.0);
        REQUIRE(result.significant);
    }

    SECTION("A zero control mean leaves the relative difference unset")
    {
        const MetricTestResult result = engine.testMetric("conversion", binarySample(50, 0), binarySample(50, 5));
        REQUIRE_FALSE(result.relativeDifference.has_value());
    }

    SECTION("Missing observations")
    {
        REQUIRE_THROWS_AS(engine.testMetric("conversion", {}, binarySample(10, 2)), InsufficientDataException);
        REQUIRE_THROWS_AS(engine.testMetric("revenue", { 3.5 }, { 1.5, 2.5 }), InsufficientDataException);
    }

    SECTION("Bad construction")
    {
        REQUIRE_THROWS_AS(FrequentistAnalysisEngine(1.0, MultipleTestingCorrectionMethod::None, 0.001),
                          std::invalid_argument);
    }
}

TEST_CASE("FrequentistAnalysisEngine: sample ratio mismatch", "[Analysis][frequentist][srm]")
{
    const std::vector<Variant> variants =
        normalizeVariants({ VariantConfig{ "control", 1.0 }, VariantConfig{ "treatment", 1.0 } });

    SECTION("Heavy imbalance is detected")
    {
        const SampleRatioMismatchResult srm = FrequentistAnalysisEngine::checkSampleRatioMismatch(
            variants, { { "control", 600 }, { "treatment", 400 } }, 0.001);

        REQUIRE(srm.statistic == Approx(40.0));
        REQUIRE(srm.degreesOfFreedom == 1.0);
        REQUIRE(srm.detected);
        REQUIRE(srm.expected.at("control") == Approx(500.0));
    }

    SECTION("Small imbalance is not")
    {
        const SampleRatioMismatchResult srm = FrequentistAnalysisEngine::checkSampleRatioMismatch(
            variants, { { "control", 500 }, { "treatment", 510 } }, 0.001);
        REQUIRE_FALSE(srm.detected);
    }

    SECTION("No assignments")
    {
        REQUIRE_FALSE(FrequentistAnalysisEngine::checkSampleRatioMismatch(variants, {}, 0.001).detected);
    }
}

TEST_CASE("FrequentistAnalysisEngine: full analysis with secondary metrics", "[Analysis][frequentist]")
{
    ExperimentConfig config = makeExperimentConfig("Checkout");
    config.secondaryMetrics = { "revenue", "clicks" };
    const Experiment experiment("exp_full", config, normalizeVariants(config.variants),
                                AssignmentStrategyKind::Deterministic, MetricType::Binary,
                                PowerAnalysisResult(), boost::posix_time::microsec_clock::universal_time());

    MetricStore store;
    appendValues(store, "exp_full", "control", "conversion", binarySample(200, 40));
    appendValues(store, "exp_full", "treatment", "conversion", binarySample(200, 60));
    appendValues(store, "exp_full", "control", "revenue", sequence(1.0, 40.0));
    appendValues(store, "exp_full", "treatment", "revenue", sequence(2.0, 41.0));

    const AnalysisData data = AnalysisData::prepare(experiment, store.snapshot("exp_full"),
                                                    { { "control", 200 }, { "treatment", 200 } });
    REQUIRE(data.getVariant("control").sampleSize == 200);
    REQUIRE(data.getTotalSampleSize() == 400);

    FrequentistAnalysisEngine engine(0.95, MultipleTestingCorrectionMethod::Bonferroni, 0.001);
    const FrequentistResult result = engine.analyze(data, "control", "treatment");

    REQUIRE(result.primary.metricName == "conversion");
    REQUIRE(result.secondary.size() == 1);
    REQUIRE(result.secondary[0].metricName == "revenue");
    REQUIRE(result.skippedMetrics.size() == 1);
    REQUIRE(result.skippedMetrics[0].first == "clicks");

    REQUIRE(result.correction == MultipleTestingCorrectionMethod::Bonferroni);
    REQUIRE(result.primary.adjustedPValue.has_value());
    REQUIRE(*result.primary.adjustedPValue == Approx(std::min(1.0, 2.0 * result.primary.pValue)));
    REQUIRE_FALSE(result.sampleRatioMismatch.detected);

    REQUIRE_THROWS_AS(engine.analyze(data, "control", "holdout"), AnalysisException);
}

TEST_CASE("BayesianAnalysisEngine", "[Analysis][bayesian]")
{
    RandomSource random(2024);
    BayesianAnalysisEngine engine(random, 20000, 0.95);

    SECTION("Binary metric with a clear winner")
    {
        const BayesianMetricResult result = engine.analyzeMetric(
            "conversion", { { "control", binarySample(100, 10) }, { "treatment", binarySample(100, 30) } });

        REQUIRE(result.type == MetricType::Binary);
        REQUIRE(result.simulations == 20000);
        REQUIRE(result.posteriors.at("control").alpha == 11.0);
        REQUIRE(result.posteriors.at("control").beta == 91.0);

        const double total = result.probabilityOfBeingBest.at("control") + result.probabilityOfBeingBest.at("treatment");
        REQUIRE(total == Approx(1.0));
        REQUIRE(result.probabilityOfBeingBest.at("treatment") > 0.99);
        REQUIRE(result.expectedLoss.at("treatment") < result.expectedLoss.at("control"));
        REQUIRE(result.recommendWinner(0.95) == std::string("treatment"));

        // Small posteriors fall back to the mean
        REQUIRE(result.credibleIntervals.at("control").degraded);
    }

    SECTION("Three arms share the probability mass")
    {
        const BayesianMetricResult result = engine.analyzeMetric(
            "conversion", { { "a", binarySample(200, 40) }, { "b", binarySample(200, 41) }, { "c", binarySample(200, 39) } });

        double total = 0.0;
        for (const auto& entry : result.probabilityOfBeingBest)
            total += entry.second;

        REQUIRE(total == Approx(1.0));
        REQUIRE_FALSE(result.recommendWinner(0.95).has_value());
    }

    SECTION("Credible intervals")
    {
        const PosteriorDistribution large = BayesianAnalysisEngine::betaPosterior(binarySample(1000, 400));
        const CredibleInterval interval = engine.credibleInterval(large);
        REQUIRE_FALSE(interval.degraded);
        REQUIRE(interval.lower < large.mean);
        REQUIRE(interval.upper > large.mean);
        REQUIRE(interval.level == 0.95);

        const PosteriorDistribution normal = BayesianAnalysisEngine::normalPosterior({ 1.0, 2.0, 3.0, 4.0, 5.0 });
        REQUIRE(normal.mu == Approx(3.0).epsilon(1e-3));
        const CredibleInterval normalInterval = engine.credibleInterval(normal);
        REQUIRE(normalInterval.lower < normal.mu);
        REQUIRE(normalInterval.upper > normal.mu);
    }

    SECTION("Insufficient data")
    {
        REQUIRE_THROWS_AS(engine.analyzeMetric("conversion", { { "control", binarySample(10, 1) } }),
                          InsufficientDataException);
        REQUIRE_THROWS_AS(engine.analyzeMetric("conversion", { { "control", {} }, { "treatment", {} } }),
                          InsufficientDataException);
        REQUIRE_THROWS_AS(BayesianAnalysisEngine::normalPosterior({ 4.2 }), InsufficientDataException);
    }

    SECTION("Simulation count has a floor")
    {
        BayesianAnalysisEngine small(random, 100, 0.95);
        REQUIRE(small.getSimulations() == BayesianAnalysisEngine::kMinSimulations);
    }
}

TEST_CASE("SequentialAnalysisEngine", "[Analysis][sequential]")
{
    SequentialAnalysisEngine engine(5, 0.05);

    SECTION("Early look with a modest statistic continues")
    {
        const SequentialResult result = engine.evaluate(1, 1.0, 100, 1000, "control", "treatment");
        REQUIRE_FALSE(result.decision.has_value());
        REQUIRE(result.checkpoints.size() == 5);
        REQUIRE(result.criticalValue > 4.0);
        REQUIRE(result.checkpoints[4].sampleSize == 1000);
        REQUIRE(result.checkpoints[4].cumulativeAlphaSpent == Approx(0.05).margin(1e-3));
    }

    SECTION("Final look with a large statistic stops")
    {
        const SequentialResult result = engine.evaluate(5, 3.0, 1000, 1000, "control", "treatment");
        REQUIRE(result.decision.has_value());
        REQUIRE(result.decision->stop);
        REQUIRE(result.decision->winningVariant == "treatment");
        REQUIRE(result.decision->stage == 5);
        REQUIRE(result.decision->adjustedPValue < 0.05);

        const SequentialResult negative = engine.evaluate(5, -3.0, 1000, 1000, "control", "treatment");
        REQUIRE(negative.decision->winningVariant == "control");
    }

    SECTION("Stage from sample fraction")
    {
        REQUIRE(engine.computeStage(0, 1000) == 1);
        REQUIRE(engine.computeStage(150, 1000) == 1);
        REQUIRE(engine.computeStage(450, 1000) == 3);
        REQUIRE(engine.computeStage(5000, 1000) == 5);
        REQUIRE(engine.computeStage(10, 0) == 5);
    }

    SECTION("Analysis over prepared data")
    {
        const Experiment experiment = makeExperiment("exp_seq");
        MetricStore store;
        appendValues(store, "exp_seq", "control", "conversion", binarySample(2000, 200));
        appendValues(store, "exp_seq", "treatment", "conversion", binarySample(2000, 400));

        const AnalysisData data = AnalysisData::prepare(experiment, store.snapshot("exp_seq"), {});
        const SequentialResult result = engine.analyze(data, "control", "treatment");

        REQUIRE(result.currentSampleSize == 4000);
        REQUIRE(result.currentStage == 5);
        REQUIRE(result.testStatistic > 5.0);
        REQUIRE(result.decision.has_value());
        REQUIRE(result.decision->winningVariant == "treatment");
    }

    SECTION("Running moments agree with prepared data")
    {
        const Experiment experiment = makeExperiment("exp_rev",
                                                     { VariantConfig{ "control", 1.0 }, VariantConfig{ "treatment", 1.0 } },
                                                     AssignmentStrategyKind::Deterministic, "revenue");
        MetricStore store;
        appendValues(store, "exp_rev", "control", "revenue", sequence(1.0, 40.0));
        appendValues(store, "exp_rev", "treatment", "revenue", sequence(6.0, 45.0));

        const AnalysisData data = AnalysisData::prepare(experiment, store.snapshot("exp_rev"), {});
        const SequentialResult fromData = engine.analyze(data, "control", "treatment");

        const auto moments = store.getMoments("exp_rev", "revenue");
        const SequentialResult fromMoments = engine.analyze(MetricType::Continuous,
                                                            moments.at("control"), moments.at("treatment"),
                                                            80, experiment.getRequiredSampleSize(),
                                                            "control", "treatment");

        REQUIRE(fromMoments.testStatistic == Approx(fromData.testStatistic).margin(1e-9));
        REQUIRE(fromMoments.testStatistic == Approx(5.0 / std::sqrt(2.0 * 136.666667 / 40.0)).margin(1e-4));
        REQUIRE(fromMoments.currentStage == fromData.currentStage);
        REQUIRE(fromMoments.decision.has_value() == fromData.decision.has_value());
    }

    SECTION("No primary data in an arm")
    {
        const Experiment experiment = makeExperiment("exp_empty");
        MetricStore store;
        appendValues(store, "exp_empty", "control", "conversion", binarySample(10, 2));

        const AnalysisData data = AnalysisData::prepare(experiment, store.snapshot("exp_empty"), {});
        REQUIRE_THROWS_AS(engine.analyze(data, "control", "treatment"), InsufficientDataException);
    }
}
