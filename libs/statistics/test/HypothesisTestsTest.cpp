#include <catch2/catch.hpp>
#include <cmath>
#include <stdexcept>
#include <vector>
#include "HypothesisTests.h"

using Catch::Detail::Approx;
using namespace abtesting;

namespace
{
  std::vector<double> makeBinarySample(std::size_t successes, std::size_t total)
  {
    std::vector<double> values(total, 0.0);
    for (std::size_t i = 0; i < successes; ++i)
      values[i] = 1.0;
    return values;
  }
}

TEST_CASE("chiSquare2x2Test: hand-computed table", "[HypothesisTests][chisquare]")
{
    // n (ad - bc)^2 / ((a + b)(c + d)(a + c)(b + d)) = 200 * 800^2 / (100 * 100 * 48 * 152)
    const ChiSquare2x2Result result = chiSquare2x2Test(20, 100, 28, 100);

    REQUIRE(result.statistic == Approx(1.754386).margin(1e-5));
    REQUIRE(result.pValue == Approx(0.18533).margin(1e-4));
    REQUIRE(result.controlRate == Approx(0.20));
    REQUIRE(result.treatmentRate == Approx(0.28));
    REQUIRE(result.phi == Approx(0.0936586).margin(1e-6));
}

TEST_CASE("chiSquare2x2Test: phi is signed by direction", "[HypothesisTests][chisquare]")
{
    const ChiSquare2x2Result better = chiSquare2x2Test(100, 500, 140, 500);
    const ChiSquare2x2Result worse = chiSquare2x2Test(140, 500, 100, 500);

    REQUIRE(better.phi > 0.0);
    REQUIRE(worse.phi < 0.0);
    REQUIRE(better.statistic == Approx(worse.statistic));
    REQUIRE(better.statistic == Approx(8.77193).margin(1e-4));
    REQUIRE(better.pValue < 0.01);
}

TEST_CASE("chiSquare2x2Test: degenerate tables", "[HypothesisTests][chisquare]")
{
    SECTION("Identical rates give no evidence")
    {
        const ChiSquare2x2Result result = chiSquare2x2Test(30, 100, 30, 100);
        REQUIRE(result.statistic == Approx(0.0).margin(1e-12));
        REQUIRE(result.pValue == Approx(1.0));
        REQUIRE(result.phi == Approx(0.0).margin(1e-12));
    }

    SECTION("No successes at all")
    {
        const ChiSquare2x2Result result = chiSquare2x2Test(0, 50, 0, 60);
        REQUIRE(result.statistic == 0.0);
        REQUIRE(result.pValue == 1.0);
    }

    SECTION("Invalid counts")
    {
        REQUIRE_THROWS_AS(chiSquare2x2Test(0, 0, 1, 10), std::invalid_argument);
        REQUIRE_THROWS_AS(chiSquare2x2Test(11, 10, 1, 10), std::invalid_argument);
    }
}

TEST_CASE("welchTTest: hand-computed samples", "[HypothesisTests][welch]")
{
    // Means 3 and 4, both variances 2.5: se = 1, t = 1, df = 8
    const std::vector<double> control = {1, 2, 3, 4, 5};
    const std::vector<double> treatment = {2, 3, 4, 5, 6};

    const WelchTTestResult result = welchTTest(control, treatment);

    REQUIRE(result.statistic == Approx(1.0).margin(1e-12));
    REQUIRE(result.degreesOfFreedom == Approx(8.0).margin(1e-12));
    REQUIRE(result.pValue == Approx(0.346594).margin(1e-5));
    REQUIRE(result.difference == Approx(1.0));
    REQUIRE(result.cohensD == Approx(1.0 / std::sqrt(2.5)).margin(1e-12));
}

TEST_CASE("welchTTest: identical samples", "[HypothesisTests][welch]")
{
    const std::vector<double> sample = {3.1, 2.7, 4.4, 5.0, 3.3, 2.9, 4.1};

    const WelchTTestResult result = welchTTest(sample, sample);

    REQUIRE(result.statistic == Approx(0.0).margin(1e-12));
    REQUIRE(result.pValue == Approx(1.0).margin(1e-12));
    REQUIRE(result.cohensD == Approx(0.0).margin(1e-12));
}

TEST_CASE("welchTTest: error handling", "[HypothesisTests][welch]")
{
    REQUIRE_THROWS_AS(welchTTest({1.0}, {1.0, 2.0}), std::invalid_argument);
    REQUIRE_THROWS_AS(welchTTest({1.0, 1.0}, {2.0, 2.0}), std::domain_error);

    const WelchTTestResult constant = welchTTest({2.0, 2.0, 2.0}, {2.0, 2.0});
    REQUIRE(constant.pValue == 1.0);
}

TEST_CASE("mannWhitneyUTest: complete separation", "[HypothesisTests][mannwhitney]")
{
    const MannWhitneyResult result = mannWhitneyUTest({1, 2, 3}, {4, 5, 6});

    REQUIRE(result.uStatistic == Approx(0.0));
    REQUIRE(result.rankBiserial == Approx(1.0));
    REQUIRE(result.zStatistic > 0.0);
    REQUIRE(result.controlMedian == Approx(2.0));
    REQUIRE(result.treatmentMedian == Approx(5.0));
}

TEST_CASE("mannWhitneyUTest: ties and identical samples", "[HypothesisTests][mannwhitney]")
{
    SECTION("Identical samples have no effect")
    {
        const std::vector<double> sample = {1, 1, 2, 3, 3, 3, 8, 13};
        const MannWhitneyResult result = mannWhitneyUTest(sample, sample);

        REQUIRE(result.zStatistic == Approx(0.0).margin(1e-12));
        REQUIRE(result.pValue == Approx(1.0).margin(1e-12));
        REQUIRE(result.rankBiserial == Approx(0.0).margin(1e-12));
    }

    SECTION("All values tied")
    {
        const MannWhitneyResult result = mannWhitneyUTest({5, 5, 5}, {5, 5});
        REQUIRE(result.pValue == 1.0);
    }

    SECTION("Empty sample")
    {
        REQUIRE_THROWS_AS(mannWhitneyUTest({}, {1.0}), std::invalid_argument);
    }
}

TEST_CASE("chiSquareGoodnessOfFit: allocation checks", "[HypothesisTests][goodnessoffit]")
{
    SECTION("Exact match")
    {
        const GoodnessOfFitResult result = chiSquareGoodnessOfFit({50, 50}, {1, 1});
        REQUIRE(result.statistic == Approx(0.0).margin(1e-12));
        REQUIRE(result.pValue == Approx(1.0));
        REQUIRE(result.degreesOfFreedom == 1.0);
    }

    SECTION("60/40 against 50/50")
    {
        const GoodnessOfFitResult result = chiSquareGoodnessOfFit({60, 40}, {0.5, 0.5});
        REQUIRE(result.statistic == Approx(4.0));
        REQUIRE(result.pValue == Approx(0.0455003).margin(1e-6));
    }

    SECTION("Unnormalized proportions")
    {
        const GoodnessOfFitResult weighted = chiSquareGoodnessOfFit({100, 200, 100}, {1, 2, 1});
        REQUIRE(weighted.statistic == Approx(0.0).margin(1e-12));
        REQUIRE(weighted.degreesOfFreedom == 2.0);
    }

    SECTION("Invalid arguments")
    {
        REQUIRE_THROWS_AS(chiSquareGoodnessOfFit({1, 2}, {1}), std::invalid_argument);
        REQUIRE_THROWS_AS(chiSquareGoodnessOfFit({1}, {1}), std::invalid_argument);
        REQUIRE_THROWS_AS(chiSquareGoodnessOfFit({1, 2}, {1, 0}), std::invalid_argument);
    }
}

TEST_CASE("meanDifferenceInterval brackets the observed difference", "[HypothesisTests][interval]")
{
    const std::vector<double> control = makeBinarySample(100, 500);
    const std::vector<double> treatment = makeBinarySample(140, 500);

    const ConfidenceInterval ci = meanDifferenceInterval(control, treatment, 0.95);

    REQUIRE(ci.level == 0.95);
    REQUIRE(ci.lower < 0.08);
    REQUIRE(ci.upper > 0.08);
    REQUIRE((ci.lower + ci.upper) / 2.0 == Approx(0.08).margin(1e-12));
    REQUIRE(ci.lower > 0.0);
}

TEST_CASE("z statistics used by sequential monitoring", "[HypothesisTests][zstat]")
{
    SECTION("Two proportions")
    {
        // pooled 0.24, se = sqrt(0.24 * 0.76 * 2 / 500)
        const double z = twoProportionZStatistic(100, 500, 140, 500);
        REQUIRE(z == Approx(0.08 / std::sqrt(0.24 * 0.76 * 0.004)).margin(1e-12));
        REQUIRE(twoProportionZStatistic(0, 10, 0, 10) == 0.0);
    }

    SECTION("Mean difference")
    {
        REQUIRE(meanDifferenceZStatistic({1, 2, 3, 4, 5}, {2, 3, 4, 5, 6}) == Approx(1.0));
        REQUIRE_THROWS_AS(meanDifferenceZStatistic({1, 1}, {2, 2}), std::domain_error);
    }
}

TEST_CASE("Sample classification heuristics", "[HypothesisTests][classification]")
{
    REQUIRE(isBinarySample({0, 1, 1, 0}));
    REQUIRE_FALSE(isBinarySample({0, 1, 0.5}));
    REQUIRE_FALSE(isBinarySample({}));

    std::vector<double> uniform;
    for (int i = 0; i < 40; ++i)
        uniform.push_back(static_cast<double>(i));
    REQUIRE(isApproximatelyNormal(uniform));

    std::vector<double> small(uniform.begin(), uniform.begin() + 20);
    REQUIRE_FALSE(isApproximatelyNormal(small));

    std::vector<double> heavyTail(39, 1.0);
    heavyTail.push_back(1000.0);
    REQUIRE_FALSE(isApproximatelyNormal(heavyTail));
}
