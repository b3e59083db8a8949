#include <catch2/catch.hpp>
#include <cmath>
#include <stdexcept>
#include <thread>
#include <vector>
#include "StatUtils.h"
#include "ThreadSafeAccumulator.h"
#include "RngUtils.h"

using Catch::Detail::Approx;
using namespace abtesting;

TEST_CASE("StatUtils: moments", "[StatUtils][moments]")
{
    const std::vector<double> data = {2, 4, 4, 4, 5, 5, 7, 9};

    REQUIRE(StatUtils::computeMean(data) == Approx(5.0));
    REQUIRE(StatUtils::computeVariance(data) == Approx(32.0 / 7.0));
    REQUIRE(StatUtils::computeStdDev(data) == Approx(std::sqrt(32.0 / 7.0)));

    const auto [mean, variance] = StatUtils::computeMeanAndVariance(data);
    REQUIRE(mean == Approx(5.0));
    REQUIRE(variance == Approx(32.0 / 7.0));

    SECTION("Empty and single-value samples")
    {
        REQUIRE(StatUtils::computeMean({}) == 0.0);
        REQUIRE(StatUtils::computeVariance({3.0}) == 0.0);
    }
}

TEST_CASE("StatUtils: order statistics", "[StatUtils][median]")
{
    REQUIRE(StatUtils::computeMedian({5, 1, 3}) == Approx(3.0));
    REQUIRE(StatUtils::computeMedian({4, 1, 3, 2}) == Approx(2.5));
    REQUIRE(StatUtils::computeMedian({}) == 0.0);

    std::vector<double> sorted;
    for (int i = 1; i <= 100; ++i)
        sorted.push_back(static_cast<double>(i));

    REQUIRE(StatUtils::computePercentileSorted(sorted, 0.95) == Approx(96.0));
    REQUIRE(StatUtils::computePercentileSorted(sorted, 0.99) == Approx(100.0));
    REQUIRE(StatUtils::computePercentileSorted(sorted, 1.0) == Approx(100.0));
    REQUIRE(StatUtils::computePercentileSorted(sorted, 0.0) == Approx(1.0));

    REQUIRE_THROWS_AS(StatUtils::computePercentileSorted({}, 0.5), std::invalid_argument);
    REQUIRE_THROWS_AS(StatUtils::computePercentileSorted(sorted, 1.5), std::invalid_argument);
}

TEST_CASE("StatUtils: shape statistics", "[StatUtils][shape]")
{
    SECTION("Symmetric sample has zero skew")
    {
        REQUIRE(StatUtils::computeSkewness({1, 2, 3, 4, 5}) == Approx(0.0).margin(1e-12));
    }

    SECTION("Right tail gives positive skew")
    {
        REQUIRE(StatUtils::computeSkewness({1, 1, 1, 1, 10}) > 1.0);
    }

    SECTION("Discrete uniform excess kurtosis")
    {
        // For 1..n, g2 = -6 (n^2 + 1) / (5 (n^2 - 1)); n = 5 gives -1.3
        REQUIRE(StatUtils::computeExcessKurtosis({1, 2, 3, 4, 5}) == Approx(-1.3));
    }

    SECTION("Degenerate samples")
    {
        REQUIRE(StatUtils::computeSkewness({2, 2, 2}) == 0.0);
        REQUIRE(StatUtils::computeExcessKurtosis({1, 2}) == 0.0);
    }
}

TEST_CASE("ThreadSafeAccumulator: running statistics", "[ThreadSafeAccumulator]")
{
    ThreadSafeAccumulator acc;

    REQUIRE(acc.getCount() == 0);
    REQUIRE_FALSE(acc.getMean().has_value());
    REQUIRE_FALSE(acc.getMin().has_value());

    for (double v : {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0})
        acc.addValue(v);

    REQUIRE(acc.getCount() == 8);
    REQUIRE(*acc.getMin() == Approx(2.0));
    REQUIRE(*acc.getMax() == Approx(9.0));
    REQUIRE(*acc.getMean() == Approx(5.0));
    REQUIRE(*acc.getStdDev() == Approx(std::sqrt(32.0 / 7.0)));

    acc.clear();
    REQUIRE(acc.getCount() == 0);
    REQUIRE_FALSE(acc.getStdDev().has_value());
}

TEST_CASE("ThreadSafeAccumulator: concurrent writers", "[ThreadSafeAccumulator][concurrency]")
{
    ThreadSafeAccumulator acc;
    std::vector<std::thread> writers;

    for (int t = 0; t < 4; ++t)
    {
        writers.emplace_back([&acc]() {
            for (int i = 0; i < 1000; ++i)
                acc.addValue(1.0);
        });
    }

    for (auto& w : writers)
        w.join();

    REQUIRE(acc.getCount() == 4000);
    REQUIRE(*acc.getMean() == Approx(1.0));
}

TEST_CASE("RandomSource: seeded draws are reproducible", "[RngUtils][RandomSource]")
{
    RandomSource a(42);
    RandomSource b(42);

    for (int i = 0; i < 10; ++i)
    {
        REQUIRE(a.uniform01() == b.uniform01());
        REQUIRE(a.index(7) == b.index(7));
    }
}

TEST_CASE("RandomSource: distribution sanity", "[RngUtils][RandomSource]")
{
    RandomSource random(7);
    const int draws = 20000;

    double uniformSum = 0.0;
    double betaSum = 0.0;
    double normalSum = 0.0;
    bool inUnitInterval = true;
    for (int i = 0; i < draws; ++i)
    {
        const double u = random.uniform01();
        inUnitInterval = inUnitInterval && u >= 0.0 && u < 1.0;
        uniformSum += u;
        betaSum += random.beta(2.0, 6.0);
        normalSum += random.normal(3.0, 2.0);
    }

    REQUIRE(inUnitInterval);
    REQUIRE(uniformSum / draws == Approx(0.5).margin(0.01));
    REQUIRE(betaSum / draws == Approx(0.25).margin(0.01));
    REQUIRE(normalSum / draws == Approx(3.0).margin(0.05));

    REQUIRE(random.index(5) < 5);
    REQUIRE_THROWS_AS(random.beta(0.0, 1.0), std::invalid_argument);
    REQUIRE_THROWS_AS(random.normal(0.0, 0.0), std::invalid_argument);
}
