#include <catch2/catch.hpp>
#include <stdexcept>
#include <vector>
#include "MultipleTestingCorrection.h"

using Catch::Detail::Approx;
using namespace abtesting;

TEST_CASE("bonferroniAdjust scales and caps p-values", "[MultipleTestingCorrection][bonferroni]")
{
    const std::vector<double> adjusted = bonferroniAdjust({0.01, 0.04, 0.5});

    REQUIRE(adjusted.size() == 3);
    REQUIRE(adjusted[0] == Approx(0.03));
    REQUIRE(adjusted[1] == Approx(0.12));
    REQUIRE(adjusted[2] == Approx(1.0));
}

TEST_CASE("holmAdjust is step-down and monotone", "[MultipleTestingCorrection][holm]")
{
    // Sorted: 0.01 * 3 = 0.03, 0.03 * 2 = 0.06, 0.04 * 1 = 0.04 -> raised to 0.06
    const std::vector<double> adjusted = holmAdjust({0.01, 0.04, 0.03});

    REQUIRE(adjusted[0] == Approx(0.03));
    REQUIRE(adjusted[1] == Approx(0.06));
    REQUIRE(adjusted[2] == Approx(0.06));

    SECTION("Never larger than Bonferroni")
    {
        const std::vector<double> raw = {0.002, 0.2, 0.011, 0.04};
        const std::vector<double> holm = holmAdjust(raw);
        const std::vector<double> bonf = bonferroniAdjust(raw);

        for (std::size_t i = 0; i < raw.size(); ++i)
        {
            REQUIRE(holm[i] <= bonf[i] + 1e-15);
            REQUIRE(holm[i] >= raw[i]);
        }
    }

    SECTION("Empty input")
    {
        REQUIRE(holmAdjust({}).empty());
    }
}

TEST_CASE("adjustPValues dispatches on the method", "[MultipleTestingCorrection]")
{
    const std::vector<double> raw = {0.01, 0.02};

    REQUIRE(adjustPValues(raw, MultipleTestingCorrectionMethod::None) == raw);
    REQUIRE(adjustPValues(raw, MultipleTestingCorrectionMethod::Bonferroni)[1] == Approx(0.04));
    REQUIRE(adjustPValues(raw, MultipleTestingCorrectionMethod::Holm)[0] == Approx(0.02));
}

TEST_CASE("Correction method names", "[MultipleTestingCorrection][names]")
{
    REQUIRE(parseMultipleTestingCorrectionMethod("holm") == MultipleTestingCorrectionMethod::Holm);
    REQUIRE(parseMultipleTestingCorrectionMethod("bonferroni") == MultipleTestingCorrectionMethod::Bonferroni);
    REQUIRE(parseMultipleTestingCorrectionMethod("none") == MultipleTestingCorrectionMethod::None);
    REQUIRE_THROWS_AS(parseMultipleTestingCorrectionMethod("sidak"), std::invalid_argument);

    REQUIRE(toString(MultipleTestingCorrectionMethod::Holm) == "holm");
}
