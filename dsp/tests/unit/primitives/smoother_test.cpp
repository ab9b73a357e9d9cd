// ==============================================================================
// Layer 1: DSP Primitive Tests - Parameter Smoother
// ==============================================================================

#include <tonic/dsp/primitives/smoother.h>

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <limits>

using Catch::Approx;
using namespace Tonic::DSP;

TEST_CASE("calculateOnePoleCoefficient", "[smoother][primitives]") {
    const float coeff = calculateOnePoleCoefficient(5.0f, 44100.0f);
    REQUIRE(coeff > 0.0f);
    REQUIRE(coeff < 1.0f);

    SECTION("longer times give larger coefficients") {
        REQUIRE(calculateOnePoleCoefficient(50.0f, 44100.0f) > coeff);
    }

    SECTION("invalid sample rate disables smoothing") {
        REQUIRE(calculateOnePoleCoefficient(5.0f, 0.0f) == 0.0f);
    }
}

TEST_CASE("OnePoleSmoother reaches its target", "[smoother][primitives]") {
    OnePoleSmoother smoother(0.0f);
    smoother.configure(5.0f, 44100.0f);
    smoother.setTarget(1.0f);

    SECTION("first sample moves but does not jump") {
        const float first = smoother.process();
        REQUIRE(first > 0.0f);
        REQUIRE(first < 0.1f);
    }

    SECTION("about 99 percent after the smoothing time") {
        float value = 0.0f;
        for (int i = 0; i < 221; ++i) {  // 5 ms at 44.1 kHz
            value = smoother.process();
        }
        REQUIRE(value == Approx(0.99f).margin(0.01f));
    }

    SECTION("completes and snaps exactly") {
        for (int i = 0; i < 4410; ++i) {
            (void)smoother.process();
        }
        REQUIRE(smoother.isComplete());
        REQUIRE(smoother.getCurrentValue() == 1.0f);
    }
}

TEST_CASE("OnePoleSmoother snapping and invalid targets", "[smoother][primitives]") {
    OnePoleSmoother smoother;

    SECTION("snapTo sets current and target") {
        smoother.snapTo(0.75f);
        REQUIRE(smoother.getCurrentValue() == 0.75f);
        REQUIRE(smoother.getTarget() == 0.75f);
        REQUIRE(smoother.process() == 0.75f);
    }

    SECTION("snapToTarget jumps") {
        smoother.setTarget(0.3f);
        smoother.snapToTarget();
        REQUIRE(smoother.getCurrentValue() == 0.3f);
    }

    SECTION("NaN target resets to zero") {
        smoother.snapTo(1.0f);
        smoother.setTarget(std::numeric_limits<float>::quiet_NaN());
        REQUIRE(smoother.getTarget() == 0.0f);
        REQUIRE(smoother.getCurrentValue() == 0.0f);
    }

    SECTION("non-finite snap is treated as zero") {
        smoother.snapTo(std::numeric_limits<float>::infinity());
        REQUIRE(smoother.getCurrentValue() == 0.0f);
    }
}
