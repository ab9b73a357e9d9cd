// ==============================================================================
// Layer 2: DSP Processor Tests - Dynamics Compressor
// ==============================================================================

#include <tonic/dsp/processors/dynamics_compressor.h>

#include "test_helpers/test_signals.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>
#include <limits>
#include <vector>

using Catch::Approx;
using namespace Tonic::DSP;

namespace {

constexpr double kSampleRate = 44100.0;

/// Run a constant-level stereo signal long enough to settle
float settledGainReduction(DynamicsCompressor& comp, float level) {
    std::vector<float> left(44100, level);
    std::vector<float> right(44100, level);
    comp.process(left.data(), right.data(), left.size());
    return comp.getCurrentGainReduction();
}

} // namespace

TEST_CASE("DynamicsCompressor defaults", "[dynamics][compressor][processors]") {
    DynamicsCompressor comp;
    REQUIRE(comp.getThreshold() == -24.0f);
    REQUIRE(comp.getRatio() == 12.0f);
    REQUIRE(comp.getKneeWidth() == 30.0f);
    REQUIRE(comp.getAttackTime() == 3.0f);
    REQUIRE(comp.getReleaseTime() == 250.0f);
    REQUIRE(comp.getCurrentGainReduction() == 0.0f);
}

TEST_CASE("DynamicsCompressor parameter clamping", "[dynamics][compressor][processors]") {
    DynamicsCompressor comp;

    comp.setRatio(0.5f);
    REQUIRE(comp.getRatio() == 1.0f);
    comp.setRatio(40.0f);
    REQUIRE(comp.getRatio() == 20.0f);

    comp.setThreshold(12.0f);
    REQUIRE(comp.getThreshold() == 0.0f);
    comp.setKneeWidth(-5.0f);
    REQUIRE(comp.getKneeWidth() == 0.0f);
    comp.setAttackTime(5000.0f);
    REQUIRE(comp.getAttackTime() == 1000.0f);
}

TEST_CASE("DynamicsCompressor static curve", "[dynamics][compressor][processors]") {
    DynamicsCompressor comp;
    comp.setThreshold(-24.0f);
    comp.setKneeWidth(30.0f);
    comp.setRatio(20.0f);

    SECTION("below the knee the signal is untouched") {
        REQUIRE(comp.computeOutputLevel(-60.0f) == Approx(-60.0f));
    }

    SECTION("above the knee the ratio applies") {
        // 0 dB input: 24 dB over threshold -> 1.2 dB over at 20:1
        REQUIRE(comp.computeOutputLevel(0.0f) == Approx(-22.8f).margin(1e-4f));
    }

    SECTION("the knee is continuous at both edges") {
        const float lower = -24.0f - 15.0f;
        const float upper = -24.0f + 15.0f;
        REQUIRE(comp.computeOutputLevel(lower) == Approx(lower).margin(1e-4f));
        REQUIRE(comp.computeOutputLevel(upper) ==
                Approx(-24.0f + 15.0f / 20.0f).margin(1e-4f));
    }

    SECTION("output never exceeds input") {
        for (float in = -100.0f; in <= 0.0f; in += 0.5f) {
            REQUIRE(comp.computeOutputLevel(in) <= in + 1e-5f);
        }
    }

    SECTION("ratio 1 is transparent") {
        comp.setRatio(1.0f);
        REQUIRE(comp.computeOutputLevel(-3.0f) == Approx(-3.0f));
    }
}

TEST_CASE("DynamicsCompressor settles to the static curve", "[dynamics][compressor][processors]") {
    DynamicsCompressor comp;
    comp.prepare(kSampleRate, 512);
    comp.setRatio(20.0f);

    const float gr = settledGainReduction(comp, 1.0f);
    REQUIRE(gr == Approx(-22.8f).margin(0.05f));
}

TEST_CASE("DynamicsCompressor reduces loud signals more at higher ratios",
          "[dynamics][compressor][processors]") {
    DynamicsCompressor gentle;
    gentle.prepare(kSampleRate, 512);
    gentle.setRatio(1.0f);

    DynamicsCompressor hard;
    hard.prepare(kSampleRate, 512);
    hard.setRatio(20.0f);

    auto leftA = TestHelpers::makeSine(44100, 440.0f, 44100.0f, 0.9f);
    auto rightA = leftA;
    auto leftB = leftA;
    auto rightB = leftA;

    gentle.process(leftA.data(), rightA.data(), leftA.size());
    hard.process(leftB.data(), rightB.data(), leftB.size());

    const float gentleRms = TestHelpers::calculateRMS(leftA.data() + 22050, 22050);
    const float hardRms = TestHelpers::calculateRMS(leftB.data() + 22050, 22050);

    REQUIRE(gentleRms == Approx(0.9f / std::sqrt(2.0f)).epsilon(1e-3));
    REQUIRE(hardRms < gentleRms * 0.5f);
}

TEST_CASE("DynamicsCompressor attack and release", "[dynamics][compressor][processors]") {
    DynamicsCompressor comp;
    comp.prepare(kSampleRate, 512);
    comp.setRatio(20.0f);

    SECTION("gain reduction builds over the attack time") {
        float left = 1.0f;
        float right = 1.0f;
        comp.processStereo(left, right);
        const float afterOne = comp.getCurrentGainReduction();
        REQUIRE(afterOne < 0.0f);
        REQUIRE(afterOne > -22.8f);
    }

    SECTION("gain reduction recovers on silence") {
        const float loaded = settledGainReduction(comp, 1.0f);
        // One second is four release time constants
        const float gr = settledGainReduction(comp, 0.0f);
        REQUIRE(gr == Approx(loaded * std::exp(-4.0f)).margin(0.05f));
    }

    SECTION("reset clears the state") {
        (void)settledGainReduction(comp, 1.0f);
        comp.reset();
        REQUIRE(comp.getCurrentGainReduction() == 0.0f);
    }
}

TEST_CASE("DynamicsCompressor stereo link", "[dynamics][compressor][processors]") {
    DynamicsCompressor comp;
    comp.prepare(kSampleRate, 512);
    comp.setRatio(20.0f);

    std::vector<float> left(44100, 1.0f);
    std::vector<float> right(44100, 0.1f);
    comp.process(left.data(), right.data(), left.size());

    // Both channels receive the same gain, so their ratio is preserved
    REQUIRE(right.back() / left.back() == Approx(0.1f).epsilon(1e-4));
}

TEST_CASE("DynamicsCompressor non-finite input", "[dynamics][compressor][processors]") {
    DynamicsCompressor comp;
    comp.prepare(kSampleRate, 512);

    REQUIRE(comp.processSample(std::numeric_limits<float>::quiet_NaN()) == 0.0f);

    float left = std::numeric_limits<float>::infinity();
    float right = 0.5f;
    comp.processStereo(left, right);
    REQUIRE(left == 0.0f);
    REQUIRE(std::isfinite(right));
    REQUIRE(std::isfinite(comp.getCurrentGainReduction()));
}
