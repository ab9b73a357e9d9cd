// ==============================================================================
// Layer 2: DSP Processor - Dynamics Compressor
// ==============================================================================
// Feed-forward peak compressor with a quadratic soft knee and
// attack/release smoothing of the gain reduction. Stereo processing uses a
// linked detector (the louder channel drives both) so the stereo image is
// preserved.
//
// Real-time safe: noexcept, no allocations in process.
// ==============================================================================

#pragma once

#include <tonic/dsp/core/db_utils.h>

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace Tonic {
namespace DSP {

/// @brief Layer 2 DSP Processor - downward compressor
///
/// @par Usage
/// @code
/// DynamicsCompressor comp;
/// comp.prepare(44100.0, 512);
/// comp.setThreshold(-24.0f);
/// comp.setRatio(4.0f);
///
/// // In process callback
/// comp.process(left, right, numSamples);
/// @endcode
class DynamicsCompressor {
public:
    // =========================================================================
    // Constants
    // =========================================================================

    static constexpr float kMinThreshold = -100.0f;
    static constexpr float kMaxThreshold = 0.0f;
    static constexpr float kMinRatio = 1.0f;
    static constexpr float kMaxRatio = 20.0f;
    static constexpr float kMinKnee = 0.0f;
    static constexpr float kMaxKnee = 40.0f;
    static constexpr float kMinAttackMs = 0.0f;
    static constexpr float kMaxAttackMs = 1000.0f;
    static constexpr float kMinReleaseMs = 0.0f;
    static constexpr float kMaxReleaseMs = 1000.0f;

    static constexpr float kDefaultThreshold = -24.0f;
    static constexpr float kDefaultRatio = 12.0f;
    static constexpr float kDefaultKnee = 30.0f;
    static constexpr float kDefaultAttackMs = 3.0f;
    static constexpr float kDefaultReleaseMs = 250.0f;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// @brief Prepare for given sample rate
    /// @param sampleRate Audio sample rate in Hz
    /// @param maxBlockSize Maximum samples per process() call (unused)
    void prepare(double sampleRate, size_t maxBlockSize) noexcept {
        (void)maxBlockSize;
        sampleRate_ = static_cast<float>(sampleRate);
        updateAttackCoeff();
        updateReleaseCoeff();
        reset();
    }

    /// @brief Clear gain reduction state
    void reset() noexcept {
        gainReductionDb_ = 0.0f;
    }

    // =========================================================================
    // Parameters
    // =========================================================================

    /// @param dB Threshold in dBFS, clamped to [-100, 0]
    void setThreshold(float dB) noexcept {
        thresholdDb_ = std::clamp(dB, kMinThreshold, kMaxThreshold);
    }

    /// @param ratio Compression ratio (N:1), clamped to [1, 20]
    void setRatio(float ratio) noexcept {
        ratio_ = std::clamp(ratio, kMinRatio, kMaxRatio);
    }

    /// @param dB Knee width in dB, clamped to [0, 40]
    void setKneeWidth(float dB) noexcept {
        kneeDb_ = std::clamp(dB, kMinKnee, kMaxKnee);
    }

    /// @param ms Attack time in milliseconds, clamped to [0, 1000]
    void setAttackTime(float ms) noexcept {
        attackMs_ = std::clamp(ms, kMinAttackMs, kMaxAttackMs);
        updateAttackCoeff();
    }

    /// @param ms Release time in milliseconds, clamped to [0, 1000]
    void setReleaseTime(float ms) noexcept {
        releaseMs_ = std::clamp(ms, kMinReleaseMs, kMaxReleaseMs);
        updateReleaseCoeff();
    }

    [[nodiscard]] float getThreshold() const noexcept { return thresholdDb_; }
    [[nodiscard]] float getRatio() const noexcept { return ratio_; }
    [[nodiscard]] float getKneeWidth() const noexcept { return kneeDb_; }
    [[nodiscard]] float getAttackTime() const noexcept { return attackMs_; }
    [[nodiscard]] float getReleaseTime() const noexcept { return releaseMs_; }

    /// @brief Current (smoothed) gain reduction in dB, <= 0
    [[nodiscard]] float getCurrentGainReduction() const noexcept {
        return gainReductionDb_;
    }

    // =========================================================================
    // Static Curve
    // =========================================================================

    /// @brief Output level for a given input level (both dB), no smoothing
    [[nodiscard]] float computeOutputLevel(float inputDb) const noexcept {
        const float overshoot = inputDb - thresholdDb_;
        const float slope = 1.0f / ratio_ - 1.0f;

        if (2.0f * overshoot < -kneeDb_) {
            return inputDb;
        }
        if (kneeDb_ > 0.0f && 2.0f * std::abs(overshoot) <= kneeDb_) {
            const float x = overshoot + kneeDb_ * 0.5f;
            return inputDb + slope * x * x / (2.0f * kneeDb_);
        }
        return thresholdDb_ + overshoot / ratio_;
    }

    // =========================================================================
    // Processing
    // =========================================================================

    /// @brief Process one mono sample
    [[nodiscard]] float processSample(float input) noexcept {
        if (!detail::isFinite(input)) {
            return 0.0f;
        }
        const float gain = computeGain(std::abs(input));
        return input * gain;
    }

    /// @brief Process one stereo frame in place with a linked detector
    void processStereo(float& left, float& right) noexcept {
        if (!detail::isFinite(left)) left = 0.0f;
        if (!detail::isFinite(right)) right = 0.0f;

        const float gain = computeGain(std::max(std::abs(left), std::abs(right)));
        left *= gain;
        right *= gain;
    }

    /// @brief Process stereo buffers in place
    void process(float* left, float* right, size_t numSamples) noexcept {
        if (left == nullptr || right == nullptr) return;
        for (size_t i = 0; i < numSamples; ++i) {
            processStereo(left[i], right[i]);
        }
    }

private:
    [[nodiscard]] float computeGain(float peak) noexcept {
        const float inputDb = gainToDb(peak);
        const float targetGr = computeOutputLevel(inputDb) - inputDb;

        // More reduction = attack, less = release
        const float coeff = (targetGr < gainReductionDb_) ? attackCoeff_ : releaseCoeff_;
        gainReductionDb_ = targetGr + coeff * (gainReductionDb_ - targetGr);
        gainReductionDb_ = detail::flushDenormal(gainReductionDb_);

        return dbToGain(gainReductionDb_);
    }

    [[nodiscard]] float timeToCoeff(float ms) const noexcept {
        if (ms <= 0.0f || sampleRate_ <= 0.0f) return 0.0f;
        return std::exp(-1.0f / (ms * 0.001f * sampleRate_));
    }

    void updateAttackCoeff() noexcept { attackCoeff_ = timeToCoeff(attackMs_); }
    void updateReleaseCoeff() noexcept { releaseCoeff_ = timeToCoeff(releaseMs_); }

    float sampleRate_ = 44100.0f;
    float thresholdDb_ = kDefaultThreshold;
    float ratio_ = kDefaultRatio;
    float kneeDb_ = kDefaultKnee;
    float attackMs_ = kDefaultAttackMs;
    float releaseMs_ = kDefaultReleaseMs;

    float attackCoeff_ = 0.0f;
    float releaseCoeff_ = 0.0f;
    float gainReductionDb_ = 0.0f;
};

} // namespace DSP
} // namespace Tonic
