#pragma once

// ==============================================================================
// Enhancer Parameters
// ==============================================================================
// User-facing settings (0-100 percent scale) and their mapping to the native
// parameters of the processing stages.
//
// The mapping is pure: the same Settings always yield the same
// StageParameters. Out-of-range input is clamped before mapping; NaN reads
// as 0.
// ==============================================================================

#include <tonic/dsp/core/db_utils.h>
#include <tonic/dsp/primitives/biquad.h>

#include <algorithm>

namespace Tonic::Enhancer {

// ==============================================================================
// Settings
// ==============================================================================

struct Settings {
    float bassBoost = 50.0f;    // 0-100, 50 = flat
    float lowFreq = 50.0f;      // 0-100, 50 = flat
    float midFreq = 50.0f;      // 0-100, 50 = flat
    float highFreq = 50.0f;     // 0-100, 50 = flat
    float saturation = 0.0f;    // 0-100, accepted but drives no stage
    float compression = 0.0f;   // 0-100
    float gain = 100.0f;        // 0-100 (linear percent)
    bool enabled = true;        // false = processing stages bypassed

    bool operator==(const Settings&) const = default;
};

inline constexpr float kMinPercent = 0.0f;
inline constexpr float kMaxPercent = 100.0f;

/// Clamp one percent value to [0, 100]; NaN -> 0
[[nodiscard]] constexpr float clampPercent(float value) noexcept {
    if (DSP::detail::isNaN(value)) return kMinPercent;
    return std::clamp(value, kMinPercent, kMaxPercent);
}

[[nodiscard]] constexpr Settings clampSettings(const Settings& s) noexcept {
    Settings out = s;
    out.bassBoost = clampPercent(s.bassBoost);
    out.lowFreq = clampPercent(s.lowFreq);
    out.midFreq = clampPercent(s.midFreq);
    out.highFreq = clampPercent(s.highFreq);
    out.saturation = clampPercent(s.saturation);
    out.compression = clampPercent(s.compression);
    out.gain = clampPercent(s.gain);
    return out;
}

// ==============================================================================
// Stage Constants
// ==============================================================================

inline constexpr float kBassShelfFrequency = 100.0f;   // Hz, low shelf corner
inline constexpr float kLowPeakFrequency = 100.0f;     // Hz
inline constexpr float kMidPeakFrequency = 1000.0f;    // Hz
inline constexpr float kHighPeakFrequency = 3000.0f;   // Hz

inline constexpr float kShelfQ = DSP::kButterworthQ;   // shelf slope S = 1
inline constexpr float kPeakQ = 1.0f;

inline constexpr float kShelfGainScale = 0.5f;         // dB per percent
inline constexpr float kPeakGainScale = 0.48f;         // dB per percent

inline constexpr float kCompressorThresholdDb = -24.0f;
inline constexpr float kCompressorKneeDb = 30.0f;
inline constexpr float kCompressorAttackMs = 3.0f;
inline constexpr float kCompressorReleaseMs = 250.0f;

/// Ratio the compressor runs at before the first settings update
inline constexpr float kInitialCompressorRatio = 12.0f;

// ==============================================================================
// Stage Parameters
// ==============================================================================

struct StageParameters {
    float bassShelfGainDb = 0.0f;
    float lowPeakGainDb = 0.0f;
    float midPeakGainDb = 0.0f;
    float highPeakGainDb = 0.0f;
    float compressorRatio = 1.0f;
    float outputGain = 1.0f;        // linear, 0-1
    bool bypass = false;

    bool operator==(const StageParameters&) const = default;
};

// ==============================================================================
// Mapping Functions (input already clamped to [0, 100])
// ==============================================================================

// 0-100 -> -25..+25 dB
[[nodiscard]] constexpr float mapShelfGainDb(float percent) noexcept {
    return (percent - 50.0f) * kShelfGainScale;
}

// 0-100 -> -24..+24 dB
[[nodiscard]] constexpr float mapPeakGainDb(float percent) noexcept {
    return (percent - 50.0f) * kPeakGainScale;
}

// 0-100 -> 1:1..20:1
[[nodiscard]] constexpr float mapCompressorRatio(float percent) noexcept {
    return 1.0f + (percent / 100.0f) * 19.0f;
}

// 0-100 -> 0..1 linear
[[nodiscard]] constexpr float mapOutputGain(float percent) noexcept {
    return percent / 100.0f;
}

/// Map (and clamp) settings onto native stage parameters
[[nodiscard]] constexpr StageParameters mapSettings(const Settings& settings) noexcept {
    const Settings s = clampSettings(settings);

    StageParameters p;
    p.bassShelfGainDb = mapShelfGainDb(s.bassBoost);
    p.lowPeakGainDb = mapPeakGainDb(s.lowFreq);
    p.midPeakGainDb = mapPeakGainDb(s.midFreq);
    p.highPeakGainDb = mapPeakGainDb(s.highFreq);
    p.compressorRatio = mapCompressorRatio(s.compression);
    p.outputGain = mapOutputGain(s.gain);
    p.bypass = !s.enabled;
    return p;
}

/// Parameters the graph starts with, before any settings update
[[nodiscard]] constexpr StageParameters initialStageParameters() noexcept {
    StageParameters p = mapSettings(Settings{});
    p.compressorRatio = kInitialCompressorRatio;
    return p;
}

} // namespace Tonic::Enhancer
