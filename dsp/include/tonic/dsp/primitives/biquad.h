// ==============================================================================
// Layer 1: DSP Primitive - Biquad Filter
// ==============================================================================
// Second-order IIR section for the equalizer stages: low shelf and peaking
// (bell) responses from the RBJ Audio EQ Cookbook.
//
// Processing uses the transposed direct form II, which keeps only two state
// values per channel and behaves well in single precision.
//
// Real-time safe: process() and processBlock() never allocate.
// ==============================================================================

#pragma once

#include <tonic/dsp/core/db_utils.h>
#include <tonic/dsp/core/math_constants.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>

namespace Tonic {
namespace DSP {

/// Q giving a maximally flat response; as a shelf Q it equals slope S = 1
inline constexpr float kButterworthQ = 0.7071067811865476f;

/// Equalizer responses supported by BiquadCoefficients::calculate()
enum class FilterType : uint8_t {
    LowShelf,   ///< Gain applied below the corner frequency
    Peak        ///< Bell around the centre frequency
};

namespace detail {

inline constexpr float kBiquadMinFrequency = 1.0f;
inline constexpr float kBiquadMaxFrequencyRatio = 0.495f;  // of the sample rate
inline constexpr float kBiquadMinQ = 0.1f;
inline constexpr float kBiquadMaxQ = 30.0f;

} // namespace detail

// =============================================================================
// Coefficients
// =============================================================================

/// @brief Biquad coefficients normalised so that a0 == 1.
///
/// Default-constructed coefficients are an identity filter.
struct BiquadCoefficients {
    float b0 = 1.0f;
    float b1 = 0.0f;
    float b2 = 0.0f;
    float a1 = 0.0f;
    float a2 = 0.0f;

    /// @brief Design a filter.
    /// @param type Response shape
    /// @param frequency Corner or centre frequency in Hz, clamped below Nyquist
    /// @param Q Quality factor, clamped to [0.1, 30]
    /// @param gainDb Shelf or peak gain in dB
    /// @param sampleRate Sample rate in Hz; a non-positive rate yields identity
    [[nodiscard]] static BiquadCoefficients calculate(
        FilterType type, float frequency, float Q, float gainDb, float sampleRate) noexcept;

    /// @brief Magnitude of H(e^jw) in dB at one frequency
    [[nodiscard]] float magnitudeDb(float frequency, float sampleRate) const noexcept {
        const float w = kTwoPi * frequency / sampleRate;
        const float cw = std::cos(w);
        const float sw = std::sin(w);
        const float c2w = std::cos(2.0f * w);
        const float s2w = std::sin(2.0f * w);

        const float zr = b0 + b1 * cw + b2 * c2w;
        const float zi = b1 * sw + b2 * s2w;
        const float pr = 1.0f + a1 * cw + a2 * c2w;
        const float pi = a1 * sw + a2 * s2w;

        const float poles = pr * pr + pi * pi;
        if (!(poles > 0.0f)) return kSilenceFloorDb;
        return gainToDb(std::sqrt((zr * zr + zi * zi) / poles));
    }

    /// @brief Both poles inside the unit circle (stability triangle)
    [[nodiscard]] bool isStable() const noexcept {
        constexpr float tolerance = 1e-6f;
        return std::abs(a2) < 1.0f + tolerance && std::abs(a1) < 1.0f + a2 + tolerance;
    }

    [[nodiscard]] bool operator==(const BiquadCoefficients&) const noexcept = default;
};

inline BiquadCoefficients BiquadCoefficients::calculate(
    FilterType type, float frequency, float Q, float gainDb, float sampleRate) noexcept {
    if (!(sampleRate > 0.0f)) {
        return {};
    }

    const float nyquistLimit = sampleRate * detail::kBiquadMaxFrequencyRatio;
    const float f0 = std::clamp(frequency, std::min(detail::kBiquadMinFrequency, nyquistLimit),
                                nyquistLimit);
    const float q = std::clamp(Q, detail::kBiquadMinQ, detail::kBiquadMaxQ);

    const float w0 = kTwoPi * f0 / sampleRate;
    const float cw = std::cos(w0);
    const float sw = std::sin(w0);
    const float alpha = sw / (2.0f * q);
    const float A = std::sqrt(dbToGain(gainDb));  // 10^(gainDb / 40)

    float nb0, nb1, nb2, na0, na1, na2;
    if (type == FilterType::LowShelf) {
        const float ap1 = A + 1.0f;
        const float am1 = A - 1.0f;
        const float twoRootAAlpha = 2.0f * std::sqrt(A) * alpha;

        nb0 = A * (ap1 - am1 * cw + twoRootAAlpha);
        nb1 = 2.0f * A * (am1 - ap1 * cw);
        nb2 = A * (ap1 - am1 * cw - twoRootAAlpha);
        na0 = ap1 + am1 * cw + twoRootAAlpha;
        na1 = -2.0f * (am1 + ap1 * cw);
        na2 = ap1 + am1 * cw - twoRootAAlpha;
    } else {
        nb0 = 1.0f + alpha * A;
        nb1 = -2.0f * cw;
        nb2 = 1.0f - alpha * A;
        na0 = 1.0f + alpha / A;
        na1 = -2.0f * cw;
        na2 = 1.0f - alpha / A;
    }

    BiquadCoefficients c;
    c.b0 = nb0 / na0;
    c.b1 = nb1 / na0;
    c.b2 = nb2 / na0;
    c.a1 = na1 / na0;
    c.a2 = na2 / na0;
    return c;
}

// =============================================================================
// Filter
// =============================================================================

/// @brief One channel of biquad filtering (TDF2).
class Biquad {
public:
    Biquad() noexcept = default;

    explicit Biquad(const BiquadCoefficients& coeffs) noexcept
        : coeffs_(coeffs) {}

    /// Replace coefficients; filter state is kept
    void setCoefficients(const BiquadCoefficients& coeffs) noexcept { coeffs_ = coeffs; }

    void configure(FilterType type, float frequency, float Q, float gainDb,
                   float sampleRate) noexcept {
        coeffs_ = BiquadCoefficients::calculate(type, frequency, Q, gainDb, sampleRate);
    }

    [[nodiscard]] const BiquadCoefficients& coefficients() const noexcept { return coeffs_; }

    [[nodiscard]] float process(float x) noexcept {
        // A non-finite sample would stay in the state forever
        if (!detail::isFinite(x)) {
            reset();
            return 0.0f;
        }

        const float y = coeffs_.b0 * x + s1_;
        s1_ = detail::flushDenormal(coeffs_.b1 * x - coeffs_.a1 * y + s2_);
        s2_ = detail::flushDenormal(coeffs_.b2 * x - coeffs_.a2 * y);
        return y;
    }

    void processBlock(float* buffer, size_t numSamples) noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            buffer[i] = process(buffer[i]);
        }
    }

    void reset() noexcept {
        s1_ = 0.0f;
        s2_ = 0.0f;
    }

private:
    BiquadCoefficients coeffs_;
    float s1_ = 0.0f;
    float s2_ = 0.0f;
};

} // namespace DSP
} // namespace Tonic
