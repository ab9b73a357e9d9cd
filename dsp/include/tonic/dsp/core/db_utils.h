// ==============================================================================
// Layer 0: Core Utility - dB/Linear Conversion
// ==============================================================================
// Decibel conversions and float classification shared by every layer.
//
// All functions are constexpr and noexcept. Classification works on the IEEE
// 754 bit pattern, so it survives -ffast-math builds where std::isnan may be
// folded to false.
// ==============================================================================

#pragma once

#include <tonic/dsp/core/math_constants.h>

#include <bit>
#include <cstdint>
#include <limits>

namespace Tonic {
namespace DSP {

/// gainToDb() result for silence (zero, negative or NaN gain)
inline constexpr float kSilenceFloorDb = -144.0f;

/// Magnitude below which recursive state is flushed to zero
inline constexpr float kDenormalThreshold = 1e-15f;

namespace detail {

inline constexpr std::uint32_t kExponentMask = 0x7F800000u;
inline constexpr std::uint32_t kMantissaMask = 0x007FFFFFu;

[[nodiscard]] constexpr bool isNaN(float x) noexcept {
    const auto bits = std::bit_cast<std::uint32_t>(x);
    return (bits & kExponentMask) == kExponentMask && (bits & kMantissaMask) != 0;
}

[[nodiscard]] constexpr bool isInf(float x) noexcept {
    const auto bits = std::bit_cast<std::uint32_t>(x);
    return (bits & ~0x80000000u) == kExponentMask;
}

[[nodiscard]] constexpr bool isFinite(float x) noexcept {
    return (std::bit_cast<std::uint32_t>(x) & kExponentMask) != kExponentMask;
}

[[nodiscard]] constexpr float flushDenormal(float x) noexcept {
    return (x > -kDenormalThreshold && x < kDenormalThreshold) ? 0.0f : x;
}

/// 2^k for k in [-126, 127], built directly from the exponent field
[[nodiscard]] constexpr float exp2Int(int k) noexcept {
    return std::bit_cast<float>(static_cast<std::uint32_t>(k + 127) << 23);
}

/// Natural log. The exponent comes from the bit pattern; the mantissa,
/// folded into [sqrt(1/2), sqrt(2)], goes through the atanh series.
[[nodiscard]] constexpr float constexprLn(float x) noexcept {
    if (isNaN(x)) return std::numeric_limits<float>::quiet_NaN();
    if (x <= 0.0f) return -std::numeric_limits<float>::infinity();
    if (isInf(x)) return std::numeric_limits<float>::infinity();

    constexpr float kLn2 = 0.693147181f;

    int exponent = 0;
    if (x < std::numeric_limits<float>::min()) {
        x *= 8388608.0f;  // 2^23, lifts denormals into the normal range
        exponent -= 23;
    }

    const auto bits = std::bit_cast<std::uint32_t>(x);
    exponent += static_cast<int>((bits & kExponentMask) >> 23) - 127;
    float m = std::bit_cast<float>((bits & kMantissaMask) | 0x3F800000u);  // [1, 2)
    if (m > 1.41421356f) {
        m *= 0.5f;
        ++exponent;
    }

    const float z = (m - 1.0f) / (m + 1.0f);
    const float z2 = z * z;
    float power = z;
    float series = z;
    for (int n = 3; n <= 15; n += 2) {
        power *= z2;
        series += power / static_cast<float>(n);
    }
    return 2.0f * series + static_cast<float>(exponent) * kLn2;
}

/// Exponential: x = k*ln2 + r with |r| <= ln2/2, Taylor series for e^r
[[nodiscard]] constexpr float constexprExp(float x) noexcept {
    if (isNaN(x)) return x;
    if (x == 0.0f) return 1.0f;
    if (x > 88.0f) return std::numeric_limits<float>::infinity();
    if (x < -87.0f) return 0.0f;

    constexpr float kLn2 = 0.693147181f;
    const float scaled = x / kLn2;
    const int k = static_cast<int>(scaled < 0.0f ? scaled - 0.5f : scaled + 0.5f);
    const float r = x - static_cast<float>(k) * kLn2;

    float term = 1.0f;
    float sum = 1.0f;
    for (int n = 1; n <= 10; ++n) {
        term *= r / static_cast<float>(n);
        sum += term;
    }
    return sum * exp2Int(k);
}

[[nodiscard]] constexpr float constexprPow10(float x) noexcept {
    return constexprExp(x * kLn10);
}

[[nodiscard]] constexpr float constexprLog10(float x) noexcept {
    return constexprLn(x) / kLn10;
}

} // namespace detail

/// gain = 10^(dB / 20); NaN gives 0
[[nodiscard]] constexpr float dbToGain(float dB) noexcept {
    if (detail::isNaN(dB)) return 0.0f;
    return detail::constexprPow10(dB / 20.0f);
}

/// dB = 20 * log10(gain), floored at kSilenceFloorDb
[[nodiscard]] constexpr float gainToDb(float gain) noexcept {
    if (detail::isNaN(gain) || gain <= 0.0f) return kSilenceFloorDb;
    const float dB = 20.0f * detail::constexprLog10(gain);
    return dB < kSilenceFloorDb ? kSilenceFloorDb : dB;
}

} // namespace DSP
} // namespace Tonic
