// ==============================================================================
// Layer 0: Core - Math Constants
// ==============================================================================

#pragma once

namespace Tonic {
namespace DSP {

inline constexpr float kPi = 3.14159265358979323846f;

/// Angular frequency factor: omega = kTwoPi * f / fs
inline constexpr float kTwoPi = 2.0f * kPi;

/// ln(10), for dB conversions through exp/log
inline constexpr float kLn10 = 2.302585093f;

} // namespace DSP
} // namespace Tonic
