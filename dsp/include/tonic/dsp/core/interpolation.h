// ==============================================================================
// Layer 0: Core Utility - Interpolation
// ==============================================================================
// Fractional-position reads, for playing a buffer whose sample rate differs
// from the engine rate.
// ==============================================================================

#pragma once

#include <cstddef>

namespace Tonic {
namespace DSP {
namespace Interpolation {

/// y0 at t = 0, y1 at t = 1
[[nodiscard]] constexpr float linearInterpolate(float y0, float y1, float t) noexcept {
    return y0 + t * (y1 - y0);
}

/// @brief Sample value at a fractional index.
///
/// The last sample is returned as-is; positions past it, negative positions
/// and empty buffers read as silence.
[[nodiscard]] inline float readLinear(const float* data, size_t size, double position) noexcept {
    if (data == nullptr || size == 0 || position < 0.0) return 0.0f;

    const auto index = static_cast<size_t>(position);
    if (index >= size - 1) {
        return index == size - 1 ? data[size - 1] : 0.0f;
    }
    const float frac = static_cast<float>(position - static_cast<double>(index));
    return linearInterpolate(data[index], data[index + 1], frac);
}

} // namespace Interpolation
} // namespace DSP
} // namespace Tonic
