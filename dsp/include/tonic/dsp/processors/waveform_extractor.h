// ==============================================================================
// Layer 2: DSP Processor - Waveform Extractor
// ==============================================================================
// Offline downsampler producing a fixed-length amplitude envelope for static
// waveform display.
//
// The input is split into kWaveformPoints contiguous blocks of
// floor(length / kWaveformPoints) samples; each point is the mean absolute
// value of its block. Trailing samples beyond kWaveformPoints * blockSize are
// ignored.
//
// Inputs shorter than kWaveformPoints use one sample per point and leave the
// remaining points at zero. NaN and infinite samples count as silence.
// ==============================================================================

#pragma once

#include <tonic/dsp/core/simd_math.h>

#include <array>
#include <cstddef>

namespace Tonic {
namespace DSP {

/// Number of points in a waveform envelope
inline constexpr size_t kWaveformPoints = 800;

/// Fixed-length waveform envelope
using WaveformEnvelope = std::array<float, kWaveformPoints>;

/// @brief Compute the mean-absolute envelope of a mono sample array
/// @param samples Input samples (may be nullptr when length is 0)
/// @param length Number of samples
/// @return kWaveformPoints envelope values, each >= 0
[[nodiscard]] inline WaveformEnvelope extractWaveform(const float* samples,
                                                      size_t length) noexcept {
    WaveformEnvelope envelope{};
    if (samples == nullptr || length == 0) {
        return envelope;
    }

    const size_t blockSize = length / kWaveformPoints;
    if (blockSize == 0) {
        // Short input: one sample per point, zero padded
        for (size_t i = 0; i < length; ++i) {
            envelope[i] = static_cast<float>(sumAbsolute(samples + i, 1));
        }
        return envelope;
    }

    const double invBlockSize = 1.0 / static_cast<double>(blockSize);
    for (size_t i = 0; i < kWaveformPoints; ++i) {
        const double sum = sumAbsolute(samples + i * blockSize, blockSize);
        envelope[i] = static_cast<float>(sum * invBlockSize);
    }
    return envelope;
}

} // namespace DSP
} // namespace Tonic
