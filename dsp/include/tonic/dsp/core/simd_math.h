// ==============================================================================
// Layer 0: Core Utility - SIMD-Accelerated Bulk Math
// ==============================================================================
// Bulk kernels used by the analysis paths, compiled through Google Highway
// for runtime SIMD dispatch (SSE2/AVX2/AVX-512/NEON):
// - complex magnitude for FFT output (spectrum analyser)
// - sum of absolute values (waveform envelope extraction)
//
// All kernels are noexcept and allocation-free.
// ==============================================================================

#pragma once

#include <cstddef>

namespace Tonic {
namespace DSP {

/// @brief Bulk compute |z| from interleaved Complex data
/// @param complexData Pointer to interleaved {real, imag} float pairs
/// @param numBins Number of complex bins (NOT number of floats)
/// @param mags Output magnitude array (must hold numBins floats)
void computeMagnitudeBulk(const float* complexData, size_t numBins,
                          float* mags) noexcept;

/// @brief Sum of |x| over a buffer, ignoring NaN and infinite samples
/// @param data Input samples
/// @param count Number of samples
/// @return Sum of absolute values of the finite samples
[[nodiscard]] double sumAbsolute(const float* data, size_t count) noexcept;

} // namespace DSP
} // namespace Tonic
