// ==============================================================================
// Layer 0: Core Utility - Window Functions
// ==============================================================================
// Analysis windows as generalized cosine sums:
//   w[n] = a0 - a1*cos(2 pi n / N) + a2*cos(4 pi n / N)
// Windows are periodic (DFT-even), i.e. divided by N rather than N - 1.
// ==============================================================================

#pragma once

#include <tonic/dsp/core/math_constants.h>

#include <cmath>
#include <cstddef>

namespace Tonic {
namespace DSP {

namespace Window {

struct CosineSumTerms {
    float a0;
    float a1;
    float a2;
};

/// Analyser window; 0.42 coherent gain, -58 dB sidelobes
inline constexpr CosineSumTerms kBlackmanTerms{0.42f, 0.5f, 0.08f};

inline void generateCosineSum(float* output, size_t size, const CosineSumTerms& t) noexcept {
    if (output == nullptr || size == 0) return;

    const float step = kTwoPi / static_cast<float>(size);
    for (size_t n = 0; n < size; ++n) {
        const float phase = step * static_cast<float>(n);
        output[n] = t.a0 - t.a1 * std::cos(phase) + t.a2 * std::cos(2.0f * phase);
    }
}

inline void generateBlackman(float* output, size_t size) noexcept {
    generateCosineSum(output, size, kBlackmanTerms);
}

} // namespace Window

} // namespace DSP
} // namespace Tonic
