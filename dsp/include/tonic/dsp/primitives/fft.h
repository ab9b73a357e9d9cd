// ==============================================================================
// Layer 1: DSP Primitive - Real FFT
// ==============================================================================
// Forward real-to-complex transform backed by pffft.
//
// prepare() allocates one SIMD-aligned workspace holding the staging input,
// the transform output and pffft's scratch area. forward() only copies and
// transforms, so it is safe to call from any thread that owns the object.
// ==============================================================================

#pragma once

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstddef>
#include <memory>

#include <pffft.h>

namespace Tonic {
namespace DSP {

inline constexpr size_t kMinFFTSize = 256;
inline constexpr size_t kMaxFFTSize = 8192;

/// @brief One frequency bin. Layout is two packed floats (re, im), which
///        the SIMD magnitude kernel relies on.
struct Complex {
    float real = 0.0f;
    float imag = 0.0f;

    [[nodiscard]] float magnitude() const noexcept {
        return std::sqrt(real * real + imag * imag);
    }
};

static_assert(sizeof(Complex) == 2 * sizeof(float), "Complex must be two packed floats");

/// @brief Real-input FFT of a fixed power-of-two size
class FFT {
public:
    FFT() noexcept = default;

    FFT(const FFT&) = delete;
    FFT& operator=(const FFT&) = delete;
    FFT(FFT&&) noexcept = default;
    FFT& operator=(FFT&&) noexcept = default;

    /// @brief Set up the transform.
    /// @param fftSize Power of two in [256, 8192]
    /// @return false for an unsupported size or if pffft could not allocate;
    ///         the object is then unprepared
    /// @note Allocates
    bool prepare(size_t fftSize) noexcept {
        size_ = 0;
        workspace_.reset();
        setup_.reset();

        if (fftSize < kMinFFTSize || fftSize > kMaxFFTSize || !std::has_single_bit(fftSize)) {
            return false;
        }

        setup_.reset(pffft_new_setup(static_cast<int>(fftSize), PFFFT_REAL));
        workspace_.reset(static_cast<float*>(
            pffft_aligned_malloc(kWorkspaceBlocks * fftSize * sizeof(float))));
        if (!setup_ || !workspace_) {
            workspace_.reset();
            setup_.reset();
            return false;
        }

        size_ = fftSize;
        return true;
    }

    /// @brief Transform fftSize() real samples into numBins() bins, DC to Nyquist
    void forward(const float* input, Complex* output) noexcept {
        if (!isPrepared() || input == nullptr || output == nullptr) return;

        float* staged = workspace_.get();
        float* spectrum = staged + size_;
        float* scratch = spectrum + size_;

        std::copy_n(input, size_, staged);
        pffft_transform_ordered(setup_.get(), staged, spectrum, scratch, PFFFT_FORWARD);

        // Ordered real output packs Nyquist into slot 1:
        // [re0, reN/2, re1, im1, re2, im2, ...]
        const size_t half = size_ / 2;
        output[0] = {spectrum[0], 0.0f};
        for (size_t k = 1; k < half; ++k) {
            output[k].real = spectrum[2 * k];
            output[k].imag = spectrum[2 * k + 1];
        }
        output[half] = {spectrum[1], 0.0f};
    }

    [[nodiscard]] size_t size() const noexcept { return size_; }

    /// fftSize / 2 + 1
    [[nodiscard]] size_t numBins() const noexcept { return size_ / 2 + 1; }

    [[nodiscard]] bool isPrepared() const noexcept { return size_ != 0; }

private:
    // staged input | ordered output | pffft scratch
    static constexpr size_t kWorkspaceBlocks = 3;

    struct SetupDeleter {
        void operator()(PFFFT_Setup* setup) const noexcept { pffft_destroy_setup(setup); }
    };

    struct AlignedDeleter {
        void operator()(float* data) const noexcept { pffft_aligned_free(data); }
    };

    size_t size_ = 0;
    std::unique_ptr<PFFFT_Setup, SetupDeleter> setup_;
    std::unique_ptr<float, AlignedDeleter> workspace_;
};

} // namespace DSP
} // namespace Tonic
