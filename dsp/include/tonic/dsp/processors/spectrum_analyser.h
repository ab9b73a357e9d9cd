// ==============================================================================
// Layer 2: DSP Processor - Spectrum Analyser
// ==============================================================================
// Consumer-side FFT analyser producing byte-scaled magnitude frames.
//
// Pipeline per analyse() call:
//   latest N samples -> Blackman window -> FFT -> |X[k]|/N
//   -> per-bin time smoothing: s[k] = tau * s[k] + (1 - tau) * |X[k]|
//   -> dB -> linear map of [minDb, maxDb] onto [0, 255] with clamp
//
// The smoothing state is the only history kept between calls. prepare()
// allocates; analyse() does not.
// ==============================================================================

#pragma once

#include <tonic/dsp/core/db_utils.h>
#include <tonic/dsp/core/simd_math.h>
#include <tonic/dsp/core/window_functions.h>
#include <tonic/dsp/primitives/fft.h>
#include <tonic/dsp/primitives/spectrum_fifo.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Tonic {
namespace DSP {

/// @brief Analyser configuration
struct SpectrumAnalyserConfig {
    size_t fftSize = 2048;                   ///< Power of two, [256, 8192]
    float smoothing = 0.8f;                  ///< Time constant in [0, 1]
    float minDb = -100.0f;                   ///< Maps to byte 0
    float maxDb = -30.0f;                    ///< Maps to byte 255
};

/// @brief FFT magnitude analyser with byte-scaled output
class SpectrumAnalyser {
public:
    SpectrumAnalyser() noexcept = default;

    SpectrumAnalyser(const SpectrumAnalyser&) = delete;
    SpectrumAnalyser& operator=(const SpectrumAnalyser&) = delete;
    SpectrumAnalyser(SpectrumAnalyser&&) noexcept = default;
    SpectrumAnalyser& operator=(SpectrumAnalyser&&) noexcept = default;

    /// @brief Allocate buffers and the FFT for the given configuration
    /// @return false if the configuration is invalid or the FFT backend
    ///         could not be set up
    bool prepare(const SpectrumAnalyserConfig& config) {
        prepared_ = false;

        if (!(config.smoothing >= 0.0f && config.smoothing <= 1.0f)) return false;
        if (!(config.maxDb > config.minDb)) return false;
        if (!fft_.prepare(config.fftSize)) return false;

        config_ = config;
        window_.assign(config.fftSize, 0.0f);
        Window::generateBlackman(window_.data(), window_.size());
        timeData_.assign(config.fftSize, 0.0f);
        fifoScratch_.assign(config.fftSize, 0.0f);
        spectrum_.assign(config.fftSize / 2 + 1, Complex{});
        magnitudes_.assign(config.fftSize / 2 + 1, 0.0f);
        smoothed_.assign(config.fftSize / 2, 0.0f);
        prepared_ = true;
        return true;
    }

    [[nodiscard]] bool isPrepared() const noexcept { return prepared_; }

    /// @brief Number of output bins (fftSize / 2)
    [[nodiscard]] size_t binCount() const noexcept { return smoothed_.size(); }

    [[nodiscard]] const SpectrumAnalyserConfig& config() const noexcept { return config_; }

    /// @brief Clear the smoothing history
    void reset() noexcept {
        std::fill(smoothed_.begin(), smoothed_.end(), 0.0f);
    }

    /// @brief Analyse one window of time-domain samples
    /// @param timeData fftSize samples, oldest first
    /// @param dest Byte output, receives min(destSize, binCount()) values
    void analyse(const float* timeData, uint8_t* dest, size_t destSize) noexcept {
        if (!prepared_ || timeData == nullptr) return;

        const size_t N = fft_.size();
        for (size_t i = 0; i < N; ++i) {
            const float x = timeData[i];
            timeData_[i] = detail::isFinite(x) ? x * window_[i] : 0.0f;
        }

        fft_.forward(timeData_.data(), spectrum_.data());
        computeMagnitudeBulk(reinterpret_cast<const float*>(spectrum_.data()),
                             spectrum_.size(), magnitudes_.data());

        const float invN = 1.0f / static_cast<float>(N);
        const float tau = config_.smoothing;
        for (size_t k = 0; k < smoothed_.size(); ++k) {
            const float magnitude = magnitudes_[k] * invN;
            float value = tau * smoothed_[k] + (1.0f - tau) * magnitude;
            if (!detail::isFinite(value)) {
                value = 0.0f;
            }
            smoothed_[k] = detail::flushDenormal(value);
        }

        if (dest == nullptr) return;
        const size_t count = std::min(destSize, smoothed_.size());
        for (size_t k = 0; k < count; ++k) {
            dest[k] = magnitudeToByte(gainToDb(smoothed_[k]), config_.minDb, config_.maxDb);
        }
    }

    /// @brief Analyse the most recent fftSize samples held by a FIFO
    ///
    /// If the FIFO holds fewer samples than one window, the samples it has
    /// fill the end of the window and the missing head counts as silence.
    template <size_t Capacity>
    void analyse(const SpectrumFIFO<Capacity>& fifo, uint8_t* dest, size_t destSize) noexcept {
        if (!prepared_) return;

        const size_t N = fifoScratch_.size();
        const size_t available = std::min({fifo.totalWritten(), N, Capacity});
        const size_t head = N - available;

        std::fill(fifoScratch_.begin(), fifoScratch_.begin() + static_cast<std::ptrdiff_t>(head),
                  0.0f);
        if (available == 0 || fifo.readLatest(fifoScratch_.data() + head, available) == 0) {
            // Nothing written yet, or cleared since totalWritten()
            std::fill(fifoScratch_.begin(), fifoScratch_.end(), 0.0f);
        }
        analyse(fifoScratch_.data(), dest, destSize);
    }

    /// @brief Smoothed linear magnitudes from the last analyse() call
    [[nodiscard]] const std::vector<float>& smoothedMagnitudes() const noexcept {
        return smoothed_;
    }

    /// @brief Centre frequency of a bin in Hz
    [[nodiscard]] float binFrequency(size_t bin, float sampleRate) const noexcept {
        if (fft_.size() == 0) return 0.0f;
        return static_cast<float>(bin) * sampleRate / static_cast<float>(fft_.size());
    }

    /// @brief Map a dB value onto a byte: 255 * (dB - minDb) / (maxDb - minDb)
    [[nodiscard]] static uint8_t magnitudeToByte(float dB, float minDb, float maxDb) noexcept {
        if (!(maxDb > minDb) || detail::isNaN(dB)) return 0;
        const float scaled = 255.0f * (dB - minDb) / (maxDb - minDb);
        if (scaled <= 0.0f) return 0;
        if (scaled >= 255.0f) return 255;
        return static_cast<uint8_t>(scaled);
    }

private:
    SpectrumAnalyserConfig config_;
    FFT fft_;
    std::vector<float> window_;
    std::vector<float> timeData_;
    std::vector<float> fifoScratch_;
    std::vector<Complex> spectrum_;
    std::vector<float> magnitudes_;
    std::vector<float> smoothed_;
    bool prepared_ = false;
};

} // namespace DSP
} // namespace Tonic
