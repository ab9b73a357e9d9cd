#pragma once

// ==============================================================================
// Engine Configuration
// ==============================================================================

#include "engine/engine_errors.h"

#include <tonic/dsp/core/db_utils.h>

#include <cstddef>

namespace Tonic::Enhancer {

inline constexpr double kMinEngineSampleRate = 8000.0;
inline constexpr double kMaxEngineSampleRate = 768000.0;

/// Largest block the graph accepts in one pass (analysis FIFO capacity)
inline constexpr size_t kMaxBlockSizeLimit = 8192;

struct EngineConfig {
    double sampleRate = 44100.0;        // Device rate in Hz
    size_t maxBlockSize = 512;          // Frames per processing pass
    float analyserSmoothing = 0.8f;     // 0-1 spectrum time constant
    float analyserMinDb = -100.0f;      // Maps to spectrum byte 0
    float analyserMaxDb = -30.0f;       // Maps to spectrum byte 255
    float gainSmoothingMs = 5.0f;       // Output gain ramp time
};

/// Check a configuration before any resource is allocated
[[nodiscard]] inline InitError validateConfig(const EngineConfig& config) noexcept {
    if (!(config.sampleRate >= kMinEngineSampleRate && config.sampleRate <= kMaxEngineSampleRate)) {
        return InitError::InvalidSampleRate;
    }
    if (config.maxBlockSize == 0 || config.maxBlockSize > kMaxBlockSizeLimit) {
        return InitError::InvalidBlockSize;
    }
    if (!(config.analyserSmoothing >= 0.0f && config.analyserSmoothing <= 1.0f)) {
        return InitError::InvalidAnalyserRange;
    }
    if (!DSP::detail::isFinite(config.analyserMinDb) ||
        !DSP::detail::isFinite(config.analyserMaxDb) ||
        !(config.analyserMaxDb > config.analyserMinDb)) {
        return InitError::InvalidAnalyserRange;
    }
    return InitError::None;
}

} // namespace Tonic::Enhancer
