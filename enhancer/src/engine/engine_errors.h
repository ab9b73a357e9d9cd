#pragma once

// ==============================================================================
// Engine Error Codes
// ==============================================================================
// Typed failure codes returned by the engine. None of these are thrown; the
// engine also keeps a readable copy of the most recent one (lastError()).
// ==============================================================================

#include <cstdint>
#include <string_view>

namespace Tonic::Enhancer {

/// Failure of AudioEngine::initialize()
enum class InitError : uint8_t {
    None = 0,
    Destroyed,              ///< Engine was destroyed; it cannot be revived
    InvalidSampleRate,      ///< Sample rate not finite or outside [8000, 768000]
    InvalidBlockSize,       ///< Max block size 0 or above the analysis FIFO capacity
    InvalidAnalyserRange,   ///< Smoothing outside [0, 1] or minDb >= maxDb
    FftUnavailable          ///< FFT backend could not be set up
};

/// Failure of AudioEngine::loadBuffer() and decode reporting
enum class LoadError : uint8_t {
    None = 0,
    NotReady,               ///< Engine not initialized
    Destroyed,              ///< Engine was destroyed
    NoChannels,             ///< Buffer has no channel data
    InvalidSampleRate,      ///< Sample rate not finite or outside (0, 768000]
    ChannelLengthMismatch,  ///< A channel's length differs from frameCount
    DecodeFailed            ///< The decoder could not produce a buffer
};

/// Failure of any other engine operation
enum class EngineError : uint8_t {
    None = 0,
    NotReady,               ///< Engine not initialized
    Destroyed               ///< Engine was destroyed
};

[[nodiscard]] constexpr std::string_view toString(InitError error) noexcept {
    switch (error) {
        case InitError::None:                 return "No error";
        case InitError::Destroyed:            return "Engine has been destroyed";
        case InitError::InvalidSampleRate:    return "Invalid engine sample rate";
        case InitError::InvalidBlockSize:     return "Invalid maximum block size";
        case InitError::InvalidAnalyserRange: return "Invalid analyser smoothing or dB range";
        case InitError::FftUnavailable:       return "FFT backend unavailable";
    }
    return "Unknown init error";
}

[[nodiscard]] constexpr std::string_view toString(LoadError error) noexcept {
    switch (error) {
        case LoadError::None:                  return "No error";
        case LoadError::NotReady:              return "Engine is not initialized";
        case LoadError::Destroyed:             return "Engine has been destroyed";
        case LoadError::NoChannels:            return "Buffer has no channels";
        case LoadError::InvalidSampleRate:     return "Buffer sample rate is invalid";
        case LoadError::ChannelLengthMismatch: return "Channel length does not match frame count";
        case LoadError::DecodeFailed:          return "Audio decoding failed";
    }
    return "Unknown load error";
}

[[nodiscard]] constexpr std::string_view toString(EngineError error) noexcept {
    switch (error) {
        case EngineError::None:      return "No error";
        case EngineError::NotReady:  return "Engine is not initialized";
        case EngineError::Destroyed: return "Engine has been destroyed";
    }
    return "Unknown engine error";
}

} // namespace Tonic::Enhancer
