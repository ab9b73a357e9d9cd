#pragma once

// ==============================================================================
// Decoded Buffer
// ==============================================================================
// Result of the external decoder: planar float channels at a fixed sample
// rate. Immutable once handed to the engine; shared so a playing voice can
// keep reading it after a newer buffer replaces it.
// ==============================================================================

#include "engine/engine_errors.h"

#include <cmath>
#include <cstddef>
#include <memory>
#include <vector>

namespace Tonic::Enhancer {

inline constexpr double kMaxBufferSampleRate = 768000.0;

struct DecodedBuffer {
    double sampleRate = 0.0;
    size_t frameCount = 0;
    std::vector<std::vector<float>> channelData;    // [channel][frame], -1..1

    [[nodiscard]] size_t numChannels() const noexcept { return channelData.size(); }

    [[nodiscard]] double durationSeconds() const noexcept {
        return sampleRate > 0.0 ? static_cast<double>(frameCount) / sampleRate : 0.0;
    }
};

using DecodedBufferPtr = std::shared_ptr<const DecodedBuffer>;

/// Structural checks applied before a buffer is accepted
[[nodiscard]] inline LoadError validateBuffer(const DecodedBuffer& buffer) noexcept {
    if (buffer.channelData.empty()) {
        return LoadError::NoChannels;
    }
    if (!std::isfinite(buffer.sampleRate) || buffer.sampleRate <= 0.0 ||
        buffer.sampleRate > kMaxBufferSampleRate) {
        return LoadError::InvalidSampleRate;
    }
    for (const auto& channel : buffer.channelData) {
        if (channel.size() != buffer.frameCount) {
            return LoadError::ChannelLengthMismatch;
        }
    }
    return LoadError::None;
}

} // namespace Tonic::Enhancer
