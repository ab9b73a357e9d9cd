#pragma once

// ==============================================================================
// Playback Voice
// ==============================================================================
// Single-use reader of a decoded buffer. A voice starts at a given offset,
// renders until the end of the buffer and is then finished for good: pause
// and resume create a new voice at the paused offset.
//
// Buffers at a different sample rate than the engine are resampled with
// linear interpolation. Mono buffers feed both outputs; only the first two
// channels of wider buffers are played.
//
// render() is real-time safe and never calls out. Reaching the end of the
// buffer marks the voice ended; the owner collects the ended callback with
// takeEnded() and fires it once it has released its own locks.
// ==============================================================================

#include "engine/decoded_buffer.h"

#include <cstddef>
#include <functional>
#include <memory>

namespace Tonic::Enhancer {

using EndedCallback = std::function<void()>;

/// Shared so the audio thread can hold the callback past the voice's lifetime
using SharedEndedCallback = std::shared_ptr<const EndedCallback>;

class PlaybackVoice {
public:
    /// @param buffer Buffer to read (must be non-null and validated)
    /// @param startSeconds Offset into the buffer
    /// @param engineSampleRate Rate the voice renders at
    /// @param onEnded Optional callback handed out once on reaching the end
    PlaybackVoice(DecodedBufferPtr buffer,
                  double startSeconds,
                  double engineSampleRate,
                  SharedEndedCallback onEnded = {});

    PlaybackVoice(const PlaybackVoice&) = delete;
    PlaybackVoice& operator=(const PlaybackVoice&) = delete;

    /// Render the next frames; frames past the end of the buffer are silent.
    /// @return Number of frames read from the buffer
    size_t render(float* left, float* right, size_t numFrames) noexcept;

    [[nodiscard]] bool isFinished() const noexcept { return finished_; }

    /// The ended callback, the first time it is asked for after render()
    /// reached the end of the buffer; null otherwise
    [[nodiscard]] SharedEndedCallback takeEnded() noexcept;

private:
    void finish() noexcept;

    DecodedBufferPtr buffer_;
    SharedEndedCallback onEnded_;
    const float* left_ = nullptr;
    const float* right_ = nullptr;
    size_t frameCount_ = 0;
    double position_ = 0.0;     // in buffer frames
    double increment_ = 1.0;    // buffer frames per output frame
    bool finished_ = false;
    bool endedPending_ = false;
};

} // namespace Tonic::Enhancer
