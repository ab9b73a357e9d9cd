#pragma once

// ==============================================================================
// Transport Controller
// ==============================================================================
// Stopped / Playing / Paused state machine. Owns the playback position
// (anchor and paused offset, measured on an injected Clock) and the one
// active PlaybackVoice.
//
// Control methods run on the control thread. render() runs on the audio
// thread; it try-locks the voice slot and renders silence for the block if
// the control thread holds it. The ended callback is fired only after the
// voice slot is unlocked, so it may call stop() or play().
//
// Auto-stop is not internal: a poller that sees shouldAutoStop() calls
// stop().
// ==============================================================================

#include "engine/clock.h"
#include "engine/decoded_buffer.h"
#include "engine/playback_voice.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>

namespace Tonic::Enhancer {

enum class PlaybackState : uint8_t {
    Stopped,
    Playing,
    Paused
};

class TransportController {
public:
    explicit TransportController(const Clock& clock) noexcept;
    ~TransportController();

    TransportController(const TransportController&) = delete;
    TransportController& operator=(const TransportController&) = delete;

    void setEngineSampleRate(double sampleRate) noexcept;

    /// Replace the loaded buffer. Any playback is stopped first.
    void setBuffer(DecodedBufferPtr buffer, EndedCallback onEnded = {});

    /// Drop the buffer and stop
    void clearBuffer();

    [[nodiscard]] bool hasBuffer() const noexcept { return buffer_ != nullptr; }

    // =========================================================================
    // Transitions
    // =========================================================================

    /// Start (or restart) playback from the paused offset.
    /// @return false if no buffer is loaded (nothing happens)
    bool play();

    /// @return false unless the transport was playing
    bool pause();

    /// Return to Stopped from any state, resetting the position
    void stop();

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] PlaybackState getPlaybackState() const noexcept { return state_; }
    [[nodiscard]] bool isPlaying() const noexcept { return state_ == PlaybackState::Playing; }

    /// Seconds since the playback anchor while playing, paused offset otherwise
    [[nodiscard]] double getCurrentTime() const noexcept;

    /// Buffer length in seconds, 0 without a buffer
    [[nodiscard]] double getDuration() const noexcept;

    /// currentTime / duration clamped to [0, 1]
    [[nodiscard]] double getProgress() const noexcept;

    /// True while playing once currentTime >= duration > 0
    [[nodiscard]] bool shouldAutoStop() const noexcept;

    [[nodiscard]] double getPausedOffset() const noexcept { return pausedOffset_; }

    // =========================================================================
    // Audio Thread
    // =========================================================================

    /// renderVoice() followed by dispatchEnded()
    /// @return Frames read from the buffer
    size_t render(float* left, float* right, size_t numFrames) noexcept;

    /// Render the active voice into left/right (numFrames each), or silence.
    /// A voice that reaches its end here leaves its callback pending.
    /// @return Frames read from the buffer
    size_t renderVoice(float* left, float* right, size_t numFrames) noexcept;

    /// Fire the pending ended callback, if any. Call from the audio thread
    /// with no engine lock held.
    void dispatchEnded() noexcept;

private:
    /// Swap the voice slot under the lock; the old voice is destroyed after
    /// the lock is released
    void replaceVoice(std::unique_ptr<PlaybackVoice> voice);

    const Clock& clock_;
    double engineSampleRate_ = 44100.0;

    DecodedBufferPtr buffer_;
    SharedEndedCallback onEnded_;

    PlaybackState state_ = PlaybackState::Stopped;
    double anchor_ = 0.0;
    double pausedOffset_ = 0.0;

    std::mutex voiceMutex_;
    std::unique_ptr<PlaybackVoice> voice_;

    // Audio thread only
    SharedEndedCallback pendingEnded_;
};

} // namespace Tonic::Enhancer
