// ==============================================================================
// Transport Controller
// ==============================================================================

#include "engine/transport_controller.h"
#include "engine/engine_log.h"

#include <algorithm>
#include <utility>

namespace Tonic::Enhancer {

namespace {

[[maybe_unused]] const char* stateName(PlaybackState state) noexcept {
    switch (state) {
        case PlaybackState::Stopped: return "Stopped";
        case PlaybackState::Playing: return "Playing";
        case PlaybackState::Paused:  return "Paused";
    }
    return "?";
}

} // namespace

TransportController::TransportController(const Clock& clock) noexcept
    : clock_(clock) {}

TransportController::~TransportController() {
    replaceVoice(nullptr);
}

void TransportController::setEngineSampleRate(double sampleRate) noexcept {
    if (sampleRate > 0.0) {
        engineSampleRate_ = sampleRate;
    }
}

void TransportController::setBuffer(DecodedBufferPtr buffer, EndedCallback onEnded) {
    stop();
    buffer_ = std::move(buffer);
    onEnded_ = onEnded ? std::make_shared<const EndedCallback>(std::move(onEnded)) : nullptr;
}

void TransportController::clearBuffer() {
    stop();
    buffer_.reset();
    onEnded_ = nullptr;
}

bool TransportController::play() {
    // Decode may still be in flight; check at call time
    if (!buffer_) {
        return false;
    }

    // Playing again restarts from the beginning
    if (state_ == PlaybackState::Playing) {
        replaceVoice(nullptr);
        pausedOffset_ = 0.0;
    }

    const double offset = pausedOffset_;
    anchor_ = clock_.now() - offset;
    replaceVoice(std::make_unique<PlaybackVoice>(buffer_, offset, engineSampleRate_, onEnded_));
    pausedOffset_ = 0.0;

    TONIC_LOG("transport %s -> Playing at %.3f s", stateName(state_), offset);
    state_ = PlaybackState::Playing;
    return true;
}

bool TransportController::pause() {
    if (state_ != PlaybackState::Playing) {
        return false;
    }

    pausedOffset_ = std::max(0.0, clock_.now() - anchor_);
    replaceVoice(nullptr);
    state_ = PlaybackState::Paused;

    TONIC_LOG("transport Playing -> Paused at %.3f s", pausedOffset_);
    return true;
}

void TransportController::stop() {
    replaceVoice(nullptr);
    TONIC_LOG("transport %s -> Stopped", stateName(state_));
    state_ = PlaybackState::Stopped;
    anchor_ = 0.0;
    pausedOffset_ = 0.0;
}

double TransportController::getCurrentTime() const noexcept {
    if (state_ == PlaybackState::Playing) {
        return std::max(0.0, clock_.now() - anchor_);
    }
    return pausedOffset_;
}

double TransportController::getDuration() const noexcept {
    return buffer_ ? buffer_->durationSeconds() : 0.0;
}

double TransportController::getProgress() const noexcept {
    const double duration = getDuration();
    if (duration <= 0.0) return 0.0;
    return std::clamp(getCurrentTime() / duration, 0.0, 1.0);
}

bool TransportController::shouldAutoStop() const noexcept {
    const double duration = getDuration();
    return state_ == PlaybackState::Playing && duration > 0.0 && getCurrentTime() >= duration;
}

size_t TransportController::render(float* left, float* right, size_t numFrames) noexcept {
    const size_t rendered = renderVoice(left, right, numFrames);
    dispatchEnded();
    return rendered;
}

size_t TransportController::renderVoice(float* left, float* right, size_t numFrames) noexcept {
    std::unique_lock<std::mutex> lock(voiceMutex_, std::try_to_lock);
    if (!lock.owns_lock() || !voice_ || voice_->isFinished()) {
        std::fill(left, left + numFrames, 0.0f);
        std::fill(right, right + numFrames, 0.0f);
        return 0;
    }

    const size_t rendered = voice_->render(left, right, numFrames);
    if (auto ended = voice_->takeEnded()) {
        pendingEnded_ = std::move(ended);
    }
    return rendered;
}

void TransportController::dispatchEnded() noexcept {
    const SharedEndedCallback ended = std::move(pendingEnded_);
    if (ended && *ended) {
        (*ended)();
    }
}

void TransportController::replaceVoice(std::unique_ptr<PlaybackVoice> voice) {
    {
        std::lock_guard<std::mutex> lock(voiceMutex_);
        voice_.swap(voice);
    }
    // Previous voice released here, outside the audio thread's reach
}

} // namespace Tonic::Enhancer
