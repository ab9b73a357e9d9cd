// ==============================================================================
// Playback Voice
// ==============================================================================

#include "engine/playback_voice.h"

#include <tonic/dsp/core/interpolation.h>

#include <algorithm>
#include <utility>

namespace Tonic::Enhancer {

PlaybackVoice::PlaybackVoice(DecodedBufferPtr buffer,
                             double startSeconds,
                             double engineSampleRate,
                             SharedEndedCallback onEnded)
    : buffer_(std::move(buffer))
    , onEnded_(std::move(onEnded)) {
    if (!buffer_ || buffer_->channelData.empty() || engineSampleRate <= 0.0) {
        finished_ = true;
        return;
    }

    frameCount_ = buffer_->frameCount;
    left_ = buffer_->channelData[0].data();
    right_ = buffer_->numChannels() > 1 ? buffer_->channelData[1].data() : left_;
    increment_ = buffer_->sampleRate / engineSampleRate;
    position_ = std::max(0.0, startSeconds) * buffer_->sampleRate;

    // Starting at or past the end plays nothing and does not count as a
    // playback-to-completion
    if (position_ >= static_cast<double>(frameCount_)) {
        finished_ = true;
    }
}

size_t PlaybackVoice::render(float* left, float* right, size_t numFrames) noexcept {
    size_t rendered = 0;
    const auto end = static_cast<double>(frameCount_);

    for (size_t i = 0; i < numFrames; ++i) {
        if (finished_ || position_ >= end) {
            if (!finished_) finish();
            left[i] = 0.0f;
            right[i] = 0.0f;
            continue;
        }
        left[i] = DSP::Interpolation::readLinear(left_, frameCount_, position_);
        right[i] = DSP::Interpolation::readLinear(right_, frameCount_, position_);
        position_ += increment_;
        ++rendered;
    }

    if (!finished_ && position_ >= end) {
        finish();
    }
    return rendered;
}

SharedEndedCallback PlaybackVoice::takeEnded() noexcept {
    if (!endedPending_) return nullptr;
    endedPending_ = false;
    return std::move(onEnded_);
}

void PlaybackVoice::finish() noexcept {
    finished_ = true;
    endedPending_ = true;
}

} // namespace Tonic::Enhancer
