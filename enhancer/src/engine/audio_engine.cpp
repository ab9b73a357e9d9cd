// ==============================================================================
// Audio Engine
// ==============================================================================

#include "engine/audio_engine.h"
#include "engine/engine_log.h"

#include <algorithm>
#include <string>
#include <utility>

namespace Tonic::Enhancer {

AudioEngine::AudioEngine() noexcept
    : clock_(&steadyClock_)
    , transport_(*clock_) {}

AudioEngine::AudioEngine(const Clock& clock) noexcept
    : clock_(&clock)
    , transport_(*clock_) {}

AudioEngine::~AudioEngine() {
    destroy();
}

// =============================================================================
// Lifecycle
// =============================================================================

InitError AudioEngine::initialize(const EngineConfig& config) {
    std::lock_guard<std::mutex> control(controlMutex_);

    const Lifecycle lifecycle = lifecycle_.load(std::memory_order_acquire);
    if (lifecycle == Lifecycle::Destroyed) {
        setError(toString(InitError::Destroyed));
        return InitError::Destroyed;
    }
    if (lifecycle == Lifecycle::Ready) {
        return InitError::None;
    }

    auto graph = std::make_unique<ProcessingGraph>();
    const InitError error = graph->initialize(config);
    if (error != InitError::None) {
        TONIC_LOG("initialize failed: %s", std::string(toString(error)).c_str());
        setError(toString(error));
        return error;
    }

    auto metering = std::make_unique<Metering>(*graph);
    monoScratch_.assign(config.maxBlockSize, 0.0f);
    transport_.setEngineSampleRate(config.sampleRate);

    {
        std::lock_guard<std::mutex> meteringLock(meteringMutex_);
        std::lock_guard<std::mutex> audioLock(audioMutex_);
        graph_ = std::move(graph);
        metering_ = std::move(metering);
    }
    settings_ = Settings{};

    lifecycle_.store(Lifecycle::Ready, std::memory_order_release);
    clearError();
    TONIC_LOG("initialized at %.0f Hz, block %zu", config.sampleRate, config.maxBlockSize);
    return InitError::None;
}

void AudioEngine::destroy() {
    std::lock_guard<std::mutex> control(controlMutex_);

    if (lifecycle_.load(std::memory_order_acquire) == Lifecycle::Destroyed) {
        return;
    }

    transport_.clearBuffer();

    std::unique_ptr<ProcessingGraph> graph;
    std::unique_ptr<Metering> metering;
    {
        std::lock_guard<std::mutex> meteringLock(meteringMutex_);
        std::lock_guard<std::mutex> audioLock(audioMutex_);
        lifecycle_.store(Lifecycle::Destroyed, std::memory_order_release);
        metering = std::move(metering_);
        graph = std::move(graph_);
    }

    waveform_.fill(0.0f);
    TONIC_LOG("destroyed");
}

bool AudioEngine::isReady() const noexcept {
    return lifecycle_.load(std::memory_order_acquire) == Lifecycle::Ready;
}

bool AudioEngine::isDestroyed() const noexcept {
    return lifecycle_.load(std::memory_order_acquire) == Lifecycle::Destroyed;
}

std::string AudioEngine::lastError() const {
    std::lock_guard<std::mutex> lock(errorMutex_);
    return lastError_;
}

EngineError AudioEngine::checkUsable() const noexcept {
    switch (lifecycle_.load(std::memory_order_acquire)) {
        case Lifecycle::Ready:         return EngineError::None;
        case Lifecycle::Destroyed:     return EngineError::Destroyed;
        case Lifecycle::Uninitialized: return EngineError::NotReady;
    }
    return EngineError::NotReady;
}

void AudioEngine::resetGraph() {
    std::lock_guard<std::mutex> audioLock(audioMutex_);
    if (graph_) {
        graph_->reset();
    }
}

void AudioEngine::setError(std::string_view message) {
    std::lock_guard<std::mutex> lock(errorMutex_);
    lastError_.assign(message);
}

void AudioEngine::clearError() {
    std::lock_guard<std::mutex> lock(errorMutex_);
    lastError_.clear();
}

// =============================================================================
// Buffer
// =============================================================================

LoadError AudioEngine::loadBuffer(DecodedBufferPtr buffer, EndedCallback onEnded) {
    const auto rejectUnusable = [this]() -> LoadError {
        switch (checkUsable()) {
            case EngineError::None:      return LoadError::None;
            case EngineError::Destroyed: return LoadError::Destroyed;
            case EngineError::NotReady:  return LoadError::NotReady;
        }
        return LoadError::NotReady;
    };

    LoadError error = rejectUnusable();
    if (error == LoadError::None) {
        error = buffer ? validateBuffer(*buffer) : LoadError::NoChannels;
    }
    if (error != LoadError::None) {
        TONIC_LOG("load rejected: %s", std::string(toString(error)).c_str());
        setError(toString(error));
        return error;
    }

    // Envelope extraction runs outside the control lock
    const auto& first = buffer->channelData.front();
    const WaveformEnvelope envelope = DSP::extractWaveform(first.data(), first.size());

    std::lock_guard<std::mutex> control(controlMutex_);
    if (const LoadError late = rejectUnusable(); late != LoadError::None) {
        setError(toString(late));
        return late;
    }

    TONIC_LOG("loaded %zu frames x %zu channels at %.0f Hz",
              buffer->frameCount, buffer->numChannels(), buffer->sampleRate);
    transport_.setBuffer(std::move(buffer), std::move(onEnded));
    resetGraph();
    waveform_ = envelope;
    clearError();
    return LoadError::None;
}

LoadError AudioEngine::loadBuffer(DecodedBuffer buffer, EndedCallback onEnded) {
    return loadBuffer(std::make_shared<const DecodedBuffer>(std::move(buffer)),
                      std::move(onEnded));
}

LoadError AudioEngine::reportDecodeFailure(std::string_view message) {
    std::string text(toString(LoadError::DecodeFailed));
    if (!message.empty()) {
        text += ": ";
        text += message;
    }
    TONIC_LOG("%s", text.c_str());
    setError(text);
    return LoadError::DecodeFailed;
}

WaveformEnvelope AudioEngine::getWaveform() const {
    std::lock_guard<std::mutex> control(controlMutex_);
    return waveform_;
}

// =============================================================================
// Parameters
// =============================================================================

bool AudioEngine::updateSettings(const Settings& settings) {
    std::lock_guard<std::mutex> control(controlMutex_);
    if (const EngineError error = checkUsable(); error != EngineError::None) {
        setError(toString(error));
        return false;
    }

    settings_ = clampSettings(settings);
    graph_->update(settings_);
    return true;
}

Settings AudioEngine::getSettings() const {
    std::lock_guard<std::mutex> control(controlMutex_);
    return settings_;
}

StageParameters AudioEngine::getStageParameters() const {
    std::lock_guard<std::mutex> control(controlMutex_);
    if (!graph_) return StageParameters{};
    return graph_->stageParameters();
}

// =============================================================================
// Transport
// =============================================================================

bool AudioEngine::play() {
    std::lock_guard<std::mutex> control(controlMutex_);
    if (const EngineError error = checkUsable(); error != EngineError::None) {
        setError(toString(error));
        return false;
    }
    return transport_.play();
}

bool AudioEngine::pause() {
    std::lock_guard<std::mutex> control(controlMutex_);
    if (const EngineError error = checkUsable(); error != EngineError::None) {
        setError(toString(error));
        return false;
    }
    return transport_.pause();
}

bool AudioEngine::stop() {
    std::lock_guard<std::mutex> control(controlMutex_);
    if (const EngineError error = checkUsable(); error != EngineError::None) {
        setError(toString(error));
        return false;
    }
    transport_.stop();
    resetGraph();
    return true;
}

double AudioEngine::getCurrentTime() const {
    std::lock_guard<std::mutex> control(controlMutex_);
    return checkUsable() == EngineError::None ? transport_.getCurrentTime() : 0.0;
}

double AudioEngine::getDuration() const {
    std::lock_guard<std::mutex> control(controlMutex_);
    return checkUsable() == EngineError::None ? transport_.getDuration() : 0.0;
}

double AudioEngine::getProgress() const {
    std::lock_guard<std::mutex> control(controlMutex_);
    return checkUsable() == EngineError::None ? transport_.getProgress() : 0.0;
}

bool AudioEngine::shouldAutoStop() const {
    std::lock_guard<std::mutex> control(controlMutex_);
    return checkUsable() == EngineError::None && transport_.shouldAutoStop();
}

bool AudioEngine::isPlaying() const {
    std::lock_guard<std::mutex> control(controlMutex_);
    return checkUsable() == EngineError::None && transport_.isPlaying();
}

PlaybackState AudioEngine::getPlaybackState() const {
    std::lock_guard<std::mutex> control(controlMutex_);
    return checkUsable() == EngineError::None ? transport_.getPlaybackState()
                                              : PlaybackState::Stopped;
}

// =============================================================================
// Metering
// =============================================================================

float AudioEngine::getLevel() {
    std::lock_guard<std::mutex> lock(meteringMutex_);
    if (const EngineError error = checkUsable(); error != EngineError::None) {
        setError(toString(error));
        return 0.0f;
    }
    return metering_->getLevel();
}

SpectrumFrame AudioEngine::getSpectrumFrame() {
    std::lock_guard<std::mutex> lock(meteringMutex_);
    if (const EngineError error = checkUsable(); error != EngineError::None) {
        setError(toString(error));
        return SpectrumFrame{};
    }
    return metering_->getSpectrumFrame();
}

// =============================================================================
// Audio Device
// =============================================================================

void AudioEngine::process(float* const* outputs, size_t numChannels, size_t numFrames) noexcept {
    if (outputs == nullptr || numChannels == 0) return;

    std::unique_lock<std::mutex> lock(audioMutex_, std::try_to_lock);
    if (!lock.owns_lock() || !graph_) {
        for (size_t ch = 0; ch < numChannels; ++ch) {
            std::fill(outputs[ch], outputs[ch] + numFrames, 0.0f);
        }
        return;
    }

    const bool mono = numChannels == 1;
    const size_t maxChunk = monoScratch_.size();

    size_t offset = 0;
    while (offset < numFrames) {
        const size_t chunk = std::min(maxChunk, numFrames - offset);
        float* left = outputs[0] + offset;
        float* right = mono ? monoScratch_.data() : outputs[1] + offset;

        transport_.renderVoice(left, right, chunk);
        graph_->process(left, right, chunk);

        if (mono) {
            for (size_t i = 0; i < chunk; ++i) {
                left[i] = 0.5f * (left[i] + right[i]);
            }
        }
        offset += chunk;
    }

    for (size_t ch = 2; ch < numChannels; ++ch) {
        std::fill(outputs[ch], outputs[ch] + numFrames, 0.0f);
    }

    lock.unlock();
    transport_.dispatchEnded();
}

} // namespace Tonic::Enhancer
