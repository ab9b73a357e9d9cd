#pragma once

// ==============================================================================
// Audio Engine
// ==============================================================================
// Facade owning one of each engine component with an explicit lifecycle:
//
//   AudioEngine engine;
//   engine.initialize();              // builds the processing graph
//   engine.loadBuffer(decoded);       // playback source + waveform envelope
//   engine.updateSettings(settings);  // live reparameterization
//   engine.play();                    // transport
//   ...
//   engine.process(outputs, 2, n);    // from the audio device callback
//   ...
//   engine.destroy();                 // every later call fails cleanly
//
// Threading:
// - Control methods may be called from any thread; they are serialized.
// - getLevel()/getSpectrumFrame() run on their own lock so a metering poller
//   never stalls the control thread or the audio thread.
// - process() never blocks: if the control side holds the graph or voice
//   slot, the block is rendered as silence.
// ==============================================================================

#include "engine/clock.h"
#include "engine/decoded_buffer.h"
#include "engine/engine_config.h"
#include "engine/engine_errors.h"
#include "engine/metering.h"
#include "engine/playback_voice.h"
#include "engine/processing_graph.h"
#include "engine/transport_controller.h"
#include "parameters/enhancer_params.h"

#include <tonic/dsp/processors/waveform_extractor.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace Tonic::Enhancer {

using DSP::WaveformEnvelope;

class AudioEngine {
public:
    /// Engine timed by the monotonic system clock
    AudioEngine() noexcept;

    /// Engine timed by an external clock (must outlive the engine)
    explicit AudioEngine(const Clock& clock) noexcept;

    ~AudioEngine();

    AudioEngine(const AudioEngine&) = delete;
    AudioEngine& operator=(const AudioEngine&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Build the processing graph. Idempotent once it has succeeded; after a
    /// failure the engine stays not-ready and may be initialized again.
    InitError initialize(const EngineConfig& config = {});

    /// Stop playback and release the graph. Every later call reports
    /// Destroyed.
    void destroy();

    [[nodiscard]] bool isReady() const noexcept;
    [[nodiscard]] bool isDestroyed() const noexcept;

    /// Readable description of the most recent failure, empty if none
    [[nodiscard]] std::string lastError() const;

    // =========================================================================
    // Buffer
    // =========================================================================

    /// Replace the loaded buffer and recompute the waveform envelope.
    /// On failure the previous buffer, envelope and transport are unchanged.
    /// Processing history of the graph is cleared along with the transport.
    /// @param onEnded Fired once, from the audio thread, each time a
    ///        playback runs to the end of this buffer. It runs after
    ///        process() has released its locks and may call stop() or play().
    LoadError loadBuffer(DecodedBufferPtr buffer, EndedCallback onEnded = {});
    LoadError loadBuffer(DecodedBuffer buffer, EndedCallback onEnded = {});

    /// Record a decoder failure; the loaded buffer is kept
    LoadError reportDecodeFailure(std::string_view message);

    [[nodiscard]] WaveformEnvelope getWaveform() const;

    // =========================================================================
    // Parameters
    // =========================================================================

    /// Clamp and apply settings; effective from the next processing block
    /// @return false if the engine is not ready
    bool updateSettings(const Settings& settings);

    /// Last applied settings, clamped
    [[nodiscard]] Settings getSettings() const;

    /// Parameters currently requested of the processing stages
    [[nodiscard]] StageParameters getStageParameters() const;

    // =========================================================================
    // Transport
    // =========================================================================

    /// @return true if playback started; false with no buffer or not ready
    bool play();

    /// @return true if playback was paused
    bool pause();

    /// Return to Stopped and clear the processing history of the graph
    /// @return false only if the engine is not ready
    bool stop();

    [[nodiscard]] double getCurrentTime() const;
    [[nodiscard]] double getDuration() const;
    [[nodiscard]] double getProgress() const;
    [[nodiscard]] bool shouldAutoStop() const;
    [[nodiscard]] bool isPlaying() const;
    [[nodiscard]] PlaybackState getPlaybackState() const;

    // =========================================================================
    // Metering
    // =========================================================================

    /// Mean spectrum level 0-100; 0 when not ready
    [[nodiscard]] float getLevel();

    /// Fresh spectrum frame; all zeros when not ready
    [[nodiscard]] SpectrumFrame getSpectrumFrame();

    // =========================================================================
    // Audio Device
    // =========================================================================

    /// Render numFrames into each of numChannels output buffers.
    /// Mono devices receive the average of both channels; channels beyond
    /// the second are silent.
    void process(float* const* outputs, size_t numChannels, size_t numFrames) noexcept;

private:
    enum class Lifecycle : uint8_t {
        Uninitialized,
        Ready,
        Destroyed
    };

    [[nodiscard]] EngineError checkUsable() const noexcept;

    /// Clear graph filter, compressor and analyser state. Caller holds
    /// controlMutex_.
    void resetGraph();
    void setError(std::string_view message);
    void clearError();

    SteadyClock steadyClock_;
    const Clock* clock_;

    std::atomic<Lifecycle> lifecycle_{Lifecycle::Uninitialized};

    mutable std::mutex controlMutex_;
    std::mutex meteringMutex_;
    std::mutex audioMutex_;

    std::unique_ptr<ProcessingGraph> graph_;
    std::unique_ptr<Metering> metering_;
    TransportController transport_;

    Settings settings_;
    WaveformEnvelope waveform_{};
    std::vector<float> monoScratch_;

    mutable std::mutex errorMutex_;
    std::string lastError_;
};

} // namespace Tonic::Enhancer
