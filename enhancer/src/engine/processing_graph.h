#pragma once

// ==============================================================================
// Processing Graph
// ==============================================================================
// Fixed-order stereo chain built once by initialize():
//   Bass Shelf -> Low Peak -> Mid Peak -> High Peak -> Compressor
//   -> Output Gain -> Spectrum Analyser (tap) -> Output
//
// update() is the only writer of stage parameters. It maps Settings, stores
// the result in atomics and bumps a version counter; the audio thread
// recomputes coefficients at the start of the next process() block.
//
// The analyser tap pushes a mono mixdown into a lock-free FIFO; readSpectrum()
// runs the FFT on the consumer side.
//
// With bypass set (Settings::enabled == false) the EQ, compressor and gain
// stages are skipped; the analyser still sees the signal.
// ==============================================================================

#include "engine/engine_config.h"
#include "engine/engine_errors.h"
#include "parameters/enhancer_params.h"

#include <tonic/dsp/primitives/biquad.h>
#include <tonic/dsp/primitives/smoother.h>
#include <tonic/dsp/primitives/spectrum_fifo.h>
#include <tonic/dsp/processors/dynamics_compressor.h>
#include <tonic/dsp/processors/spectrum_analyser.h>

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace Tonic::Enhancer {

inline constexpr size_t kAnalyserFftSize = 2048;
inline constexpr size_t kSpectrumBins = kAnalyserFftSize / 2;
inline constexpr size_t kAnalysisFifoSize = 8192;

using SpectrumFrame = std::array<uint8_t, kSpectrumBins>;

class ProcessingGraph {
public:
    ProcessingGraph() noexcept;

    ProcessingGraph(const ProcessingGraph&) = delete;
    ProcessingGraph& operator=(const ProcessingGraph&) = delete;

    /// Build the chain for a configuration. A second call is a no-op.
    /// @note NOT real-time safe (allocates)
    InitError initialize(const EngineConfig& config);

    [[nodiscard]] bool isInitialized() const noexcept { return initialized_; }

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

    /// Recompute every stage parameter from (clamped) settings
    void update(const Settings& settings) noexcept;

    /// Parameters most recently requested through update()
    [[nodiscard]] StageParameters stageParameters() const noexcept;

    /// Process a stereo block in place (audio thread)
    void process(float* left, float* right, size_t numFrames) noexcept;

    /// Clear filter, compressor and analysis history. The engine calls this
    /// on stop and on buffer replacement.
    /// @note Call only while process() is not running
    void reset() noexcept;

    /// Analyse the most recent output into a spectrum frame (consumer side)
    void readSpectrum(SpectrumFrame& frame);

private:
    struct LiveParameters {
        std::atomic<float> bassShelfGainDb{0.0f};
        std::atomic<float> lowPeakGainDb{0.0f};
        std::atomic<float> midPeakGainDb{0.0f};
        std::atomic<float> highPeakGainDb{0.0f};
        std::atomic<float> compressorRatio{kInitialCompressorRatio};
        std::atomic<float> outputGain{1.0f};
        std::atomic<bool> bypass{false};
        std::atomic<uint32_t> version{0};
    };

    void storeParameters(const StageParameters& params) noexcept;
    void applyParameters(const StageParameters& params) noexcept;
    void processChunk(float* left, float* right, size_t numFrames) noexcept;

    EngineConfig config_;
    bool initialized_ = false;

    LiveParameters live_;
    uint32_t appliedVersion_ = 0;
    bool bypass_ = false;

    // Per-stage, per-channel filters: [0] = left, [1] = right
    std::array<DSP::Biquad, 2> bassShelf_;
    std::array<DSP::Biquad, 2> lowPeak_;
    std::array<DSP::Biquad, 2> midPeak_;
    std::array<DSP::Biquad, 2> highPeak_;

    DSP::DynamicsCompressor compressor_;
    DSP::OnePoleSmoother gainSmoother_;

    DSP::SpectrumFIFO<kAnalysisFifoSize> analysisFifo_;
    std::vector<float> monoScratch_;

    std::mutex analyserMutex_;
    DSP::SpectrumAnalyser analyser_;
};

} // namespace Tonic::Enhancer
