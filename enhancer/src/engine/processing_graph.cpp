// ==============================================================================
// Processing Graph
// ==============================================================================

#include "engine/processing_graph.h"

#include <algorithm>

namespace Tonic::Enhancer {

ProcessingGraph::ProcessingGraph() noexcept {
    storeParameters(initialStageParameters());
}

InitError ProcessingGraph::initialize(const EngineConfig& config) {
    if (initialized_) {
        return InitError::None;
    }

    if (const InitError error = validateConfig(config); error != InitError::None) {
        return error;
    }

    DSP::SpectrumAnalyserConfig analyserConfig;
    analyserConfig.fftSize = kAnalyserFftSize;
    analyserConfig.smoothing = config.analyserSmoothing;
    analyserConfig.minDb = config.analyserMinDb;
    analyserConfig.maxDb = config.analyserMaxDb;
    if (!analyser_.prepare(analyserConfig)) {
        return InitError::FftUnavailable;
    }

    config_ = config;
    monoScratch_.assign(config.maxBlockSize, 0.0f);

    compressor_.prepare(config.sampleRate, config.maxBlockSize);
    compressor_.setThreshold(kCompressorThresholdDb);
    compressor_.setKneeWidth(kCompressorKneeDb);
    compressor_.setAttackTime(kCompressorAttackMs);
    compressor_.setReleaseTime(kCompressorReleaseMs);

    gainSmoother_.configure(config.gainSmoothingMs, static_cast<float>(config.sampleRate));

    // Apply the current parameters now so the first block starts settled
    const StageParameters params = stageParameters();
    applyParameters(params);
    gainSmoother_.snapTo(params.outputGain);
    appliedVersion_ = live_.version.load(std::memory_order_acquire);

    analysisFifo_.clear();
    initialized_ = true;
    return InitError::None;
}

void ProcessingGraph::update(const Settings& settings) noexcept {
    storeParameters(mapSettings(settings));
}

StageParameters ProcessingGraph::stageParameters() const noexcept {
    StageParameters p;
    p.bassShelfGainDb = live_.bassShelfGainDb.load(std::memory_order_relaxed);
    p.lowPeakGainDb = live_.lowPeakGainDb.load(std::memory_order_relaxed);
    p.midPeakGainDb = live_.midPeakGainDb.load(std::memory_order_relaxed);
    p.highPeakGainDb = live_.highPeakGainDb.load(std::memory_order_relaxed);
    p.compressorRatio = live_.compressorRatio.load(std::memory_order_relaxed);
    p.outputGain = live_.outputGain.load(std::memory_order_relaxed);
    p.bypass = live_.bypass.load(std::memory_order_relaxed);
    return p;
}

void ProcessingGraph::storeParameters(const StageParameters& params) noexcept {
    live_.bassShelfGainDb.store(params.bassShelfGainDb, std::memory_order_relaxed);
    live_.lowPeakGainDb.store(params.lowPeakGainDb, std::memory_order_relaxed);
    live_.midPeakGainDb.store(params.midPeakGainDb, std::memory_order_relaxed);
    live_.highPeakGainDb.store(params.highPeakGainDb, std::memory_order_relaxed);
    live_.compressorRatio.store(params.compressorRatio, std::memory_order_relaxed);
    live_.outputGain.store(params.outputGain, std::memory_order_relaxed);
    live_.bypass.store(params.bypass, std::memory_order_relaxed);
    live_.version.fetch_add(1, std::memory_order_release);
}

void ProcessingGraph::applyParameters(const StageParameters& params) noexcept {
    const auto sampleRate = static_cast<float>(config_.sampleRate);

    const auto shelf = DSP::BiquadCoefficients::calculate(
        DSP::FilterType::LowShelf, kBassShelfFrequency, kShelfQ,
        params.bassShelfGainDb, sampleRate);
    const auto low = DSP::BiquadCoefficients::calculate(
        DSP::FilterType::Peak, kLowPeakFrequency, kPeakQ,
        params.lowPeakGainDb, sampleRate);
    const auto mid = DSP::BiquadCoefficients::calculate(
        DSP::FilterType::Peak, kMidPeakFrequency, kPeakQ,
        params.midPeakGainDb, sampleRate);
    const auto high = DSP::BiquadCoefficients::calculate(
        DSP::FilterType::Peak, kHighPeakFrequency, kPeakQ,
        params.highPeakGainDb, sampleRate);

    for (size_t ch = 0; ch < 2; ++ch) {
        bassShelf_[ch].setCoefficients(shelf);
        lowPeak_[ch].setCoefficients(low);
        midPeak_[ch].setCoefficients(mid);
        highPeak_[ch].setCoefficients(high);
    }

    compressor_.setRatio(params.compressorRatio);
    gainSmoother_.setTarget(params.outputGain);
    bypass_ = params.bypass;
}

void ProcessingGraph::process(float* left, float* right, size_t numFrames) noexcept {
    if (!initialized_ || left == nullptr || right == nullptr) return;

    // Parameter changes land at block granularity
    const uint32_t version = live_.version.load(std::memory_order_acquire);
    if (version != appliedVersion_) {
        applyParameters(stageParameters());
        appliedVersion_ = version;
    }

    const size_t maxChunk = monoScratch_.size();
    size_t offset = 0;
    while (offset < numFrames) {
        const size_t chunk = std::min(maxChunk, numFrames - offset);
        processChunk(left + offset, right + offset, chunk);
        offset += chunk;
    }
}

void ProcessingGraph::processChunk(float* left, float* right, size_t numFrames) noexcept {
    if (!bypass_) {
        for (size_t i = 0; i < numFrames; ++i) {
            float l = left[i];
            float r = right[i];

            l = bassShelf_[0].process(l);
            r = bassShelf_[1].process(r);
            l = lowPeak_[0].process(l);
            r = lowPeak_[1].process(r);
            l = midPeak_[0].process(l);
            r = midPeak_[1].process(r);
            l = highPeak_[0].process(l);
            r = highPeak_[1].process(r);

            compressor_.processStereo(l, r);

            const float gain = gainSmoother_.process();
            left[i] = l * gain;
            right[i] = r * gain;
        }
    }

    // Analyser tap: mono mixdown of the output
    for (size_t i = 0; i < numFrames; ++i) {
        monoScratch_[i] = 0.5f * (left[i] + right[i]);
    }
    analysisFifo_.push(monoScratch_.data(), numFrames);
}

void ProcessingGraph::reset() noexcept {
    for (size_t ch = 0; ch < 2; ++ch) {
        bassShelf_[ch].reset();
        lowPeak_[ch].reset();
        midPeak_[ch].reset();
        highPeak_[ch].reset();
    }
    compressor_.reset();
    gainSmoother_.snapToTarget();

    std::lock_guard<std::mutex> lock(analyserMutex_);
    analysisFifo_.clear();
    analyser_.reset();
}

void ProcessingGraph::readSpectrum(SpectrumFrame& frame) {
    frame.fill(0);
    if (!initialized_) return;

    std::lock_guard<std::mutex> lock(analyserMutex_);
    analyser_.analyse(analysisFifo_, frame.data(), frame.size());
}

} // namespace Tonic::Enhancer
