#pragma once

// ==============================================================================
// Metering
// ==============================================================================
// Pull-based level and spectrum snapshots from the graph's analyser stage.
// Every call analyses the latest output afresh; nothing is cached here, so
// the only smoothing is the analyser's own per-bin time constant.
// ==============================================================================

#include "engine/processing_graph.h"

#include <cstddef>
#include <cstdint>

namespace Tonic::Enhancer {

class Metering {
public:
    explicit Metering(ProcessingGraph& graph) noexcept
        : graph_(graph) {}

    /// Mean spectrum magnitude on a 0-100 scale
    [[nodiscard]] float getLevel();

    /// Fresh spectrum snapshot, one byte (0-255) per bin
    [[nodiscard]] SpectrumFrame getSpectrumFrame();

    /// mean(bins) / 255 * 100, 0 for an empty frame
    [[nodiscard]] static float levelFromSpectrum(const uint8_t* bins, size_t count) noexcept;

private:
    ProcessingGraph& graph_;
};

} // namespace Tonic::Enhancer
