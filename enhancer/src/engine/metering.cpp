// ==============================================================================
// Metering
// ==============================================================================

#include "engine/metering.h"

#include <algorithm>

namespace Tonic::Enhancer {

float Metering::getLevel() {
    const SpectrumFrame frame = getSpectrumFrame();
    return levelFromSpectrum(frame.data(), frame.size());
}

SpectrumFrame Metering::getSpectrumFrame() {
    SpectrumFrame frame{};
    graph_.readSpectrum(frame);
    return frame;
}

float Metering::levelFromSpectrum(const uint8_t* bins, size_t count) noexcept {
    if (bins == nullptr || count == 0) return 0.0f;

    uint64_t sum = 0;
    for (size_t i = 0; i < count; ++i) {
        sum += bins[i];
    }
    const double mean = static_cast<double>(sum) / static_cast<double>(count);
    return std::clamp(static_cast<float>(mean / 255.0 * 100.0), 0.0f, 100.0f);
}

} // namespace Tonic::Enhancer
