// ==============================================================================
// Layer 1: DSP Primitive - One-Pole Smoother
// ==============================================================================
// Exponential approach to a target value, one step per sample. The output
// gain stage uses it so volume changes ramp instead of clicking.
// ==============================================================================

#pragma once

#include <tonic/dsp/core/db_utils.h>

#include <algorithm>
#include <cmath>

namespace Tonic {
namespace DSP {

inline constexpr float kDefaultSmoothingTimeMs = 5.0f;
inline constexpr float kMinSmoothingTimeMs = 0.1f;
inline constexpr float kMaxSmoothingTimeMs = 1000.0f;

/// Distance to the target below which the smoother snaps onto it
inline constexpr float kSmootherSnapDistance = 1e-4f;

/// @brief Pole for a one-pole lowpass that covers 99% of a step in
///        smoothTimeMs (five time constants). 0 disables smoothing.
[[nodiscard]] constexpr float calculateOnePoleCoefficient(float smoothTimeMs,
                                                          float sampleRate) noexcept {
    if (!(sampleRate > 0.0f)) return 0.0f;
    const float timeMs = std::clamp(smoothTimeMs, kMinSmoothingTimeMs, kMaxSmoothingTimeMs);
    const float samplesPerTimeConstant = timeMs * 0.001f * sampleRate / 5.0f;
    return detail::constexprExp(-1.0f / samplesPerTimeConstant);
}

/// @brief y[n] = target + pole * (y[n-1] - target)
///
/// Non-finite values passed to setTarget() or snapTo() are read as 0.
class OnePoleSmoother {
public:
    OnePoleSmoother() noexcept = default;

    explicit OnePoleSmoother(float initialValue) noexcept { snapTo(initialValue); }

    void configure(float smoothTimeMs, float sampleRate) noexcept {
        pole_ = calculateOnePoleCoefficient(smoothTimeMs, sampleRate);
    }

    void setTarget(float target) noexcept {
        if (!detail::isFinite(target)) {
            snapTo(0.0f);
            return;
        }
        target_ = target;
    }

    [[nodiscard]] float getTarget() const noexcept { return target_; }
    [[nodiscard]] float getCurrentValue() const noexcept { return value_; }

    [[nodiscard]] float process() noexcept {
        if (isComplete()) {
            value_ = target_;
        } else {
            value_ = detail::flushDenormal(target_ + pole_ * (value_ - target_));
        }
        return value_;
    }

    [[nodiscard]] bool isComplete() const noexcept {
        return std::abs(value_ - target_) < kSmootherSnapDistance;
    }

    void snapTo(float value) noexcept {
        value_ = detail::isFinite(value) ? value : 0.0f;
        target_ = value_;
    }

    void snapToTarget() noexcept { value_ = target_; }

private:
    float pole_ = calculateOnePoleCoefficient(kDefaultSmoothingTimeMs, 44100.0f);
    float value_ = 0.0f;
    float target_ = 0.0f;
};

} // namespace DSP
} // namespace Tonic
