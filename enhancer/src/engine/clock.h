#pragma once

// ==============================================================================
// Clock
// ==============================================================================
// Time source for the transport's playback anchor. Production code uses the
// monotonic SteadyClock; tests substitute a manually advanced clock.
// ==============================================================================

#include <chrono>

namespace Tonic::Enhancer {

class Clock {
public:
    virtual ~Clock() = default;

    /// Current time in seconds from an arbitrary, fixed origin
    [[nodiscard]] virtual double now() const noexcept = 0;
};

class SteadyClock final : public Clock {
public:
    [[nodiscard]] double now() const noexcept override {
        using Seconds = std::chrono::duration<double>;
        return std::chrono::duration_cast<Seconds>(
            std::chrono::steady_clock::now().time_since_epoch()).count();
    }
};

} // namespace Tonic::Enhancer
