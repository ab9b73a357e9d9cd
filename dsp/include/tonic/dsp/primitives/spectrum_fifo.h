// ==============================================================================
// Layer 1: DSP Primitive - Spectrum FIFO
// ==============================================================================
// Lock-free single-producer/single-consumer ring buffer that streams audio
// samples from the audio thread to an analysis consumer.
//
// The producer (audio thread) pushes blocks; the consumer reads the most
// recent N samples whenever it polls. Old samples are overwritten: this is a
// "latest window" buffer, not a queue. A read that races a push may see a
// partially updated window, which is acceptable for visualization.
// ==============================================================================

#pragma once

#include <algorithm>
#include <array>
#include <atomic>
#include <bit>
#include <cstddef>

namespace Tonic {
namespace DSP {

/// @brief SPSC ring buffer for audio -> analysis sample transfer
/// @tparam Capacity Ring size in samples (power of two)
template <size_t Capacity>
class SpectrumFIFO {
public:
    static_assert(std::has_single_bit(Capacity), "SpectrumFIFO capacity must be a power of two");

    SpectrumFIFO() noexcept { buffer_.fill(0.0f); }

    // Shared between threads by address; never copied or moved
    SpectrumFIFO(const SpectrumFIFO&) = delete;
    SpectrumFIFO& operator=(const SpectrumFIFO&) = delete;

    /// @brief Push samples (producer side, real-time safe)
    void push(const float* samples, size_t count) noexcept {
        if (samples == nullptr || count == 0) return;

        const size_t written = totalWritten_.load(std::memory_order_relaxed);
        for (size_t i = 0; i < count; ++i) {
            buffer_[(written + i) & kMask] = samples[i];
        }
        totalWritten_.store(written + count, std::memory_order_release);
    }

    /// @brief Copy the most recent @p count samples, oldest first
    /// @return count on success, 0 if fewer samples are available or
    ///         count exceeds the capacity
    size_t readLatest(float* dest, size_t count) const noexcept {
        if (dest == nullptr || count == 0 || count > Capacity) return 0;

        const size_t written = totalWritten_.load(std::memory_order_acquire);
        if (written < count) return 0;

        const size_t start = written - count;
        for (size_t i = 0; i < count; ++i) {
            dest[i] = buffer_[(start + i) & kMask];
        }
        return count;
    }

    /// @brief Total samples pushed since construction or clear()
    [[nodiscard]] size_t totalWritten() const noexcept {
        return totalWritten_.load(std::memory_order_acquire);
    }

    /// @brief Forget all samples
    /// @note Call only while the producer is not pushing
    void clear() noexcept {
        buffer_.fill(0.0f);
        totalWritten_.store(0, std::memory_order_release);
    }

    [[nodiscard]] static constexpr size_t capacity() noexcept { return Capacity; }

private:
    static constexpr size_t kMask = Capacity - 1;

    std::array<float, Capacity> buffer_;
    std::atomic<size_t> totalWritten_{0};
};

} // namespace DSP
} // namespace Tonic
