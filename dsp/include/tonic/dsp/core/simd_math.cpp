// ==============================================================================
// Layer 0: Core Utility - SIMD-Accelerated Bulk Math
// ==============================================================================
// This file uses Highway's self-inclusion pattern: foreach_target.h re-includes
// this file once per ISA target. The SIMD kernels compile for each target;
// HWY_EXPORT/HWY_DYNAMIC_DISPATCH (inside #if HWY_ONCE) select the best at
// runtime.
// ==============================================================================

#undef HWY_TARGET_INCLUDE
#define HWY_TARGET_INCLUDE "tonic/dsp/core/simd_math.cpp"
#include "hwy/foreach_target.h"  // NOLINT(misc-header-include-cycle) Highway self-inclusion
#include "hwy/highway.h"

#include <cmath>
#include <cstddef>

// =============================================================================
// Per-Target SIMD Kernels (compiled once per ISA target)
// =============================================================================

HWY_BEFORE_NAMESPACE();

// NOLINTNEXTLINE(modernize-concat-nested-namespaces) HWY_NAMESPACE is a macro
namespace Tonic {
namespace DSP {
namespace HWY_NAMESPACE {

namespace hn = hwy::HWY_NAMESPACE;

// -----------------------------------------------------------------------------
// ComputeMagnitudeImpl: Complex[] -> mags[]
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void ComputeMagnitudeImpl(const float* HWY_RESTRICT complexData, size_t numBins,
                          float* HWY_RESTRICT mags) {
    const hn::ScalableTag<float> d;
    const size_t N = hn::Lanes(d);

    size_t k = 0;
    for (; k + N <= numBins; k += N) {
        hn::Vec<decltype(d)> re;
        hn::Vec<decltype(d)> im;
        hn::LoadInterleaved2(d, complexData + k * 2, re, im);

        const auto reSq = hn::Mul(re, re);
        hn::StoreU(hn::Sqrt(hn::MulAdd(im, im, reSq)), d, mags + k);
    }

    for (; k < numBins; ++k) {
        const float re = complexData[k * 2];
        const float im = complexData[k * 2 + 1];
        mags[k] = std::sqrt(re * re + im * im);
    }
}

// -----------------------------------------------------------------------------
// SumAbsoluteImpl: sum(|x|) over finite samples
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
double SumAbsoluteImpl(const float* HWY_RESTRICT data, size_t count) {
    const hn::ScalableTag<float> d;
    const size_t N = hn::Lanes(d);

    // Partial sums are flushed to double every block so long buffers keep
    // their precision
    constexpr size_t kFlushInterval = 4096;

    double total = 0.0;
    size_t k = 0;
    while (k + N <= count) {
        auto acc = hn::Zero(d);
        const size_t blockEnd = k + kFlushInterval;
        for (; k + N <= count && k < blockEnd; k += N) {
            const auto v = hn::LoadU(d, data + k);
            acc = hn::Add(acc, hn::IfThenElseZero(hn::IsFinite(v), hn::Abs(v)));
        }
        total += static_cast<double>(hn::ReduceSum(d, acc));
    }

    for (; k < count; ++k) {
        const float x = data[k];
        if (std::isfinite(x)) {
            total += static_cast<double>(std::abs(x));
        }
    }
    return total;
}

}  // namespace HWY_NAMESPACE
}  // namespace DSP
}  // namespace Tonic

HWY_AFTER_NAMESPACE();

// =============================================================================
// Dispatch Table + Wrapper Functions (compiled once)
// =============================================================================

#if HWY_ONCE

#include "tonic/dsp/core/simd_math.h"

// NOLINTNEXTLINE(modernize-concat-nested-namespaces) HWY_NAMESPACE dispatch section
namespace Tonic {
namespace DSP {

HWY_EXPORT(ComputeMagnitudeImpl);
HWY_EXPORT(SumAbsoluteImpl);

void computeMagnitudeBulk(const float* complexData, size_t numBins,
                          float* mags) noexcept {
    if (complexData == nullptr || mags == nullptr || numBins == 0) return;
    HWY_DYNAMIC_DISPATCH(ComputeMagnitudeImpl)(complexData, numBins, mags);
}

double sumAbsolute(const float* data, size_t count) noexcept {
    if (data == nullptr || count == 0) return 0.0;
    return HWY_DYNAMIC_DISPATCH(SumAbsoluteImpl)(data, count);
}

}  // namespace DSP
}  // namespace Tonic

#endif  // HWY_ONCE
