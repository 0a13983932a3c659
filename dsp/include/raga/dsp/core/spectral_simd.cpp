// ==============================================================================
// Layer 0: Core Utility - SIMD-Accelerated Spectral Math
// ==============================================================================
// Highway's self-inclusion pattern: foreach_target.h re-includes this file
// once per ISA target. The SIMD kernels compile for each target;
// HWY_EXPORT/HWY_DYNAMIC_DISPATCH (inside #if HWY_ONCE) select the best at
// runtime.
// ==============================================================================

#undef HWY_TARGET_INCLUDE
#define HWY_TARGET_INCLUDE "raga/dsp/core/spectral_simd.cpp"
#include "hwy/foreach_target.h"  // NOLINT(misc-header-include-cycle) Highway self-inclusion
#include "hwy/highway.h"

#include <algorithm>
#include <cmath>
#include <cstddef>

// =============================================================================
// Per-Target SIMD Kernels (compiled once per ISA target)
// =============================================================================

HWY_BEFORE_NAMESPACE();

// NOLINTNEXTLINE(modernize-concat-nested-namespaces) HWY_NAMESPACE is a macro
namespace Raga {
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

        // sqrt(re^2 + im^2)
        const auto mag = hn::Sqrt(hn::MulAdd(im, im, hn::Mul(re, re)));
        hn::StoreU(mag, d, mags + k);
    }

    for (; k < numBins; ++k) {
        const float re = complexData[k * 2];
        const float im = complexData[k * 2 + 1];
        mags[k] = std::sqrt(re * re + im * im);
    }
}

// -----------------------------------------------------------------------------
// ScaleComplexImpl: Complex[] * gains[] -> Complex[]
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void ScaleComplexImpl(const float* complexData, const float* HWY_RESTRICT gains,
                      size_t numBins, float* output) {
    const hn::ScalableTag<float> d;
    const size_t N = hn::Lanes(d);

    size_t k = 0;
    for (; k + N <= numBins; k += N) {
        hn::Vec<decltype(d)> re;
        hn::Vec<decltype(d)> im;
        hn::LoadInterleaved2(d, complexData + k * 2, re, im);
        const auto g = hn::LoadU(d, gains + k);
        hn::StoreInterleaved2(hn::Mul(re, g), hn::Mul(im, g), d, output + k * 2);
    }

    for (; k < numBins; ++k) {
        output[k * 2] = complexData[k * 2] * gains[k];
        output[k * 2 + 1] = complexData[k * 2 + 1] * gains[k];
    }
}

// -----------------------------------------------------------------------------
// PeakAbsImpl: max(|x|)
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
float PeakAbsImpl(const float* HWY_RESTRICT data, size_t count) {
    const hn::ScalableTag<float> d;
    const size_t N = hn::Lanes(d);

    auto peak = hn::Zero(d);
    size_t k = 0;
    for (; k + N <= count; k += N) {
        peak = hn::Max(peak, hn::Abs(hn::LoadU(d, data + k)));
    }

    float result = hn::ReduceMax(d, peak);
    for (; k < count; ++k) {
        result = std::max(result, std::abs(data[k]));
    }
    return result;
}

// -----------------------------------------------------------------------------
// DivideImpl: x[i] /= divisor
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void DivideImpl(float* HWY_RESTRICT data, size_t count, float divisor) {
    const hn::ScalableTag<float> d;
    const size_t N = hn::Lanes(d);
    const auto div = hn::Set(d, divisor);

    size_t k = 0;
    for (; k + N <= count; k += N) {
        hn::StoreU(hn::Div(hn::LoadU(d, data + k), div), d, data + k);
    }
    for (; k < count; ++k) {
        data[k] = data[k] / divisor;
    }
}

// -----------------------------------------------------------------------------
// ReplaceNonFiniteImpl: NaN/Inf -> 0
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
size_t ReplaceNonFiniteImpl(float* HWY_RESTRICT data, size_t count) {
    const hn::ScalableTag<float> d;
    const size_t N = hn::Lanes(d);

    size_t replaced = 0;
    size_t k = 0;
    for (; k + N <= count; k += N) {
        const auto v = hn::LoadU(d, data + k);
        const auto finite = hn::IsFinite(v);
        replaced += N - hn::CountTrue(d, finite);
        hn::StoreU(hn::IfThenElseZero(finite, v), d, data + k);
    }
    for (; k < count; ++k) {
        if (!std::isfinite(data[k])) {
            data[k] = 0.0f;
            ++replaced;
        }
    }
    return replaced;
}

}  // namespace HWY_NAMESPACE
}  // namespace DSP
}  // namespace Raga

HWY_AFTER_NAMESPACE();

// =============================================================================
// Dispatch Table + Wrapper Functions (compiled once)
// =============================================================================

#if HWY_ONCE

#include "raga/dsp/core/spectral_simd.h"

// NOLINTNEXTLINE(modernize-concat-nested-namespaces) HWY_NAMESPACE dispatch section
namespace Raga {
namespace DSP {

HWY_EXPORT(ComputeMagnitudeImpl);
HWY_EXPORT(ScaleComplexImpl);
HWY_EXPORT(PeakAbsImpl);
HWY_EXPORT(DivideImpl);
HWY_EXPORT(ReplaceNonFiniteImpl);

void computeMagnitudeBulk(const float* complexData, size_t numBins,
                          float* mags) noexcept {
    HWY_DYNAMIC_DISPATCH(ComputeMagnitudeImpl)(complexData, numBins, mags);
}

void scaleComplexBulk(const float* complexData, const float* gains,
                      size_t numBins, float* output) noexcept {
    HWY_DYNAMIC_DISPATCH(ScaleComplexImpl)(complexData, gains, numBins, output);
}

float peakAbsBulk(const float* data, size_t count) noexcept {
    if (data == nullptr || count == 0) return 0.0f;
    return HWY_DYNAMIC_DISPATCH(PeakAbsImpl)(data, count);
}

void divideBulk(float* data, size_t count, float divisor) noexcept {
    if (data == nullptr || count == 0) return;
    HWY_DYNAMIC_DISPATCH(DivideImpl)(data, count, divisor);
}

size_t replaceNonFiniteBulk(float* data, size_t count) noexcept {
    if (data == nullptr || count == 0) return 0;
    return HWY_DYNAMIC_DISPATCH(ReplaceNonFiniteImpl)(data, count);
}

}  // namespace DSP
}  // namespace Raga

#endif  // HWY_ONCE
