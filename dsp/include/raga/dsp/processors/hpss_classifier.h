// ==============================================================================
// Layer 2: DSP Processor - Median-Filter HPSS Classifier
// ==============================================================================
// Harmonic/percussive classification of a magnitude spectrogram.
//
// Harmonic content is continuous in time, so a median along the time axis of
// each bin keeps it and rejects transients. Percussive content is continuous
// in frequency, so a median along the bin axis of each frame keeps it and
// rejects narrow-band peaks. The two enhanced views are compared bin by bin to
// build complementary masks.
//
// Reference: D. FitzGerald, "Harmonic/Percussive Separation using Median
// Filtering", DAFx 2010.
// ==============================================================================

#pragma once

#include <raga/dsp/core/separation_error.h>
#include <raga/dsp/primitives/median_filter.h>
#include <raga/dsp/primitives/spectral_matrix.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace Raga {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

/// Stabilizer in the soft-mask denominator
inline constexpr double kMaskEpsilon = 1e-12;

/// Default median length along time (harmonic) and frequency (percussive)
inline constexpr int kDefaultKernelSize = 31;

/// Default soft-mask exponent
inline constexpr float kDefaultMaskPower = 2.0f;

// =============================================================================
// Mask Mode
// =============================================================================

/// @brief How enhancements are turned into masks
enum class MaskMode : uint8_t {
    Soft,    ///< Wiener-like weights in [0, 1], masks sum to one
    Binary   ///< Each bin assigned wholly to the larger enhancement
};

[[nodiscard]] constexpr std::string_view maskModeName(MaskMode mode) noexcept {
    switch (mode) {
        case MaskMode::Soft:   return "soft";
        case MaskMode::Binary: return "binary";
    }
    return "unknown";
}

/// @brief Complementary harmonic and percussive masks of equal shape
struct MaskPair {
    MaskMatrix harmonic;
    MaskMatrix percussive;
};

// =============================================================================
// Classifier Functions
// =============================================================================

namespace Classifier {

/// @brief Validate a median kernel length
/// @return InvalidParameter unless length is positive and odd
[[nodiscard]] inline ValidationResult validateKernel(int length, std::string_view name) {
    if (length <= 0 || length % 2 == 0) {
        return ValidationResult::fail(SeparationError::InvalidParameter,
            std::string(name) + " must be a positive odd length (got "
            + std::to_string(length) + ")");
    }
    return ValidationResult::ok();
}

/// @brief Validate a mask exponent
[[nodiscard]] inline ValidationResult validatePower(float power) {
    if (!std::isfinite(power) || power <= 0.0f) {
        return ValidationResult::fail(SeparationError::InvalidParameter,
            "power must be a positive finite number (got " + std::to_string(power) + ")");
    }
    return ValidationResult::ok();
}

/// @brief Median along the time axis of every bin
/// @param magnitudes Input matrix (not modified)
/// @param length Odd kernel length in frames
/// @param boundary Edge extension along time
/// @return Fresh matrix of the same shape
[[nodiscard]] inline MagnitudeMatrix harmonicEnhancement(
    const MagnitudeMatrix& magnitudes,
    size_t length,
    BoundaryMode boundary = BoundaryMode::Reflect
) {
    MagnitudeMatrix out(magnitudes.numFrames(), magnitudes.numBins());
    if (magnitudes.empty()) return out;

    SlidingMedian median;
    median.prepare(length);
    const size_t stride = magnitudes.numBins();
    for (size_t bin = 0; bin < magnitudes.numBins(); ++bin) {
        median.process(magnitudes.data() + bin, magnitudes.numFrames(), stride,
                       out.data() + bin, stride, boundary);
    }
    return out;
}

/// @brief Median along the frequency axis of every frame
/// @param magnitudes Input matrix (not modified)
/// @param length Odd kernel length in bins
/// @param boundary Edge extension along frequency
/// @return Fresh matrix of the same shape
[[nodiscard]] inline MagnitudeMatrix percussiveEnhancement(
    const MagnitudeMatrix& magnitudes,
    size_t length,
    BoundaryMode boundary = BoundaryMode::Reflect
) {
    MagnitudeMatrix out(magnitudes.numFrames(), magnitudes.numBins());
    if (magnitudes.empty()) return out;

    SlidingMedian median;
    median.prepare(length);
    for (size_t frame = 0; frame < magnitudes.numFrames(); ++frame) {
        median.process(magnitudes.frame(frame), magnitudes.numBins(), 1,
                       out.frame(frame), 1, boundary);
    }
    return out;
}

/// @brief Soft-mask weights for one bin
/// @note Both enhancements are scaled by their maximum first so powers stay in
///       [0, 1]; a bin silent in both views gets 0.5 / 0.5.
inline void softMaskBin(float harmonicEnh, float percussiveEnh, double power,
                        double& maskH, double& maskP) noexcept {
    const double h = static_cast<double>(harmonicEnh);
    const double p = static_cast<double>(percussiveEnh);
    const double z = std::max(h, p);
    if (!(z > 0.0)) {
        maskH = 0.5;
        maskP = 0.5;
        return;
    }
    const double hp = std::pow(h / z, power);
    const double pp = std::pow(p / z, power);
    const double denom = hp + pp + kMaskEpsilon;
    maskH = hp / denom;
    maskP = pp / denom;
}

/// @brief Build harmonic and percussive masks from the two enhanced views
/// @param harmonicEnh Time-median magnitudes
/// @param percussiveEnh Frequency-median magnitudes (same shape)
/// @param power Soft-mask exponent (ignored in Binary mode)
/// @param mode Soft or Binary
/// @return Masks of the input shape; empty pair on shape mismatch
[[nodiscard]] inline MaskPair maskFromEnhancements(
    const MagnitudeMatrix& harmonicEnh,
    const MagnitudeMatrix& percussiveEnh,
    float power,
    MaskMode mode
) {
    if (!harmonicEnh.sameShape(percussiveEnh)) {
        return {};
    }

    MaskPair masks{
        MaskMatrix(harmonicEnh.numFrames(), harmonicEnh.numBins()),
        MaskMatrix(harmonicEnh.numFrames(), harmonicEnh.numBins())
    };

    const float* h = harmonicEnh.data();
    const float* p = percussiveEnh.data();
    double* mh = masks.harmonic.data();
    double* mp = masks.percussive.data();
    const size_t count = harmonicEnh.size();

    if (mode == MaskMode::Binary) {
        for (size_t i = 0; i < count; ++i) {
            // Ties (including silent bins) go to the harmonic stem
            mh[i] = (h[i] >= p[i]) ? 1.0 : 0.0;
            mp[i] = 1.0 - mh[i];
        }
    } else {
        const double exponent = static_cast<double>(power);
        for (size_t i = 0; i < count; ++i) {
            softMaskBin(h[i], p[i], exponent, mh[i], mp[i]);
        }
    }
    return masks;
}

} // namespace Classifier

} // namespace DSP
} // namespace Raga
