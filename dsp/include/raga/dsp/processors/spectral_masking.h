// ==============================================================================
// Layer 2: DSP Processor - Spectral Masking & Stem Synthesis
// ==============================================================================
// Applies real-valued masks to a complex spectrogram (original phase kept),
// inverts the masked spectrograms to stems, and peak-normalizes stems for
// clipping-safe export.
// ==============================================================================

#pragma once

#include <raga/dsp/core/separation_error.h>
#include <raga/dsp/core/spectral_simd.h>
#include <raga/dsp/primitives/spectral_matrix.h>
#include <raga/dsp/primitives/stft.h>
#include <raga/dsp/processors/hpss_classifier.h>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace Raga {
namespace DSP {

/// @brief Harmonic and percussive waveforms of one synthesis run
struct StemPairResult {
    SeparationError error = SeparationError::Success;
    std::string errorMessage;
    std::vector<float> harmonic;
    std::vector<float> percussive;

    [[nodiscard]] explicit operator bool() const noexcept {
        return error == SeparationError::Success;
    }
};

namespace Masking {

/// @brief Scale every bin's magnitude by its mask value, keeping its phase
/// @return Fresh spectrogram; empty on shape mismatch
[[nodiscard]] inline Spectrogram applyMask(const Spectrogram& spectrogram,
                                           const MaskMatrix& mask) {
    if (!spectrogram.sameShape(mask)) {
        return {};
    }

    Spectrogram out(spectrogram.numFrames(), spectrogram.numBins());
    std::vector<float> gains(spectrogram.numBins());
    for (size_t t = 0; t < spectrogram.numFrames(); ++t) {
        const double* m = mask.frame(t);
        for (size_t k = 0; k < gains.size(); ++k) {
            gains[k] = static_cast<float>(m[k]);
        }
        scaleComplexBulk(reinterpret_cast<const float*>(spectrogram.frame(t)),
                         gains.data(), gains.size(),
                         reinterpret_cast<float*>(out.frame(t)));
    }
    return out;
}

/// @brief Mask the same spectrogram twice and invert both
/// @param spectrogram Mixture spectrogram
/// @param masks Harmonic / percussive masks of the spectrogram's shape
/// @param params Framing used to produce the spectrogram
/// @param originalLength Output length of each stem
[[nodiscard]] inline StemPairResult synthesizeStems(
    const Spectrogram& spectrogram,
    const MaskPair& masks,
    const TransformParams& params,
    size_t originalLength
) {
    StemPairResult result;

    if (!spectrogram.sameShape(masks.harmonic) || !spectrogram.sameShape(masks.percussive)) {
        result.error = SeparationError::InvalidParameter;
        result.errorMessage = "mask dimensions do not match the spectrogram";
        return result;
    }

    OverlapAdd ola;
    ValidationResult check = ola.prepare(params);
    if (!check) {
        result.error = check.error;
        result.errorMessage = std::move(check.errorMessage);
        return result;
    }
    if (spectrogram.empty() || originalLength == 0) {
        result.error = SeparationError::EmptyInput;
        result.errorMessage = "nothing to synthesize";
        return result;
    }

    result.harmonic = ola.synthesize(applyMask(spectrogram, masks.harmonic), originalLength);
    result.percussive = ola.synthesize(applyMask(spectrogram, masks.percussive), originalLength);

    if (result.harmonic.size() != originalLength || result.percussive.size() != originalLength) {
        result = StemPairResult{};
        result.error = SeparationError::InvalidParameter;
        result.errorMessage = "spectrogram bins do not match the transform parameters";
    }
    return result;
}

/// @brief Scale a waveform down so its peak is at most 1.0, in place
/// @return Divisor applied (1.0 when unchanged; silent input is unchanged)
inline float normalizePeak(float* data, size_t count) noexcept {
    if (data == nullptr || count == 0) return 1.0f;
    const float peak = peakAbsBulk(data, count);
    if (peak > 1.0f) {
        divideBulk(data, count, peak);
        return peak;
    }
    return 1.0f;
}

/// @brief Value-returning form of normalizePeak
[[nodiscard]] inline std::vector<float> normalize(std::vector<float> waveform) {
    normalizePeak(waveform.data(), waveform.size());
    return waveform;
}

} // namespace Masking

} // namespace DSP
} // namespace Raga
