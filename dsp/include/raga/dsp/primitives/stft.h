// ==============================================================================
// Layer 1: DSP Primitive - Offline Short-Time Fourier Transform
// ==============================================================================
// Whole-signal STFT analysis and weighted overlap-add synthesis.
//
// Framing convention (shared by analysis and synthesis):
// - The signal is conceptually padded with windowSize/2 zeros on the left, so
//   frame t is centered on input sample t * hopSize.
// - Frames are added until the last one reaches past the final input sample:
//   numFrames = 1 + ceil(max(0, n + 2*(W/2) - W) / hop).
// - The window occupies the first windowSize samples of each FFT frame, the
//   rest is zero (FFT length is the next power of two >= windowSize).
//
// Synthesis multiplies each inverse frame by the same window and divides the
// accumulated signal by the sum of squared windows, so an unmodified
// spectrogram reconstructs its input exactly (up to float rounding).
// ==============================================================================

#pragma once

#include <raga/dsp/core/separation_error.h>
#include <raga/dsp/core/window_functions.h>
#include <raga/dsp/primitives/fft.h>
#include <raga/dsp/primitives/spectral_matrix.h>

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace Raga {
namespace DSP {

// =============================================================================
// Transform Parameters
// =============================================================================

/// @brief Framing parameters shared by forward and inverse transforms
struct TransformParams {
    int windowSize = 2048;                  ///< Analysis frame length in samples
    int hopSize = 512;                      ///< Frame advance in samples
    WindowType windowType = WindowType::Hann;

    /// @brief Check sizes and window coverage before any transform work
    /// @return InvalidParameter for non-positive sizes, hop > window, a
    ///         window longer than kMaxFFTSize, or a window/hop pair whose
    ///         overlapped squared windows vanish somewhere (those samples
    ///         could not be resynthesized)
    [[nodiscard]] ValidationResult validate() const {
        if (windowSize <= 0) {
            return ValidationResult::fail(SeparationError::InvalidParameter,
                "windowSize must be positive (got " + std::to_string(windowSize) + ")");
        }
        if (hopSize <= 0) {
            return ValidationResult::fail(SeparationError::InvalidParameter,
                "hopSize must be positive (got " + std::to_string(hopSize) + ")");
        }
        if (hopSize > windowSize) {
            return ValidationResult::fail(SeparationError::InvalidParameter,
                "hopSize (" + std::to_string(hopSize) + ") must not exceed windowSize ("
                + std::to_string(windowSize) + ")");
        }
        if (static_cast<size_t>(windowSize) > kMaxFFTSize) {
            return ValidationResult::fail(SeparationError::InvalidParameter,
                "windowSize must not exceed " + std::to_string(kMaxFFTSize));
        }

        const std::vector<float> window = Window::generate(windowType,
                                                           static_cast<size_t>(windowSize));
        const float coverage = Window::minSquaredOverlapGain(
            window.data(), window.size(), static_cast<size_t>(hopSize));
        if (coverage <= kMinOverlapGain) {
            return ValidationResult::fail(SeparationError::InvalidParameter,
                std::string(windowTypeName(windowType)) + " window of "
                + std::to_string(windowSize) + " samples with hop "
                + std::to_string(hopSize) + " leaves samples with zero overlap-add gain");
        }
        return ValidationResult::ok();
    }

    /// @brief FFT length used for this window (0 if windowSize is invalid)
    [[nodiscard]] size_t fftSize() const noexcept {
        return windowSize > 0 ? fftSizeFor(static_cast<size_t>(windowSize)) : 0;
    }

    /// @brief Frequency bins per frame
    [[nodiscard]] size_t numBins() const noexcept {
        const size_t n = fftSize();
        return n > 0 ? n / 2 + 1 : 0;
    }
};

/// @brief Number of centered frames covering numSamples
[[nodiscard]] constexpr size_t frameCount(
    size_t numSamples, size_t windowSize, size_t hopSize) noexcept {
    if (windowSize == 0 || hopSize == 0) return 0;
    const size_t padded = numSamples + 2 * (windowSize / 2);
    const size_t span = padded > windowSize ? padded - windowSize : 0;
    return 1 + (span + hopSize - 1) / hopSize;
}

// =============================================================================
// STFT Class
// =============================================================================

/// @brief Offline short-time Fourier analysis of a complete waveform
class STFT {
public:
    STFT() noexcept = default;
    ~STFT() noexcept = default;

    // Non-copyable, movable
    STFT(const STFT&) = delete;
    STFT& operator=(const STFT&) = delete;
    STFT(STFT&&) noexcept = default;
    STFT& operator=(STFT&&) noexcept = default;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /// @brief Validate parameters, build the window and prepare the FFT
    /// @note Allocates. On failure the STFT stays unprepared.
    [[nodiscard]] ValidationResult prepare(const TransformParams& params) {
        windowSize_ = 0;
        hopSize_ = 0;

        ValidationResult check = params.validate();
        if (!check) return check;

        fft_.prepare(params.fftSize());
        if (!fft_.isPrepared()) {
            return ValidationResult::fail(SeparationError::InvalidParameter,
                "FFT setup failed for size " + std::to_string(params.fftSize()));
        }

        windowSize_ = static_cast<size_t>(params.windowSize);
        hopSize_ = static_cast<size_t>(params.hopSize);
        windowType_ = params.windowType;
        window_ = Window::generate(windowType_, windowSize_);
        frameBuffer_.assign(fft_.size(), 0.0f);
        return check;
    }

    // -------------------------------------------------------------------------
    // Analysis
    // -------------------------------------------------------------------------

    /// @brief Transform a whole waveform into a spectrogram
    /// @param input Samples (numSamples values)
    /// @param numSamples Length of input
    /// @return frameCount(numSamples) x numBins() matrix; empty if unprepared
    ///         or input is empty
    [[nodiscard]] Spectrogram analyze(const float* input, size_t numSamples) {
        if (!isPrepared() || input == nullptr || numSamples == 0) {
            return {};
        }

        const size_t frames = frameCount(numSamples, windowSize_, hopSize_);
        const size_t pad = windowSize_ / 2;
        Spectrogram spectrogram(frames, numBins());

        for (size_t t = 0; t < frames; ++t) {
            // Padded index t*hop + i maps to input index t*hop + i - pad
            const size_t start = t * hopSize_;
            for (size_t i = 0; i < windowSize_; ++i) {
                const size_t padded = start + i;
                const bool inside = padded >= pad && padded - pad < numSamples;
                frameBuffer_[i] = inside ? input[padded - pad] * window_[i] : 0.0f;
            }
            // Zero-padding tail stays zero from prepare()
            fft_.forward(frameBuffer_.data(), spectrogram.frame(t));
        }
        return spectrogram;
    }

    // -------------------------------------------------------------------------
    // Query
    // -------------------------------------------------------------------------

    [[nodiscard]] size_t windowSize() const noexcept { return windowSize_; }
    [[nodiscard]] size_t hopSize() const noexcept { return hopSize_; }
    [[nodiscard]] size_t fftSize() const noexcept { return fft_.size(); }
    [[nodiscard]] size_t numBins() const noexcept { return fft_.numBins(); }
    [[nodiscard]] WindowType windowType() const noexcept { return windowType_; }
    [[nodiscard]] const std::vector<float>& window() const noexcept { return window_; }
    [[nodiscard]] bool isPrepared() const noexcept { return windowSize_ > 0 && fft_.isPrepared(); }

private:
    FFT fft_;
    std::vector<float> window_;
    std::vector<float> frameBuffer_;
    WindowType windowType_ = WindowType::Hann;
    size_t windowSize_ = 0;
    size_t hopSize_ = 0;
};

// =============================================================================
// OverlapAdd Class
// =============================================================================

/// @brief Weighted overlap-add synthesis matching STFT's framing
class OverlapAdd {
public:
    OverlapAdd() noexcept = default;
    ~OverlapAdd() noexcept = default;

    // Non-copyable, movable
    OverlapAdd(const OverlapAdd&) = delete;
    OverlapAdd& operator=(const OverlapAdd&) = delete;
    OverlapAdd(OverlapAdd&&) noexcept = default;
    OverlapAdd& operator=(OverlapAdd&&) noexcept = default;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /// @brief Validate parameters, build the synthesis window and prepare the FFT
    /// @note Must use the same TransformParams as the analysing STFT
    [[nodiscard]] ValidationResult prepare(const TransformParams& params) {
        windowSize_ = 0;
        hopSize_ = 0;

        ValidationResult check = params.validate();
        if (!check) return check;

        fft_.prepare(params.fftSize());
        if (!fft_.isPrepared()) {
            return ValidationResult::fail(SeparationError::InvalidParameter,
                "FFT setup failed for size " + std::to_string(params.fftSize()));
        }

        windowSize_ = static_cast<size_t>(params.windowSize);
        hopSize_ = static_cast<size_t>(params.hopSize);
        synthesisWindow_ = Window::generate(params.windowType, windowSize_);
        ifftBuffer_.assign(fft_.size(), 0.0f);
        return check;
    }

    // -------------------------------------------------------------------------
    // Synthesis
    // -------------------------------------------------------------------------

    /// @brief Invert a spectrogram to exactly originalLength samples
    /// @param spectrogram Matrix with numBins() bins per frame
    /// @param originalLength Output length (truncates or zero-pads)
    /// @return Reconstructed waveform; empty if unprepared or bins mismatch
    [[nodiscard]] std::vector<float> synthesize(
        const Spectrogram& spectrogram, size_t originalLength) {
        if (!isPrepared() || spectrogram.empty()
            || spectrogram.numBins() != fft_.numBins()) {
            return {};
        }

        const size_t frames = spectrogram.numFrames();
        const std::vector<float> gain = Window::squaredOverlapGain(
            synthesisWindow_.data(), windowSize_, hopSize_, frames);
        std::vector<float> accum(gain.size(), 0.0f);

        for (size_t t = 0; t < frames; ++t) {
            fft_.inverse(spectrogram.frame(t), ifftBuffer_.data());
            float* dst = accum.data() + t * hopSize_;
            for (size_t i = 0; i < windowSize_; ++i) {
                dst[i] += ifftBuffer_[i] * synthesisWindow_[i];
            }
        }

        // Drop the centering pad and normalize by the squared-window sum
        const size_t pad = windowSize_ / 2;
        std::vector<float> output(originalLength, 0.0f);
        for (size_t j = 0; j < originalLength; ++j) {
            const size_t k = j + pad;
            if (k >= accum.size()) break;
            if (gain[k] > kMinOverlapGain) {
                output[j] = accum[k] / gain[k];
            }
        }
        return output;
    }

    // -------------------------------------------------------------------------
    // Query
    // -------------------------------------------------------------------------

    [[nodiscard]] size_t windowSize() const noexcept { return windowSize_; }
    [[nodiscard]] size_t hopSize() const noexcept { return hopSize_; }
    [[nodiscard]] size_t numBins() const noexcept { return fft_.numBins(); }
    [[nodiscard]] bool isPrepared() const noexcept { return windowSize_ > 0 && fft_.isPrepared(); }

private:
    FFT fft_;
    std::vector<float> synthesisWindow_;
    std::vector<float> ifftBuffer_;
    size_t windowSize_ = 0;
    size_t hopSize_ = 0;
};

// =============================================================================
// Free-Function Interface
// =============================================================================

/// @brief Outcome of forwardTransform
struct TransformResult {
    SeparationError error = SeparationError::Success;
    std::string errorMessage;
    Spectrogram spectrogram;

    [[nodiscard]] explicit operator bool() const noexcept {
        return error == SeparationError::Success;
    }
};

/// @brief Outcome of inverseTransform
struct WaveformResult {
    SeparationError error = SeparationError::Success;
    std::string errorMessage;
    std::vector<float> samples;

    [[nodiscard]] explicit operator bool() const noexcept {
        return error == SeparationError::Success;
    }
};

/// @brief One-shot analysis of a waveform
/// @return InvalidParameter for bad params, EmptyInput for numSamples == 0
[[nodiscard]] inline TransformResult forwardTransform(
    const float* input, size_t numSamples, const TransformParams& params) {
    TransformResult result;

    STFT stft;
    ValidationResult check = stft.prepare(params);
    if (!check) {
        result.error = check.error;
        result.errorMessage = std::move(check.errorMessage);
        return result;
    }
    if (input == nullptr || numSamples == 0) {
        result.error = SeparationError::EmptyInput;
        result.errorMessage = "input waveform is empty";
        return result;
    }

    result.spectrogram = stft.analyze(input, numSamples);
    return result;
}

/// @brief One-shot synthesis of a spectrogram
/// @return InvalidParameter for bad params or a bin count that does not match
///         params, EmptyInput for an empty matrix or originalLength == 0
[[nodiscard]] inline WaveformResult inverseTransform(
    const Spectrogram& spectrogram, const TransformParams& params, size_t originalLength) {
    WaveformResult result;

    OverlapAdd ola;
    ValidationResult check = ola.prepare(params);
    if (!check) {
        result.error = check.error;
        result.errorMessage = std::move(check.errorMessage);
        return result;
    }
    if (spectrogram.empty() || originalLength == 0) {
        result.error = SeparationError::EmptyInput;
        result.errorMessage = "spectrogram is empty";
        return result;
    }
    if (spectrogram.numBins() != ola.numBins()) {
        result.error = SeparationError::InvalidParameter;
        result.errorMessage = "spectrogram has " + std::to_string(spectrogram.numBins())
            + " bins, expected " + std::to_string(ola.numBins());
        return result;
    }

    result.samples = ola.synthesize(spectrogram, originalLength);
    return result;
}

} // namespace DSP
} // namespace Raga
