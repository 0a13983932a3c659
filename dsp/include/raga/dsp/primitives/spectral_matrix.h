// ==============================================================================
// Layer 1: DSP Primitive - Spectral Matrix
// ==============================================================================
// Dense (frame x bin) grid used for every time-frequency quantity of the
// separator: complex spectrograms, magnitude matrices and masks.
//
// Storage is frame-major: all bins of frame 0, then all bins of frame 1, ...
// so a single frame is one contiguous spectrum (what FFT::forward writes) and
// a whole matrix can be handed to the bulk SIMD kernels in one call.
// ==============================================================================

#pragma once

#include <raga/dsp/primitives/fft.h>
#include <raga/dsp/core/spectral_simd.h>

#include <algorithm>
#include <cstddef>
#include <vector>

namespace Raga {
namespace DSP {

// =============================================================================
// SpectralMatrix Class
// =============================================================================

/// @brief Value-semantic 2-D grid indexed by (frame, bin)
/// @tparam T Element type (Complex, float magnitudes, double masks)
///
/// Copies are deep. Downstream stages always produce a fresh matrix rather than
/// writing into their input.
template <typename T>
class SpectralMatrix {
public:
    SpectralMatrix() = default;

    /// @brief Allocate a zero-initialized matrix
    SpectralMatrix(size_t numFrames, size_t numBins)
        : numFrames_(numFrames)
        , numBins_(numBins)
        , data_(numFrames * numBins, T{}) {}

    /// @brief Allocate a matrix filled with value
    SpectralMatrix(size_t numFrames, size_t numBins, const T& value)
        : numFrames_(numFrames)
        , numBins_(numBins)
        , data_(numFrames * numBins, value) {}

    // -------------------------------------------------------------------------
    // Shape
    // -------------------------------------------------------------------------

    [[nodiscard]] size_t numFrames() const noexcept { return numFrames_; }
    [[nodiscard]] size_t numBins() const noexcept { return numBins_; }
    [[nodiscard]] size_t size() const noexcept { return data_.size(); }
    [[nodiscard]] bool empty() const noexcept { return data_.empty(); }

    /// @brief True if other has identical dimensions
    template <typename U>
    [[nodiscard]] bool sameShape(const SpectralMatrix<U>& other) const noexcept {
        return numFrames_ == other.numFrames() && numBins_ == other.numBins();
    }

    // -------------------------------------------------------------------------
    // Element Access
    // -------------------------------------------------------------------------

    [[nodiscard]] T& at(size_t frame, size_t bin) noexcept {
        return data_[frame * numBins_ + bin];
    }

    [[nodiscard]] const T& at(size_t frame, size_t bin) const noexcept {
        return data_[frame * numBins_ + bin];
    }

    /// @brief Pointer to the first bin of a frame (numBins() contiguous values)
    [[nodiscard]] T* frame(size_t index) noexcept {
        return data_.data() + index * numBins_;
    }

    [[nodiscard]] const T* frame(size_t index) const noexcept {
        return data_.data() + index * numBins_;
    }

    [[nodiscard]] T* data() noexcept { return data_.data(); }
    [[nodiscard]] const T* data() const noexcept { return data_.data(); }

    void fill(const T& value) noexcept {
        std::fill(data_.begin(), data_.end(), value);
    }

private:
    size_t numFrames_ = 0;
    size_t numBins_ = 0;
    std::vector<T> data_;
};

/// Complex short-time spectrum
using Spectrogram = SpectralMatrix<Complex>;

/// Magnitudes |X| of a Spectrogram
using MagnitudeMatrix = SpectralMatrix<float>;

/// Per-bin mask weights (double so that complementary masks sum to 1 tightly)
using MaskMatrix = SpectralMatrix<double>;

// =============================================================================
// Conversions
// =============================================================================

/// @brief Compute |X| for every bin into a freshly allocated matrix
[[nodiscard]] inline MagnitudeMatrix computeMagnitudes(const Spectrogram& spectrogram) {
    MagnitudeMatrix mags(spectrogram.numFrames(), spectrogram.numBins());
    if (!spectrogram.empty()) {
        computeMagnitudeBulk(reinterpret_cast<const float*>(spectrogram.data()),
                             spectrogram.size(), mags.data());
    }
    return mags;
}

} // namespace DSP
} // namespace Raga
