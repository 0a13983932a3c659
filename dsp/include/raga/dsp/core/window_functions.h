// ==============================================================================
// Layer 0: Core Utility - Window Functions
// ==============================================================================
// Window function generators for STFT analysis and overlap-add synthesis.
// Includes Hann, Hamming and Blackman windows plus overlap-gain helpers used
// by the inverse transform to undo the analysis/synthesis window product.
// ==============================================================================

#pragma once

#include <raga/dsp/core/math_constants.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>
#include <vector>

namespace Raga {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

/// Squared-window sums below this are treated as "no coverage"
inline constexpr float kMinOverlapGain = 1e-10f;

// =============================================================================
// Window Type Enumeration
// =============================================================================

/// @brief Supported window function types for STFT analysis
enum class WindowType : uint8_t {
    Hann,       ///< Hann (Hanning) window - COLA at 50%/75% overlap
    Hamming,    ///< Hamming window - COLA at 50%/75% overlap
    Blackman    ///< Blackman window - COLA at 66%/75% overlap
};

/// @brief Human-readable window name (for logging)
[[nodiscard]] constexpr std::string_view windowTypeName(WindowType type) noexcept {
    switch (type) {
        case WindowType::Hann:     return "hann";
        case WindowType::Hamming:  return "hamming";
        case WindowType::Blackman: return "blackman";
    }
    return "unknown";
}

// =============================================================================
// Window Namespace - Free Functions
// =============================================================================

namespace Window {

// -----------------------------------------------------------------------------
// Window Generators (In-Place)
// -----------------------------------------------------------------------------

/// @brief Fill buffer with Hann window (periodic/DFT-even variant)
/// @param output Destination buffer
/// @param size Window size
/// @note Formula: 0.5 - 0.5*cos(2*pi*n/N) (periodic variant)
inline void generateHann(float* output, size_t size) noexcept {
    if (output == nullptr || size == 0) return;

    const float N = static_cast<float>(size);
    for (size_t n = 0; n < size; ++n) {
        // Periodic (DFT-even) variant: divides by N, not N-1
        const float phase = kTwoPi * static_cast<float>(n) / N;
        output[n] = 0.5f - 0.5f * std::cos(phase);
    }
}

/// @brief Fill buffer with Hamming window
/// @note Formula: 0.54 - 0.46*cos(2*pi*n/N)
inline void generateHamming(float* output, size_t size) noexcept {
    if (output == nullptr || size == 0) return;

    const float N = static_cast<float>(size);
    for (size_t n = 0; n < size; ++n) {
        const float phase = kTwoPi * static_cast<float>(n) / N;
        output[n] = 0.54f - 0.46f * std::cos(phase);
    }
}

/// @brief Fill buffer with Blackman window
/// @note Formula: 0.42 - 0.5*cos(2*pi*n/N) + 0.08*cos(4*pi*n/N)
inline void generateBlackman(float* output, size_t size) noexcept {
    if (output == nullptr || size == 0) return;

    const float N = static_cast<float>(size);
    for (size_t n = 0; n < size; ++n) {
        const float phase = kTwoPi * static_cast<float>(n) / N;
        // Clamp: the formula dips to about -1.4e-17 at n = 0
        output[n] = std::max(0.0f,
            0.42f - 0.5f * std::cos(phase) + 0.08f * std::cos(2.0f * phase));
    }
}

// -----------------------------------------------------------------------------
// Overlap Coverage
// -----------------------------------------------------------------------------

/// @brief Smallest steady-state squared-window sum for a hop size
///
/// Every output position away from the signal edges is covered by the frames
/// starting at pos, pos - hop, pos - 2*hop, ...; its overlap-add normalizer is
/// the sum of w[pos + k*hop]^2 over k. Weighted overlap-add can only recover
/// positions where that sum is nonzero.
///
/// @return Minimum over pos in [0, hopSize); 0 for invalid arguments
[[nodiscard]] inline float minSquaredOverlapGain(
    const float* window,
    size_t size,
    size_t hopSize
) noexcept {
    if (window == nullptr || size == 0 || hopSize == 0 || hopSize > size) {
        return 0.0f;
    }

    float minimum = std::numeric_limits<float>::max();
    for (size_t pos = 0; pos < hopSize; ++pos) {
        float sum = 0.0f;
        for (size_t idx = pos; idx < size; idx += hopSize) {
            sum += window[idx] * window[idx];
        }
        minimum = std::min(minimum, sum);
    }
    return minimum;
}

// -----------------------------------------------------------------------------
// Overlap Gain
// -----------------------------------------------------------------------------

/// @brief Accumulate squared window values at every hop offset
///
/// Adds w[n]^2 into gain[start + n] for each frame start = t * hopSize,
/// t in [0, numFrames). This is the normalizer of weighted overlap-add
/// synthesis: analysis window times synthesis window, summed over frames.
///
/// @param window Window coefficients (length size)
/// @param size Window size
/// @param hopSize Frame advance
/// @param numFrames Number of frames
/// @return Vector of length (numFrames - 1) * hopSize + size
[[nodiscard]] inline std::vector<float> squaredOverlapGain(
    const float* window,
    size_t size,
    size_t hopSize,
    size_t numFrames
) {
    if (window == nullptr || size == 0 || numFrames == 0) {
        return {};
    }

    std::vector<float> gain((numFrames - 1) * hopSize + size, 0.0f);
    for (size_t frame = 0; frame < numFrames; ++frame) {
        float* dst = gain.data() + frame * hopSize;
        for (size_t n = 0; n < size; ++n) {
            dst[n] += window[n] * window[n];
        }
    }
    return gain;
}

// -----------------------------------------------------------------------------
// Factory Function
// -----------------------------------------------------------------------------

/// @brief Generate window coefficients (allocates vector)
/// @param type Window type
/// @param size Window size
/// @return Vector of window coefficients
[[nodiscard]] inline std::vector<float> generate(WindowType type, size_t size) {
    std::vector<float> window(size, 0.0f);

    switch (type) {
        case WindowType::Hann:
            generateHann(window.data(), size);
            break;
        case WindowType::Hamming:
            generateHamming(window.data(), size);
            break;
        case WindowType::Blackman:
            generateBlackman(window.data(), size);
            break;
    }

    return window;
}

} // namespace Window

} // namespace DSP
} // namespace Raga
