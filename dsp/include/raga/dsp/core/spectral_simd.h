// ==============================================================================
// Layer 0: Core Utility - SIMD-Accelerated Spectral Math
// ==============================================================================
// Bulk magnitude computation, real-gain complex scaling and waveform sweeps
// using Google Highway for runtime SIMD dispatch (SSE2/AVX2/AVX-512/NEON).
//
// These functions are the vectorized equivalents of the per-bin sqrt and
// per-sample loops of the separator. Spectral matrices call them once per
// frame (or once per whole matrix, since frames are stored contiguously).
// ==============================================================================

#pragma once

#include <cstddef>

namespace Raga {
namespace DSP {

/// @brief Bulk compute magnitudes from interleaved Complex data
/// @param complexData Pointer to interleaved {real, imag} float pairs
/// @param numBins Number of complex bins (NOT number of floats)
/// @param mags Output magnitude array (must hold numBins floats)
/// @note SIMD-accelerated with runtime ISA dispatch
void computeMagnitudeBulk(const float* complexData, size_t numBins,
                          float* mags) noexcept;

/// @brief Multiply each complex bin by a real gain (phase is preserved)
/// @param complexData Input interleaved {real, imag} pairs
/// @param gains Real gain per bin
/// @param numBins Number of complex bins
/// @param output Output interleaved pairs (may alias complexData)
void scaleComplexBulk(const float* complexData, const float* gains,
                      size_t numBins, float* output) noexcept;

/// @brief Largest absolute sample value (0 for empty input)
[[nodiscard]] float peakAbsBulk(const float* data, size_t count) noexcept;

/// @brief In-place division by a scalar
/// @note Uses true division (not reciprocal multiply) so that the sample equal
///       to the divisor maps exactly to +/-1
void divideBulk(float* data, size_t count, float divisor) noexcept;

/// @brief Replace NaN and +/-Inf with zero, in place
/// @return Number of samples replaced
size_t replaceNonFiniteBulk(float* data, size_t count) noexcept;

} // namespace DSP
} // namespace Raga
