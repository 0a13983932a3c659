// ==============================================================================
// Layer 0: Core Utility - Signal Statistics
// ==============================================================================
// Duration / RMS / peak summary of a mono waveform, used for stem reports.
// ==============================================================================

#pragma once

#include <raga/dsp/core/db_utils.h>
#include <raga/dsp/core/spectral_simd.h>

#include <cmath>
#include <cstddef>

namespace Raga {
namespace DSP {

/// @brief Level summary of one waveform
struct SignalStats {
    size_t numSamples = 0;
    float durationSeconds = 0.0f;
    float rms = 0.0f;
    float peak = 0.0f;

    [[nodiscard]] float rmsDb() const noexcept { return gainToDb(rms); }
    [[nodiscard]] float peakDb() const noexcept { return gainToDb(peak); }
};

/// @brief Measure duration, RMS and peak
/// @param data Samples (may be nullptr when numSamples == 0)
/// @param numSamples Sample count
/// @param sampleRate Sample rate in Hz (duration is 0 when not positive)
[[nodiscard]] inline SignalStats measureSignal(
    const float* data,
    size_t numSamples,
    double sampleRate
) noexcept {
    SignalStats stats;
    if (data == nullptr || numSamples == 0) {
        return stats;
    }

    stats.numSamples = numSamples;
    if (sampleRate > 0.0) {
        stats.durationSeconds = static_cast<float>(static_cast<double>(numSamples) / sampleRate);
    }

    // Accumulate in double: long stems lose precision in a float sum
    double sumSquares = 0.0;
    for (size_t i = 0; i < numSamples; ++i) {
        const double s = data[i];
        sumSquares += s * s;
    }
    stats.rms = static_cast<float>(std::sqrt(sumSquares / static_cast<double>(numSamples)));
    stats.peak = peakAbsBulk(data, numSamples);
    return stats;
}

} // namespace DSP
} // namespace Raga
