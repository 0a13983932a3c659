// ==============================================================================
// Test Helper: Signal Quality Metrics
// ==============================================================================
// RMS, error and SNR measurements for verifying separation results.
//
// This is TEST INFRASTRUCTURE, not production DSP code.
//
// Location: tests/test_helpers/signal_metrics.h
// Namespace: Raga::DSP::TestUtils::SignalMetrics
// ==============================================================================

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace Raga {
namespace DSP {
namespace TestUtils {
namespace SignalMetrics {

/// @brief Root mean square (double accumulation)
[[nodiscard]] inline double rms(const float* data, size_t n) {
    if (n == 0) return 0.0;
    double sum = 0.0;
    for (size_t i = 0; i < n; ++i) {
        sum += static_cast<double>(data[i]) * data[i];
    }
    return std::sqrt(sum / static_cast<double>(n));
}

[[nodiscard]] inline double rms(const std::vector<float>& data) {
    return rms(data.data(), data.size());
}

/// @brief Largest |a[i] - b[i]| over the common length
[[nodiscard]] inline double maxAbsDifference(const std::vector<float>& a,
                                             const std::vector<float>& b) {
    const size_t n = std::min(a.size(), b.size());
    double worst = 0.0;
    for (size_t i = 0; i < n; ++i) {
        worst = std::max(worst, std::abs(static_cast<double>(a[i]) - b[i]));
    }
    return worst;
}

/// @brief RMS of (a + b - reference)
[[nodiscard]] inline double sumResidualRms(const std::vector<float>& a,
                                           const std::vector<float>& b,
                                           const std::vector<float>& reference) {
    const size_t n = std::min({a.size(), b.size(), reference.size()});
    if (n == 0) return 0.0;
    double sum = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double e = static_cast<double>(a[i]) + b[i] - reference[i];
        sum += e * e;
    }
    return std::sqrt(sum / static_cast<double>(n));
}

/// @brief Signal-to-noise ratio in dB, noise = signal - reference
[[nodiscard]] inline double calculateSNR(const std::vector<float>& signal,
                                         const std::vector<float>& reference) {
    const size_t n = std::min(signal.size(), reference.size());
    double signalPower = 0.0;
    double noisePower = 0.0;
    for (size_t i = 0; i < n; ++i) {
        signalPower += static_cast<double>(reference[i]) * reference[i];
        const double noise = static_cast<double>(signal[i]) - reference[i];
        noisePower += noise * noise;
    }
    if (noisePower < 1e-30) return 200.0;
    if (signalPower < 1e-30) return -200.0;
    return 10.0 * std::log10(signalPower / noisePower);
}

/// @brief True if every sample is exactly zero
[[nodiscard]] inline bool isSilent(const std::vector<float>& data) {
    return std::all_of(data.begin(), data.end(), [](float x) { return x == 0.0f; });
}

} // namespace SignalMetrics
} // namespace TestUtils
} // namespace DSP
} // namespace Raga
