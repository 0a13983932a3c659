// ==============================================================================
// Layer 1: DSP Primitive - Biquad Filter
// ==============================================================================
// Transposed Direct Form II biquad and fixed-length cascades of biquads.
// Coefficients come from Layer 0 filter design (double precision) and are
// rounded to float for processing.
// ==============================================================================

#pragma once

#include <raga/dsp/core/db_utils.h>
#include <raga/dsp/core/filter_design.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>

namespace Raga {
namespace DSP {

// =============================================================================
// Biquad Coefficients
// =============================================================================

/// @brief Normalized biquad filter coefficients (a0 = 1 implied).
struct BiquadCoefficients {
    float b0 = 1.0f;  ///< Feedforward coefficient 0
    float b1 = 0.0f;  ///< Feedforward coefficient 1
    float b2 = 0.0f;  ///< Feedforward coefficient 2
    float a1 = 0.0f;  ///< Feedback coefficient 1 (a0 = 1 implied)
    float a2 = 0.0f;  ///< Feedback coefficient 2

    /// Round a designed second-order section to float coefficients
    [[nodiscard]] static BiquadCoefficients fromSection(const SecondOrderSection& s) noexcept {
        return {static_cast<float>(s.b0), static_cast<float>(s.b1),
                static_cast<float>(s.b2), static_cast<float>(s.a1),
                static_cast<float>(s.a2)};
    }

    /// Check if coefficients represent a stable filter
    /// @return true if both poles lie inside the unit circle
    [[nodiscard]] bool isStable() const noexcept {
        // Jury stability criterion for second-order IIR filter:
        // 1. |a2| < 1
        // 2. |a1| < 1 + a2
        return std::abs(a2) < 1.0f && std::abs(a1) < 1.0f + a2;
    }

    /// Check if this is effectively bypass (unity gain, no filtering)
    [[nodiscard]] bool isBypass() const noexcept {
        constexpr float epsilon = 1e-6f;
        return std::abs(b0 - 1.0f) < epsilon &&
               std::abs(b1) < epsilon &&
               std::abs(b2) < epsilon &&
               std::abs(a1) < epsilon &&
               std::abs(a2) < epsilon;
    }
};

// =============================================================================
// Biquad Filter Class
// =============================================================================

/// @brief Transposed Direct Form II biquad filter.
///
/// Processes audio using the TDF2 difference equations:
/// @code
/// y[n] = b0*x[n] + z1[n-1]
/// z1[n] = b1*x[n] - a1*y[n] + z2[n-1]
/// z2[n] = b2*x[n] - a2*y[n]
/// @endcode
class Biquad {
public:
    Biquad() noexcept = default;

    /// Construct with initial coefficients
    explicit Biquad(const BiquadCoefficients& coeffs) noexcept
        : coeffs_(coeffs) {}

    /// Set coefficients directly
    void setCoefficients(const BiquadCoefficients& coeffs) noexcept {
        coeffs_ = coeffs;
    }

    [[nodiscard]] const BiquadCoefficients& coefficients() const noexcept {
        return coeffs_;
    }

    /// Process single sample using TDF2
    /// @note Non-finite input resets the state and yields 0
    [[nodiscard]] float process(float input) noexcept {
        if (!detail::isFiniteBits(input)) {
            reset();
            return 0.0f;
        }

        const float output = coeffs_.b0 * input + z1_;
        z1_ = coeffs_.b1 * input - coeffs_.a1 * output + z2_;
        z2_ = coeffs_.b2 * input - coeffs_.a2 * output;

        z1_ = detail::flushDenormal(z1_);
        z2_ = detail::flushDenormal(z2_);

        return output;
    }

    /// Process buffer of samples in-place
    void processBlock(float* buffer, size_t numSamples) noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            buffer[i] = process(buffer[i]);
        }
    }

    /// Clear filter state
    void reset() noexcept {
        z1_ = 0.0f;
        z2_ = 0.0f;
    }

private:
    BiquadCoefficients coeffs_;
    float z1_ = 0.0f;
    float z2_ = 0.0f;
};

// =============================================================================
// Biquad Cascade
// =============================================================================

/// @brief Series cascade of NumStages biquads (2 * NumStages poles).
template<size_t NumStages>
class BiquadCascade {
public:
    static_assert(NumStages >= 1 && NumStages <= 8,
        "BiquadCascade supports 1-8 stages");

    /// Configure as a Butterworth band-stop of prototype order NumStages
    /// @return false (and bypass stages) if the band is invalid for sampleRate
    [[nodiscard]] bool setButterworthBandStop(
        double lowHz,
        double highHz,
        double sampleRate
    ) noexcept {
        if (!FilterDesign::isValidBand(lowHz, highHz, sampleRate)) {
            for (auto& stage : stages_) {
                stage.setCoefficients(BiquadCoefficients{});
            }
            return false;
        }
        const auto sections =
            FilterDesign::butterworthBandStop<NumStages>(lowHz, highHz, sampleRate);
        for (size_t i = 0; i < NumStages; ++i) {
            stages_[i].setCoefficients(BiquadCoefficients::fromSection(sections[i]));
        }
        return true;
    }

    /// Set individual stage coefficients
    void setStage(size_t index, const BiquadCoefficients& coeffs) noexcept {
        if (index < NumStages) {
            stages_[index].setCoefficients(coeffs);
        }
    }

    /// Process single sample through all stages
    [[nodiscard]] float process(float input) noexcept {
        float x = input;
        for (auto& stage : stages_) {
            x = stage.process(x);
        }
        return x;
    }

    /// Process buffer through all stages
    void processBlock(float* buffer, size_t numSamples) noexcept {
        for (auto& stage : stages_) {
            stage.processBlock(buffer, numSamples);
        }
    }

    void reset() noexcept {
        for (auto& stage : stages_) {
            stage.reset();
        }
    }

    [[nodiscard]] const Biquad& stage(size_t index) const noexcept {
        return stages_[std::min(index, NumStages - 1)];
    }

    [[nodiscard]] static constexpr size_t numStages() noexcept { return NumStages; }

    /// Total filter order (2 * NumStages poles)
    [[nodiscard]] static constexpr size_t order() noexcept { return 2 * NumStages; }

private:
    std::array<Biquad, NumStages> stages_;
};

} // namespace DSP
} // namespace Raga
