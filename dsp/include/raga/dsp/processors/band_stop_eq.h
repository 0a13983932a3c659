// ==============================================================================
// Layer 2: DSP Processor - Band-Stop Clean-Up EQ
// ==============================================================================
// 4th-order Butterworth band-stop (8 poles, 4 biquads) run causally over a
// whole stem. Used to carve residual percussion bleed out of the harmonic
// stem, producing the optional "harmonic_clean" stem.
// ==============================================================================

#pragma once

#include <raga/dsp/core/filter_design.h>
#include <raga/dsp/core/separation_error.h>
#include <raga/dsp/primitives/biquad.h>

#include <cstddef>
#include <string>
#include <vector>

namespace Raga {
namespace DSP {

/// Prototype order of the clean-up band-stop
inline constexpr size_t kBandStopOrder = 4;

/// Default stop band, Hz
inline constexpr double kDefaultBandStopLowHz = 10.0;
inline constexpr double kDefaultBandStopHighHz = 4000.0;

/// @brief Butterworth band-stop over [lowHz, highHz]
class BandStopEQ {
public:
    BandStopEQ() noexcept = default;

    /// @brief Design the filter for a sample rate
    /// @return InvalidParameter unless 0 < lowHz < highHz < sampleRate / 2
    [[nodiscard]] ValidationResult prepare(double sampleRate,
                                           double lowHz = kDefaultBandStopLowHz,
                                           double highHz = kDefaultBandStopHighHz) {
        prepared_ = false;
        if (!cascade_.setButterworthBandStop(lowHz, highHz, sampleRate)) {
            return ValidationResult::fail(SeparationError::InvalidParameter,
                "band-stop edges must satisfy 0 < low < high < sampleRate/2 (got "
                + std::to_string(lowHz) + ".." + std::to_string(highHz) + " Hz at "
                + std::to_string(sampleRate) + " Hz)");
        }
        cascade_.reset();
        prepared_ = true;
        return ValidationResult::ok();
    }

    /// @brief Clear the filter state
    void reset() noexcept { cascade_.reset(); }

    /// @brief Filter a buffer in place, continuing from the current state
    void process(float* buffer, size_t numSamples) noexcept {
        if (!prepared_ || buffer == nullptr) return;
        cascade_.processBlock(buffer, numSamples);
    }

    /// @brief Filter a copy of a whole stem from a cleared state
    [[nodiscard]] std::vector<float> apply(const std::vector<float>& input) {
        std::vector<float> output(input);
        reset();
        process(output.data(), output.size());
        return output;
    }

    [[nodiscard]] bool isPrepared() const noexcept { return prepared_; }

    [[nodiscard]] const BiquadCascade<kBandStopOrder>& cascade() const noexcept {
        return cascade_;
    }

private:
    BiquadCascade<kBandStopOrder> cascade_;
    bool prepared_ = false;
};

} // namespace DSP
} // namespace Raga
