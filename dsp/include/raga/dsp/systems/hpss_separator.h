// ==============================================================================
// Layer 3: System Component - Harmonic/Percussive Separator
// ==============================================================================
// Complete offline HPSS pipeline:
//
//   input -> non-finite guard -> unit peak -> STFT -> |X| -+-> time median
//                                                          +-> freq median
//         -> masks -> masked inverse STFT -> input scale -> reconciliation report
//         -> optional band-stop "harmonic_clean" -> peak normalization
//
// All parameters are validated before any allocation. A run either yields
// every stem or none: failures return an error code and empty payload.
// ==============================================================================

#pragma once

#include <raga/dsp/core/separation_error.h>
#include <raga/dsp/core/spectral_simd.h>
#include <raga/dsp/core/window_functions.h>
#include <raga/dsp/primitives/median_filter.h>
#include <raga/dsp/primitives/spectral_matrix.h>
#include <raga/dsp/primitives/stft.h>
#include <raga/dsp/processors/band_stop_eq.h>
#include <raga/dsp/processors/hpss_classifier.h>
#include <raga/dsp/processors/spectral_masking.h>

#include <cmath>
#include <cstddef>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace Raga {
namespace DSP {

// =============================================================================
// Configuration
// =============================================================================

/// @brief Optional clean-up EQ applied to the harmonic stem
struct BandStopConfig {
    bool enabled = false;
    double lowHz = kDefaultBandStopLowHz;
    double highHz = kDefaultBandStopHighHz;
};

/// @brief Separator configuration
///
/// | field            | effect                                       |
/// |------------------|----------------------------------------------|
/// | windowSize       | frame length (frequency vs time resolution)  |
/// | hopSize          | frame advance (<= windowSize)                |
/// | filterLengthTime | harmonic median span in frames (odd)         |
/// | filterLengthFreq | percussive median span in bins (odd)         |
/// | power            | soft-mask sharpness                          |
/// | mode             | soft (energy conserving) or binary           |
struct HPSSConfig {
    int windowSize = 2048;
    int hopSize = 512;
    int filterLengthTime = kDefaultKernelSize;
    int filterLengthFreq = kDefaultKernelSize;
    float power = kDefaultMaskPower;
    MaskMode mode = MaskMode::Soft;
    WindowType windowType = WindowType::Hann;
    BoundaryMode boundary = BoundaryMode::Reflect;
    bool normalizeOutput = true;
    BandStopConfig bandStop;

    [[nodiscard]] TransformParams transformParams() const noexcept {
        return {windowSize, hopSize, windowType};
    }

    /// @brief First violated constraint, or success
    /// @note Band-stop edges depend on the sample rate and are checked by
    ///       validateFor()
    [[nodiscard]] ValidationResult validate() const {
        if (ValidationResult r = transformParams().validate(); !r) return r;
        if (ValidationResult r = Classifier::validateKernel(filterLengthTime, "filterLengthTime"); !r) {
            return r;
        }
        if (ValidationResult r = Classifier::validateKernel(filterLengthFreq, "filterLengthFreq"); !r) {
            return r;
        }
        return Classifier::validatePower(power);
    }

    /// @brief validate() plus the checks that need the sample rate
    [[nodiscard]] ValidationResult validateFor(double sampleRate) const {
        if (ValidationResult r = validate(); !r) return r;
        if (!std::isfinite(sampleRate) || sampleRate <= 0.0) {
            return ValidationResult::fail(SeparationError::InvalidParameter,
                "sampleRate must be positive (got " + std::to_string(sampleRate) + ")");
        }
        if (bandStop.enabled
            && !FilterDesign::isValidBand(bandStop.lowHz, bandStop.highHz, sampleRate)) {
            return ValidationResult::fail(SeparationError::InvalidParameter,
                "band-stop edges must satisfy 0 < low < high < sampleRate/2");
        }
        return ValidationResult::ok();
    }
};

// =============================================================================
// Result
// =============================================================================

/// @brief Stems of one separation run
struct SeparationResult {
    SeparationError error = SeparationError::Success;
    std::string errorMessage;

    std::vector<float> harmonic;       ///< Tonal stem, input length
    std::vector<float> percussive;     ///< Transient stem, input length
    std::vector<float> harmonicClean;  ///< Band-stopped harmonic (empty if EQ off)

    double sampleRate = 0.0;
    size_t numFrames = 0;              ///< Spectrogram frames analysed
    size_t numBins = 0;                ///< Spectrogram bins per frame

    /// RMS of (harmonic + percussive - input) before normalization
    double reconstructionError = 0.0;

    /// Input samples that were NaN/Inf and replaced by zero
    size_t nonFiniteInputSamples = 0;

    [[nodiscard]] explicit operator bool() const noexcept {
        return error == SeparationError::Success;
    }

    [[nodiscard]] static SeparationResult failure(SeparationError code, std::string message) {
        SeparationResult r;
        r.error = code;
        r.errorMessage = std::move(message);
        return r;
    }
};

// =============================================================================
// HarmonicPercussiveSeparator Class
// =============================================================================

/// @brief Median-filter HPSS of a mono waveform into harmonic and percussive stems
///
/// Stateless between calls apart from its configuration; one instance may be
/// reused for any number of inputs. Distinct instances may run concurrently.
class HarmonicPercussiveSeparator {
public:
    HarmonicPercussiveSeparator() = default;
    explicit HarmonicPercussiveSeparator(HPSSConfig config)
        : config_(std::move(config)) {}

    void setConfig(const HPSSConfig& config) { config_ = config; }
    [[nodiscard]] const HPSSConfig& config() const noexcept { return config_; }

    /// @brief Separate a waveform
    /// @param input Mono samples (any range; NaN/Inf treated as 0)
    /// @param numSamples Length of input
    /// @param sampleRate Sample rate in Hz
    /// @return InvalidParameter / EmptyInput before any work on bad arguments
    [[nodiscard]] SeparationResult separate(const float* input, size_t numSamples,
                                            double sampleRate) const {
        if (ValidationResult check = config_.validateFor(sampleRate); !check) {
            return SeparationResult::failure(check.error, std::move(check.errorMessage));
        }
        if (input == nullptr || numSamples == 0) {
            return SeparationResult::failure(SeparationError::EmptyInput,
                                             "input waveform is empty");
        }

        SeparationResult result;
        result.sampleRate = sampleRate;

        std::vector<float> mixture(input, input + numSamples);
        result.nonFiniteInputSamples = replaceNonFiniteBulk(mixture.data(), mixture.size());

        // Transform
        const TransformParams params = config_.transformParams();
        STFT stft;
        if (ValidationResult check = stft.prepare(params); !check) {
            return SeparationResult::failure(check.error, std::move(check.errorMessage));
        }
        // Masks do not depend on input scale: analyse at unit peak so that
        // magnitudes stay far from float overflow for any finite input
        const float inputPeak = peakAbsBulk(mixture.data(), mixture.size());
        std::vector<float> analysisInput = mixture;
        if (inputPeak > 0.0f) {
            divideBulk(analysisInput.data(), analysisInput.size(), inputPeak);
        }
        const Spectrogram spectrogram = stft.analyze(analysisInput.data(),
                                                     analysisInput.size());
        result.numFrames = spectrogram.numFrames();
        result.numBins = spectrogram.numBins();

        // Classify: both views filter the same immutable magnitudes
        const MagnitudeMatrix magnitudes = computeMagnitudes(spectrogram);
        const MagnitudeMatrix harmonicEnh = Classifier::harmonicEnhancement(
            magnitudes, static_cast<size_t>(config_.filterLengthTime), config_.boundary);
        const MagnitudeMatrix percussiveEnh = Classifier::percussiveEnhancement(
            magnitudes, static_cast<size_t>(config_.filterLengthFreq), config_.boundary);
        const MaskPair masks = Classifier::maskFromEnhancements(
            harmonicEnh, percussiveEnh, config_.power, config_.mode);

        if (!masksAreFinite(masks)) {
            return SeparationResult::failure(SeparationError::NumericInstability,
                                             "mask computation produced a non-finite value");
        }

        // Synthesize
        StemPairResult stems = Masking::synthesizeStems(spectrogram, masks, params, numSamples);
        if (!stems) {
            return SeparationResult::failure(stems.error, std::move(stems.errorMessage));
        }
        result.harmonic = std::move(stems.harmonic);
        result.percussive = std::move(stems.percussive);

        // Reconcile
        if (inputPeak > 0.0f) {
            rescale(result.harmonic, inputPeak);
            rescale(result.percussive, inputPeak);
        }
        replaceNonFiniteBulk(result.harmonic.data(), result.harmonic.size());
        replaceNonFiniteBulk(result.percussive.data(), result.percussive.size());
        result.reconstructionError = residualRms(result.harmonic, result.percussive, mixture);

        if (config_.bandStop.enabled) {
            BandStopEQ eq;
            if (ValidationResult check = eq.prepare(sampleRate, config_.bandStop.lowHz,
                                                    config_.bandStop.highHz); !check) {
                return SeparationResult::failure(check.error, std::move(check.errorMessage));
            }
            result.harmonicClean = eq.apply(result.harmonic);
            replaceNonFiniteBulk(result.harmonicClean.data(), result.harmonicClean.size());
        }

        if (config_.normalizeOutput) {
            Masking::normalizePeak(result.harmonic.data(), result.harmonic.size());
            Masking::normalizePeak(result.percussive.data(), result.percussive.size());
            Masking::normalizePeak(result.harmonicClean.data(), result.harmonicClean.size());
        }
        return result;
    }

    /// @brief Convenience overload for vectors
    [[nodiscard]] SeparationResult separate(const std::vector<float>& input,
                                            double sampleRate) const {
        return separate(input.data(), input.size(), sampleRate);
    }

private:
    static void rescale(std::vector<float>& samples, float gain) noexcept {
        for (float& x : samples) {
            x *= gain;
        }
    }

    [[nodiscard]] static bool masksAreFinite(const MaskPair& masks) noexcept {
        for (const MaskMatrix* m : {&masks.harmonic, &masks.percussive}) {
            const double* d = m->data();
            for (size_t i = 0; i < m->size(); ++i) {
                if (!std::isfinite(d[i])) return false;
            }
        }
        return true;
    }

    [[nodiscard]] static double residualRms(const std::vector<float>& harmonic,
                                            const std::vector<float>& percussive,
                                            const std::vector<float>& mixture) noexcept {
        double sum = 0.0;
        for (size_t i = 0; i < mixture.size(); ++i) {
            const double e = static_cast<double>(harmonic[i]) + percussive[i] - mixture[i];
            sum += e * e;
        }
        return std::sqrt(sum / static_cast<double>(mixture.size()));
    }

    HPSSConfig config_;
};

/// @brief One-shot separation with an explicit configuration
[[nodiscard]] inline SeparationResult separate(const std::vector<float>& waveform,
                                               double sampleRate,
                                               const HPSSConfig& config = {}) {
    return HarmonicPercussiveSeparator(config).separate(waveform, sampleRate);
}

} // namespace DSP
} // namespace Raga
