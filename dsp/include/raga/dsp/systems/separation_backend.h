// ==============================================================================
// Layer 3: System Component - Separation Backends
// ==============================================================================
// Two interchangeable ways of turning one waveform into named stems:
//
// - HPSSBackend   : the median-filter separator of this library
// - NeuralBackend : an opaque learned model supplied by the caller as a
//                   callable (e.g. a process wrapper around demucs)
//
// SeparationBackend is a closed std::variant of the two; runSeparation()
// dispatches with std::visit and normalizes both outcomes into a StemSet.
// The neural path is never retried here; retry policy belongs to the caller.
// ==============================================================================

#pragma once

#include <raga/dsp/core/separation_error.h>
#include <raga/dsp/core/spectral_simd.h>
#include <raga/dsp/systems/hpss_separator.h>

#include <cmath>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace Raga {
namespace DSP {

// =============================================================================
// Stems
// =============================================================================

/// Stem names produced by the HPSS backend
inline constexpr std::string_view kHarmonicStem = "harmonic";
inline constexpr std::string_view kPercussiveStem = "percussive";
inline constexpr std::string_view kHarmonicCleanStem = "harmonic_clean";

/// @brief One named output waveform
struct Stem {
    std::string name;
    std::vector<float> samples;
};

/// @brief All stems of one backend run
struct StemSet {
    SeparationError error = SeparationError::Success;
    std::string errorMessage;
    std::vector<Stem> stems;
    double sampleRate = 0.0;
    std::string backend;  ///< "hpss" or the neural model name

    [[nodiscard]] explicit operator bool() const noexcept {
        return error == SeparationError::Success;
    }

    /// @return Stem with the given name, or nullptr
    [[nodiscard]] const Stem* find(std::string_view name) const noexcept {
        for (const auto& stem : stems) {
            if (stem.name == name) return &stem;
        }
        return nullptr;
    }
};

/// @brief What a learned model hands back
struct NeuralSeparation {
    SeparationError error = SeparationError::Success;
    std::string errorMessage;
    std::vector<Stem> stems;

    [[nodiscard]] explicit operator bool() const noexcept {
        return error == SeparationError::Success;
    }
};

/// @brief Opaque learned separator: waveform + sample rate -> named stems
/// @note Expected to report ModelUnavailable or ResourceExhausted on failure
using NeuralSeparateFn =
    std::function<NeuralSeparation(const std::vector<float>& waveform, double sampleRate)>;

// =============================================================================
// Backends
// =============================================================================

/// @brief Median-filter HPSS
struct HPSSBackend {
    HPSSConfig config;
};

/// @brief Caller-provided learned model
struct NeuralBackend {
    std::string modelName = "htdemucs_ft";
    NeuralSeparateFn separate;
};

using SeparationBackend = std::variant<HPSSBackend, NeuralBackend>;

/// @brief Short label for logs
[[nodiscard]] inline std::string backendName(const SeparationBackend& backend) {
    return std::visit([](const auto& b) -> std::string {
        using T = std::decay_t<decltype(b)>;
        if constexpr (std::is_same_v<T, HPSSBackend>) {
            return "hpss";
        } else {
            return b.modelName;
        }
    }, backend);
}

// =============================================================================
// Dispatch
// =============================================================================

namespace detail {

[[nodiscard]] inline StemSet failedStemSet(SeparationError code, std::string message,
                                           std::string backend) {
    StemSet set;
    set.error = code;
    set.errorMessage = std::move(message);
    set.backend = std::move(backend);
    return set;
}

[[nodiscard]] inline StemSet runBackend(const HPSSBackend& backend,
                                        const std::vector<float>& waveform,
                                        double sampleRate) {
    SeparationResult result = HarmonicPercussiveSeparator(backend.config)
                                  .separate(waveform, sampleRate);
    if (!result) {
        return failedStemSet(result.error, std::move(result.errorMessage), "hpss");
    }

    StemSet set;
    set.sampleRate = sampleRate;
    set.backend = "hpss";
    set.stems.push_back({std::string(kHarmonicStem), std::move(result.harmonic)});
    set.stems.push_back({std::string(kPercussiveStem), std::move(result.percussive)});
    if (backend.config.bandStop.enabled) {
        set.stems.push_back({std::string(kHarmonicCleanStem), std::move(result.harmonicClean)});
    }
    return set;
}

[[nodiscard]] inline StemSet runBackend(const NeuralBackend& backend,
                                        const std::vector<float>& waveform,
                                        double sampleRate) {
    if (!backend.separate) {
        return failedStemSet(SeparationError::ModelUnavailable,
                             "no implementation bound for model '" + backend.modelName + "'",
                             backend.modelName);
    }
    if (!std::isfinite(sampleRate) || sampleRate <= 0.0) {
        return failedStemSet(SeparationError::InvalidParameter,
                             "sampleRate must be positive", backend.modelName);
    }
    if (waveform.empty()) {
        return failedStemSet(SeparationError::EmptyInput, "input waveform is empty",
                             backend.modelName);
    }

    NeuralSeparation separation = backend.separate(waveform, sampleRate);
    if (!separation) {
        return failedStemSet(separation.error, std::move(separation.errorMessage),
                             backend.modelName);
    }
    if (separation.stems.empty()) {
        return failedStemSet(SeparationError::ModelUnavailable,
                             "model '" + backend.modelName + "' returned no stems",
                             backend.modelName);
    }

    StemSet set;
    set.sampleRate = sampleRate;
    set.backend = backend.modelName;
    set.stems = std::move(separation.stems);
    for (auto& stem : set.stems) {
        // Models may pad to their own block size
        stem.samples.resize(waveform.size(), 0.0f);
        replaceNonFiniteBulk(stem.samples.data(), stem.samples.size());
    }
    return set;
}

} // namespace detail

/// @brief Run whichever backend is selected
[[nodiscard]] inline StemSet runSeparation(const SeparationBackend& backend,
                                           const std::vector<float>& waveform,
                                           double sampleRate) {
    return std::visit([&](const auto& b) {
        return detail::runBackend(b, waveform, sampleRate);
    }, backend);
}

} // namespace DSP
} // namespace Raga
