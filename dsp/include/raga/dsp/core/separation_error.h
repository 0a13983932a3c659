// ==============================================================================
// Layer 0: Core Utility - Separation Error Codes
// ==============================================================================
// Error taxonomy shared by the transform, the separator pipeline and the
// separation backends. Results carry an error code plus a human-readable
// message instead of throwing, so every DSP entry point stays noexcept.
// ==============================================================================

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace Raga {
namespace DSP {

/// @brief Failure categories of a separation run
enum class SeparationError : uint8_t {
    Success,
    InvalidParameter,    ///< Bad configuration (sizes, hop > window, even kernels)
    EmptyInput,          ///< Zero-length waveform
    NumericInstability,  ///< Non-finite value escaped the guards (never expected)
    ModelUnavailable,    ///< Neural backend missing or not installed
    ResourceExhausted,   ///< Neural backend ran out of memory/compute
    IOError              ///< File layer could not read or write audio
};

/// @brief Stable identifier for logs and CLI messages
[[nodiscard]] constexpr std::string_view errorToString(SeparationError error) noexcept {
    switch (error) {
        case SeparationError::Success:            return "Success";
        case SeparationError::InvalidParameter:   return "InvalidParameter";
        case SeparationError::EmptyInput:         return "EmptyInput";
        case SeparationError::NumericInstability: return "NumericInstability";
        case SeparationError::ModelUnavailable:   return "ModelUnavailable";
        case SeparationError::ResourceExhausted:  return "ResourceExhausted";
        case SeparationError::IOError:            return "IOError";
    }
    return "Unknown";
}

/// @brief Outcome of a validation step: error code plus description
struct ValidationResult {
    SeparationError error = SeparationError::Success;
    std::string errorMessage;

    [[nodiscard]] static ValidationResult ok() { return {}; }

    [[nodiscard]] static ValidationResult fail(SeparationError code, std::string message) {
        return {code, std::move(message)};
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return error == SeparationError::Success;
    }
};

} // namespace DSP
} // namespace Raga
