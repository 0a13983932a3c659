// ==============================================================================
// Layer 0: Core Utilities
// db_utils.h - dB/Linear Conversion and Float Classification
// ==============================================================================
// No allocation, no locks, no exceptions, no I/O.
//
// Float classification works on IEEE 754 bit patterns so that it keeps
// working when a consumer compiles with -ffast-math (std::isnan may be
// optimized out under that flag).
// ==============================================================================

#pragma once

#include <bit>
#include <cmath>
#include <cstdint>

namespace Raga {
namespace DSP {

// ==============================================================================
// Constants
// ==============================================================================

/// Floor value for silence/zero gain in decibels.
/// Represents approximately 24-bit dynamic range (6.02 dB/bit * 24 = ~144 dB).
inline constexpr float kSilenceFloorDb = -144.0f;

/// Values below this magnitude are flushed to zero in recursive filters
inline constexpr float kDenormalThreshold = 1e-15f;

namespace detail {

/// NaN: exponent = 0xFF (all 1s), mantissa != 0
constexpr bool isNaN(float x) noexcept {
    const auto bits = std::bit_cast<std::uint32_t>(x);
    return ((bits & 0x7F800000u) == 0x7F800000u) && ((bits & 0x007FFFFFu) != 0);
}

/// Inf: exponent = 0xFF, mantissa == 0
constexpr bool isInf(float x) noexcept {
    const auto bits = std::bit_cast<std::uint32_t>(x);
    return (bits & 0x7FFFFFFFu) == 0x7F800000u;
}

/// Finite: exponent is not all 1s
constexpr bool isFiniteBits(float x) noexcept {
    const auto bits = std::bit_cast<std::uint32_t>(x);
    return (bits & 0x7F800000u) != 0x7F800000u;
}

/// Flush tiny values to zero to keep IIR state out of the denormal range
constexpr float flushDenormal(float x) noexcept {
    return (x > -kDenormalThreshold && x < kDenormalThreshold) ? 0.0f : x;
}

} // namespace detail

// ==============================================================================
// Functions
// ==============================================================================

/// Convert linear gain to decibels.
///
/// @param gain  Linear gain value
/// @return      Decibel value (clamped to kSilenceFloorDb minimum)
///
/// @note        Zero/negative/NaN input returns kSilenceFloorDb (-144 dB)
///
/// @example     gainToDb(1.0f)   -> 0.0f      (unity = 0 dB)
/// @example     gainToDb(0.5f)   -> ~-6.02f   (half amplitude)
/// @example     gainToDb(0.0f)   -> -144.0f   (silence floor)
[[nodiscard]] inline float gainToDb(float gain) noexcept {
    if (detail::isNaN(gain) || gain <= 0.0f) {
        return kSilenceFloorDb;
    }
    const float result = 20.0f * std::log10(gain);
    return (result < kSilenceFloorDb) ? kSilenceFloorDb : result;
}

/// Convert decibels to linear gain (NaN input returns 0).
[[nodiscard]] inline float dbToGain(float dB) noexcept {
    if (detail::isNaN(dB)) {
        return 0.0f;
    }
    return std::pow(10.0f, dB / 20.0f);
}

} // namespace DSP
} // namespace Raga
