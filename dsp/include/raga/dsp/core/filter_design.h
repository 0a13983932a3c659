// ==============================================================================
// Layer 0: Core Utility - IIR Filter Design
// ==============================================================================
// Analog-prototype filter design mapped to second-order sections through the
// bilinear transform. Computation runs in double precision; callers convert
// sections to their runtime coefficient type.
//
// Butterworth band-stop:
//   1. Pre-warp band edges:      w = 2*fs*tan(pi*f/fs)
//   2. Prototype poles:          p_k = exp(j*pi*(2k + N + 1) / (2N))
//   3. LP -> BS substitution:    s_lp = bw*s / (s^2 + w0^2)
//   4. Bilinear map:             z = (2fs + s) / (2fs - s)
//   5. Pair conjugate poles into sections, zeros on the unit circle at w0,
//      each section normalized to unity gain at Nyquist.
// ==============================================================================

#pragma once

#include <raga/dsp/core/math_constants.h>

#include <array>
#include <cmath>
#include <complex>
#include <initializer_list>
#include <cstddef>

namespace Raga {
namespace DSP {

/// @brief Double-precision second-order section (a0 = 1 implied)
struct SecondOrderSection {
    double b0 = 1.0;
    double b1 = 0.0;
    double b2 = 0.0;
    double a1 = 0.0;
    double a2 = 0.0;

    /// Magnitude response at normalized angular frequency omega (rad/sample)
    [[nodiscard]] double magnitudeAt(double omega) const noexcept {
        const std::complex<double> z1 = std::polar(1.0, -omega);
        const std::complex<double> z2 = z1 * z1;
        const std::complex<double> num = b0 + b1 * z1 + b2 * z2;
        const std::complex<double> den = 1.0 + a1 * z1 + a2 * z2;
        return std::abs(num / den);
    }
};

namespace FilterDesign {

/// @brief Check that band-stop edges are usable at the given sample rate
[[nodiscard]] inline bool isValidBand(double lowHz, double highHz, double sampleRate) noexcept {
    return sampleRate > 0.0 && lowHz > 0.0 && lowHz < highHz && highHz < 0.5 * sampleRate;
}

/// @brief Design an Order-th order Butterworth band-stop as Order biquads
///
/// The resulting filter has 2*Order poles (an Order-th order prototype
/// doubled by the band transformation), matching the convention of
/// butter(Order, [low, high], 'bandstop').
///
/// @tparam Order Prototype order (even)
/// @param lowHz Lower stop-band edge (-3 dB)
/// @param highHz Upper stop-band edge (-3 dB)
/// @param sampleRate Sample rate in Hz
/// @pre isValidBand(lowHz, highHz, sampleRate)
template <size_t Order>
[[nodiscard]] std::array<SecondOrderSection, Order> butterworthBandStop(
    double lowHz,
    double highHz,
    double sampleRate
) noexcept {
    static_assert(Order >= 2 && Order % 2 == 0,
        "band-stop design pairs conjugate prototype poles: Order must be even");

    std::array<SecondOrderSection, Order> sections{};
    if (!isValidBand(lowHz, highHz, sampleRate)) {
        return sections;  // bypass sections
    }

    const double fs2 = 2.0 * sampleRate;
    const double wl = fs2 * std::tan(kPiD * lowHz / sampleRate);
    const double wh = fs2 * std::tan(kPiD * highHz / sampleRate);
    const double w0Sq = wl * wh;
    const double bw = wh - wl;

    // Zeros of every section sit at z = exp(+/- j*omega0)
    const std::complex<double> zeroS(0.0, std::sqrt(w0Sq));
    const std::complex<double> zeroZ = (fs2 + zeroS) / (fs2 - zeroS);
    const double cosOmega0 = zeroZ.real() / std::abs(zeroZ);

    size_t index = 0;
    for (size_t k = 0; k < Order; ++k) {
        const double angle = kPiD * static_cast<double>(2 * k + Order + 1)
                           / static_cast<double>(2 * Order);
        const std::complex<double> p = std::polar(1.0, angle);

        // s^2 - (bw/p) s + w0^2 = 0
        const std::complex<double> half = bw / (2.0 * p);
        const std::complex<double> root = std::sqrt(half * half - w0Sq);

        for (const auto& s : {half + root, half - root}) {
            // Keep upper-half-plane poles; the conjugate partner comes from
            // the conjugate prototype pole
            if (s.imag() <= 0.0 || index >= Order) continue;

            const std::complex<double> z = (fs2 + s) / (fs2 - s);
            SecondOrderSection& section = sections[index++];
            section.a1 = -2.0 * z.real();
            section.a2 = std::norm(z);
            section.b0 = 1.0;
            section.b1 = -2.0 * cosOmega0;
            section.b2 = 1.0;

            // Unity gain at Nyquist (z = -1)
            const double gain = (1.0 - section.a1 + section.a2)
                              / (section.b0 - section.b1 + section.b2);
            section.b0 *= gain;
            section.b1 *= gain;
            section.b2 *= gain;
        }
    }

    return sections;
}

} // namespace FilterDesign

} // namespace DSP
} // namespace Raga
