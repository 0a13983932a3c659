// ==============================================================================
// Layer 0: Core Tests - Window Functions
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <raga/dsp/core/window_functions.h>

#include <algorithm>
#include <cmath>
#include <vector>

using namespace Raga::DSP;
using Catch::Approx;

TEST_CASE("Hann window is periodic", "[window][hann]") {
    const auto w = Window::generate(WindowType::Hann, 8);
    REQUIRE(w.size() == 8);
    REQUIRE(w[0] == Approx(0.0f).margin(1e-7f));
    REQUIRE(w[4] == Approx(1.0f));
    // DFT-even symmetry: w[n] == w[N - n]
    for (size_t n = 1; n < 8; ++n) {
        REQUIRE(w[n] == Approx(w[8 - n]).margin(1e-6f));
    }
}

TEST_CASE("Hamming and Blackman coefficients", "[window]") {
    SECTION("Hamming endpoints sit at 0.08") {
        const auto w = Window::generate(WindowType::Hamming, 64);
        REQUIRE(w[0] == Approx(0.08f).margin(1e-6f));
        REQUIRE(w[32] == Approx(1.0f));
    }

    SECTION("Blackman is non-negative with unit peak") {
        const auto w = Window::generate(WindowType::Blackman, 64);
        REQUIRE(*std::min_element(w.begin(), w.end()) >= 0.0f);
        REQUIRE(w[32] == Approx(1.0f));
    }
}

TEST_CASE("minSquaredOverlapGain finds uncovered positions", "[window][overlap]") {
    const auto hann = Window::generate(WindowType::Hann, 1024);

    SECTION("overlapping Hann frames cover every position") {
        // sin^4 + cos^4 bottoms out at 0.5 halfway between frame starts
        REQUIRE(Window::minSquaredOverlapGain(hann.data(), hann.size(), 512)
                == Approx(0.5f).margin(1e-4f));
        REQUIRE(Window::minSquaredOverlapGain(hann.data(), hann.size(), 256)
                == Approx(1.5f).margin(1e-4f));
    }

    SECTION("hop equal to window exposes the Hann zero") {
        REQUIRE(Window::minSquaredOverlapGain(hann.data(), hann.size(), 1024)
                <= kMinOverlapGain);
    }

    SECTION("Hamming never reaches zero") {
        const auto hamming = Window::generate(WindowType::Hamming, 1024);
        REQUIRE(Window::minSquaredOverlapGain(hamming.data(), hamming.size(), 1024)
                == Approx(0.0064f).margin(1e-4f));
    }

    SECTION("invalid arguments report no coverage") {
        REQUIRE(Window::minSquaredOverlapGain(hann.data(), hann.size(), 0) == 0.0f);
        REQUIRE(Window::minSquaredOverlapGain(hann.data(), hann.size(), 2048) == 0.0f);
        REQUIRE(Window::minSquaredOverlapGain(nullptr, 16, 4) == 0.0f);
    }
}

TEST_CASE("squaredOverlapGain accumulates w^2 per hop", "[window][overlap]") {
    const auto w = Window::generate(WindowType::Hann, 16);
    const auto gain = Window::squaredOverlapGain(w.data(), w.size(), 4, 5);

    REQUIRE(gain.size() == (5 - 1) * 4 + 16);

    // Fully overlapped region: periodic Hann^2 at 75% overlap sums to 1.5
    for (size_t i = 12; i < 20; ++i) {
        REQUIRE(gain[i] == Approx(1.5f).margin(1e-5f));
    }
    // First sample only sees frame 0
    REQUIRE(gain[1] == Approx(w[1] * w[1]));
}

TEST_CASE("windowTypeName", "[window]") {
    REQUIRE(windowTypeName(WindowType::Hann) == "hann");
    REQUIRE(windowTypeName(WindowType::Hamming) == "hamming");
    REQUIRE(windowTypeName(WindowType::Blackman) == "blackman");
}
