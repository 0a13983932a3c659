// ==============================================================================
// Layer 0: Core Tests - Signal Statistics and dB Conversion
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <raga/dsp/core/db_utils.h>
#include <raga/dsp/core/math_constants.h>
#include <raga/dsp/core/separation_error.h>
#include <raga/dsp/core/signal_stats.h>

#include <cmath>
#include <vector>

using namespace Raga::DSP;
using Catch::Approx;

TEST_CASE("measureSignal on a full-scale sine", "[signal_stats]") {
    const double sampleRate = 48000.0;
    std::vector<float> sine(48000);
    for (size_t i = 0; i < sine.size(); ++i) {
        sine[i] = std::sin(kTwoPi * 1000.0f * static_cast<float>(i) / 48000.0f);
    }

    const SignalStats stats = measureSignal(sine.data(), sine.size(), sampleRate);

    REQUIRE(stats.numSamples == 48000);
    REQUIRE(stats.durationSeconds == Approx(1.0f));
    REQUIRE(stats.rms == Approx(1.0f / std::sqrt(2.0f)).margin(1e-4f));
    REQUIRE(stats.peak == Approx(1.0f).margin(1e-4f));
    REQUIRE(stats.rmsDb() == Approx(-3.0103f).margin(0.01f));
    REQUIRE(stats.peakDb() == Approx(0.0f).margin(0.01f));
}

TEST_CASE("measureSignal on silence and empty input", "[signal_stats]") {
    std::vector<float> silence(100, 0.0f);
    const SignalStats stats = measureSignal(silence.data(), silence.size(), 100.0);
    REQUIRE(stats.rms == 0.0f);
    REQUIRE(stats.rmsDb() == kSilenceFloorDb);

    const SignalStats empty = measureSignal(nullptr, 0, 44100.0);
    REQUIRE(empty.numSamples == 0);
    REQUIRE(empty.durationSeconds == 0.0f);
}

TEST_CASE("gainToDb and dbToGain", "[db_utils]") {
    REQUIRE(gainToDb(1.0f) == Approx(0.0f));
    REQUIRE(gainToDb(0.5f) == Approx(-6.0206f).margin(1e-3f));
    REQUIRE(gainToDb(0.0f) == kSilenceFloorDb);
    REQUIRE(gainToDb(-1.0f) == kSilenceFloorDb);
    REQUIRE(dbToGain(-6.0206f) == Approx(0.5f).margin(1e-4f));
    REQUIRE(dbToGain(0.0f) == Approx(1.0f));
}

TEST_CASE("ValidationResult and errorToString", "[separation_error]") {
    REQUIRE(static_cast<bool>(ValidationResult::ok()));

    const ValidationResult bad =
        ValidationResult::fail(SeparationError::InvalidParameter, "hop too large");
    REQUIRE_FALSE(static_cast<bool>(bad));
    REQUIRE(bad.errorMessage == "hop too large");

    REQUIRE(errorToString(SeparationError::EmptyInput) == "EmptyInput");
    REQUIRE(errorToString(SeparationError::ModelUnavailable) == "ModelUnavailable");
    REQUIRE(errorToString(SeparationError::ResourceExhausted) == "ResourceExhausted");
}
