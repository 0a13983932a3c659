// ==============================================================================
// Layer 3: System Tests - Harmonic/Percussive Separator
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <raga/dsp/core/spectral_simd.h>
#include <raga/dsp/primitives/stft.h>
#include <raga/dsp/systems/hpss_separator.h>

#include <signal_metrics.h>
#include <test_signals.h>

#include <cmath>
#include <initializer_list>
#include <limits>
#include <vector>

using namespace Raga::DSP;
using namespace Raga::DSP::TestUtils;
using Catch::Approx;

namespace {

constexpr double kSampleRate = 44100.0;
constexpr size_t kTwoSeconds = 88200;

HPSSConfig unnormalized() {
    HPSSConfig config;
    config.normalizeOutput = false;
    return config;
}

} // namespace

// ==============================================================================
// Scenarios
// ==============================================================================

TEST_CASE("Pure tone goes to the harmonic stem", "[hpss][separator][scenario]") {
    const auto tone = TestHelpers::makeSine(kTwoSeconds, 440.0f, 44100.0f, 0.8f);

    const SeparationResult r = separate(tone, kSampleRate);
    REQUIRE(static_cast<bool>(r));
    REQUIRE(r.harmonic.size() == tone.size());
    REQUIRE(r.percussive.size() == tone.size());

    const double inputRms = SignalMetrics::rms(tone);
    REQUIRE(SignalMetrics::rms(r.harmonic) / inputRms == Approx(1.0).margin(0.05));
    REQUIRE(SignalMetrics::rms(r.percussive) / inputRms < 0.05);
}

TEST_CASE("Click train goes to the percussive stem", "[hpss][separator][scenario]") {
    const auto clicks = TestHelpers::makeClickTrain(kTwoSeconds, 11025, 5000, 0.9f);

    const SeparationResult r = separate(clicks, kSampleRate);
    REQUIRE(static_cast<bool>(r));

    const double inputRms = SignalMetrics::rms(clicks);
    REQUIRE(SignalMetrics::rms(r.percussive) / inputRms == Approx(1.0).margin(0.05));
    REQUIRE(SignalMetrics::rms(r.harmonic) / inputRms < 0.05);
}

TEST_CASE("Tone plus clicks splits both ways", "[hpss][separator][scenario]") {
    const auto tone = TestHelpers::makeHarmonicTone(kTwoSeconds, 220.0f, 44100.0f);
    const auto clicks = TestHelpers::makeClickTrain(kTwoSeconds, 11025, 3000, 0.9f);
    const auto mixture = TestHelpers::mix(tone, clicks);

    const SeparationResult r = separate(mixture, kSampleRate, unnormalized());
    REQUIRE(static_cast<bool>(r));

    // Each stem is closer to its own source than to the other one
    REQUIRE(SignalMetrics::calculateSNR(r.harmonic, tone) > 10.0);
    REQUIRE(SignalMetrics::calculateSNR(r.percussive, clicks)
            > SignalMetrics::calculateSNR(r.percussive, tone));
}

// ==============================================================================
// Reconstruction
// ==============================================================================

TEST_CASE("Soft stems sum to the mixture", "[hpss][separator][reconstruction]") {
    const auto mixture = TestHelpers::mix(
        TestHelpers::mix(TestHelpers::makeHarmonicTone(30000, 196.0f, 44100.0f),
                         TestHelpers::makeClickTrain(30000, 7000, 1234, 0.7f)),
        TestHelpers::makeWhiteNoise(30000, 0.05f, 8));

    const SeparationResult r = separate(mixture, kSampleRate, unnormalized());
    REQUIRE(static_cast<bool>(r));
    REQUIRE(SignalMetrics::sumResidualRms(r.harmonic, r.percussive, mixture) < 1e-4);
    REQUIRE(r.reconstructionError < 1e-4);
}

TEST_CASE("Binary stems partition the mixture", "[hpss][separator][binary]") {
    const auto mixture = TestHelpers::mix(TestHelpers::makeSine(20000, 330.0f, 44100.0f, 0.5f),
                                          TestHelpers::makeClickTrain(20000, 5000, 700, 0.5f));
    HPSSConfig config = unnormalized();
    config.mode = MaskMode::Binary;

    const SeparationResult r = separate(mixture, kSampleRate, config);
    REQUIRE(static_cast<bool>(r));
    REQUIRE(SignalMetrics::sumResidualRms(r.harmonic, r.percussive, mixture) < 1e-4);
}

TEST_CASE("Result dimensions follow the framing", "[hpss][separator]") {
    const auto x = TestHelpers::makeWhiteNoise(12345, 0.3f, 4);
    HPSSConfig config;
    config.windowSize = 1024;
    config.hopSize = 256;

    const SeparationResult r = separate(x, kSampleRate, config);
    REQUIRE(static_cast<bool>(r));
    REQUIRE(r.numFrames == frameCount(12345, 1024, 256));
    REQUIRE(r.numBins == 513);
    REQUIRE(r.harmonic.size() == 12345);
    REQUIRE(r.percussive.size() == 12345);
    REQUIRE(r.sampleRate == kSampleRate);
}

// ==============================================================================
// Edge Cases
// ==============================================================================

TEST_CASE("Silence yields silent stems", "[hpss][separator][silence]") {
    const std::vector<float> silence(kTwoSeconds / 4, 0.0f);

    for (MaskMode mode : {MaskMode::Soft, MaskMode::Binary}) {
        HPSSConfig config;
        config.mode = mode;
        const SeparationResult r = separate(silence, kSampleRate, config);
        REQUIRE(static_cast<bool>(r));
        REQUIRE(SignalMetrics::isSilent(r.harmonic));
        REQUIRE(SignalMetrics::isSilent(r.percussive));
        REQUIRE(r.reconstructionError == 0.0);
    }
}

TEST_CASE("Non-finite input samples are treated as zero", "[hpss][separator][safety]") {
    auto x = TestHelpers::makeSine(20000, 440.0f, 44100.0f, 0.5f);
    x[100] = std::numeric_limits<float>::quiet_NaN();
    x[5000] = std::numeric_limits<float>::infinity();

    const SeparationResult r = separate(x, kSampleRate);
    REQUIRE(static_cast<bool>(r));
    REQUIRE(r.nonFiniteInputSamples == 2);
    for (size_t i = 0; i < x.size(); ++i) {
        REQUIRE(std::isfinite(r.harmonic[i]));
        REQUIRE(std::isfinite(r.percussive[i]));
    }
}

TEST_CASE("Huge finite input separates like unit-scale input", "[hpss][separator][safety]") {
    const auto unit = TestHelpers::mix(TestHelpers::makeSine(20000, 440.0f, 44100.0f, 0.5f),
                                       TestHelpers::makeClickTrain(20000, 4000, 300, 0.5f));
    HPSSConfig config = unnormalized();
    config.windowSize = 256;
    config.hopSize = 64;
    config.filterLengthTime = 7;
    config.filterLengthFreq = 7;
    const SeparationResult reference = separate(unit, kSampleRate, config);
    REQUIRE(static_cast<bool>(reference));

    for (float scale : {1e18f, 1e30f}) {
        std::vector<float> loud(unit);
        for (float& x : loud) x *= scale;

        const SeparationResult r = separate(loud, kSampleRate, config);
        REQUIRE(r.error == SeparationError::Success);
        for (size_t i = 0; i < loud.size(); ++i) {
            REQUIRE(std::isfinite(r.harmonic[i]));
            REQUIRE(std::isfinite(r.percussive[i]));
        }
        REQUIRE(SignalMetrics::rms(r.harmonic) / scale
                == Approx(SignalMetrics::rms(reference.harmonic)).epsilon(1e-3));
        REQUIRE(SignalMetrics::rms(r.percussive) / scale
                == Approx(SignalMetrics::rms(reference.percussive)).epsilon(1e-3));
        REQUIRE(r.reconstructionError / (SignalMetrics::rms(loud)) < 1e-4);
    }

    // Normalized output of a huge input is back at full scale
    HPSSConfig normalized = config;
    normalized.normalizeOutput = true;
    std::vector<float> loud(unit);
    for (float& x : loud) x *= 1e30f;
    const SeparationResult r = separate(loud, kSampleRate, normalized);
    REQUIRE(static_cast<bool>(r));
    REQUIRE(peakAbsBulk(r.percussive.data(), r.percussive.size()) <= 1.0f);
}

TEST_CASE("Normalized stems never exceed full scale", "[hpss][separator][normalize]") {
    const auto loud = TestHelpers::makeClickTrain(30000, 4000, 100, 8.0f);
    const SeparationResult r = separate(loud, kSampleRate);
    REQUIRE(static_cast<bool>(r));
    REQUIRE(peakAbsBulk(r.percussive.data(), r.percussive.size()) <= 1.0f);
    REQUIRE(peakAbsBulk(r.harmonic.data(), r.harmonic.size()) <= 1.0f);

    HPSSConfig raw;
    raw.normalizeOutput = false;
    const SeparationResult unscaled = separate(loud, kSampleRate, raw);
    REQUIRE(peakAbsBulk(unscaled.percussive.data(), unscaled.percussive.size()) > 1.0f);
}

TEST_CASE("Band-stop EQ adds a harmonic_clean stem", "[hpss][separator][eq]") {
    const auto tone = TestHelpers::makeHarmonicTone(kTwoSeconds / 2, 300.0f, 44100.0f);
    HPSSConfig config;
    config.bandStop.enabled = true;

    const SeparationResult r = separate(tone, kSampleRate, config);
    REQUIRE(static_cast<bool>(r));
    REQUIRE(r.harmonicClean.size() == tone.size());
    // Partials at 300..1800 Hz are inside the stop band
    REQUIRE(SignalMetrics::rms(r.harmonicClean) < 0.1 * SignalMetrics::rms(r.harmonic));

    config.bandStop.enabled = false;
    REQUIRE(separate(tone, kSampleRate, config).harmonicClean.empty());
}

// ==============================================================================
// Validation
// ==============================================================================

TEST_CASE("Invalid parameters fail before any work", "[hpss][separator][validate]") {
    const auto x = TestHelpers::makeWhiteNoise(4096, 0.5f);

    auto expectInvalid = [&](const HPSSConfig& config, double sampleRate = kSampleRate) {
        const SeparationResult r = separate(x, sampleRate, config);
        REQUIRE(r.error == SeparationError::InvalidParameter);
        REQUIRE_FALSE(r.errorMessage.empty());
        REQUIRE(r.harmonic.empty());
        REQUIRE(r.percussive.empty());
    };

    HPSSConfig config;
    SECTION("negative window") { config.windowSize = -1; expectInvalid(config); }
    SECTION("zero hop") { config.hopSize = 0; expectInvalid(config); }
    SECTION("hop above window") { config.hopSize = 4096; expectInvalid(config); }
    SECTION("even time kernel") { config.filterLengthTime = 30; expectInvalid(config); }
    SECTION("even frequency kernel") { config.filterLengthFreq = 16; expectInvalid(config); }
    SECTION("zero power") { config.power = 0.0f; expectInvalid(config); }
    SECTION("zero sample rate") { expectInvalid(config, 0.0); }
    SECTION("band-stop above Nyquist") {
        config.bandStop.enabled = true;
        config.bandStop.highHz = 30000.0;
        expectInvalid(config);
    }
}

TEST_CASE("Empty input fails with EmptyInput", "[hpss][separator][validate]") {
    const SeparationResult r = separate(std::vector<float>{}, kSampleRate);
    REQUIRE(r.error == SeparationError::EmptyInput);
    REQUIRE_FALSE(static_cast<bool>(r));

    // Parameter errors win over the empty check
    HPSSConfig bad;
    bad.windowSize = -1;
    REQUIRE(separate(std::vector<float>{}, kSampleRate, bad).error
            == SeparationError::InvalidParameter);
}

TEST_CASE("Separator instance is reusable", "[hpss][separator]") {
    HarmonicPercussiveSeparator separator;
    REQUIRE(separator.config().windowSize == 2048);

    const auto a = TestHelpers::makeSine(10000, 440.0f, 44100.0f, 0.5f);
    const SeparationResult first = separator.separate(a, kSampleRate);
    const SeparationResult second = separator.separate(a, kSampleRate);
    REQUIRE(first.harmonic == second.harmonic);
    REQUIRE(first.percussive == second.percussive);
}
