// ==============================================================================
// Layer 1: DSP Primitive Tests - Biquad / Band-Stop Cascade
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <raga/dsp/primitives/biquad.h>

#include <signal_metrics.h>
#include <test_signals.h>

#include <limits>
#include <vector>

using namespace Raga::DSP;
using namespace Raga::DSP::TestUtils;
using Catch::Approx;

namespace {

constexpr float kSampleRate = 44100.0f;

/// RMS gain of a sine through the cascade, measured after settling
template <size_t N>
double steadyStateGain(BiquadCascade<N>& filter, float frequency) {
    auto x = TestHelpers::makeSine(2 * 44100, frequency, kSampleRate);
    const auto reference = x;
    filter.reset();
    filter.processBlock(x.data(), x.size());
    const size_t half = x.size() / 2;
    return SignalMetrics::rms(x.data() + half, half)
         / SignalMetrics::rms(reference.data() + half, half);
}

} // namespace

TEST_CASE("Default biquad is bypass", "[biquad]") {
    Biquad bq;
    REQUIRE(bq.coefficients().isBypass());
    REQUIRE(bq.process(0.75f) == 0.75f);
}

TEST_CASE("Biquad resets on non-finite input", "[biquad][safety]") {
    Biquad bq(BiquadCoefficients{0.5f, 0.2f, 0.1f, -0.3f, 0.1f});
    (void)bq.process(1.0f);
    REQUIRE(bq.process(std::numeric_limits<float>::quiet_NaN()) == 0.0f);
    // State cleared: next output is b0 * x only
    REQUIRE(bq.process(1.0f) == Approx(0.5f));
}

TEST_CASE("Band-stop cascade response", "[biquad][bandstop]") {
    BiquadCascade<4> filter;
    REQUIRE(filter.setButterworthBandStop(10.0, 4000.0, kSampleRate));
    REQUIRE(filter.order() == 8);

    for (size_t i = 0; i < filter.numStages(); ++i) {
        REQUIRE(filter.stage(i).coefficients().isStable());
    }

    SECTION("stop band attenuates") {
        REQUIRE(steadyStateGain(filter, 1000.0f) < 0.01);
        REQUIRE(steadyStateGain(filter, 300.0f) < 0.001);
    }

    SECTION("upper pass band is untouched") {
        REQUIRE(steadyStateGain(filter, 12000.0f) == Approx(1.0).margin(0.02));
    }
}

TEST_CASE("Band-stop rejects invalid edges", "[biquad][bandstop]") {
    BiquadCascade<4> filter;
    REQUIRE_FALSE(filter.setButterworthBandStop(4000.0, 10.0, kSampleRate));
    REQUIRE_FALSE(filter.setButterworthBandStop(10.0, 30000.0, kSampleRate));
    REQUIRE(filter.stage(0).coefficients().isBypass());
}
