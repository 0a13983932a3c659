// ==============================================================================
// Layer 2: DSP Processor Tests - Spectral Masking & Stem Synthesis
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <raga/dsp/processors/spectral_masking.h>

#include <signal_metrics.h>
#include <test_signals.h>

#include <cmath>
#include <vector>

using namespace Raga::DSP;
using namespace Raga::DSP::TestUtils;
using Catch::Approx;

// ==============================================================================
// applyMask
// ==============================================================================

TEST_CASE("applyMask scales magnitude and keeps phase", "[masking][apply]") {
    Spectrogram s(2, 3);
    s.at(0, 0) = {3.0f, 4.0f};
    s.at(0, 1) = {-1.0f, 1.0f};
    s.at(1, 2) = {0.0f, -2.0f};

    MaskMatrix mask(2, 3, 0.5);
    mask.at(1, 2) = 0.0;

    const Spectrogram out = Masking::applyMask(s, mask);
    REQUIRE(out.sameShape(s));
    REQUIRE(out.at(0, 0).magnitude() == Approx(2.5f));
    REQUIRE(out.at(0, 0).phase() == Approx(s.at(0, 0).phase()));
    REQUIRE(out.at(0, 1).phase() == Approx(s.at(0, 1).phase()));
    REQUIRE(out.at(1, 2).magnitude() == 0.0f);

    // Input untouched
    REQUIRE(s.at(0, 0).real == 3.0f);
}

TEST_CASE("applyMask with mismatched shape is empty", "[masking][apply]") {
    REQUIRE(Masking::applyMask(Spectrogram(2, 3), MaskMatrix(3, 2)).empty());
}

// ==============================================================================
// synthesizeStems
// ==============================================================================

TEST_CASE("Complementary masks reconstruct the mixture", "[masking][synthesis]") {
    const auto x = TestHelpers::makeWhiteNoise(8000, 0.5f, 5);
    const TransformParams params{1024, 256};
    const TransformResult fwd = forwardTransform(x.data(), x.size(), params);
    REQUIRE(static_cast<bool>(fwd));
    const Spectrogram& s = fwd.spectrogram;

    SECTION("all to harmonic") {
        const MaskPair masks{MaskMatrix(s.numFrames(), s.numBins(), 1.0),
                             MaskMatrix(s.numFrames(), s.numBins(), 0.0)};
        const StemPairResult stems = Masking::synthesizeStems(s, masks, params, x.size());
        REQUIRE(static_cast<bool>(stems));
        REQUIRE(SignalMetrics::maxAbsDifference(stems.harmonic, x) < 1e-4);
        REQUIRE(SignalMetrics::rms(stems.percussive) == 0.0);
    }

    SECTION("graded split") {
        MaskPair masks{MaskMatrix(s.numFrames(), s.numBins()),
                       MaskMatrix(s.numFrames(), s.numBins())};
        for (size_t t = 0; t < s.numFrames(); ++t) {
            for (size_t k = 0; k < s.numBins(); ++k) {
                const double m = static_cast<double>(k) / static_cast<double>(s.numBins() - 1);
                masks.harmonic.at(t, k) = m;
                masks.percussive.at(t, k) = 1.0 - m;
            }
        }
        const StemPairResult stems = Masking::synthesizeStems(s, masks, params, x.size());
        REQUIRE(stems.harmonic.size() == x.size());
        REQUIRE(SignalMetrics::sumResidualRms(stems.harmonic, stems.percussive, x) < 1e-5);
    }
}

TEST_CASE("synthesizeStems errors", "[masking][synthesis]") {
    const Spectrogram s(5, 513);
    const MaskPair wrong{MaskMatrix(5, 100), MaskMatrix(5, 100)};

    REQUIRE(Masking::synthesizeStems(s, wrong, {1024, 256}, 1000).error
            == SeparationError::InvalidParameter);

    const MaskPair right{MaskMatrix(5, 513), MaskMatrix(5, 513)};
    REQUIRE(Masking::synthesizeStems(s, right, {1024, 2048}, 1000).error
            == SeparationError::InvalidParameter);
    REQUIRE(Masking::synthesizeStems(s, right, {2048, 512}, 1000).error
            == SeparationError::InvalidParameter);
}

// ==============================================================================
// Normalization
// ==============================================================================

TEST_CASE("normalize scales only clipping stems", "[masking][normalize]") {
    SECTION("peak above one is brought to exactly one") {
        std::vector<float> x = {0.5f, -2.5f, 1.25f};
        x = Masking::normalize(x);
        REQUIRE(x[1] == -1.0f);
        REQUIRE(x[0] == Approx(0.2f));
    }

    SECTION("in-range stem is unchanged") {
        const std::vector<float> x = {0.5f, -0.9f, 1.0f};
        REQUIRE(Masking::normalize(x) == x);
    }

    SECTION("silent stem is unchanged") {
        const std::vector<float> x(64, 0.0f);
        REQUIRE(Masking::normalize(x) == x);
    }

    SECTION("empty stem") {
        REQUIRE(Masking::normalize({}).empty());
        REQUIRE(Masking::normalizePeak(nullptr, 0) == 1.0f);
    }
}

TEST_CASE("normalize is idempotent", "[masking][normalize]") {
    for (uint32_t seed = 1; seed <= 5; ++seed) {
        const auto x = TestHelpers::makeWhiteNoise(1000, 3.0f * static_cast<float>(seed), seed);
        const auto once = Masking::normalize(x);
        const auto twice = Masking::normalize(once);
        REQUIRE(once == twice);
    }
}
