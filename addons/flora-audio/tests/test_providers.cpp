/**
 * @file test_providers.cpp
 * @brief Unit tests for the synthetic signal and provider selection
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <flora/audio/audio_provider.h>
#include <flora/audio/synthetic_signal.h>
#include <string>

using namespace flora;
using namespace flora::audio;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

TEST_CASE("Synthetic signal values", "[audio][synthetic]") {
    SECTION("midpoints at t = 0 with bass in antiphase") {
        BandEnergies e = syntheticEnergies(0.0);
        REQUIRE_THAT(e.volume, WithinRel(7500.0f, 1e-5f));
        REQUIRE_THAT(e.bass, WithinRel(5e5f, 1e-5f));
        REQUIRE_THAT(e.mids, WithinRel(5e4f, 1e-5f));
        REQUIRE_THAT(e.treble, WithinRel(5e3f, 1e-5f));
    }

    SECTION("peaks of volume meet troughs of bass") {
        // sin(2t) = 1
        BandEnergies e = syntheticEnergies(PI / 4.0);
        REQUIRE_THAT(e.volume, WithinRel(15000.0f, 1e-5f));
        REQUIRE_THAT(e.bass, WithinAbs(0.0f, 1.0f));
    }

    SECTION("never negative") {
        for (int i = 0; i < 1000; i++) {
            BandEnergies e = syntheticEnergies(i * 0.0137);
            for (size_t b = 0; b < BandLevels::COUNT; b++) {
                REQUIRE(e[b] >= 0.0f);
            }
        }
    }
}

TEST_CASE("SyntheticAudioProvider", "[audio][synthetic]") {
    SECTION("advances one tick per read") {
        SyntheticAudioProvider provider(50.0f);
        provider.read();
        provider.read();
        REQUIRE_THAT(provider.time(), WithinAbs(0.04, 1e-12));
    }

    SECTION("two providers produce the same sequence") {
        SyntheticAudioProvider a(60.0f);
        SyntheticAudioProvider b(60.0f);
        for (int i = 0; i < 120; i++) {
            BandEnergies ea = a.read();
            BandEnergies eb = b.read();
            REQUIRE(ea.bass == eb.bass);
            REQUIRE(ea.treble == eb.treble);
        }
    }

    SECTION("start time offsets the sequence") {
        SyntheticAudioProvider provider(60.0f, 1.5);
        BandEnergies e = provider.read();
        REQUIRE(e.mids == syntheticEnergies(1.5).mids);
    }

    SECTION("invalid rate falls back to 60") {
        SyntheticAudioProvider provider(0.0f);
        provider.read();
        REQUIRE_THAT(provider.time(), WithinAbs(1.0 / 60.0, 1e-12));
    }
}

TEST_CASE("Provider selection", "[audio][provider]") {
    AudioConfig config;

    SECTION("synthetic when requested") {
        config.synthetic = true;
        auto provider = openAudioProvider(config, 60.0f);
        REQUIRE(provider);
        REQUIRE(std::string(provider->name()) == "synthetic");

        BandEnergies e = provider->read();
        REQUIRE(e.volume > 0.0f);
    }

    SECTION("an unopened capture provider reads silence") {
        CaptureAudioProvider capture(config);
        REQUIRE(std::string(capture.name()) == "capture");

        BandEnergies e = capture.read();
        REQUIRE(e.volume == 0.0f);
        REQUIRE(e.bass == 0.0f);
    }
}
