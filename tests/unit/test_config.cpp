/**
 * @file test_config.cpp
 * @brief Unit tests for FloraConfig loading and validation
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <flora/config.h>
#include <filesystem>
#include <fstream>

using namespace flora;
using Catch::Matchers::WithinAbs;
using json = nlohmann::json;

TEST_CASE("FloraConfig defaults", "[config]") {
    FloraConfig config;

    REQUIRE(config.width == 1920);
    REQUIRE(config.height == 1080);
    REQUIRE(config.fps == 60);
    REQUIRE(config.seed == 0);
    REQUIRE(config.overlay);
    REQUIRE_FALSE(config.fullscreen);
    REQUIRE(config.frames == 0);
    REQUIRE(config.audio.sampleRate == 44100);
    REQUIRE(config.audio.frameSize == 2048);
    REQUIRE(config.audio.device == -1);
    REQUIRE_FALSE(config.audio.synthetic);
    REQUIRE_THAT(config.audio.bassHigh, WithinAbs(250.0f, 1e-6f));
    REQUIRE(config.validate() == 0);
}

TEST_CASE("FloraConfig loadJson", "[config]") {
    FloraConfig config;

    SECTION("overrides present keys and keeps the rest") {
        json j = {
            {"width", 1280},
            {"fps", 30},
            {"overlay", false},
            {"audio", {{"synthetic", true}, {"mids_high", 2500}}}
        };

        REQUIRE(config.loadJson(j));
        REQUIRE(config.width == 1280);
        REQUIRE(config.height == 1080);
        REQUIRE(config.fps == 30);
        REQUIRE_FALSE(config.overlay);
        REQUIRE(config.audio.synthetic);
        REQUIRE_THAT(config.audio.midsHigh, WithinAbs(2500.0f, 1e-6f));
    }

    SECTION("unknown keys are ignored") {
        REQUIRE(config.loadJson({{"palette", "autumn"}}));
        REQUIRE(config.width == 1920);
    }

    SECTION("wrong types are skipped and reported") {
        json j = {{"width", "wide"}, {"fps", 24}, {"overlay", 1}};

        REQUIRE_FALSE(config.loadJson(j));
        REQUIRE(config.width == 1920);
        REQUIRE(config.fps == 24);
        REQUIRE(config.overlay);
    }

    SECTION("fractional values are rejected for integer keys") {
        REQUIRE_FALSE(config.loadJson({{"fps", 29.97}}));
        REQUIRE(config.fps == 60);
    }

    SECTION("top level must be an object") {
        REQUIRE_FALSE(config.loadJson(json::array({1, 2})));
    }

    SECTION("toJson uses the same layout") {
        config.seed = 9;
        FloraConfig copy;
        REQUIRE(copy.loadJson(config.toJson()));
        REQUIRE(copy.seed == 9);
        REQUIRE(copy.toJson() == config.toJson());
    }
}

TEST_CASE("FloraConfig loadFile", "[config]") {
    FloraConfig config;

    SECTION("missing file") {
        REQUIRE_FALSE(config.loadFile("/nonexistent/flora.json"));
    }

    SECTION("file on disk") {
        auto path = std::filesystem::temp_directory_path() / "flora_config_test.json";
        {
            std::ofstream out(path);
            out << R"({"height": 720, "audio": {"device": 2}})";
        }

        REQUIRE(config.loadFile(path.string()));
        REQUIRE(config.height == 720);
        REQUIRE(config.audio.device == 2);
        std::filesystem::remove(path);
    }

    SECTION("malformed file") {
        auto path = std::filesystem::temp_directory_path() / "flora_config_bad.json";
        {
            std::ofstream out(path);
            out << "{ \"width\": ";
        }

        REQUIRE_FALSE(config.loadFile(path.string()));
        REQUIRE(config.width == 1920);
        std::filesystem::remove(path);
    }
}

TEST_CASE("FloraConfig validate", "[config]") {
    FloraConfig config;

    SECTION("clamps out-of-range values") {
        config.fps = 1000;
        config.width = 10;
        REQUIRE(config.validate() == 2);
        REQUIRE(config.fps == 240);
        REQUIRE(config.width == 64);
    }

    SECTION("misordered band edges fall back to defaults") {
        config.audio.bassHigh = 3000.0f;
        REQUIRE(config.validate() == 4);
        REQUIRE_THAT(config.audio.bassHigh, WithinAbs(250.0f, 1e-6f));
        REQUIRE_THAT(config.audio.midsHigh, WithinAbs(2000.0f, 1e-6f));
    }

    SECTION("band edges must fit below Nyquist") {
        config.audio.sampleRate = 8000;
        REQUIRE(config.validate() == 4);
        REQUIRE_THAT(config.audio.trebleHigh, WithinAbs(8000.0f, 1e-6f));

        config.audio.trebleHigh = 3900.0f;
        REQUIRE(config.validate() == 0);
    }

    SECTION("every parameter is declared") {
        auto decls = config.params();
        REQUIRE(decls.size() == 16);
        REQUIRE(decls.front().name == "width");
        REQUIRE(decls.front().type == ParamType::Int);
        REQUIRE(decls.back().name == "audio.treble_high");
    }
}
