/**
 * @file test_cli.cpp
 * @brief Unit tests for command line parsing
 */

#include <catch2/catch_test_macros.hpp>
#include <flora/cli.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace flora;

namespace {

int parse(std::vector<const char*> args, FloraConfig& config, cli::Options& options) {
    args.insert(args.begin(), "flora-app");
    return cli::parseArgs(static_cast<int>(args.size()), args.data(), config, options);
}

} // namespace

TEST_CASE("parseSize", "[cli]") {
    int w = 1;
    int h = 2;

    SECTION("accepts WxH") {
        REQUIRE(cli::parseSize("1280x720", w, h));
        REQUIRE(w == 1280);
        REQUIRE(h == 720);
    }

    SECTION("rejects malformed sizes and leaves outputs untouched") {
        REQUIRE_FALSE(cli::parseSize("1280", w, h));
        REQUIRE_FALSE(cli::parseSize("x720", w, h));
        REQUIRE_FALSE(cli::parseSize("1280x", w, h));
        REQUIRE_FALSE(cli::parseSize("12a0x720", w, h));
        REQUIRE_FALSE(cli::parseSize("1280x720px", w, h));
        REQUIRE_FALSE(cli::parseSize("widexhigh", w, h));
        REQUIRE(w == 1);
        REQUIRE(h == 2);
    }
}

TEST_CASE("parseArgs applies flags", "[cli]") {
    FloraConfig config;
    cli::Options options;

    SECTION("no arguments keeps defaults") {
        REQUIRE(parse({}, config, options) == -1);
        REQUIRE(config.width == 1920);
        REQUIRE_FALSE(options.listDevices);
    }

    SECTION("settings") {
        int rc = parse({"--window", "1280x720", "--fps", "30", "--seed", "5",
                        "--device", "2", "--frames", "100",
                        "--synthetic", "--no-overlay", "--fullscreen"},
                       config, options);

        REQUIRE(rc == -1);
        REQUIRE(config.width == 1280);
        REQUIRE(config.height == 720);
        REQUIRE(config.fps == 30);
        REQUIRE(config.seed == 5);
        REQUIRE(config.audio.device == 2);
        REQUIRE(config.frames == 100);
        REQUIRE(config.audio.synthetic);
        REQUIRE_FALSE(config.overlay);
        REQUIRE(config.fullscreen);
    }

    SECTION("malformed window size is ignored") {
        REQUIRE(parse({"--window", "big"}, config, options) == -1);
        REQUIRE(config.width == 1920);
        REQUIRE(config.height == 1080);
    }

    SECTION("list devices") {
        REQUIRE(parse({"--list-devices"}, config, options) == -1);
        REQUIRE(options.listDevices);
    }

    SECTION("out-of-range values are left for validate") {
        REQUIRE(parse({"--fps", "5000"}, config, options) == -1);
        REQUIRE(config.fps == 5000);
        REQUIRE(config.validate() == 1);
        REQUIRE(config.fps == 240);
    }
}

TEST_CASE("parseArgs exits early", "[cli]") {
    FloraConfig config;
    cli::Options options;

    SECTION("help") {
        REQUIRE(parse({"--help"}, config, options) == 0);
    }

    SECTION("version") {
        REQUIRE(parse({"--version"}, config, options) == 0);
    }

    SECTION("unknown option") {
        REQUIRE(parse({"--bloom"}, config, options) > 0);
    }

    SECTION("non-numeric value") {
        REQUIRE(parse({"--fps", "fast"}, config, options) > 0);
    }
}

TEST_CASE("parseArgs layers flags over the config file", "[cli]") {
    auto path = std::filesystem::temp_directory_path() / "flora_cli_test.json";
    {
        std::ofstream out(path);
        out << R"({"fps": 24, "seed": 3, "width": 800})";
    }

    FloraConfig config;
    cli::Options options;
    std::string pathString = path.string();

    REQUIRE(parse({"--seed", "8", "-c", pathString.c_str()}, config, options) == -1);
    REQUIRE(options.configPath == pathString);
    REQUIRE(config.fps == 24);
    REQUIRE(config.width == 800);
    REQUIRE(config.seed == 8);

    std::filesystem::remove(path);
}

TEST_CASE("settingsHelp lists every config key", "[cli]") {
    FloraConfig config;
    std::string help = cli::settingsHelp(config);

    SECTION("integer keys show default and range") {
        REQUIRE(help.find("  fps = 60  [1, 240]\n") != std::string::npos);
        REQUIRE(help.find("  audio.frame_size = 2048  [256, 16384]\n") != std::string::npos);
    }

    SECTION("boolean keys show only the default") {
        REQUIRE(help.find("  overlay = true\n") != std::string::npos);
        REQUIRE(help.find("  audio.synthetic = false\n") != std::string::npos);
    }

    SECTION("float keys") {
        REQUIRE(help.find("  audio.treble_high = 8000  [0, 96000]\n") != std::string::npos);
    }

    SECTION("help text is built from current defaults, not overrides") {
        config.fps = 30;
        REQUIRE(cli::settingsHelp(config) == help);
    }
}
