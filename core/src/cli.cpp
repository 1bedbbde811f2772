// Flora command line handling

#include <flora/cli.h>
#include <CLI/CLI.hpp>
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace flora::cli {

bool parseSize(const std::string& s, int& w, int& h) {
    size_t x = s.find('x');
    if (x == std::string::npos || x == 0 || x + 1 >= s.size()) {
        return false;
    }
    try {
        size_t usedW = 0;
        size_t usedH = 0;
        int parsedW = std::stoi(s.substr(0, x), &usedW);
        int parsedH = std::stoi(s.substr(x + 1), &usedH);
        if (usedW != x || usedH != s.size() - x - 1) {
            return false;
        }
        w = parsedW;
        h = parsedH;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

namespace {

std::string formatValue(ParamType type, float value) {
    switch (type) {
        case ParamType::Bool: return value != 0.0f ? "true" : "false";
        case ParamType::Int: return std::to_string(std::llround(value));
        case ParamType::Float: break;
    }
    std::ostringstream out;
    out << value;
    return out.str();
}

} // namespace

std::string settingsHelp(const FloraConfig& config) {
    std::ostringstream out;
    out << "Config file keys:\n";
    for (const ParamDecl& decl : config.params()) {
        out << "  " << decl.name << " = " << formatValue(decl.type, decl.defaultVal);
        if (decl.type != ParamType::Bool) {
            out << "  [" << formatValue(decl.type, decl.minVal)
                << ", " << formatValue(decl.type, decl.maxVal) << "]";
        }
        out << "\n";
    }
    return out.str();
}

int parseArgs(int argc, const char* const* argv, FloraConfig& config, Options& options) {
    CLI::App app{"Flora - audio-reactive procedural plant"};
    app.set_version_flag("-v,--version", std::string(VERSION));
    app.set_help_flag("-h,--help", "Show this help");
    app.footer(settingsHelp(config));

    std::string windowSize;
    int fps = 0;
    int seed = 0;
    int device = -1;
    int frames = 0;
    bool synthetic = false;
    bool noOverlay = false;
    bool fullscreen = false;

    app.add_option("-c,--config", options.configPath, "JSON settings file");
    auto* windowOpt = app.add_option("--window", windowSize, "Window size as WxH (default 1920x1080)");
    auto* fpsOpt = app.add_option("--fps", fps, "Ticks per second (default 60)");
    auto* seedOpt = app.add_option("--seed", seed, "Random seed, 0 = random (default 0)");
    auto* deviceOpt = app.add_option("--device", device, "Capture device index, -1 = default");
    auto* framesOpt = app.add_option("--frames", frames, "Stop after N ticks, 0 = run forever");
    app.add_flag("--synthetic", synthetic, "Use the synthetic signal instead of capture");
    app.add_flag("--no-overlay", noOverlay, "Start with the level meters hidden");
    app.add_flag("--fullscreen", fullscreen, "Fullscreen on the primary monitor");
    app.add_flag("--list-devices", options.listDevices, "List capture devices and exit");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    if (!options.configPath.empty() && !config.loadFile(options.configPath)) {
        std::cerr << "[Flora] Some settings in " << options.configPath << " were not applied\n";
    }

    if (windowOpt->count() > 0) {
        int w = config.width;
        int h = config.height;
        if (parseSize(windowSize, w, h)) {
            config.width = w;
            config.height = h;
        } else {
            std::cerr << "[Flora] Ignoring --window '" << windowSize << "', expected WxH\n";
        }
    }
    if (fpsOpt->count() > 0) config.fps = fps;
    if (seedOpt->count() > 0) config.seed = seed;
    if (deviceOpt->count() > 0) config.audio.device = device;
    if (framesOpt->count() > 0) config.frames = frames;
    if (synthetic) config.audio.synthetic = true;
    if (noOverlay) config.overlay = false;
    if (fullscreen) config.fullscreen = true;

    return -1;
}

} // namespace flora::cli
