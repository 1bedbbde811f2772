// Flora runtime entry point

#include "app.h"
#include <flora/audio/audio_capture.h>
#include <flora/cli.h>
#include <flora/config.h>

#include <iostream>
#include <stdexcept>

int main(int argc, char** argv) {
    flora::FloraConfig config;
    flora::cli::Options options;

    int cliResult = flora::cli::parseArgs(argc, argv, config, options);
    if (cliResult >= 0) {
        return cliResult;  // --help, --version or a parse error
    }

    if (options.listDevices) {
        auto devices = flora::audio::AudioCapture::listDevices();
        std::cout << "Capture devices (" << devices.size() << "):\n";
        for (const auto& d : devices) {
            std::cout << "  [" << d.index << "] " << d.name;
            if (d.isDefault) std::cout << " (default)";
            std::cout << "\n";
        }
        return 0;
    }

    int adjusted = config.validate();
    if (adjusted > 0) {
        std::cerr << "[Flora] " << adjusted << " setting(s) adjusted to fit their range\n";
    }

    std::cout << "Flora " << flora::cli::VERSION << " - Starting..." << std::endl;

    try {
        flora::FloraApp app(config);
        return app.run();
    } catch (const std::runtime_error& e) {
        std::cerr << "[Flora] " << e.what() << "\n";
        return 1;
    }
}
