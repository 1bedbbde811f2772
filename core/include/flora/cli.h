// Flora command line handling
// Parses flags with CLI11 and applies them on top of the JSON config

#pragma once

#include <flora/config.h>
#include <string>

namespace flora::cli {

// Version info
constexpr const char* VERSION = "1.0.0";

// Flags that select an action rather than a setting
struct Options {
    std::string configPath;   // --config FILE
    bool listDevices = false; // --list-devices
};

// Parse argv into config and options.
// Order: defaults, then --config file, then the remaining flags.
// Returns: 0+ = handled (exit with this code, e.g. --help or a parse error),
//          -1 = continue running
int parseArgs(int argc, const char* const* argv, FloraConfig& config, Options& options);

// One line per config-file key with its range and default, for --help
std::string settingsHelp(const FloraConfig& config);

// Parse "WxH" (e.g. "1280x720"). Returns false and leaves w/h untouched if malformed.
bool parseSize(const std::string& s, int& w, int& h);

} // namespace flora::cli
