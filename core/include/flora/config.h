#pragma once

/**
 * @file config.h
 * @brief Every tunable of the application in one place
 *
 * Values start at their defaults, can be overridden from a JSON file and
 * then from command line flags (see main.cpp). validate() clamps anything
 * out of range.
 *
 * @par JSON layout
 * @code
 * {
 *   "width": 1920, "height": 1080, "fullscreen": false,
 *   "fps": 60, "seed": 0, "overlay": true, "frames": 0,
 *   "audio": {
 *     "sample_rate": 44100, "frame_size": 2048, "device": -1,
 *     "synthetic": false, "window": false,
 *     "bass_low": 20, "bass_high": 250, "mids_high": 2000, "treble_high": 8000
 *   }
 * }
 * @endcode
 */

#include <flora/param.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace flora {

/**
 * @brief Audio input and analysis settings
 */
struct AudioConfig {
    Param<int> sampleRate{"sample_rate", 44100, 8000, 192000};
    Param<int> frameSize{"frame_size", 2048, 256, 16384};   ///< Mono samples per analysis
    Param<int> device{"device", -1, -1, 255};               ///< -1 = system default
    Param<bool> synthetic{"synthetic", false, false, true}; ///< Skip capture entirely
    Param<bool> window{"window", false, false, true};       ///< Hann window before FFT

    // Band edges in Hz: bass [bassLow, bassHigh), mids [bassHigh, midsHigh),
    // treble [midsHigh, trebleHigh)
    Param<float> bassLow{"bass_low", 20.0f, 0.0f, 96000.0f};
    Param<float> bassHigh{"bass_high", 250.0f, 0.0f, 96000.0f};
    Param<float> midsHigh{"mids_high", 2000.0f, 0.0f, 96000.0f};
    Param<float> trebleHigh{"treble_high", 8000.0f, 0.0f, 96000.0f};
};

/**
 * @brief Application settings
 */
struct FloraConfig {
    Param<int> width{"width", 1920, 64, 7680};
    Param<int> height{"height", 1080, 64, 4320};
    Param<bool> fullscreen{"fullscreen", false, false, true};
    Param<int> fps{"fps", 60, 1, 240};
    Param<int> seed{"seed", 0, 0, 2147483647};           ///< 0 = nondeterministic
    Param<bool> overlay{"overlay", true, false, true};
    Param<int> frames{"frames", 0, 0, 2147483647};       ///< Stop after N ticks, 0 = run forever

    AudioConfig audio;

    /**
     * @brief Load overrides from a JSON file
     * @return false if the file is missing or not valid JSON (defaults kept)
     */
    bool loadFile(const std::string& path);

    /**
     * @brief Apply overrides from parsed JSON
     *
     * Unknown keys are ignored. Keys with the wrong type are reported and
     * leave the current value untouched.
     *
     * @return false if any key had to be skipped
     */
    bool loadJson(const nlohmann::json& j);

    /// @brief Current values in the loadJson() layout
    nlohmann::json toJson() const;

    /**
     * @brief Clamp every value into range and repair inconsistent band edges
     * @return Number of values that had to be changed
     */
    int validate();

    /// @brief Declarations of every parameter, audio keys as "audio.<key>"
    std::vector<ParamDecl> params() const;
};

} // namespace flora
