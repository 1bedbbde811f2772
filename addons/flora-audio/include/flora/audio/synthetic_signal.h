#pragma once

/**
 * @file synthetic_signal.h
 * @brief Deterministic stand-in for live audio
 *
 * Slow sine sweeps on each band, with bass in antiphase to volume, at
 * magnitudes similar to what the spectrum analyzer produces for 16-bit
 * input. Used when no capture device is available or when requested.
 */

#include <flora/audio_levels.h>
#include <flora/math.h>
#include <cmath>

namespace flora::audio {

/// @brief Synthetic band energies at time t (seconds)
inline BandEnergies syntheticEnergies(double t) {
    BandEnergies e;
    e.volume = static_cast<float>((std::sin(t * 2.0) + 1.0) / 2.0 * 15000.0);
    e.bass = static_cast<float>((std::sin(t * 2.0 + PI) + 1.0) / 2.0 * 1e6);
    e.mids = static_cast<float>((std::sin(t * 4.0) + 1.0) / 2.0 * 1e5);
    e.treble = static_cast<float>((std::sin(t * 8.0) + 1.0) / 2.0 * 1e4);
    return e;
}

} // namespace flora::audio
