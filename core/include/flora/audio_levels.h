#pragma once

/**
 * @file audio_levels.h
 * @brief Per-band audio energies and the auto-gain normalizer
 *
 * BandLevels carries one scalar per analysis band. The same struct is used
 * for raw energies coming out of the audio provider (arbitrary scale) and
 * for the normalized levels driving the scene (0-1).
 *
 * @par Example
 * @code
 * AudioNormalizer normalizer;
 *
 * // Each tick:
 * const BandLevels& levels = normalizer.update(provider.read());
 * float growthTarget = levels.mids * 1.2f;
 * @endcode
 */

#include <cstddef>

namespace flora {

/**
 * @brief Energies for the four analysis bands
 */
struct BandLevels {
    float volume = 0.0f;  ///< Overall loudness (RMS)
    float bass = 0.0f;    ///< 20-250 Hz
    float mids = 0.0f;    ///< 250-2000 Hz
    float treble = 0.0f;  ///< 2000-8000 Hz

    static constexpr size_t COUNT = 4;

    /// @brief Access band by index (volume, bass, mids, treble)
    float& operator[](size_t index);
    float operator[](size_t index) const;
};

/// Raw per-band energies as delivered by an audio provider
using BandEnergies = BandLevels;

/**
 * @brief Smoothed, self-adjusting normalization of raw band energies
 *
 * Each band keeps a peak tracker that rises instantly to any louder input
 * and decays geometrically afterwards, so the output adapts to whatever
 * dynamic range the source has. The normalized value is then smoothed.
 *
 * Output is in [0, 1] for any finite non-negative input. Non-numeric
 * input (NaN, infinity) is treated as silence.
 */
class AudioNormalizer {
public:
    static constexpr float INITIAL_PEAK = 1e-5f;  ///< Keeps the first division finite
    static constexpr float SMOOTHING = 0.35f;     ///< Level smoothing rate per tick
    static constexpr float PEAK_DECAY = 0.999f;   ///< Peak multiplier per tick

    AudioNormalizer();

    /**
     * @brief Feed one tick of raw energies
     * @param raw Raw band energies (any non-negative scale)
     * @return Updated normalized levels
     */
    const BandLevels& update(const BandLevels& raw);

    /// @brief Current normalized levels
    const BandLevels& levels() const { return m_levels; }

    /// @brief Current peak trackers
    const BandLevels& peaks() const { return m_peaks; }

    /// @brief Return to the startup state
    void reset();

    /// @brief Coerce non-numeric energies to zero
    static float sanitize(float raw);

private:
    BandLevels m_levels;
    BandLevels m_peaks;
};

} // namespace flora
