#pragma once

/**
 * @file spectrum_analyzer.h
 * @brief Turns one frame of mono samples into per-band energies
 *
 * - volume: RMS of the frame
 * - bass/mids/treble: mean FFT magnitude over bins with low <= f < high
 *
 * Magnitudes are left unscaled. The normalizer downstream adapts to
 * whatever range comes out.
 *
 * @par Example
 * @code
 * SpectrumAnalyzer analyzer(44100, 2048);
 * BandEnergies raw = analyzer.analyze(frame.data(), frame.size());
 * @endcode
 */

#include <flora/audio_levels.h>
#include <flora/config.h>
#include <cstdint>
#include <memory>
#include <vector>

namespace flora::audio {

/**
 * @brief Band edges in Hz
 */
struct BandLayout {
    float bassLow = 20.0f;
    float bassHigh = 250.0f;
    float midsHigh = 2000.0f;
    float trebleHigh = 8000.0f;

    static BandLayout fromConfig(const AudioConfig& config);
};

class SpectrumAnalyzer {
public:
    SpectrumAnalyzer(uint32_t sampleRate, uint32_t frameSize, BandLayout bands = {});
    ~SpectrumAnalyzer();

    SpectrumAnalyzer(const SpectrumAnalyzer&) = delete;
    SpectrumAnalyzer& operator=(const SpectrumAnalyzer&) = delete;

    /**
     * @brief Analyze one frame
     * @param samples Mono samples
     * @param count Number of samples (shorter frames are zero padded)
     * @return Raw band energies, all zero for an all-zero frame
     */
    BandEnergies analyze(const float* samples, uint32_t count);

    /// @brief Apply a Hann window before the FFT (off by default)
    void setWindowEnabled(bool enabled) { m_windowEnabled = enabled; }
    bool windowEnabled() const { return m_windowEnabled; }

    /// @brief Magnitudes of the last analyzed frame (frameSize/2 + 1 bins)
    const std::vector<float>& spectrum() const { return m_spectrum; }

    /// @brief Center frequency of an FFT bin
    float binFrequency(int index) const;

    /// @brief Nearest bin for a frequency
    int frequencyToBin(float hz) const;

    /// @brief Mean magnitude over bins with lowHz <= f < highHz (0 if none)
    float bandEnergy(float lowHz, float highHz) const;

    uint32_t sampleRate() const { return m_sampleRate; }
    uint32_t frameSize() const { return m_frameSize; }
    const BandLayout& bands() const { return m_bands; }

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;

    uint32_t m_sampleRate;
    uint32_t m_frameSize;
    BandLayout m_bands;
    bool m_windowEnabled = false;
    std::vector<float> m_spectrum;
};

} // namespace flora::audio
