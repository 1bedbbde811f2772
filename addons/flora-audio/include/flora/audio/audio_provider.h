#pragma once

/**
 * @file audio_provider.h
 * @brief Source of raw band energies, one read per tick
 *
 * @par Example
 * @code
 * auto provider = audio::openAudioProvider(config.audio, config.fps);
 *
 * // Each tick:
 * BandEnergies raw = provider->read();
 * @endcode
 */

#include <flora/audio/audio_capture.h>
#include <flora/audio/spectrum_analyzer.h>
#include <flora/audio_levels.h>
#include <flora/config.h>
#include <chrono>
#include <memory>
#include <vector>

namespace flora::audio {

class AudioProvider {
public:
    virtual ~AudioProvider() = default;

    /**
     * @brief Energies for this tick
     *
     * Never fails: anything that goes wrong yields a zero frame.
     */
    virtual BandEnergies read() = 0;

    /// @brief Short description for logs
    virtual const char* name() const = 0;
};

/**
 * @brief Live input: capture, then spectrum analysis
 */
class CaptureAudioProvider : public AudioProvider {
public:
    /// Longest a read waits for samples newer than the previous frame
    static constexpr std::chrono::milliseconds READ_TIMEOUT{50};

    explicit CaptureAudioProvider(const AudioConfig& config);

    /// @brief Open and start the device
    bool open(int deviceIndex);

    BandEnergies read() override;
    const char* name() const override { return "capture"; }

private:
    AudioCapture m_capture;
    SpectrumAnalyzer m_analyzer;
    std::vector<float> m_frame;
};

/**
 * @brief Time-driven synthetic energies, advanced by 1/fps per read
 */
class SyntheticAudioProvider : public AudioProvider {
public:
    explicit SyntheticAudioProvider(float fps = 60.0f, double startTime = 0.0);

    BandEnergies read() override;
    const char* name() const override { return "synthetic"; }

    double time() const { return m_time; }

private:
    double m_step;
    double m_time;
};

/**
 * @brief Open the configured provider
 *
 * Returns the capture provider if a device opens, otherwise logs the
 * failure and returns the synthetic provider.
 */
std::unique_ptr<AudioProvider> openAudioProvider(const AudioConfig& config, float fps);

} // namespace flora::audio
