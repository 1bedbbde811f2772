#pragma once

/**
 * @file audio_capture.h
 * @brief Microphone / line-in capture using miniaudio
 *
 * The miniaudio callback thread only appends to a SampleRing. The main
 * thread pulls the most recent fixed-size frame with readLatest(), waiting
 * a bounded time for new data.
 */

#include <flora/audio/sample_ring.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace flora::audio {

/**
 * @brief Audio capture device information.
 */
struct AudioDeviceInfo {
    std::string name;
    uint32_t index;
    bool isDefault;
};

class AudioCapture {
public:
    AudioCapture();
    ~AudioCapture();

    // Non-copyable
    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    /**
     * @brief List available audio input devices.
     */
    static std::vector<AudioDeviceInfo> listDevices();

    /**
     * @brief Initialize mono float capture.
     * @param sampleRate Sample rate in Hz.
     * @param bufferFrames Sample history capacity in frames.
     * @param deviceIndex Device index (-1 for default).
     * @return true if initialization succeeded.
     */
    bool init(uint32_t sampleRate = 44100, uint32_t bufferFrames = 8192, int deviceIndex = -1);

    /**
     * @brief Stop capture and release the device.
     */
    void shutdown();

    /**
     * @brief Start audio capture.
     * @return false if the device refused to start.
     */
    bool start();

    /**
     * @brief Stop audio capture.
     */
    void stop();

    /**
     * @brief Copy out the newest frameCount samples.
     *
     * Consecutive reads may overlap. Waits up to timeout for at least one
     * sample newer than the previous read.
     *
     * @return frameCount on success, 0 if nothing new arrived in time.
     */
    uint32_t readLatest(float* output, uint32_t frameCount, std::chrono::milliseconds timeout);

private:
    // Called by miniaudio when audio data is available
    static void dataCallback(struct ma_device* device, void* output, const void* input, unsigned int frameCount);

    struct Impl;
    std::unique_ptr<Impl> impl_;

    SampleRing samples_;

    uint32_t sampleRate_ = 44100;
    std::atomic<bool> initialized_{false};
    std::atomic<bool> capturing_{false};
};

} // namespace flora::audio
