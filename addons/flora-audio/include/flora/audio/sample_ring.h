#pragma once

/**
 * @file sample_ring.h
 * @brief Fixed-capacity sample history shared by the capture thread and the tick
 *
 * The writer appends and overwrites the oldest samples when full. The reader
 * takes the newest frameCount samples, which may overlap the previous read:
 * it only waits until something new has arrived since that read.
 */

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <vector>

namespace flora::audio {

class SampleRing {
public:
    explicit SampleRing(uint32_t capacity = 0);

    /// @brief Drop all samples and resize
    void reset(uint32_t capacity);

    uint32_t capacity() const;

    /// @brief Samples currently held (at most capacity)
    uint32_t stored() const;

    /**
     * @brief Append samples, overwriting the oldest when full
     *
     * Only the last capacity() samples of a larger block are kept.
     */
    void push(const float* samples, uint32_t count);

    /**
     * @brief Copy out the newest frameCount samples
     *
     * Waits up to timeout until at least frameCount samples are held and at
     * least one arrived since the previous successful read.
     *
     * @return frameCount on success, 0 on timeout or if frameCount exceeds capacity.
     */
    uint32_t readLatest(float* output, uint32_t frameCount, std::chrono::milliseconds timeout);

private:
    std::vector<float> buffer_;
    uint32_t writePos_ = 0;
    uint32_t stored_ = 0;
    uint32_t fresh_ = 0;  // pushed since the last read
    mutable std::mutex mutex_;
    std::condition_variable dataReady_;
};

} // namespace flora::audio
