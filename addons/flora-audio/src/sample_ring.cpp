#include <flora/audio/sample_ring.h>
#include <algorithm>

namespace flora::audio {

SampleRing::SampleRing(uint32_t capacity) {
    reset(capacity);
}

void SampleRing::reset(uint32_t capacity) {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_.assign(capacity, 0.0f);
    writePos_ = 0;
    stored_ = 0;
    fresh_ = 0;
}

uint32_t SampleRing::capacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(buffer_.size());
}

uint32_t SampleRing::stored() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stored_;
}

void SampleRing::push(const float* samples, uint32_t count) {
    if (!samples || count == 0) return;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        uint32_t size = static_cast<uint32_t>(buffer_.size());
        if (size == 0) return;

        if (count > size) {
            samples += count - size;
            count = size;
        }
        for (uint32_t i = 0; i < count; i++) {
            buffer_[writePos_] = samples[i];
            writePos_ = (writePos_ + 1) % size;
        }
        stored_ = std::min(size, stored_ + count);
        fresh_ = std::min(size, fresh_ + count);
    }
    dataReady_.notify_one();
}

uint32_t SampleRing::readLatest(float* output, uint32_t frameCount, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    uint32_t size = static_cast<uint32_t>(buffer_.size());
    if (!output || frameCount == 0 || frameCount > size) return 0;

    bool ready = dataReady_.wait_for(lock, timeout, [&] {
        return stored_ >= frameCount && fresh_ > 0;
    });
    if (!ready) {
        return 0;
    }

    // Newest frameCount samples end at writePos_
    uint32_t pos = (writePos_ + size - frameCount) % size;
    for (uint32_t i = 0; i < frameCount; i++) {
        output[i] = buffer_[pos];
        pos = (pos + 1) % size;
    }
    fresh_ = 0;
    return frameCount;
}

} // namespace flora::audio
