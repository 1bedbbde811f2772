/**
 * @file test_sample_ring.cpp
 * @brief Unit tests for the capture sample history
 */

#include <catch2/catch_test_macros.hpp>
#include <flora/audio/sample_ring.h>
#include <chrono>
#include <numeric>
#include <thread>
#include <vector>

using namespace flora::audio;
using namespace std::chrono_literals;

namespace {

std::vector<float> ramp(float first, size_t count) {
    std::vector<float> v(count);
    std::iota(v.begin(), v.end(), first);
    return v;
}

} // namespace

TEST_CASE("SampleRing returns the newest frame", "[audio][ring]") {
    SampleRing ring(8);
    std::vector<float> frame(4, -1.0f);

    SECTION("times out until a full frame is held") {
        auto block = ramp(0.0f, 3);
        ring.push(block.data(), 3);
        REQUIRE(ring.readLatest(frame.data(), 4, 1ms) == 0);
    }

    SECTION("oldest samples are overwritten when full") {
        auto block = ramp(0.0f, 10);
        ring.push(block.data(), 10);
        REQUIRE(ring.stored() == 8);
        REQUIRE(ring.readLatest(frame.data(), 4, 1ms) == 4);
        REQUIRE(frame == std::vector<float>{6.0f, 7.0f, 8.0f, 9.0f});
    }

    SECTION("a block larger than capacity keeps its tail") {
        auto block = ramp(0.0f, 20);
        ring.push(block.data(), 20);
        std::vector<float> all(8);
        REQUIRE(ring.readLatest(all.data(), 8, 1ms) == 8);
        REQUIRE(all == ramp(12.0f, 8));
    }

    SECTION("frames larger than capacity are refused") {
        auto block = ramp(0.0f, 8);
        ring.push(block.data(), 8);
        std::vector<float> big(9);
        REQUIRE(ring.readLatest(big.data(), 9, 1ms) == 0);
    }
}

TEST_CASE("SampleRing reads overlap once new samples arrive", "[audio][ring]") {
    SampleRing ring(8);
    std::vector<float> frame(4);

    auto block = ramp(0.0f, 6);
    ring.push(block.data(), 6);
    REQUIRE(ring.readLatest(frame.data(), 4, 1ms) == 4);

    SECTION("nothing new means a timeout") {
        REQUIRE(ring.readLatest(frame.data(), 4, 1ms) == 0);
    }

    SECTION("one new sample is enough for a full frame") {
        float next = 6.0f;
        ring.push(&next, 1);
        REQUIRE(ring.readLatest(frame.data(), 4, 1ms) == 4);
        REQUIRE(frame == std::vector<float>{3.0f, 4.0f, 5.0f, 6.0f});
    }
}

TEST_CASE("SampleRing keeps up with frames longer than a tick", "[audio][ring]") {
    // 4096-sample frames delivered in 256-sample device periods
    const uint32_t frameSize = 4096;
    const uint32_t period = 256;
    SampleRing ring(frameSize * 4);
    std::vector<float> frame(frameSize);

    float next = 0.0f;
    for (uint32_t i = 0; i < frameSize / period; i++) {
        auto block = ramp(next, period);
        ring.push(block.data(), period);
        next += period;
    }
    REQUIRE(ring.readLatest(frame.data(), frameSize, 1ms) == frameSize);

    for (int tick = 0; tick < 5; tick++) {
        auto block = ramp(next, period);
        ring.push(block.data(), period);
        next += period;

        REQUIRE(ring.readLatest(frame.data(), frameSize, 1ms) == frameSize);
        REQUIRE(frame.back() == next - 1.0f);
        REQUIRE(frame.front() == next - static_cast<float>(frameSize));
    }
}

TEST_CASE("SampleRing wakes a waiting reader", "[audio][ring]") {
    SampleRing ring(16);
    std::vector<float> frame(4);

    std::thread writer([&ring] {
        std::this_thread::sleep_for(5ms);
        auto block = ramp(1.0f, 4);
        ring.push(block.data(), 4);
    });

    uint32_t got = ring.readLatest(frame.data(), 4, 2000ms);
    writer.join();

    REQUIRE(got == 4);
    REQUIRE(frame == std::vector<float>{1.0f, 2.0f, 3.0f, 4.0f});
}
