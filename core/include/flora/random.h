#pragma once

/**
 * @file random.h
 * @brief Seedable random source shared by tree construction and per-tick effects
 */

#include <cstdint>
#include <random>

namespace flora {

/**
 * @brief Thin wrapper over std::mt19937 with the draws the scene needs
 *
 * One instance is owned by the simulation and passed by reference to
 * everything that needs randomness, so a fixed seed reproduces a run.
 */
class RandomSource {
public:
    explicit RandomSource(uint32_t seed = 42) : m_seed(seed), m_rng(seed) {}

    /// @brief Reseed the generator
    void seed(uint32_t s) {
        m_seed = s;
        m_rng.seed(s);
    }

    /// @brief Seed used for the current sequence
    uint32_t seedValue() const { return m_seed; }

    /// @brief Uniform float in [lo, hi)
    float uniform(float lo, float hi) {
        std::uniform_real_distribution<float> dist(lo, hi);
        return dist(m_rng);
    }

    /// @brief Uniform integer in [lo, hi] (inclusive)
    int range(int lo, int hi) {
        std::uniform_int_distribution<int> dist(lo, hi);
        return dist(m_rng);
    }

    /// @brief True with probability p
    bool chance(float p) {
        return uniform(0.0f, 1.0f) < p;
    }

    /// @brief Pick one of two values with equal probability
    template<typename T>
    T either(T a, T b) {
        return range(0, 1) == 0 ? a : b;
    }

private:
    uint32_t m_seed;
    std::mt19937 m_rng;
};

} // namespace flora
