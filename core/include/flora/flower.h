#pragma once

/**
 * @file flower.h
 * @brief Watercolor flower that blooms with the treble and emits sparkles
 *
 * @par Emission
 * Sparkles are edge-triggered: a burst of 1-3 is emitted only on a tick
 * where bloom is above 0.5 and has risen by more than 0.05 since the
 * previous tick. A flower held fully open emits nothing.
 */

#include <flora/branch.h>
#include <flora/draw_surface.h>
#include <flora/random.h>
#include <flora/sparkles.h>
#include <glm/glm.hpp>

namespace flora {

struct Flower {
    static constexpr float BRANCH_GATE = 0.7f;
    static constexpr float BLOOM_GAIN = 1.5f;
    static constexpr float BLOOM_RATE = 0.1f;
    static constexpr float EMIT_THRESHOLD = 0.5f;
    static constexpr float EMIT_RISE = 0.05f;
    static constexpr int MIN_BURST = 1;
    static constexpr int MAX_BURST = 3;
    static constexpr float SPIN_GAIN = 20.0f;     ///< Degrees per tick at full treble
    static constexpr float VISIBLE_BLOOM = 0.05f;
    static constexpr float HIGHLIGHT_BLOOM = 0.3f;
    static constexpr float PETAL_ALPHA = 150.0f / 255.0f;
    static constexpr float HIGHLIGHT_ALPHA = 100.0f / 255.0f;

    BranchId branch = NO_BRANCH;
    float position = 1.0f;    ///< Fraction along the branch
    float size = 20.0f;       ///< Radius scale at full bloom
    float rotation = 0.0f;    ///< Degrees
    int petals = 6;
    float bloom = 0.0f;
    float lastBloom = 0.0f;

    /**
     * @brief One tick: bloom, emit on a rising edge, spin
     * @return Number of sparkles emitted
     */
    int update(const BandLevels& levels, const Branch& owner, RandomSource& rng,
               SparkleSystem& sparkles);

    /// @brief Ease bloom toward its target given the owning branch's growth
    void advanceBloom(const BandLevels& levels, float branchGrowth);

    /**
     * @brief Emit a burst if bloom rose past the threshold, then latch bloom
     * @return Number of sparkles emitted
     */
    int emitOnRisingEdge(const glm::vec2& origin, RandomSource& rng, SparkleSystem& sparkles);

    glm::vec2 worldPosition(const Branch& owner) const;

    bool isVisible() const { return bloom > VISIBLE_BLOOM; }

    void draw(const Branch& owner, DrawSurface& surface) const;
};

} // namespace flora
