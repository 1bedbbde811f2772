#pragma once

/**
 * @file simulation.h
 * @brief One plant, its particles and the compositor, advanced tick by tick
 *
 * FloraSimulation has no window, GPU or audio device dependency: it takes
 * raw band energies in and draws onto any DrawSurface. The runtime feeds
 * it from an AudioProvider and renders into a Tessellator.
 *
 * @par Example
 * @code
 * FloraConfig config;
 * FloraSimulation sim(config);
 *
 * // Each tick:
 * sim.tick(provider.read());
 * sim.render(tessellator);
 * @endcode
 */

#include <flora/audio_levels.h>
#include <flora/compositor.h>
#include <flora/config.h>
#include <flora/draw_list.h>
#include <flora/draw_surface.h>
#include <flora/growth_tree.h>
#include <flora/level_meter.h>
#include <flora/random.h>
#include <flora/sparkles.h>
#include <cstdint>

namespace flora {

class FloraSimulation {
public:
    /**
     * @brief Build the tree for the configured viewport
     *
     * A config seed of 0 picks a seed from std::random_device.
     */
    explicit FloraSimulation(const FloraConfig& config);

    /**
     * @brief Advance one tick
     *
     * Normalize, grow the tree (flowers may emit), age the sparkles, then
     * pick the shake offset for this tick.
     */
    void tick(const BandEnergies& raw);

    /**
     * @brief Draw the current state
     *
     * The tree and sparkles are recorded into the scene layer and replayed
     * with the shake offset. The level meter is drawn last, unshaken.
     */
    void render(DrawSurface& target);

    const BandLevels& levels() const { return m_normalizer.levels(); }
    const AudioNormalizer& normalizer() const { return m_normalizer; }
    const GrowthTree& tree() const { return m_tree; }
    GrowthTree& tree() { return m_tree; }
    const SparkleSystem& sparkles() const { return m_sparkles; }
    const SceneCompositor& compositor() const { return m_compositor; }
    const DrawList& sceneLayer() const { return m_scene; }
    LevelMeter& overlay() { return m_overlay; }

    uint32_t seed() const { return m_rng.seedValue(); }
    uint64_t tickCount() const { return m_ticks; }

    /// @brief Pick the seed used for a config seed value (0 = random)
    static uint32_t resolveSeed(int configSeed);

private:
    RandomSource m_rng;
    AudioNormalizer m_normalizer;
    GrowthTree m_tree;
    SparkleSystem m_sparkles;
    SceneCompositor m_compositor;
    DrawList m_scene;
    LevelMeter m_overlay;
    uint64_t m_ticks = 0;
};

} // namespace flora
