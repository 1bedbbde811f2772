#pragma once

/**
 * @file compositor.h
 * @brief Blits the scene layer onto the target with a bass-driven shake
 */

#include <flora/draw_list.h>
#include <flora/draw_surface.h>
#include <flora/random.h>
#include <glm/glm.hpp>

namespace flora {

class SceneCompositor {
public:
    static constexpr float SHAKE_SCALE = 8.0f;  ///< Pixels of shake at full bass

    /**
     * @brief Pick this tick's scene offset
     *
     * Magnitude is bass x 8. X and Y are drawn independently and
     * uniformly from [-magnitude, magnitude].
     */
    void updateShake(float bass, RandomSource& rng);

    float shakeMagnitude() const { return m_shake; }
    glm::vec2 offset() const { return m_offset; }

    /// @brief Replay the scene layer onto the target, shifted by offset()
    void compose(const DrawList& scene, DrawSurface& target) const;

private:
    float m_shake = 0.0f;
    glm::vec2 m_offset{0.0f};
};

} // namespace flora
