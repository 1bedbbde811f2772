#pragma once

/**
 * @file sparkles.h
 * @brief Short-lived particles emitted by blooming flowers
 *
 * Motion is per tick (velocity in px/tick with exponential drag), life is
 * in seconds and counts down by 1/tickRate each tick.
 */

#include <flora/draw_surface.h>
#include <flora/random.h>
#include <glm/glm.hpp>
#include <vector>

namespace flora {

struct Sparkle {
    glm::vec2 position{0.0f};
    glm::vec2 velocity{0.0f};
    float life = 0.0f;     ///< Seconds remaining
    float maxLife = 1.0f;  ///< Life at spawn
    float size = 1.0f;

    /// @brief Remaining life as a fraction of max life
    float lifeFraction() const { return maxLife > 0.0f ? life / maxLife : 0.0f; }
};

class SparkleSystem {
public:
    static constexpr float MIN_SPEED = 0.8f;
    static constexpr float MAX_SPEED = 2.5f;
    static constexpr float MIN_LIFE = 0.6f;
    static constexpr float MAX_LIFE = 1.2f;
    static constexpr float MIN_SIZE = 1.0f;
    static constexpr float MAX_SIZE = 3.0f;
    static constexpr float DRAG = 0.93f;

    explicit SparkleSystem(float tickRate = 60.0f);

    /// @brief Emit one sparkle in a random direction
    Sparkle& spawn(const glm::vec2& origin, RandomSource& rng);

    /// @brief Move, age and cull all sparkles
    void update();

    /// @brief Draw with size and alpha fading by remaining life
    void draw(DrawSurface& surface) const;

    void clear() { m_sparkles.clear(); }
    size_t count() const { return m_sparkles.size(); }
    const std::vector<Sparkle>& sparkles() const { return m_sparkles; }
    float tickRate() const { return m_tickRate; }

private:
    float m_tickRate;
    std::vector<Sparkle> m_sparkles;
};

} // namespace flora
