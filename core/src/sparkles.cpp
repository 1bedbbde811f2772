#include <flora/sparkles.h>
#include <flora/math.h>
#include <flora/palette.h>
#include <algorithm>
#include <cmath>

namespace flora {

SparkleSystem::SparkleSystem(float tickRate)
    : m_tickRate(tickRate > 0.0f ? tickRate : 60.0f) {}

Sparkle& SparkleSystem::spawn(const glm::vec2& origin, RandomSource& rng) {
    float angle = rng.uniform(0.0f, TWO_PI);
    float speed = rng.uniform(MIN_SPEED, MAX_SPEED);

    Sparkle s;
    s.position = origin;
    s.velocity = glm::vec2(std::cos(angle), std::sin(angle)) * speed;
    s.life = rng.uniform(MIN_LIFE, MAX_LIFE);
    s.maxLife = s.life;
    s.size = rng.uniform(MIN_SIZE, MAX_SIZE);

    m_sparkles.push_back(s);
    return m_sparkles.back();
}

void SparkleSystem::update() {
    float dt = 1.0f / m_tickRate;
    for (auto& s : m_sparkles) {
        s.position += s.velocity;
        s.velocity *= DRAG;
        s.life -= dt;
    }

    m_sparkles.erase(
        std::remove_if(m_sparkles.begin(), m_sparkles.end(),
                       [](const Sparkle& s) { return s.life <= 0.0f; }),
        m_sparkles.end());
}

void SparkleSystem::draw(DrawSurface& surface) const {
    for (const auto& s : m_sparkles) {
        float frac = s.lifeFraction();
        surface.circle(s.position, s.size * frac, palette::Sparkle, frac);
    }
}

} // namespace flora
