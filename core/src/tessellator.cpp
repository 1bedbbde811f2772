#include <flora/tessellator.h>
#include <flora/math.h>
#include <algorithm>
#include <cmath>

namespace flora {

void Tessellator::clear() {
    m_vertices.clear();
    m_indices.clear();
}

int Tessellator::circleSegments(float radius) {
    int segments = static_cast<int>(std::ceil(radius * 2.0f));
    return std::clamp(segments, MIN_CIRCLE_SEGMENTS, MAX_CIRCLE_SEGMENTS);
}

void Tessellator::addQuad(glm::vec2 p0, glm::vec2 p1, glm::vec2 p2, glm::vec2 p3,
                          const glm::vec4& color) {
    uint32_t baseIndex = static_cast<uint32_t>(m_vertices.size());

    m_vertices.push_back({p0, color});
    m_vertices.push_back({p1, color});
    m_vertices.push_back({p2, color});
    m_vertices.push_back({p3, color});

    m_indices.push_back(baseIndex + 0);
    m_indices.push_back(baseIndex + 1);
    m_indices.push_back(baseIndex + 2);
    m_indices.push_back(baseIndex + 0);
    m_indices.push_back(baseIndex + 2);
    m_indices.push_back(baseIndex + 3);
}

void Tessellator::line(const glm::vec2& p0, const glm::vec2& p1, float width,
                       const glm::vec3& color) {
    glm::vec2 dir = p1 - p0;
    float len = glm::length(dir);
    if (len < 0.001f || width <= 0.0f) return;

    dir = dir / len;
    glm::vec2 perp(-dir.y, dir.x);
    float halfWidth = width * 0.5f;

    addQuad(p0 - perp * halfWidth,
            p0 + perp * halfWidth,
            p1 + perp * halfWidth,
            p1 - perp * halfWidth,
            glm::vec4(color, 1.0f));
}

void Tessellator::polygon(const std::vector<glm::vec2>& points, const glm::vec3& color) {
    if (points.size() < 3) return;

    glm::vec4 rgba(color, 1.0f);
    uint32_t baseIndex = static_cast<uint32_t>(m_vertices.size());
    for (const auto& p : points) {
        m_vertices.push_back({p, rgba});
    }

    uint32_t count = static_cast<uint32_t>(points.size());
    for (uint32_t i = 1; i + 1 < count; i++) {
        m_indices.push_back(baseIndex);
        m_indices.push_back(baseIndex + i);
        m_indices.push_back(baseIndex + i + 1);
    }
}

void Tessellator::circle(const glm::vec2& center, float radius, const glm::vec3& color,
                         float alpha) {
    if (radius <= 0.0f || alpha <= 0.0f) return;

    glm::vec4 rgba(color, clamp01(alpha));
    int segments = circleSegments(radius);
    uint32_t centerIndex = static_cast<uint32_t>(m_vertices.size());

    m_vertices.push_back({center, rgba});
    for (int i = 0; i <= segments; i++) {
        float angle = static_cast<float>(i) / segments * TWO_PI;
        glm::vec2 p = center + glm::vec2(std::cos(angle), std::sin(angle)) * radius;
        m_vertices.push_back({p, rgba});
    }

    for (int i = 0; i < segments; i++) {
        m_indices.push_back(centerIndex);
        m_indices.push_back(centerIndex + 1 + i);
        m_indices.push_back(centerIndex + 2 + i);
    }
}

} // namespace flora
