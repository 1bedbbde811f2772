#pragma once

/**
 * @file tessellator.h
 * @brief DrawSurface that turns draw calls into an indexed triangle list
 *
 * The tessellator has no GPU dependency. SceneCanvas uploads its vertex
 * and index arrays once per frame and issues a single draw call.
 *
 * - Lines become quads perpendicular to the segment
 * - Circles become triangle fans (segment count scales with radius)
 * - Polygons become fans from their first point
 */

#include <flora/draw_surface.h>
#include <cstdint>
#include <vector>

namespace flora {

/**
 * @brief Vertex for the scene pipeline
 */
struct CanvasVertex {
    glm::vec2 position;  ///< Screen space position in pixels
    glm::vec4 color;     ///< RGBA, straight alpha
};

class Tessellator : public DrawSurface {
public:
    static constexpr int MIN_CIRCLE_SEGMENTS = 8;
    static constexpr int MAX_CIRCLE_SEGMENTS = 48;

    void line(const glm::vec2& p0, const glm::vec2& p1, float width,
              const glm::vec3& color) override;
    void polygon(const std::vector<glm::vec2>& points, const glm::vec3& color) override;
    void circle(const glm::vec2& center, float radius, const glm::vec3& color,
                float alpha = 1.0f) override;

    /// @brief Start a new frame
    void clear();

    const std::vector<CanvasVertex>& vertices() const { return m_vertices; }
    const std::vector<uint32_t>& indices() const { return m_indices; }
    size_t triangleCount() const { return m_indices.size() / 3; }

    /// @brief Segments used for a circle of the given radius
    static int circleSegments(float radius);

private:
    void addQuad(glm::vec2 p0, glm::vec2 p1, glm::vec2 p2, glm::vec2 p3, const glm::vec4& color);

    std::vector<CanvasVertex> m_vertices;
    std::vector<uint32_t> m_indices;
};

} // namespace flora
