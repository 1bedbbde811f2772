#pragma once

/**
 * @file draw_surface.h
 * @brief Abstract 2D drawing target
 *
 * Everything in the scene draws through this interface: the GPU-backed
 * tessellator, the recording DrawList used for the shaken scene layer,
 * and test doubles.
 *
 * Coordinates are screen pixels with +y down. Colors are RGB in 0-1.
 */

#include <glm/glm.hpp>
#include <vector>

namespace flora {

class DrawSurface {
public:
    virtual ~DrawSurface() = default;

    /// @brief Straight line with a stroke width in pixels
    virtual void line(const glm::vec2& p0, const glm::vec2& p1, float width,
                      const glm::vec3& color) = 0;

    /// @brief Filled polygon (points in order)
    virtual void polygon(const std::vector<glm::vec2>& points, const glm::vec3& color) = 0;

    /// @brief Filled circle with optional alpha
    virtual void circle(const glm::vec2& center, float radius, const glm::vec3& color,
                        float alpha = 1.0f) = 0;
};

} // namespace flora
