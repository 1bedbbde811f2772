#pragma once

/**
 * @file palette.h
 * @brief Fixed scene colors
 *
 * Colors are RGB in 0-1 range. They are authored as 8-bit values to keep
 * them readable next to the artwork they were picked from.
 */

#include <glm/glm.hpp>

namespace flora {

/// @brief Build a 0-1 RGB color from 8-bit components
inline glm::vec3 rgb8(int r, int g, int b) {
    return glm::vec3(r / 255.0f, g / 255.0f, b / 255.0f);
}

namespace palette {

inline const glm::vec3 Background = rgb8(15, 10, 20);
inline const glm::vec3 Branch = rgb8(80, 60, 40);

// Watercolor blue petals
inline const glm::vec3 FlowerBase = rgb8(100, 130, 220);
inline const glm::vec3 FlowerHighlight = rgb8(200, 220, 255);
inline const glm::vec3 FlowerCenter = rgb8(255, 255, 200);

// Muted green leaves, interpolated by growth
inline const glm::vec3 LeafStart = rgb8(40, 60, 45);
inline const glm::vec3 LeafEnd = rgb8(90, 130, 95);

inline const glm::vec3 Sparkle = rgb8(240, 245, 255);

// Level meter overlay
inline const glm::vec3 MeterTrack = rgb8(60, 60, 60);
inline const glm::vec3 MeterFill = rgb8(150, 255, 150);

} // namespace palette

} // namespace flora
