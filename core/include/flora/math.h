#pragma once

// Flora - small math helpers shared by the simulation

#include <glm/glm.hpp>
#include <algorithm>
#include <cmath>

namespace flora {

constexpr float PI = 3.14159265358979f;
constexpr float TWO_PI = 2.0f * PI;

/// Exponential smoothing step: move current toward target by factor.
inline float smoothValue(float current, float target, float factor) {
    return current + (target - current) * factor;
}

inline float clamp01(float v) {
    return std::clamp(v, 0.0f, 1.0f);
}

inline float toRadians(float degrees) {
    return degrees * (PI / 180.0f);
}

/// Unit vector for an angle in degrees (screen space, +y down).
inline glm::vec2 directionFromDegrees(float degrees) {
    float rad = toRadians(degrees);
    return glm::vec2(std::cos(rad), std::sin(rad));
}

} // namespace flora
