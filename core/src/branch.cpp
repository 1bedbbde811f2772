#include <flora/branch.h>
#include <flora/math.h>
#include <algorithm>
#include <cmath>

namespace flora {

glm::vec2 Branch::direction() const {
    return directionFromDegrees(angle);
}

glm::vec2 Branch::endPosition() const {
    return start + direction() * (maxLength * growth);
}

glm::vec2 Branch::fullyGrownEnd() const {
    return start + direction() * maxLength;
}

glm::vec2 Branch::pointAlong(float t) const {
    return start + (endPosition() - start) * t;
}

void Branch::updateGrowth(const BandLevels& levels) {
    float target = clamp01(levels.mids * GROWTH_GAIN);
    growth = smoothValue(growth, target, GROWTH_RATE);
    pulse = 1.0f + levels.bass * PULSE_GAIN * static_cast<float>(std::max(0, PULSE_DEPTH_LIMIT - depth));
}

float Branch::strokeWidth() const {
    return std::max(1.0f, std::round(thickness * growth * pulse));
}

} // namespace flora
