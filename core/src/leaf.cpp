#include <flora/leaf.h>
#include <flora/math.h>
#include <flora/palette.h>
#include <cmath>

namespace flora {

void Leaf::update(const BandLevels& levels, float branchGrowth) {
    if (branchGrowth > BRANCH_GATE) {
        float target = clamp01(levels.mids * GROWTH_GAIN);
        growth = smoothValue(growth, target, UNFURL_RATE);
    } else {
        growth = smoothValue(growth, 0.0f, FURL_RATE);
    }
}

glm::vec2 Leaf::basePosition(const Branch& owner) const {
    return owner.pointAlong(position);
}

glm::vec2 Leaf::tipPosition(const Branch& owner) const {
    glm::vec2 dir = directionFromDegrees(owner.angle + angleOffset);
    return basePosition(owner) + dir * (length * growth);
}

std::vector<glm::vec2> Leaf::outline(const Branch& owner) const {
    glm::vec2 base = basePosition(owner);
    glm::vec2 dir = directionFromDegrees(owner.angle + angleOffset);
    glm::vec2 side(-dir.y, dir.x);

    auto pointAt = [&](int i, float sign) {
        float t = static_cast<float>(i) / OUTLINE_SEGMENTS;
        float along = t * length * growth;
        float lateral = std::sin(t * PI) * width * growth * curveFactor;
        return base + dir * along + side * (lateral * sign);
    };

    std::vector<glm::vec2> points;
    points.reserve(OUTLINE_SEGMENTS * 2 + 1);
    points.push_back(base);
    for (int i = 1; i <= OUTLINE_SEGMENTS; i++) {
        points.push_back(pointAt(i, 1.0f));
    }
    points.push_back(tipPosition(owner));
    for (int i = OUTLINE_SEGMENTS - 1; i >= 1; i--) {
        points.push_back(pointAt(i, -1.0f));
    }
    return points;
}

glm::vec3 Leaf::color() const {
    return glm::mix(palette::LeafStart, palette::LeafEnd, clamp01(growth));
}

void Leaf::draw(const Branch& owner, DrawSurface& surface) const {
    if (!isVisible()) return;

    glm::vec3 fill = color();
    surface.polygon(outline(owner), fill);
    surface.line(basePosition(owner), tipPosition(owner), 1.0f, fill * VEIN_SHADE);
}

} // namespace flora
