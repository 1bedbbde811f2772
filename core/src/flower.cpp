#include <flora/flower.h>
#include <flora/math.h>
#include <flora/palette.h>

namespace flora {

int Flower::update(const BandLevels& levels, const Branch& owner, RandomSource& rng,
                   SparkleSystem& sparkles) {
    advanceBloom(levels, owner.growth);
    int emitted = emitOnRisingEdge(worldPosition(owner), rng, sparkles);
    rotation += levels.treble * SPIN_GAIN;
    return emitted;
}

void Flower::advanceBloom(const BandLevels& levels, float branchGrowth) {
    float target = 0.0f;
    if (branchGrowth > BRANCH_GATE) {
        target = clamp01(levels.treble * BLOOM_GAIN);
    }
    bloom = smoothValue(bloom, target, BLOOM_RATE);
}

int Flower::emitOnRisingEdge(const glm::vec2& origin, RandomSource& rng,
                             SparkleSystem& sparkles) {
    int emitted = 0;
    if (bloom > EMIT_THRESHOLD && bloom > lastBloom + EMIT_RISE) {
        emitted = rng.range(MIN_BURST, MAX_BURST);
        for (int i = 0; i < emitted; i++) {
            sparkles.spawn(origin, rng);
        }
    }
    lastBloom = bloom;
    return emitted;
}

glm::vec2 Flower::worldPosition(const Branch& owner) const {
    return owner.pointAlong(position);
}

void Flower::draw(const Branch& owner, DrawSurface& surface) const {
    if (!isVisible()) return;

    glm::vec2 center = worldPosition(owner);
    float s = size * bloom;

    for (int i = 0; i < petals; i++) {
        float angle = rotation + i * (360.0f / petals);
        glm::vec2 petal = center + directionFromDegrees(angle) * (s * 0.4f);

        surface.circle(petal, s * 0.5f, palette::FlowerBase, PETAL_ALPHA);

        if (bloom > HIGHLIGHT_BLOOM) {
            glm::vec2 offset = directionFromDegrees(angle + 10.0f) * (s * 0.1f);
            surface.circle(petal + offset, s * 0.3f, palette::FlowerHighlight, HIGHLIGHT_ALPHA);
        }
    }

    surface.circle(center, s * 0.15f, palette::FlowerCenter);
}

} // namespace flora
