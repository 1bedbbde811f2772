#include <flora/level_meter.h>
#include <flora/math.h>
#include <flora/palette.h>
#include <vector>

namespace flora {

namespace {

std::vector<glm::vec2> rect(glm::vec2 origin, float w, float h) {
    return {
        origin,
        origin + glm::vec2(w, 0.0f),
        origin + glm::vec2(w, h),
        origin + glm::vec2(0.0f, h)
    };
}

} // namespace

glm::vec2 LevelMeter::barOrigin(size_t index) {
    return glm::vec2(ORIGIN_X, ORIGIN_Y + ROW_SPACING * static_cast<float>(index));
}

void LevelMeter::draw(const BandLevels& levels, DrawSurface& surface) const {
    for (size_t i = 0; i < BandLevels::COUNT; i++) {
        glm::vec2 origin = barOrigin(i);
        surface.polygon(rect(origin, BAR_WIDTH, BAR_HEIGHT), palette::MeterTrack);

        float fill = clamp01(levels[i]) * BAR_WIDTH;
        if (fill > 0.0f) {
            surface.polygon(rect(origin, fill, BAR_HEIGHT), palette::MeterFill);
        }
    }
}

} // namespace flora
