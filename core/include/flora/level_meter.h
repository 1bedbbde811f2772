#pragma once

/**
 * @file level_meter.h
 * @brief Stationary debug overlay with one bar per audio band
 */

#include <flora/audio_levels.h>
#include <flora/draw_surface.h>
#include <glm/glm.hpp>

namespace flora {

class LevelMeter {
public:
    static constexpr float BAR_WIDTH = 200.0f;
    static constexpr float BAR_HEIGHT = 10.0f;
    static constexpr float ORIGIN_X = 100.0f;
    static constexpr float ORIGIN_Y = 10.0f;
    static constexpr float ROW_SPACING = 25.0f;

    /// @brief Draw track and fill for volume, bass, mids, treble
    void draw(const BandLevels& levels, DrawSurface& surface) const;

    /// @brief Top-left corner of the bar for a band index
    static glm::vec2 barOrigin(size_t index);

    bool visible() const { return m_visible; }
    void setVisible(bool visible) { m_visible = visible; }
    void toggle() { m_visible = !m_visible; }

private:
    bool m_visible = true;
};

} // namespace flora
