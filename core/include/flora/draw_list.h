#pragma once

/**
 * @file draw_list.h
 * @brief Recording DrawSurface that can be replayed with a translation
 *
 * The scene layer draws into a DrawList every tick. The compositor then
 * replays it onto the real target with the shake offset applied, which
 * keeps the shake out of the overlay drawn afterwards.
 */

#include <flora/draw_surface.h>
#include <cstddef>
#include <vector>

namespace flora {

enum class DrawCommandType {
    Line,
    Polygon,
    Circle
};

/**
 * @brief One recorded draw call
 *
 * Only the fields relevant to the command type are meaningful.
 */
struct DrawCommand {
    DrawCommandType type = DrawCommandType::Line;
    glm::vec2 p0{0.0f};          ///< Line start / circle center
    glm::vec2 p1{0.0f};          ///< Line end
    std::vector<glm::vec2> points;  ///< Polygon points
    float width = 1.0f;          ///< Line width / circle radius
    glm::vec3 color{1.0f};
    float alpha = 1.0f;
};

class DrawList : public DrawSurface {
public:
    void line(const glm::vec2& p0, const glm::vec2& p1, float width,
              const glm::vec3& color) override;
    void polygon(const std::vector<glm::vec2>& points, const glm::vec3& color) override;
    void circle(const glm::vec2& center, float radius, const glm::vec3& color,
                float alpha = 1.0f) override;

    /// @brief Drop all recorded commands (keeps capacity)
    void clear() { m_commands.clear(); }

    size_t size() const { return m_commands.size(); }
    bool empty() const { return m_commands.empty(); }
    const std::vector<DrawCommand>& commands() const { return m_commands; }

    /// @brief Number of recorded commands of a given type
    size_t count(DrawCommandType type) const;

    /**
     * @brief Re-issue every recorded command onto another surface
     * @param target Surface to draw onto
     * @param offset Translation added to every position
     */
    void replay(DrawSurface& target, const glm::vec2& offset = glm::vec2(0.0f)) const;

private:
    std::vector<DrawCommand> m_commands;
};

} // namespace flora
