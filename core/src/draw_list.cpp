#include <flora/draw_list.h>
#include <algorithm>

namespace flora {

void DrawList::line(const glm::vec2& p0, const glm::vec2& p1, float width,
                    const glm::vec3& color) {
    DrawCommand cmd;
    cmd.type = DrawCommandType::Line;
    cmd.p0 = p0;
    cmd.p1 = p1;
    cmd.width = width;
    cmd.color = color;
    m_commands.push_back(std::move(cmd));
}

void DrawList::polygon(const std::vector<glm::vec2>& points, const glm::vec3& color) {
    DrawCommand cmd;
    cmd.type = DrawCommandType::Polygon;
    cmd.points = points;
    cmd.color = color;
    m_commands.push_back(std::move(cmd));
}

void DrawList::circle(const glm::vec2& center, float radius, const glm::vec3& color,
                      float alpha) {
    DrawCommand cmd;
    cmd.type = DrawCommandType::Circle;
    cmd.p0 = center;
    cmd.width = radius;
    cmd.color = color;
    cmd.alpha = alpha;
    m_commands.push_back(std::move(cmd));
}

size_t DrawList::count(DrawCommandType type) const {
    return static_cast<size_t>(std::count_if(m_commands.begin(), m_commands.end(),
        [type](const DrawCommand& cmd) { return cmd.type == type; }));
}

void DrawList::replay(DrawSurface& target, const glm::vec2& offset) const {
    std::vector<glm::vec2> shifted;
    for (const auto& cmd : m_commands) {
        switch (cmd.type) {
            case DrawCommandType::Line:
                target.line(cmd.p0 + offset, cmd.p1 + offset, cmd.width, cmd.color);
                break;
            case DrawCommandType::Polygon:
                shifted.clear();
                for (const auto& p : cmd.points) {
                    shifted.push_back(p + offset);
                }
                target.polygon(shifted, cmd.color);
                break;
            case DrawCommandType::Circle:
                target.circle(cmd.p0 + offset, cmd.width, cmd.color, cmd.alpha);
                break;
        }
    }
}

} // namespace flora
