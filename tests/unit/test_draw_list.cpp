/**
 * @file test_draw_list.cpp
 * @brief Unit tests for DrawList recording and replay
 */

#include <catch2/catch_test_macros.hpp>
#include <flora/draw_list.h>
#include <flora/tessellator.h>

using namespace flora;

TEST_CASE("DrawList records commands in order", "[drawlist]") {
    DrawList list;
    glm::vec3 color(0.2f, 0.4f, 0.6f);

    list.line(glm::vec2(1.0f, 2.0f), glm::vec2(3.0f, 4.0f), 3.0f, color);
    list.circle(glm::vec2(5.0f), 2.0f, color, 0.5f);
    list.polygon({glm::vec2(0.0f), glm::vec2(1.0f, 0.0f), glm::vec2(1.0f)}, color);
    list.circle(glm::vec2(7.0f), 1.0f, color);

    REQUIRE(list.size() == 4);
    REQUIRE(list.count(DrawCommandType::Circle) == 2);
    REQUIRE(list.count(DrawCommandType::Line) == 1);
    REQUIRE(list.count(DrawCommandType::Polygon) == 1);

    const auto& cmds = list.commands();
    REQUIRE(cmds[0].type == DrawCommandType::Line);
    REQUIRE(cmds[0].width == 3.0f);
    REQUIRE(cmds[1].alpha == 0.5f);
    REQUIRE(cmds[2].points.size() == 3);
    REQUIRE(cmds[3].alpha == 1.0f);

    list.clear();
    REQUIRE(list.empty());
}

TEST_CASE("DrawList replay", "[drawlist]") {
    DrawList list;
    glm::vec3 color(1.0f);
    list.line(glm::vec2(0.0f), glm::vec2(10.0f, 0.0f), 2.0f, color);
    list.circle(glm::vec2(0.0f), 4.0f, color, 0.5f);

    SECTION("into another list without offset is an exact copy") {
        DrawList copy;
        list.replay(copy);
        REQUIRE(copy.size() == 2);
        REQUIRE(copy.commands()[0].p1 == glm::vec2(10.0f, 0.0f));
        REQUIRE(copy.commands()[1].width == 4.0f);
    }

    SECTION("offset moves positions but not sizes") {
        DrawList moved;
        list.replay(moved, glm::vec2(3.0f, -2.0f));
        REQUIRE(moved.commands()[0].p0 == glm::vec2(3.0f, -2.0f));
        REQUIRE(moved.commands()[0].width == 2.0f);
        REQUIRE(moved.commands()[1].p0 == glm::vec2(3.0f, -2.0f));
        REQUIRE(moved.commands()[1].width == 4.0f);
    }

    SECTION("into a tessellator") {
        Tessellator t;
        list.replay(t);
        // Quad plus an 8-segment fan
        REQUIRE(t.triangleCount() == 2 + 8);
    }
}
