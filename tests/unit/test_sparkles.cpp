/**
 * @file test_sparkles.cpp
 * @brief Unit tests for SparkleSystem
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <flora/draw_list.h>
#include <flora/palette.h>
#include <flora/sparkles.h>

using namespace flora;
using Catch::Matchers::WithinAbs;

TEST_CASE("Sparkle spawn ranges", "[sparkles]") {
    SparkleSystem system;
    RandomSource rng(21);
    glm::vec2 origin(5.0f, 6.0f);

    for (int i = 0; i < 200; i++) {
        const Sparkle& s = system.spawn(origin, rng);
        float speed = glm::length(s.velocity);

        REQUIRE(s.position == origin);
        REQUIRE(speed >= 0.8f - 1e-4f);
        REQUIRE(speed <= 2.5f + 1e-4f);
        REQUIRE(s.life >= 0.6f);
        REQUIRE(s.life <= 1.2f);
        REQUIRE(s.maxLife == s.life);
        REQUIRE(s.size >= 1.0f);
        REQUIRE(s.size <= 3.0f);
    }
    REQUIRE(system.count() == 200);
}

TEST_CASE("Sparkle motion", "[sparkles]") {
    SparkleSystem system(60.0f);
    RandomSource rng(8);
    Sparkle s = system.spawn(glm::vec2(0.0f), rng);

    system.update();
    const Sparkle& moved = system.sparkles().front();

    SECTION("moves by its velocity before drag") {
        REQUIRE_THAT(moved.position.x, WithinAbs(s.velocity.x, 1e-6f));
        REQUIRE_THAT(moved.position.y, WithinAbs(s.velocity.y, 1e-6f));
    }

    SECTION("drag slows it") {
        REQUIRE_THAT(moved.velocity.x, WithinAbs(s.velocity.x * 0.93f, 1e-6f));
        REQUIRE_THAT(moved.velocity.y, WithinAbs(s.velocity.y * 0.93f, 1e-6f));
    }

    SECTION("life drops by one tick") {
        REQUIRE_THAT(moved.life, WithinAbs(s.life - 1.0f / 60.0f, 1e-6f));
        REQUIRE(moved.maxLife == s.maxLife);
    }
}

TEST_CASE("Sparkle expiry", "[sparkles]") {
    // Quarter-second ticks keep the arithmetic exact
    SparkleSystem system(4.0f);
    RandomSource rng(2);

    Sparkle& s = system.spawn(glm::vec2(0.0f), rng);
    s.life = 0.5f;
    s.maxLife = 0.5f;

    system.update();
    REQUIRE(system.count() == 1);
    REQUIRE(system.sparkles().front().life == 0.25f);

    system.update();
    REQUIRE(system.count() == 0);
}

TEST_CASE("Sparkle tick rate", "[sparkles]") {
    REQUIRE(SparkleSystem(30.0f).tickRate() == 30.0f);
    REQUIRE(SparkleSystem(0.0f).tickRate() == 60.0f);
}

TEST_CASE("Sparkle drawing fades with life", "[sparkles][draw]") {
    SparkleSystem system(4.0f);
    RandomSource rng(4);

    Sparkle& s = system.spawn(glm::vec2(1.0f, 2.0f), rng);
    s.life = 1.0f;
    s.maxLife = 1.0f;
    s.size = 2.0f;
    s.velocity = glm::vec2(0.0f);

    system.update();

    DrawList list;
    system.draw(list);

    REQUIRE(list.size() == 1);
    const DrawCommand& cmd = list.commands().front();
    REQUIRE(cmd.type == DrawCommandType::Circle);
    REQUIRE(cmd.color == palette::Sparkle);
    REQUIRE_THAT(cmd.alpha, WithinAbs(0.75f, 1e-6f));
    REQUIRE_THAT(cmd.width, WithinAbs(1.5f, 1e-6f));
    REQUIRE(cmd.p0 == glm::vec2(1.0f, 2.0f));

    system.clear();
    REQUIRE(system.count() == 0);
}
