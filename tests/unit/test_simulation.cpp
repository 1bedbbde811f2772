/**
 * @file test_simulation.cpp
 * @brief End-to-end tests for FloraSimulation tick and render
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <flora/simulation.h>
#include <algorithm>

using namespace flora;
using Catch::Matchers::WithinAbs;

namespace {

BandEnergies uniformEnergies(float v) {
    BandEnergies e;
    e.volume = e.bass = e.mids = e.treble = v;
    return e;
}

// First seed at or after `from` whose tree carries at least one flower
int seedWithFlowers(int from) {
    for (int seed = from;; seed++) {
        RandomSource rng(static_cast<uint32_t>(seed));
        GrowthTree tree;
        tree.build(TreeShape::forViewport(1920, 1080), rng);
        if (!tree.flowers().empty()) {
            return seed;
        }
    }
}

} // namespace

TEST_CASE("FloraSimulation construction", "[simulation]") {
    FloraConfig config;
    config.seed = 31;
    config.fps = 30;
    config.overlay = false;

    FloraSimulation sim(config);

    REQUIRE(sim.seed() == 31);
    REQUIRE(sim.tickCount() == 0);
    REQUIRE_FALSE(sim.tree().empty());
    REQUIRE(sim.sparkles().tickRate() == 30.0f);

    SECTION("hidden overlay adds nothing to the frame") {
        sim.tick(uniformEnergies(1.0f));
        DrawList target;
        sim.render(target);
        REQUIRE(target.size() == sim.sceneLayer().size());
    }

    SECTION("seed resolution") {
        REQUIRE(FloraSimulation::resolveSeed(5) == 5);
    }
}

TEST_CASE("FloraSimulation is deterministic for a seed", "[simulation]") {
    FloraConfig config;
    config.seed = 2024;

    FloraSimulation a(config);
    FloraSimulation b(config);

    for (int n = 0; n < 120; n++) {
        float v = static_cast<float>((n * 37) % 11);
        a.tick(uniformEnergies(v));
        b.tick(uniformEnergies(v));
    }

    REQUIRE(a.tree().branchCount() == b.tree().branchCount());
    REQUIRE(a.sparkles().count() == b.sparkles().count());
    REQUIRE(a.compositor().offset() == b.compositor().offset());
    for (BranchId id = 0; id < a.tree().branchCount(); id++) {
        REQUIRE(a.tree().branch(id).growth == b.tree().branch(id).growth);
    }
}

TEST_CASE("FloraSimulation responds to sustained input and silence", "[simulation][e2e]") {
    FloraConfig config;
    config.seed = seedWithFlowers(1);

    FloraSimulation sim(config);
    REQUIRE_FALSE(sim.tree().flowers().empty());

    size_t peakSparkles = 0;
    for (int n = 0; n < 200; n++) {
        sim.tick(uniformEnergies(1.0f));
        peakSparkles = std::max(peakSparkles, sim.sparkles().count());
    }

    REQUIRE(sim.tickCount() == 200);
    REQUIRE_THAT(sim.levels().mids, WithinAbs(1.0f, 1e-3f));
    REQUIRE(sim.tree().branch(sim.tree().root()).growth > 0.95f);

    float maxBloom = 0.0f;
    for (const Flower& f : sim.tree().flowers()) {
        maxBloom = std::max(maxBloom, f.bloom);
    }
    REQUIRE(maxBloom > 0.5f);
    REQUIRE(peakSparkles > 0);

    DrawList loudFrame;
    sim.render(loudFrame);
    size_t loudCommands = sim.sceneLayer().size();
    REQUIRE(loudCommands > 0);

    float previousGrowth = sim.tree().branch(sim.tree().root()).growth;
    for (int n = 0; n < 100; n++) {
        sim.tick(uniformEnergies(0.0f));
        float growth = sim.tree().branch(sim.tree().root()).growth;
        REQUIRE(growth <= previousGrowth);
        previousGrowth = growth;
    }

    REQUIRE(sim.levels().mids < 1e-6f);
    REQUIRE(sim.sparkles().count() == 0);
    REQUIRE(sim.compositor().shakeMagnitude() < 1e-4f);

    // Root dropped out of sight, taking the whole tree with it
    REQUIRE_FALSE(sim.tree().branch(sim.tree().root()).isVisible());

    DrawList quietFrame;
    sim.render(quietFrame);
    REQUIRE(sim.sceneLayer().size() < loudCommands);
    REQUIRE(sim.sceneLayer().empty());
}
