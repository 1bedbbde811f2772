#pragma once

/**
 * @file branch.h
 * @brief One segment of the growth tree
 *
 * Branches live in a flat arena owned by GrowthTree and refer to each
 * other, and to their leaves and flowers, by index. A branch's length
 * follows its growth value, so its end point moves every tick while the
 * maximum length, angle and thickness never change after construction.
 */

#include <flora/audio_levels.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <limits>
#include <vector>

namespace flora {

using BranchId = uint32_t;
using LeafId = uint32_t;
using FlowerId = uint32_t;

constexpr BranchId NO_BRANCH = std::numeric_limits<BranchId>::max();

struct Branch {
    static constexpr int MAX_DEPTH = 7;
    static constexpr float GROWTH_RATE = 0.06f;
    static constexpr float GROWTH_GAIN = 1.2f;        ///< mids -> growth target
    static constexpr float PULSE_GAIN = 0.1f;
    static constexpr int PULSE_DEPTH_LIMIT = 4;       ///< Branches at this depth or deeper don't pulse
    static constexpr float VISIBLE_GROWTH = 0.01f;
    static constexpr float PROPAGATE_GROWTH = 0.05f;

    glm::vec2 start{0.0f};
    float angle = 0.0f;        ///< Degrees, screen space
    float maxLength = 0.0f;
    float thickness = 1.0f;
    int depth = 0;

    float growth = 0.0f;
    float pulse = 1.0f;

    BranchId parent = NO_BRANCH;
    std::vector<BranchId> children;
    std::vector<LeafId> leaves;
    std::vector<FlowerId> flowers;

    /// @brief Unit vector along the branch
    glm::vec2 direction() const;

    /// @brief End point at the current growth
    glm::vec2 endPosition() const;

    /// @brief End point at full length
    glm::vec2 fullyGrownEnd() const;

    /// @brief Point at fraction t of the current length
    glm::vec2 pointAlong(float t) const;

    /**
     * @brief Advance growth and pulse for one tick
     *
     * Growth eases toward mids x 1.2 (clamped to 0-1). Pulse thickens
     * the trunk and the lowest branches on bass hits.
     */
    void updateGrowth(const BandLevels& levels);

    /// @brief Stroke width at the current growth and pulse (at least 1 px)
    float strokeWidth() const;

    bool isVisible() const { return growth > VISIBLE_GROWTH; }

    /// @brief Whether children follow this branch's end this tick
    bool propagates() const { return growth > PROPAGATE_GROWTH; }
};

} // namespace flora
