#pragma once

/**
 * @file leaf.h
 * @brief Leaf that unfurls along its branch with the mids
 */

#include <flora/branch.h>
#include <flora/draw_surface.h>
#include <glm/glm.hpp>
#include <vector>

namespace flora {

struct Leaf {
    static constexpr float BRANCH_GATE = 0.4f;   ///< Parent growth needed to unfurl
    static constexpr float GROWTH_GAIN = 1.5f;
    static constexpr float UNFURL_RATE = 0.07f;
    static constexpr float FURL_RATE = 0.12f;
    static constexpr float VISIBLE_GROWTH = 0.05f;
    static constexpr int OUTLINE_SEGMENTS = 8;
    static constexpr float VEIN_SHADE = 0.7f;

    BranchId branch = NO_BRANCH;
    float position = 0.5f;     ///< Fraction along the branch
    float angleOffset = 0.0f;  ///< Degrees relative to the branch
    float length = 50.0f;
    float width = 12.0f;
    float curveFactor = 0.5f;
    float growth = 0.0f;

    /// @brief Advance growth given the owning branch's growth
    void update(const BandLevels& levels, float branchGrowth);

    bool isVisible() const { return growth > VISIBLE_GROWTH; }

    /// @brief Attachment point on the branch (at its current length)
    glm::vec2 basePosition(const Branch& owner) const;

    /// @brief Leaf tip at the current growth
    glm::vec2 tipPosition(const Branch& owner) const;

    /**
     * @brief Closed outline of the leaf
     *
     * Base point, eight points bulging to one side, the tip, then seven
     * mirrored points back toward the base. The shape is star-shaped
     * around the base point.
     */
    std::vector<glm::vec2> outline(const Branch& owner) const;

    /// @brief Fill color, darker while furled
    glm::vec3 color() const;

    /// @brief Draw the blade and its vein (no-op while not visible)
    void draw(const Branch& owner, DrawSurface& surface) const;
};

} // namespace flora
