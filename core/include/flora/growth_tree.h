#pragma once

/**
 * @file growth_tree.h
 * @brief Procedurally generated plant whose growth follows the audio
 *
 * The tree is generated once from a seed and never restructured. Each
 * tick only growth, bloom, positions and particles change.
 *
 * @par Example
 * @code
 * RandomSource rng(7);
 * GrowthTree tree;
 * tree.build(TreeShape::forViewport(1920, 1080), rng);
 *
 * // Each tick:
 * tree.update(levels, rng, sparkles);
 * tree.draw(sceneLayer);
 * @endcode
 */

#include <flora/audio_levels.h>
#include <flora/branch.h>
#include <flora/draw_surface.h>
#include <flora/flower.h>
#include <flora/leaf.h>
#include <flora/random.h>
#include <flora/sparkles.h>
#include <glm/glm.hpp>
#include <vector>

namespace flora {

/**
 * @brief Root branch parameters
 */
struct TreeShape {
    glm::vec2 rootStart{0.0f};
    float rootAngle = -90.0f;     ///< Straight up
    float rootLength = 100.0f;
    float rootThickness = 25.0f;

    /// @brief Root planted just below the bottom center of a viewport
    static TreeShape forViewport(int width, int height);
};

class GrowthTree {
public:
    // Generation parameters
    static constexpr int FLOWER_MIN_DEPTH = 4;
    static constexpr float FLOWER_CHANCE = 0.7f;
    static constexpr int LEAF_MIN_DEPTH = 2;
    static constexpr int LEAF_MAX_DEPTH = 5;
    static constexpr float LEAF_CHANCE = 0.8f;
    static constexpr float LEAF_ANGLE = 55.0f;
    static constexpr float LEAF_JITTER = 10.0f;
    static constexpr int CHILD_MAX_PARENT_DEPTH = 5;   ///< Only depths 0-5 get children
    static constexpr int MIN_CHILDREN = 1;
    static constexpr int MAX_CHILDREN = 3;
    static constexpr float CHILD_ANGLE_SPREAD = 35.0f;
    static constexpr float CHILD_MIN_LENGTH = 0.6f;
    static constexpr float CHILD_MAX_LENGTH = 0.9f;
    static constexpr float CHILD_THICKNESS = 0.7f;

    /**
     * @brief Generate the whole tree, replacing any previous one
     *
     * Draws from rng in a fixed order, so the same seed and shape always
     * produce the same tree.
     */
    void build(const TreeShape& shape, RandomSource& rng);

    /**
     * @brief Advance one tick
     *
     * Growth, then children (only while this branch is visibly present),
     * then this branch's flowers and leaves. Flowers may spawn sparkles.
     */
    void update(const BandLevels& levels, RandomSource& rng, SparkleSystem& sparkles);

    /**
     * @brief Draw every visible branch
     *
     * Per branch: line, leaves, children, flowers. Branches at or below
     * the visibility threshold are skipped together with their subtree.
     */
    void draw(DrawSurface& surface) const;

    bool empty() const { return m_branches.empty(); }
    BranchId root() const { return 0; }

    Branch& branch(BranchId id) { return m_branches.at(id); }
    const Branch& branch(BranchId id) const { return m_branches.at(id); }
    size_t branchCount() const { return m_branches.size(); }
    const std::vector<Branch>& branches() const { return m_branches; }

    Leaf& leaf(LeafId id) { return m_leaves.at(id); }
    const std::vector<Leaf>& leaves() const { return m_leaves; }

    Flower& flower(FlowerId id) { return m_flowers.at(id); }
    const std::vector<Flower>& flowers() const { return m_flowers; }

    /// @brief Deepest branch depth in the tree (-1 if empty)
    int maxDepth() const;

    glm::vec2 endPosition(BranchId id) const { return branch(id).endPosition(); }
    glm::vec2 pointAlong(BranchId id, float t) const { return branch(id).pointAlong(t); }

private:
    BranchId grow(const glm::vec2& start, float angle, float length, float thickness,
                  int depth, BranchId parent, RandomSource& rng);

    std::vector<Branch> m_branches;
    std::vector<Leaf> m_leaves;
    std::vector<Flower> m_flowers;
};

} // namespace flora
