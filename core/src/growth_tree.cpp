#include <flora/growth_tree.h>
#include <flora/palette.h>
#include <flora/tree_walk.h>
#include <algorithm>

namespace flora {

TreeShape TreeShape::forViewport(int width, int height) {
    TreeShape shape;
    shape.rootStart = glm::vec2(width / 2.0f, height + 20.0f);
    shape.rootAngle = -90.0f;
    shape.rootLength = height / 3.5f;
    shape.rootThickness = 25.0f;
    return shape;
}

void GrowthTree::build(const TreeShape& shape, RandomSource& rng) {
    m_branches.clear();
    m_leaves.clear();
    m_flowers.clear();

    grow(shape.rootStart, shape.rootAngle, shape.rootLength, shape.rootThickness, 0,
         NO_BRANCH, rng);
}

BranchId GrowthTree::grow(const glm::vec2& start, float angle, float length, float thickness,
                          int depth, BranchId parent, RandomSource& rng) {
    BranchId id = static_cast<BranchId>(m_branches.size());
    {
        Branch b;
        b.start = start;
        b.angle = angle;
        b.maxLength = length;
        b.thickness = thickness;
        b.depth = depth;
        b.parent = parent;
        m_branches.push_back(std::move(b));
    }

    // Children start where this branch ends once fully grown. update()
    // re-anchors them to the live end point as soon as this branch shows.
    glm::vec2 anchor = m_branches[id].fullyGrownEnd();

    if (depth >= FLOWER_MIN_DEPTH && rng.chance(FLOWER_CHANCE)) {
        Flower f;
        f.branch = id;
        f.position = rng.uniform(0.5f, 1.0f);
        f.size = rng.uniform(15.0f, 28.0f);
        f.rotation = rng.uniform(0.0f, 360.0f);
        f.petals = rng.range(6, 8);
        m_branches[id].flowers.push_back(static_cast<FlowerId>(m_flowers.size()));
        m_flowers.push_back(f);
    }

    if (depth >= LEAF_MIN_DEPTH && depth <= LEAF_MAX_DEPTH && rng.chance(LEAF_CHANCE)) {
        Leaf l;
        l.branch = id;
        l.position = rng.uniform(0.2f, 0.8f);
        float side = rng.either(-LEAF_ANGLE, LEAF_ANGLE);
        l.angleOffset = side + rng.uniform(-LEAF_JITTER, LEAF_JITTER);
        l.length = rng.uniform(35.0f, 70.0f);
        l.width = rng.uniform(8.0f, 18.0f);
        l.curveFactor = rng.uniform(0.3f, 0.7f);
        m_branches[id].leaves.push_back(static_cast<LeafId>(m_leaves.size()));
        m_leaves.push_back(l);
    }

    if (depth <= CHILD_MAX_PARENT_DEPTH && depth < Branch::MAX_DEPTH) {
        int count = rng.range(MIN_CHILDREN, MAX_CHILDREN);
        for (int i = 0; i < count; i++) {
            float childAngle = angle + rng.uniform(-CHILD_ANGLE_SPREAD, CHILD_ANGLE_SPREAD);
            float childLength = length * rng.uniform(CHILD_MIN_LENGTH, CHILD_MAX_LENGTH);
            float childThickness = std::max(1.0f, thickness * CHILD_THICKNESS);

            BranchId child = grow(anchor, childAngle, childLength, childThickness,
                                  depth + 1, id, rng);
            m_branches[id].children.push_back(child);
        }
    }

    return id;
}

int GrowthTree::maxDepth() const {
    int deepest = -1;
    for (const auto& b : m_branches) {
        deepest = std::max(deepest, b.depth);
    }
    return deepest;
}

namespace {

struct UpdateVisitor {
    GrowthTree& tree;
    const BandLevels& levels;
    RandomSource& rng;
    SparkleSystem& sparkles;

    bool enter(BranchId id) {
        Branch& b = tree.branch(id);
        b.updateGrowth(levels);
        if (!b.propagates()) {
            return false;
        }

        glm::vec2 end = b.endPosition();
        for (BranchId child : b.children) {
            tree.branch(child).start = end;
        }
        return true;
    }

    void leave(BranchId id, bool /*descended*/) {
        const Branch& b = tree.branch(id);
        for (FlowerId f : b.flowers) {
            tree.flower(f).update(levels, b, rng, sparkles);
        }
        for (LeafId l : b.leaves) {
            tree.leaf(l).update(levels, b.growth);
        }
    }
};

struct DrawVisitor {
    const GrowthTree& tree;
    DrawSurface& surface;

    bool enter(BranchId id) {
        const Branch& b = tree.branch(id);
        if (!b.isVisible()) {
            return false;
        }

        surface.line(b.start, b.endPosition(), b.strokeWidth(), palette::Branch);
        for (LeafId l : b.leaves) {
            tree.leaves()[l].draw(b, surface);
        }
        return true;
    }

    void leave(BranchId id, bool descended) {
        if (!descended) return;

        const Branch& b = tree.branch(id);
        for (FlowerId f : b.flowers) {
            tree.flowers()[f].draw(b, surface);
        }
    }
};

} // namespace

void GrowthTree::update(const BandLevels& levels, RandomSource& rng, SparkleSystem& sparkles) {
    if (m_branches.empty()) return;

    UpdateVisitor visitor{*this, levels, rng, sparkles};
    walkTree(*this, root(), visitor);
}

void GrowthTree::draw(DrawSurface& surface) const {
    if (m_branches.empty()) return;

    DrawVisitor visitor{*this, surface};
    walkTree(*this, root(), visitor);
}

} // namespace flora
