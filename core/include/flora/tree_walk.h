#pragma once

/**
 * @file tree_walk.h
 * @brief Depth-first walk over a branch arena driven by a visitor
 *
 * The visitor provides:
 * @code
 * bool enter(BranchId id);                 // return true to visit children
 * void leave(BranchId id, bool descended); // after children (if any)
 * @endcode
 *
 * Children are visited in creation order. Depth is bounded by
 * Branch::MAX_DEPTH so recursion stays shallow.
 */

#include <flora/branch.h>
#include <cstddef>

namespace flora {

template<typename Tree, typename Visitor>
void walkTree(Tree& tree, BranchId id, Visitor& visitor) {
    bool descend = visitor.enter(id);
    if (descend) {
        // Index loop: the arena never grows during a walk
        for (size_t i = 0; i < tree.branch(id).children.size(); i++) {
            walkTree(tree, tree.branch(id).children[i], visitor);
        }
    }
    visitor.leave(id, descend);
}

} // namespace flora
