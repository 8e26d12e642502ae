#ifndef ACTIONSELECTOR_HPP
#define ACTIONSELECTOR_HPP

#include "TreeNode.hpp"
#include <cstddef>

// ============================================================================
// ActionSelector - scoring rules over a node's child slots
// ============================================================================

class ActionSelector {
public:
    // Score given to actions the dominance oracle marks as no-gain: the
    // smallest double above lowest(). Lower than any attainable score, but
    // still a real candidate, so a node whose every action is dominated still
    // yields one.
    static const double PRUNED_SCORE;

    // Paranoid UCB used while descending the tree. Every slot must be
    // materialized. Returns the slot index of the chosen action.
    static size_t selectUcb(const TreeNode& node, SearchContext& context);

    // Robust child: the materialized child with the most visits (value is
    // ignored). Used once per decision on the root.
    static size_t selectRobust(const TreeNode& node, SearchContext& context);

    // UCB score of one materialized child, before noise and pruning
    static double ucbValue(const TreeNode& node, const TreeNode& child, const SearchContext& context);

    // Adds a tie-breaking offset in [0, epsilon) to value
    static double noise(double value, double epsilon, double random) {
        return value + epsilon * random;
    }
};

#endif // ACTIONSELECTOR_HPP
