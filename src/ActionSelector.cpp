#include "ActionSelector.hpp"
#include "Profiler.hpp"
#include <cmath>
#include <iostream>
#include <limits>
#include <random>
#include <stdexcept>

const double ActionSelector::PRUNED_SCORE = std::nextafter(std::numeric_limits<double>::lowest(), 0.0);

double ActionSelector::ucbValue(const TreeNode& node, const TreeNode& child, const SearchContext& context) {
    double childVisits = child.getVisitCount() + context.epsilon;
    double meanValue = child.getTotalValue() / childVisits;
    double explorationTerm = context.explorationConstant *
                             std::sqrt(std::log(node.getVisitCount() + 1.0) / childVisits);

    // Paranoid assumption: every other player minimises our value. The sign is
    // flipped before exploration is added so exploration always pushes
    // towards less visited children.
    bool iAmMoving = node.getState().getCurrentPlayer() == context.playerId;
    double value = iAmMoving ? meanValue : -meanValue;
    return value + explorationTerm;
}

size_t ActionSelector::selectUcb(const TreeNode& node, SearchContext& context) {
    PROFILE_SCOPE("ActionSelector::selectUcb");
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    bool found = false;
    size_t bestIndex = 0;
    double bestValue = std::numeric_limits<double>::lowest();

    for (size_t i = 0; i < node.childCount(); i++) {
        const TreeNode* child = node.getChild(i);
        if (child == nullptr) {
            std::cerr << "FATAL: UCB selection reached pending action "
                      << node.getAction(i).toString() << " at depth " << node.getDepth() << ".\n";
            throw std::logic_error("ActionSelector::selectUcb: pending child during selection");
        }

        double value = noise(ucbValue(node, *child, context), context.epsilon, unit(context.rng));

        if (context.oracle != nullptr && context.oracle->isNoGain(node.getState(), node.getAction(i))) {
            value = PRUNED_SCORE;
        }

        if (!found || value > bestValue) {
            found = true;
            bestIndex = i;
            bestValue = value;
        }
    }

    if (!found) {
        std::cerr << "FATAL: UCB selection on a node with no actions (depth " << node.getDepth() << ").\n";
        throw std::logic_error("ActionSelector::selectUcb: no action to select");
    }
    return bestIndex;
}

size_t ActionSelector::selectRobust(const TreeNode& node, SearchContext& context) {
    PROFILE_SCOPE("ActionSelector::selectRobust");
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    bool found = false;
    size_t bestIndex = 0;
    double bestValue = std::numeric_limits<double>::lowest();

    for (size_t i = 0; i < node.childCount(); i++) {
        const TreeNode* child = node.getChild(i);
        if (child == nullptr) continue;

        double value = noise(static_cast<double>(child->getVisitCount()), context.epsilon, unit(context.rng));
        if (!found || value > bestValue) {
            found = true;
            bestIndex = i;
            bestValue = value;
        }
    }

    if (!found) {
        std::cerr << "Error: No actions available to select as best action.\n";
        throw std::logic_error("ActionSelector::selectRobust: no materialized child");
    }
    return bestIndex;
}
