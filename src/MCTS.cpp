#include "MCTS.hpp"
#include "TreeNode.hpp"
#include "ActionSelector.hpp"
#include "GameUtils.hpp"
#include "Profiler.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <stdexcept>

// ============================================================================
// MCTS Constructor/Destructor
// ============================================================================

MCTS::MCTS(const Config& config)
    : config_(config)
    , rng_(config.seed ? *config.seed : std::random_device{}()) {
    validateConfig(config_);
}

MCTS::~MCTS() = default;

void MCTS::setConfig(const Config& config) {
    validateConfig(config);
    // The generator is seeded once per agent and keeps its stream
    config_ = config;
}

void MCTS::validateConfig(const Config& config) {
    if (config.evaluator == nullptr) {
        throw std::invalid_argument("MCTS::Config: evaluator is required");
    }
    if (config.maxTreeDepth < 1) {
        throw std::invalid_argument("MCTS::Config: maxTreeDepth must be at least 1");
    }
    if (config.rolloutLength < 0) {
        throw std::invalid_argument("MCTS::Config: rolloutLength must not be negative");
    }
    if (!(config.epsilon > 0.0)) {
        throw std::invalid_argument("MCTS::Config: epsilon must be positive");
    }
    if (!std::isfinite(config.explorationConstant) || config.explorationConstant < 0.0) {
        throw std::invalid_argument("MCTS::Config: explorationConstant must be finite and non-negative");
    }
    if (config.budget < 0) {
        throw std::invalid_argument("MCTS::Config: budget must not be negative");
    }
    if (config.breakMs < 0 || config.iterationTimeFactor < 0.0) {
        throw std::invalid_argument("MCTS::Config: time budget margins must not be negative");
    }
}

// ============================================================================
// Main Search Interface
// ============================================================================

std::unique_ptr<Action> MCTS::chooseAction(const GameState& state, const ActionList& legalActions) {
    if (legalActions.empty()) {
        std::cerr << "Error: chooseAction() called without legal actions.\n";
        throw std::invalid_argument("MCTS::chooseAction: no legal actions");
    }
    if (state.isTerminal()) {
        std::cerr << "Error: chooseAction() called on a terminal state.\n";
        throw std::invalid_argument("MCTS::chooseAction: terminal state");
    }
    PROFILE_SCOPE("MCTS::chooseAction");

    SearchContext context(state.getCurrentPlayer(), config_.explorationConstant, config_.epsilon,
                          config_.maxTreeDepth, config_.rolloutLength, config_.evaluator,
                          config_.oracle, rng_);
    TreeNode root(state.copy(), nullptr, context);

    BudgetController budget(config_.budgetType, config_.budget, config_.breakMs, config_.iterationTimeFactor);
    budget.start();

    bool stop = false;
    while (!stop) {
        budget.beginIteration();

        // Selection + expansion, rollout, back-propagation
        TreeNode* selected = root.treePolicy();
        double delta = selected->rollOut();
        selected->backUp(delta);

        stop = budget.endIteration(context.forwardModelCalls);
    }

    size_t chosen = ActionSelector::selectRobust(root, context);
    const Action& chosenAction = root.getAction(chosen);

    recordStats(root, chosen, budget, context.forwardModelCalls);
    decisionCount_++;

    for (const auto& legal : legalActions) {
        if (legal->equals(chosenAction)) {
            if (config_.verbose) {
                printStats();
                printBestActions(10);
            }
            return legal->copy();
        }
    }

    std::cerr << "FATAL: Search recommended " << chosenAction.toString()
              << ", which is not among the " << legalActions.size() << " legal actions supplied.\n";
    throw std::logic_error("MCTS::chooseAction: recommended action is not legal");
}

// ============================================================================
// Statistics
// ============================================================================

void MCTS::recordStats(const TreeNode& root, size_t chosen, const BudgetController& budget, int64_t forwardModelCalls) {
    SearchStats stats;
    stats.iterations = budget.getIterations();
    stats.forwardModelCalls = forwardModelCalls;
    stats.elapsedMs = budget.getElapsedMs();
    stats.treeSize = root.countNodes();
    stats.treeDepth = root.maxDepth();
    stats.rootVisits = root.getVisitCount();
    stats.rootMeanValue = root.getVisitCount() > 0 ? root.getTotalValue() / root.getVisitCount() : 0.0;
    stats.chosenAction = root.getAction(chosen).toString();

    for (size_t i = 0; i < root.childCount(); i++) {
        const TreeNode* child = root.getChild(i);
        if (child == nullptr) continue;
        ActionStats actionStats;
        actionStats.action = root.getAction(i).toString();
        actionStats.visits = child->getVisitCount();
        actionStats.meanValue = child->getVisitCount() > 0 ? child->getTotalValue() / child->getVisitCount() : 0.0;
        stats.rootActions.push_back(actionStats);
    }

    lastStats_ = std::move(stats);
}

void MCTS::printStats() const {
    const SearchStats& s = lastStats_;
    std::cout << "\n=== MCTS Statistics ===\n";
    std::cout << "Budget: " << GameUtils::formatWithCommas(config_.budget) << " "
              << budgetTypeName(config_.budgetType) << "\n";
    std::cout << "Iterations: " << GameUtils::formatWithCommas(s.iterations)
              << ". FM calls: " << GameUtils::formatWithCommas(s.forwardModelCalls)
              << ". Tree size: " << GameUtils::formatWithCommas(s.treeSize)
              << " (depth " << s.treeDepth << ")"
              << ". Root visits: " << GameUtils::formatWithCommas(s.rootVisits) << "\n";
    std::cout << "Search time: " << std::fixed << std::setprecision(1) << s.elapsedMs << " ms";
    if (s.elapsedMs > 0) {
        std::cout << " (" << std::setprecision(0) << (s.iterations * 1000.0 / s.elapsedMs) << " iterations/second)";
    }
    std::cout << "\n";
    std::cout << "Root avg value: " << std::fixed << std::setprecision(3) << s.rootMeanValue << "\n";
    std::cout << "Best action: " << s.chosenAction << "\n";
    std::cout << "=======================\n\n";
}

void MCTS::printBestActions(int topN) const {
    if (lastStats_.rootActions.empty()) {
        std::cout << "No actions analyzed yet.\n";
        return;
    }

    std::vector<ActionStats> sorted = lastStats_.rootActions;
    std::sort(sorted.begin(), sorted.end(),
        [](const ActionStats& a, const ActionStats& b) { return a.visits > b.visits; });

    int shown = std::min(topN, static_cast<int>(sorted.size()));
    std::cout << "\n=== Top " << shown << " Actions ===\n";
    std::cout << std::left << std::setw(36) << "Action"
              << std::right << std::setw(10) << "Visits"
              << std::setw(10) << "Avg Val" << "\n";
    std::cout << std::string(56, '-') << "\n";
    for (int i = 0; i < shown; i++) {
        std::cout << std::left << std::setw(36) << sorted[i].action
                  << std::right << std::setw(10) << sorted[i].visits
                  << std::setw(10) << std::fixed << std::setprecision(3) << sorted[i].meanValue << "\n";
    }
    std::cout << "===================\n\n";
}
