#ifndef MCTS_HPP
#define MCTS_HPP

#include "GameState.hpp"
#include "Evaluator.hpp"
#include "DominanceOracle.hpp"
#include "BudgetController.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

class TreeNode;

// ============================================================================
// MCTS - paranoid multi-player Monte Carlo Tree Search agent
// ============================================================================
// One call to chooseAction() builds a fresh tree rooted at a copy of the
// given state, searches until the budget runs out and returns the robust
// child's action. Nothing is kept between decisions except statistics.

class MCTS {
public:
    // Configuration parameters
    struct Config {
        double explorationConstant = 1.0;   // K in the UCB term
        double epsilon = 1e-6;              // Division guard and tie-break noise amplitude
        int maxTreeDepth = 25;              // Nodes at this depth are never expanded
        int rolloutLength = 20;             // Max random actions per rollout
        BudgetType budgetType = BudgetType::TIME;
        int64_t budget = 1000;              // ms, iterations or FM calls depending on budgetType
        int breakMs = 10;                   // Time budget safety margin
        double iterationTimeFactor = 2.0;   // Stop when this many average iterations would overrun
        std::optional<uint32_t> seed;       // Unset: seeded from std::random_device
        Evaluator* evaluator = nullptr;     // Required
        const DominanceOracle* oracle = nullptr;
        bool verbose = false;               // Print a report after each decision

        static Config timed(int64_t ms) {
            Config config;
            config.budgetType = BudgetType::TIME;
            config.budget = ms;
            return config;
        }

        static Config iterations(int64_t count) {
            Config config;
            config.budgetType = BudgetType::ITERATIONS;
            config.budget = count;
            return config;
        }

        static Config forwardModelCalls(int64_t count) {
            Config config;
            config.budgetType = BudgetType::FORWARD_MODEL_CALLS;
            config.budget = count;
            return config;
        }
    };

    // Per root action statistics of the last decision
    struct ActionStats {
        std::string action;
        int visits = 0;
        double meanValue = 0.0;
    };

    struct SearchStats {
        int iterations = 0;
        int64_t forwardModelCalls = 0;
        double elapsedMs = 0.0;
        int treeSize = 0;
        int treeDepth = 0;
        int rootVisits = 0;
        double rootMeanValue = 0.0;
        std::string chosenAction;
        std::vector<ActionStats> rootActions;   // Materialized root children only
    };

    explicit MCTS(const Config& config);
    ~MCTS();

    // Main search interface. `legalActions` are the caller's view of the
    // legal moves at `state`; the returned action is always one of them.
    std::unique_ptr<Action> chooseAction(const GameState& state, const ActionList& legalActions);

    // Statistics and debugging
    const SearchStats& getLastSearchStats() const { return lastStats_; }
    int getDecisionCount() const { return decisionCount_; }
    void printStats() const;
    void printBestActions(int topN = 5) const;

    // Configuration
    void setConfig(const Config& config);
    const Config& getConfig() const { return config_; }

    // Throws std::invalid_argument describing the first bad parameter
    static void validateConfig(const Config& config);

private:
    void recordStats(const TreeNode& root, size_t chosen, const BudgetController& budget, int64_t forwardModelCalls);

    Config config_;
    std::mt19937 rng_;

    // Statistics
    SearchStats lastStats_;
    int decisionCount_ = 0;
};

#endif // MCTS_HPP
