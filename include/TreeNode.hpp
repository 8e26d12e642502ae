#ifndef TREENODE_HPP
#define TREENODE_HPP

#include "GameState.hpp"
#include "Evaluator.hpp"
#include "DominanceOracle.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>
#include <variant>
#include <vector>

// ============================================================================
// Search Context - shared by every node of one search
// ============================================================================

struct SearchContext {
    int playerId;                    // The searching agent
    double explorationConstant;      // K in the UCB term
    double epsilon;                  // Division guard and tie-break noise amplitude
    int maxTreeDepth;
    int rolloutLength;
    Evaluator* evaluator;
    const DominanceOracle* oracle;   // Optional, nullptr disables pruning
    std::mt19937& rng;

    // Every state advance anywhere in the tree (expansion or rollout)
    int64_t forwardModelCalls = 0;

    SearchContext(int playerId, double explorationConstant, double epsilon,
                  int maxTreeDepth, int rolloutLength, Evaluator* evaluator,
                  const DominanceOracle* oracle, std::mt19937& rng)
        : playerId(playerId)
        , explorationConstant(explorationConstant)
        , epsilon(epsilon)
        , maxTreeDepth(maxTreeDepth)
        , rolloutLength(rolloutLength)
        , evaluator(evaluator)
        , oracle(oracle)
        , rng(rng) {
    }
};

// ============================================================================
// TreeNode - one reached game state
// ============================================================================

class TreeNode {
public:
    // Child slot states: pending (action known, no node yet) or materialized
    struct PendingChild {};

    struct ChildSlot {
        std::unique_ptr<Action> action;
        std::variant<PendingChild, std::unique_ptr<TreeNode>> node;
    };

    // Takes ownership of `state`; the slot keys are the legal actions of
    // `state` at this moment and never change afterwards.
    TreeNode(std::unique_ptr<GameState> state, TreeNode* parent, SearchContext& context);
    ~TreeNode();

    TreeNode(const TreeNode&) = delete;
    TreeNode& operator=(const TreeNode&) = delete;

    // MCTS phases
    TreeNode* treePolicy();
    TreeNode* expand();
    double rollOut();
    void backUp(double value);

    // Accessors
    const GameState& getState() const { return *state_; }
    TreeNode* getParent() const { return parent_; }
    TreeNode* getRoot() const { return root_; }
    int getDepth() const { return depth_; }
    int getVisitCount() const { return visitCount_; }
    double getTotalValue() const { return totalValue_; }
    SearchContext& getContext() const { return context_; }

    // Child slots
    size_t childCount() const { return children_.size(); }
    const Action& getAction(size_t index) const { return *children_[index].action; }
    TreeNode* getChild(size_t index) const;  // nullptr while pending
    bool isPending(size_t index) const;
    size_t pendingCount() const;
    size_t materializedCount() const { return children_.size() - pendingCount(); }

    // Slot index holding `action`, or -1 when the action is absent
    int findAction(const Action& action) const;

    // Number of nodes in this subtree, this node included
    int countNodes() const;
    int maxDepth() const;

private:
    void advance(GameState& state, const Action& action);

    std::unique_ptr<GameState> state_;
    TreeNode* parent_;
    TreeNode* root_;
    int depth_;
    SearchContext& context_;

    std::vector<ChildSlot> children_;

    int visitCount_ = 0;
    double totalValue_ = 0.0;
};

#endif // TREENODE_HPP
