#include "TreeNode.hpp"
#include "ActionSelector.hpp"
#include "Profiler.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

TreeNode::TreeNode(std::unique_ptr<GameState> state, TreeNode* parent, SearchContext& context)
    : state_(std::move(state))
    , parent_(parent)
    , root_(parent == nullptr ? this : parent->root_)
    , depth_(parent == nullptr ? 0 : parent->depth_ + 1)
    , context_(context) {
    ActionList legalActions = state_->getLegalActions();
    children_.reserve(legalActions.size());
    for (auto& action : legalActions) {
        // Keys must be unique; a game reporting the same action twice gets one slot
        bool duplicate = std::any_of(children_.begin(), children_.end(),
            [&action](const ChildSlot& slot) { return slot.action->equals(*action); });
        if (!duplicate) {
            children_.push_back(ChildSlot{std::move(action), PendingChild{}});
        }
    }

    if (children_.empty() && !state_->isTerminal()) {
        std::cerr << "FATAL: Non-terminal state at depth " << depth_ << " has no legal actions.\n";
        throw std::logic_error("TreeNode: non-terminal state without legal actions");
    }
}

TreeNode::~TreeNode() = default;

// ============================================================================
// MCTS Phases
// ============================================================================

TreeNode* TreeNode::treePolicy() {
    PROFILE_SCOPE("TreeNode::treePolicy");
    TreeNode* cur = this;

    // Descend until the state is terminal or the depth cap is reached; the
    // first node with an untried action is expanded and ends the descent
    while (!cur->state_->isTerminal() && cur->depth_ < context_.maxTreeDepth) {
        if (cur->pendingCount() > 0) {
            return cur->expand();
        }
        size_t chosen = ActionSelector::selectUcb(*cur, context_);
        cur = cur->getChild(chosen);
    }

    return cur;
}

TreeNode* TreeNode::expand() {
    PROFILE_SCOPE("TreeNode::expand");
    std::vector<size_t> pending;
    for (size_t i = 0; i < children_.size(); i++) {
        if (isPending(i)) {
            pending.push_back(i);
        }
    }

    if (pending.empty()) {
        std::cerr << "FATAL: expand() called on a node with no pending actions (depth "
                  << depth_ << ", " << children_.size() << " children).\n";
        throw std::logic_error("TreeNode::expand: no pending actions");
    }

    std::uniform_int_distribution<size_t> dist(0, pending.size() - 1);
    ChildSlot& slot = children_[pending[dist(context_.rng)]];

    // Advance a copy of the state with a copy of the action, so the stored
    // key never sees any mutation done by the game model
    std::unique_ptr<GameState> nextState = state_->copy();
    std::unique_ptr<Action> action = slot.action->copy();
    advance(*nextState, *action);

    auto child = std::make_unique<TreeNode>(std::move(nextState), this, context_);
    TreeNode* childPtr = child.get();
    slot.node = std::move(child);
    return childPtr;
}

double TreeNode::rollOut() {
    PROFILE_SCOPE("TreeNode::rollOut");
    std::unique_ptr<GameState> rolloutState = state_->copy();

    int rolloutDepth = 0;
    while (rolloutDepth < context_.rolloutLength && !rolloutState->isTerminal()) {
        ActionList available = rolloutState->getLegalActions();
        if (available.empty()) {
            std::cerr << "FATAL: Rollout reached a non-terminal state with no legal actions.\n";
            throw std::logic_error("TreeNode::rollOut: non-terminal state without legal actions");
        }
        std::uniform_int_distribution<size_t> dist(0, available.size() - 1);
        advance(*rolloutState, *available[dist(context_.rng)]);
        rolloutDepth++;
    }

    double value = context_.evaluator->evaluateState(*rolloutState, context_.playerId);
    if (!std::isfinite(value)) {
        std::cerr << "FATAL: Evaluator returned a non-finite value (" << value
                  << ") after a rollout of " << rolloutDepth << " actions.\n";
        throw std::runtime_error("TreeNode::rollOut: evaluator returned a non-finite value");
    }
    return value;
}

void TreeNode::backUp(double value) {
    PROFILE_SCOPE("TreeNode::backUp");
    for (TreeNode* node = this; node != nullptr; node = node->parent_) {
        node->visitCount_++;
        node->totalValue_ += value;
    }
}

// ============================================================================
// Helper Methods
// ============================================================================

void TreeNode::advance(GameState& state, const Action& action) {
    state.applyAction(action);
    context_.forwardModelCalls++;
}

TreeNode* TreeNode::getChild(size_t index) const {
    const auto& node = children_[index].node;
    if (const auto* child = std::get_if<std::unique_ptr<TreeNode>>(&node)) {
        return child->get();
    }
    return nullptr;
}

bool TreeNode::isPending(size_t index) const {
    return std::holds_alternative<PendingChild>(children_[index].node);
}

size_t TreeNode::pendingCount() const {
    return static_cast<size_t>(std::count_if(children_.begin(), children_.end(),
        [](const ChildSlot& slot) { return std::holds_alternative<PendingChild>(slot.node); }));
}

int TreeNode::findAction(const Action& action) const {
    for (size_t i = 0; i < children_.size(); i++) {
        if (children_[i].action->equals(action)) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

int TreeNode::countNodes() const {
    int count = 1;
    for (size_t i = 0; i < children_.size(); i++) {
        if (TreeNode* child = getChild(i)) {
            count += child->countNodes();
        }
    }
    return count;
}

int TreeNode::maxDepth() const {
    int deepest = depth_;
    for (size_t i = 0; i < children_.size(); i++) {
        if (TreeNode* child = getChild(i)) {
            deepest = std::max(deepest, child->maxDepth());
        }
    }
    return deepest;
}
