#ifndef TESTGAMES_HPP
#define TESTGAMES_HPP

#include "GameState.hpp"
#include "Evaluator.hpp"
#include "DominanceOracle.hpp"
#include <algorithm>
#include <limits>
#include <set>
#include <sstream>
#include <vector>

// ============================================================================
// PickGame - small deterministic game for engine tests
// ============================================================================
// Players take turns picking a number in [0, branching). A pick adds its value
// to the picker's score. The game ends after `length` picks; the highest
// score wins.

class PickAction : public Action {
public:
    PickAction(int playerId, int value) : playerId(playerId), value(value) {}

    std::unique_ptr<Action> copy() const override {
        return std::make_unique<PickAction>(playerId, value);
    }

    bool equals(const Action& other) const override {
        const auto* o = dynamic_cast<const PickAction*>(&other);
        return o != nullptr && o->playerId == playerId && o->value == value;
    }

    std::string toString() const override {
        return "P" + std::to_string(playerId) + " pick " + std::to_string(value);
    }

    const int playerId;
    const int value;
};

class PickGame : public GameState {
public:
    PickGame(int players, int branching, int length)
        : players_(players), branching_(branching), length_(length), scores_(players, 0) {}

    std::unique_ptr<GameState> copy() const override {
        return std::make_unique<PickGame>(*this);
    }

    ActionList getLegalActions() const override {
        ActionList actions;
        if (isTerminal()) return actions;
        for (int v = 0; v < branching_; v++) {
            actions.push_back(std::make_unique<PickAction>(current_, v));
        }
        // Reported twice on purpose when requested
        if (duplicateFirstAction_ && branching_ > 0) {
            actions.push_back(std::make_unique<PickAction>(current_, 0));
        }
        return actions;
    }

    void applyAction(const Action& action) override {
        const auto& pick = dynamic_cast<const PickAction&>(action);
        scores_[current_] += pick.value;
        current_ = (current_ + 1) % players_;
        moves_++;
        applyCount_++;
    }

    bool isTerminal() const override { return moves_ >= length_; }
    int getCurrentPlayer() const override { return current_; }
    int getPlayerCount() const override { return players_; }

    double getTerminalResult(int playerId) const override {
        int best = *std::max_element(scores_.begin(), scores_.end());
        if (scores_[playerId] != best) return LOSS_RESULT;
        return std::count(scores_.begin(), scores_.end(), best) == 1 ? WIN_RESULT : DRAW_RESULT;
    }

    double getGameScore(int playerId) const override { return scores_[playerId]; }

    std::string toString() const override {
        std::ostringstream out;
        out << "PickGame move " << moves_ << "/" << length_ << " scores:";
        for (int s : scores_) out << " " << s;
        out << "\n";
        return out.str();
    }

    int getMoves() const { return moves_; }
    void setDuplicateFirstAction(bool duplicate) { duplicateFirstAction_ = duplicate; }

    // Picks applied to this object since it was created (not inherited by copies)
    int applyCount() const { return applyCount_; }

private:
    int players_;
    int branching_;
    int length_;
    std::vector<int> scores_;
    int current_ = 0;
    int moves_ = 0;
    bool duplicateFirstAction_ = false;
    int applyCount_ = 0;
};

// A non-terminal state without moves, which the engine must reject
class StuckGame : public PickGame {
public:
    StuckGame() : PickGame(2, 2, 10) {}
    std::unique_ptr<GameState> copy() const override { return std::make_unique<StuckGame>(*this); }
    ActionList getLegalActions() const override { return ActionList(); }
};

// ============================================================================
// Mock evaluators and oracles
// ============================================================================

class ConstantEvaluator : public Evaluator {
public:
    explicit ConstantEvaluator(double value) : value_(value) {}

    double evaluateState(const GameState&, int) override {
        calls_++;
        return value_;
    }

    int calls() const { return calls_; }

private:
    double value_;
    int calls_ = 0;
};

class NaNEvaluator : public Evaluator {
public:
    double evaluateState(const GameState&, int) override {
        return std::numeric_limits<double>::quiet_NaN();
    }
};

// Remembers how far into the game every evaluated state was
class RecordingEvaluator : public Evaluator {
public:
    double evaluateState(const GameState& state, int playerId) override {
        const auto& game = dynamic_cast<const PickGame&>(state);
        evaluatedMoves.push_back(game.getMoves());
        evaluatedTerminal.push_back(game.isTerminal());
        return game.getGameScore(playerId);
    }

    std::vector<int> evaluatedMoves;
    std::vector<bool> evaluatedTerminal;
};

// Marks picks of the listed values as no-gain
class PickValueOracle : public DominanceOracle {
public:
    explicit PickValueOracle(std::set<int> noGainValues) : noGainValues_(std::move(noGainValues)) {}

    bool isNoGain(const GameState&, const Action& action) const override {
        const auto* pick = dynamic_cast<const PickAction*>(&action);
        return pick != nullptr && noGainValues_.count(pick->value) > 0;
    }

private:
    std::set<int> noGainValues_;
};

#endif // TESTGAMES_HPP
