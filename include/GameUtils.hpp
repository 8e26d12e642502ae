#ifndef GAMEUTILS_HPP
#define GAMEUTILS_HPP

#include "GameState.hpp"
#include <cstdint>
#include <memory>
#include <random>
#include <string>

// Forward declarations
class MCTS;

class GameUtils {
public:
    // Number formatting
    static std::string formatWithCommas(int64_t value);

    // State printing
    static void printGameState(const GameState& state);

    // Picks a uniformly random legal action (baseline opponent)
    template <typename Rng>
    static std::unique_ptr<Action> randomAction(const GameState& state, Rng& rng);

    // Search utilities: runs one decision, prints its report and returns the action
    static std::unique_ptr<Action> runSearchAndReport(MCTS& mcts, const GameState& state);
};

template <typename Rng>
std::unique_ptr<Action> GameUtils::randomAction(const GameState& state, Rng& rng) {
    ActionList actions = state.getLegalActions();
    if (actions.empty()) {
        return nullptr;
    }
    std::uniform_int_distribution<size_t> dist(0, actions.size() - 1);
    return std::move(actions[dist(rng)]);
}

#endif // GAMEUTILS_HPP
