#include "GameUtils.hpp"
#include "MCTS.hpp"
#include <chrono>
#include <iostream>

std::string GameUtils::formatWithCommas(int64_t value) {
    std::string num = std::to_string(value < 0 ? -value : value);
    std::string result;
    int count = 0;
    for (int i = static_cast<int>(num.length()) - 1; i >= 0; --i) {
        if (count > 0 && count % 3 == 0) result = ',' + result;
        result = num[i] + result;
        ++count;
    }
    return value < 0 ? "-" + result : result;
}

void GameUtils::printGameState(const GameState& state) {
    std::cout << state.toString();
    if (state.isTerminal()) {
        std::cout << "Game over.\n";
    } else {
        std::cout << "Current player: " << state.getCurrentPlayer() << "\n";
    }
}

std::unique_ptr<Action> GameUtils::runSearchAndReport(MCTS& mcts, const GameState& state) {
    auto start = std::chrono::steady_clock::now();
    std::unique_ptr<Action> action = mcts.chooseAction(state, state.getLegalActions());
    auto end = std::chrono::steady_clock::now();
    auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    std::cout << "Search took: " << formatWithCommas(elapsedMs) << " ms." << std::endl;
    mcts.printStats();
    mcts.printBestActions(8);
    std::cout << "MCTS selected action: " << action->toString() << std::endl;
    return action;
}
