#include "MCTS.hpp"
#include "SushiGoGame.hpp"
#include "SushiGoHeuristic.hpp"
#include "SushiGoOracle.hpp"
#include "GameUtils.hpp"
#include "Profiler.hpp"
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <random>
#include <vector>


// How to run: ./sushigo [players=3] [budgetMs=200] [seed=1]
// Player 0 searches with the heuristic and the pruning oracle, player 1 with
// the plain score difference, everybody else plays randomly.
int main(int argc, char* argv[]) {
    int players = (argc >= 2) ? std::atoi(argv[1]) : 3;
    int budgetMs = (argc >= 3) ? std::atoi(argv[2]) : 200;
    uint32_t seed = (argc >= 4) ? static_cast<uint32_t>(std::atoi(argv[3])) : 1;

    if (players < 2 || players > 5 || budgetMs < 0) {
        std::cerr << "Error: expected 2-5 players and a non-negative budget.\n";
        return 1;
    }

    std::cout << "Playing Sushi Go! with " << players << " players, "
              << budgetMs << " ms per decision, seed " << seed << std::endl;

    SushiGoGame game(SushiGoGame::Config::forPlayers(players), seed);

    SushiGoHeuristic heuristic;
    SushiGoOracle oracle;
    MCTS::Config prunedConfig = MCTS::Config::timed(budgetMs);
    prunedConfig.evaluator = &heuristic;
    prunedConfig.oracle = &oracle;
    prunedConfig.seed = seed;
    MCTS prunedAgent(prunedConfig);

    ScoreDifferenceEvaluator scoreDifference;
    MCTS::Config plainConfig = MCTS::Config::timed(budgetMs);
    plainConfig.evaluator = &scoreDifference;
    plainConfig.seed = seed + 1;
    MCTS plainAgent(plainConfig);

    std::vector<MCTS*> agents(players, nullptr);
    std::vector<const char*> names(players, "Random");
    agents[0] = &prunedAgent;
    names[0] = "MCTS+oracle";
    agents[1] = &plainAgent;
    names[1] = "MCTS";

    std::mt19937 randomRng(seed + 2);
    std::vector<double> thinkingTime(players, 0.0);

    while (!game.isTerminal()) {
        int player = game.getCurrentPlayer();
        std::unique_ptr<Action> action;
        auto t0 = std::chrono::steady_clock::now();

        if (agents[player] != nullptr) {
            std::cout << "\nPlayer " << player << "'s turn (" << names[player] << ")" << std::endl;
            GameUtils::printGameState(game);
            action = GameUtils::runSearchAndReport(*agents[player], game);
        } else {
            action = GameUtils::randomAction(game, randomRng);
            std::cout << "Player " << player << " (" << names[player] << ") plays " << action->toString() << std::endl;
        }

        thinkingTime[player] += std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
        game.applyAction(*action);
    }

    std::cout << "\n";
    GameUtils::printGameState(game);

    for (int p = 0; p < players; p++) {
        double result = game.getTerminalResult(p);
        const char* outcome = result == GameState::WIN_RESULT ? "wins"
                            : result == GameState::DRAW_RESULT ? "draws" : "loses";
        std::cout << "Player " << p << " (" << names[p] << "): "
                  << static_cast<int>(game.getGameScore(p)) << " points, "
                  << game.getPuddings(p) << " pudding, " << outcome
                  << " (" << thinkingTime[p] << "s)\n";
    }

    Profiler::instance().printReport();
    return 0;
}
