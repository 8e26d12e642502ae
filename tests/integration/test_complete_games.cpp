#include <gtest/gtest.h>
#include "MCTS.hpp"
#include "SushiGoGame.hpp"
#include "SushiGoHeuristic.hpp"
#include "SushiGoOracle.hpp"
#include <chrono>
#include <iostream>
#include <random>
#include <vector>

class CompleteGamesTest : public ::testing::Test {
protected:
    struct GameResult {
        int decisions = 0;
        int illegalActions = 0;
        int64_t totalIterations = 0;
        double totalTimeMs = 0.0;
        bool gameCompleted = false;
        std::vector<double> results;
        std::vector<double> scores;
    };

    SushiGoHeuristic heuristic;
    SushiGoOracle oracle;

    // Players listed in `searchers` use MCTS, the rest play uniformly at random
    GameResult playCompleteGame(int players, const MCTS::Config& baseConfig,
                                const std::vector<int>& searchers, uint32_t seed) {
        SushiGoGame game(SushiGoGame::Config::forPlayers(players), seed);

        std::vector<std::unique_ptr<MCTS>> agents(players);
        for (int p : searchers) {
            MCTS::Config config = baseConfig;
            config.seed = seed * 31 + static_cast<uint32_t>(p);
            agents[p] = std::make_unique<MCTS>(config);
        }
        std::mt19937 rng(seed);

        GameResult result;
        auto gameStart = std::chrono::steady_clock::now();
        int guard = 0;
        while (!game.isTerminal() && guard++ < 1000) {
            int player = game.getCurrentPlayer();
            ActionList legal = game.getLegalActions();
            std::unique_ptr<Action> action;

            if (agents[player]) {
                action = agents[player]->chooseAction(game, legal);
                result.decisions++;
                result.totalIterations += agents[player]->getLastSearchStats().iterations;
            } else {
                std::uniform_int_distribution<size_t> dist(0, legal.size() - 1);
                action = legal[dist(rng)]->copy();
            }

            bool isLegal = false;
            for (const auto& candidate : legal) {
                if (candidate->equals(*action)) isLegal = true;
            }
            if (!isLegal) result.illegalActions++;

            game.applyAction(*action);
        }

        result.totalTimeMs = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - gameStart).count();
        result.gameCompleted = game.isTerminal();
        if (result.gameCompleted) {
            for (int p = 0; p < players; p++) {
                result.results.push_back(game.getTerminalResult(p));
                result.scores.push_back(game.getGameScore(p));
            }
        }
        return result;
    }
};

TEST_F(CompleteGamesTest, SearchAgentsFinishGameWithLegalActions) {
    MCTS::Config config = MCTS::Config::iterations(150);
    config.evaluator = &heuristic;
    config.oracle = &oracle;

    GameResult result = playCompleteGame(3, config, {0, 1}, 7);

    EXPECT_TRUE(result.gameCompleted);
    EXPECT_EQ(result.illegalActions, 0);
    // Two searchers, three rounds of nine cards; Chopsticks can only shorten this
    EXPECT_GT(result.decisions, 0);
    EXPECT_LE(result.decisions, 2 * 3 * 9);
    EXPECT_EQ(result.totalIterations, 150 * result.decisions);
    ASSERT_EQ(result.results.size(), 3u);

    std::cout << "3-player game: " << result.decisions << " decisions in "
              << result.totalTimeMs << " ms, scores";
    for (double score : result.scores) std::cout << " " << score;
    std::cout << std::endl;
}

TEST_F(CompleteGamesTest, ForwardModelBudgetedAgentsFinishTwoPlayerGame) {
    MCTS::Config config = MCTS::Config::forwardModelCalls(2000);
    config.evaluator = &heuristic;
    config.oracle = &oracle;
    config.rolloutLength = 10;

    GameResult result = playCompleteGame(2, config, {0, 1}, 3);

    EXPECT_TRUE(result.gameCompleted);
    EXPECT_EQ(result.illegalActions, 0);
    ASSERT_EQ(result.results.size(), 2u);
    int winners = 0;
    for (double r : result.results) {
        if (r != GameState::LOSS_RESULT) winners++;
    }
    EXPECT_GE(winners, 1);
}

TEST_F(CompleteGamesTest, TimedAgentFinishesFivePlayerGame) {
    MCTS::Config config = MCTS::Config::timed(20);
    config.evaluator = &heuristic;
    config.oracle = &oracle;

    GameResult result = playCompleteGame(5, config, {2}, 11);

    EXPECT_TRUE(result.gameCompleted);
    EXPECT_EQ(result.illegalActions, 0);
    EXPECT_GE(result.totalIterations, result.decisions);
}

TEST_F(CompleteGamesTest, PlainScoreDifferenceAgentWithoutOracle) {
    ScoreDifferenceEvaluator scoreDifference;
    MCTS::Config config = MCTS::Config::iterations(100);
    config.evaluator = &scoreDifference;

    GameResult result = playCompleteGame(4, config, {0, 3}, 5);

    EXPECT_TRUE(result.gameCompleted);
    EXPECT_EQ(result.illegalActions, 0);
}
