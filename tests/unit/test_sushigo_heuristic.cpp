#include <gtest/gtest.h>
#include "SushiGoHeuristic.hpp"
#include "../TestGames.hpp"
#include <cmath>
#include <random>
#include <vector>

using SG = SushiGoGame;

class SushiGoHeuristicTest : public ::testing::Test {
protected:
    SushiGoHeuristic heuristic;

    static void play(SG& game, SG::CardType card) {
        game.applyAction(PlayCardAction(game.getCurrentPlayer(), card));
    }

    static SG twoPlayerGame(const std::vector<SG::CardType>& hand0, const std::vector<SG::CardType>& hand1) {
        SG::Config config = SG::Config::forPlayers(2);
        config.handSize = static_cast<int>(hand0.size());
        config.rounds = 1;
        SG game(config, 1);
        game.setHand(0, hand0);
        game.setHand(1, hand1);
        return game;
    }

    static SG threePlayerGame(const std::vector<SG::CardType>& hand0, const std::vector<SG::CardType>& hand1,
                              const std::vector<SG::CardType>& hand2) {
        SG::Config config = SG::Config::forPlayers(3);
        config.handSize = static_cast<int>(hand0.size());
        config.rounds = 1;
        SG game(config, 1);
        game.setHand(0, hand0);
        game.setHand(1, hand1);
        game.setHand(2, hand2);
        return game;
    }
};

TEST_F(SushiGoHeuristicTest, TerminalStateGivesGameResult) {
    SG game = twoPlayerGame({SG::PUDDING, SG::PUDDING}, {SG::PUDDING, SG::EGG_NIGIRI});
    play(game, SG::PUDDING);
    play(game, SG::EGG_NIGIRI);
    play(game, SG::PUDDING);
    play(game, SG::PUDDING);

    ASSERT_TRUE(game.isTerminal());
    EXPECT_DOUBLE_EQ(heuristic.evaluateState(game, 0), GameState::WIN_RESULT);
    EXPECT_DOUBLE_EQ(heuristic.evaluateState(game, 1), GameState::LOSS_RESULT);
}

TEST_F(SushiGoHeuristicTest, OtherGamesUseScoreDifference) {
    PickGame game(2, 5, 6);
    game.applyAction(PickAction(0, 4));
    game.applyAction(PickAction(1, 2));

    ScoreDifferenceEvaluator scoreDifference;
    EXPECT_DOUBLE_EQ(heuristic.evaluateState(game, 0), scoreDifference.evaluateState(game, 0));
    EXPECT_DOUBLE_EQ(heuristic.evaluateState(game, 0), 0.5);
}

TEST_F(SushiGoHeuristicTest, UnpairedTempuraWithPartnerStillAround) {
    SG game = twoPlayerGame({SG::TEMPURA, SG::TEMPURA, SG::MAKI_1}, {SG::EGG_NIGIRI, SG::DUMPLING, SG::PUDDING});
    play(game, SG::TEMPURA);
    play(game, SG::EGG_NIGIRI);

    std::vector<double> modifiers = heuristic.roundModifiers(game);
    EXPECT_DOUBLE_EQ(modifiers[0], 2.5);
    EXPECT_DOUBLE_EQ(modifiers[1], 0.0);

    // (0 + 0.21 * 2.5) - 1 Egg point, relative to the leading score of 1
    EXPECT_NEAR(heuristic.evaluateState(game, 0), 0.525 - 1.0, 1e-12);
    EXPECT_NEAR(heuristic.evaluateState(game, 1), 1.0 - 0.525, 1e-12);
}

TEST_F(SushiGoHeuristicTest, OpenWasabiValuedAtBestNigiriLeft) {
    SG game = twoPlayerGame({SG::WASABI, SG::SQUID_NIGIRI, SG::MAKI_1}, {SG::EGG_NIGIRI, SG::DUMPLING, SG::PUDDING});
    play(game, SG::WASABI);
    play(game, SG::EGG_NIGIRI);

    std::vector<double> modifiers = heuristic.roundModifiers(game);
    EXPECT_DOUBLE_EQ(modifiers[0], 6.0);
}

TEST_F(SushiGoHeuristicTest, MakiAndChopsticksModifiers) {
    SG game = twoPlayerGame({SG::MAKI_3, SG::MAKI_1, SG::EGG_NIGIRI, SG::EGG_NIGIRI},
                            {SG::CHOPSTICKS, SG::EGG_NIGIRI, SG::EGG_NIGIRI, SG::EGG_NIGIRI});
    play(game, SG::MAKI_3);
    play(game, SG::CHOPSTICKS);
    play(game, SG::EGG_NIGIRI);
    play(game, SG::MAKI_1);

    std::vector<double> modifiers = heuristic.roundModifiers(game);
    // Most Maki
    EXPECT_DOUBLE_EQ(modifiers[0], 6.0);
    // Runner-up Maki plus Chopsticks with two cards left in hand
    EXPECT_DOUBLE_EQ(modifiers[1], 3.0 + 1.0);
}

TEST_F(SushiGoHeuristicTest, TempuraInHandIsNotCreditedTwice) {
    SG game = twoPlayerGame({SG::TEMPURA, SG::EGG_NIGIRI, SG::EGG_NIGIRI}, {SG::TEMPURA, SG::EGG_NIGIRI, SG::EGG_NIGIRI});
    play(game, SG::TEMPURA);
    play(game, SG::EGG_NIGIRI);

    ASSERT_EQ(game.countInHand(0, SG::TEMPURA), 1);
    EXPECT_DOUBLE_EQ(heuristic.roundModifiers(game)[0], 0.0);
}

TEST_F(SushiGoHeuristicTest, SingleSashimiNeedsTwoMoreLeft) {
    SG game = twoPlayerGame({SG::SASHIMI, SG::SASHIMI, SG::SASHIMI, SG::EGG_NIGIRI},
                            {SG::SASHIMI, SG::EGG_NIGIRI, SG::EGG_NIGIRI, SG::EGG_NIGIRI});
    play(game, SG::SASHIMI);
    play(game, SG::EGG_NIGIRI);

    ASSERT_EQ(game.countAvailable()[SG::SASHIMI], 3);
    std::vector<double> modifiers = heuristic.roundModifiers(game);
    EXPECT_DOUBLE_EQ(modifiers[0], 10.0 / 3.0);
    EXPECT_DOUBLE_EQ(modifiers[1], 0.0);
}

TEST_F(SushiGoHeuristicTest, SashimiPairWithLastCardInOpponentHand) {
    SG game = twoPlayerGame({SG::SASHIMI, SG::EGG_NIGIRI, SG::EGG_NIGIRI, SG::EGG_NIGIRI},
                            {SG::SASHIMI, SG::SASHIMI, SG::EGG_NIGIRI, SG::EGG_NIGIRI});
    play(game, SG::SASHIMI);
    play(game, SG::EGG_NIGIRI);
    play(game, SG::SASHIMI);
    play(game, SG::EGG_NIGIRI);

    ASSERT_EQ(game.countOnField(0, SG::SASHIMI), 2);
    ASSERT_EQ(game.countInHand(0, SG::SASHIMI), 0);
    ASSERT_EQ(game.countInHand(1, SG::SASHIMI), 1);
    std::vector<double> modifiers = heuristic.roundModifiers(game);
    EXPECT_DOUBLE_EQ(modifiers[0], 20.0 / 3.0);
    EXPECT_DOUBLE_EQ(modifiers[1], 0.0);
}

TEST_F(SushiGoHeuristicTest, SashimiInHandIsNotCreditedTwice) {
    SG game = twoPlayerGame({SG::SASHIMI, SG::SASHIMI, SG::EGG_NIGIRI, SG::EGG_NIGIRI},
                            {SG::SASHIMI, SG::EGG_NIGIRI, SG::EGG_NIGIRI, SG::EGG_NIGIRI});
    play(game, SG::SASHIMI);
    play(game, SG::EGG_NIGIRI);
    play(game, SG::SASHIMI);
    play(game, SG::EGG_NIGIRI);

    ASSERT_EQ(game.countOnField(0, SG::SASHIMI), 2);
    ASSERT_EQ(game.countInHand(0, SG::SASHIMI), 1);
    EXPECT_DOUBLE_EQ(heuristic.roundModifiers(game)[0], 0.0);
}

TEST_F(SushiGoHeuristicTest, DumplingsValuedAtBestReachableAverage) {
    SG game = twoPlayerGame({SG::DUMPLING, SG::DUMPLING, SG::DUMPLING, SG::EGG_NIGIRI},
                            {SG::DUMPLING, SG::EGG_NIGIRI, SG::EGG_NIGIRI, SG::EGG_NIGIRI});
    play(game, SG::DUMPLING);
    play(game, SG::EGG_NIGIRI);
    play(game, SG::DUMPLING);
    play(game, SG::EGG_NIGIRI);

    ASSERT_EQ(game.countOnField(0, SG::DUMPLING), 2);
    ASSERT_EQ(game.countAvailable()[SG::DUMPLING], 2);
    // Four dumplings score 10, so the two on the field are worth 5 instead of 3
    std::vector<double> modifiers = heuristic.roundModifiers(game);
    EXPECT_DOUBLE_EQ(modifiers[0], 2.0);
    EXPECT_DOUBLE_EQ(modifiers[1], 0.0);
}

TEST_F(SushiGoHeuristicTest, TiedMakiLeadLeavesNoRunnerUp) {
    SG game = threePlayerGame({SG::MAKI_2, SG::EGG_NIGIRI}, {SG::MAKI_2, SG::EGG_NIGIRI}, {SG::MAKI_1, SG::EGG_NIGIRI});
    play(game, SG::MAKI_2);
    play(game, SG::MAKI_2);
    play(game, SG::MAKI_1);

    std::vector<double> modifiers = heuristic.roundModifiers(game);
    EXPECT_DOUBLE_EQ(modifiers[0], 3.0);
    EXPECT_DOUBLE_EQ(modifiers[1], 3.0);
    EXPECT_DOUBLE_EQ(modifiers[2], 0.0);
}

TEST_F(SushiGoHeuristicTest, PuddingMajorityAndMinority) {
    SG game = threePlayerGame({SG::PUDDING, SG::EGG_NIGIRI}, {SG::PUDDING, SG::EGG_NIGIRI}, {SG::EGG_NIGIRI, SG::EGG_NIGIRI});
    play(game, SG::PUDDING);
    play(game, SG::PUDDING);
    play(game, SG::EGG_NIGIRI);

    std::vector<double> modifiers = heuristic.roundModifiers(game);
    EXPECT_DOUBLE_EQ(modifiers[0], 3.0);
    EXPECT_DOUBLE_EQ(modifiers[1], 3.0);
    EXPECT_DOUBLE_EQ(modifiers[2], -6.0);
}

TEST_F(SushiGoHeuristicTest, TwoPlayersFewestPuddingsCostNothing) {
    SG game = twoPlayerGame({SG::PUDDING, SG::EGG_NIGIRI}, {SG::EGG_NIGIRI, SG::EGG_NIGIRI});
    play(game, SG::PUDDING);
    play(game, SG::EGG_NIGIRI);

    std::vector<double> modifiers = heuristic.roundModifiers(game);
    EXPECT_DOUBLE_EQ(modifiers[0], 6.0);
    EXPECT_DOUBLE_EQ(modifiers[1], 0.0);
    EXPECT_EQ(SG::scorePuddings({1, 0})[1], 0);
}

TEST_F(SushiGoHeuristicTest, ZeroModifierFactorIsPlainScoreLead) {
    SushiGoHeuristic::Config config;
    config.modifierFactor = 0.0;
    SushiGoHeuristic plain(config);

    SG game = twoPlayerGame({SG::TEMPURA, SG::TEMPURA, SG::MAKI_1}, {SG::SQUID_NIGIRI, SG::DUMPLING, SG::PUDDING});
    play(game, SG::TEMPURA);
    play(game, SG::SQUID_NIGIRI);

    EXPECT_DOUBLE_EQ(plain.evaluateState(game, 0), -1.0);
    EXPECT_DOUBLE_EQ(plain.evaluateState(game, 1), 1.0);
}

TEST_F(SushiGoHeuristicTest, FiniteThroughoutRandomGames) {
    for (uint32_t seed = 0; seed < 4; seed++) {
        int players = 2 + static_cast<int>(seed);
        SG game(SG::Config::forPlayers(players), seed);
        std::mt19937 rng(seed);

        while (!game.isTerminal()) {
            for (int p = 0; p < players; p++) {
                ASSERT_TRUE(std::isfinite(heuristic.evaluateState(game, p)));
            }
            ActionList actions = game.getLegalActions();
            std::uniform_int_distribution<size_t> dist(0, actions.size() - 1);
            game.applyAction(*actions[dist(rng)]);
        }
        for (int p = 0; p < players; p++) {
            EXPECT_DOUBLE_EQ(heuristic.evaluateState(game, p), game.getTerminalResult(p));
        }
    }
}
