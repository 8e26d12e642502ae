#ifndef SUSHIGOGAME_HPP
#define SUSHIGOGAME_HPP

#include "GameState.hpp"
#include <array>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

// ============================================================================
// SushiGoGame - Sushi Go! drafting card game for 2-5 players
// ============================================================================
// Each turn every player picks one card from their hand (or two, by returning
// a played Chopsticks). Picks are made in player order and stay face down
// until the last player has chosen; then all picks are revealed at once and
// every hand passes to the next player. A round ends when the hands are
// empty; the game ends after the configured number of rounds.

class SushiGoGame : public GameState {
public:
    enum CardType {
        MAKI_1 = 0,
        MAKI_2,
        MAKI_3,
        TEMPURA,
        SASHIMI,
        DUMPLING,
        SQUID_NIGIRI,
        SALMON_NIGIRI,
        EGG_NIGIRI,
        WASABI,
        CHOPSTICKS,
        PUDDING,
        CARD_TYPE_COUNT
    };

    using CardCounts = std::array<int, CARD_TYPE_COUNT>;

    struct Config {
        int playerCount = 3;
        int rounds = 3;
        int handSize = 9;
        // Indexed by CardType; the standard 108-card deck
        CardCounts deckCounts = {6, 12, 8, 14, 14, 14, 5, 10, 5, 6, 4, 10};

        int deckSize() const;

        // Standard rules: 10/9/8/7 cards per hand for 2/3/4/5 players
        static Config forPlayers(int players);
    };

    SushiGoGame();
    explicit SushiGoGame(const Config& config, uint32_t seed = 0);

    // Shuffle a fresh deck and deal the first round
    void reset(uint32_t seed);

    // GameState interface
    std::unique_ptr<GameState> copy() const override;
    ActionList getLegalActions() const override;
    void applyAction(const Action& action) override;
    bool isTerminal() const override { return gameOver_; }
    int getCurrentPlayer() const override { return currentPlayer_; }
    int getPlayerCount() const override { return config_.playerCount; }
    double getTerminalResult(int playerId) const override;
    double getGameScore(int playerId) const override;
    std::string toString() const override;

    // State access
    const Config& getConfig() const { return config_; }
    const std::vector<CardType>& getHand(int player) const { return hands_[player]; }
    const std::vector<CardType>& getField(int player) const { return fields_[player]; }
    int countInHand(int player, CardType type) const;
    int countOnField(int player, CardType type) const;
    int getMakiOnField(int player) const;
    int getPuddings(int player) const { return puddings_[player]; }
    int getWasabiAvailable(int player) const { return wasabiAvailable_[player]; }
    int getBankedScore(int player) const { return scores_[player]; }
    int getRound() const { return round_; }
    int getTurn() const { return turn_; }

    // Cards still in any player's hand
    CardCounts countAvailable() const;

    // Hands travel one seat per turn, so after t turns `observer` has held the
    // hands now in the seats up to t places further along
    bool hasSeenHand(int observer, int owner) const;
    bool hasSeenAllHands(int observer) const;

    // Replaces a hand, for setting up positions. The new hand must match the
    // size of the other hands.
    void setHand(int player, const std::vector<CardType>& cards);

    // Scoring rules
    static int scoreTempura(int count);
    static int scoreSashimi(int count);
    static int scoreDumplings(int count);
    static int nigiriValue(CardType type);
    static int makiIcons(CardType type);
    static std::vector<int> scoreMaki(const std::vector<int>& makiCounts);
    static std::vector<int> scorePuddings(const std::vector<int>& puddings);

    static const char* cardName(CardType type);

private:
    void dealRound();
    void revealTurn();
    void playToField(int player, CardType card);
    void endRound();
    int fieldScore(int player) const;
    bool removeFromHand(int player, CardType card);

    Config config_;
    std::mt19937 rng_;

    std::vector<CardType> drawPile_;
    std::vector<std::vector<CardType>> hands_;
    std::vector<std::vector<CardType>> fields_;      // Cards played this round
    std::vector<std::vector<CardType>> pending_;     // Face-down picks this turn
    std::vector<bool> usedChopsticks_;
    std::vector<int> wasabiAvailable_;
    std::vector<int> nigiriPoints_;                  // This round, wasabi included
    std::vector<int> puddings_;
    std::vector<int> scores_;                        // Banked at the end of each round

    int currentPlayer_ = 0;
    int round_ = 0;
    int turn_ = 0;
    bool gameOver_ = false;
};

// ============================================================================
// Sushi Go! actions
// ============================================================================

class PlayCardAction : public Action {
public:
    PlayCardAction(int playerId, SushiGoGame::CardType cardType)
        : playerId(playerId), cardType(cardType) {}

    std::unique_ptr<Action> copy() const override;
    bool equals(const Action& other) const override;
    std::string toString() const override;

    const int playerId;
    const SushiGoGame::CardType cardType;
};

// Plays two cards this turn and returns a Chopsticks from the field to the hand
class ChopsticksAction : public Action {
public:
    ChopsticksAction(int playerId, SushiGoGame::CardType first, SushiGoGame::CardType second)
        : playerId(playerId), first(first), second(second) {}

    std::unique_ptr<Action> copy() const override;
    bool equals(const Action& other) const override;
    std::string toString() const override;

    const int playerId;
    const SushiGoGame::CardType first;
    const SushiGoGame::CardType second;
};

#endif // SUSHIGOGAME_HPP
