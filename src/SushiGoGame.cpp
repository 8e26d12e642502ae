#include "SushiGoGame.hpp"
#include <algorithm>
#include <iostream>
#include <numeric>
#include <sstream>
#include <stdexcept>

// ============================================================================
// Config
// ============================================================================

int SushiGoGame::Config::deckSize() const {
    return std::accumulate(deckCounts.begin(), deckCounts.end(), 0);
}

SushiGoGame::Config SushiGoGame::Config::forPlayers(int players) {
    Config config;
    config.playerCount = players;
    config.handSize = 12 - players;
    return config;
}

// ============================================================================
// Setup
// ============================================================================

SushiGoGame::SushiGoGame() : SushiGoGame(Config(), 0) {
}

SushiGoGame::SushiGoGame(const Config& config, uint32_t seed)
    : config_(config) {
    if (config_.playerCount < 2 || config_.playerCount > 5) {
        throw std::invalid_argument("SushiGoGame: player count must be between 2 and 5");
    }
    if (config_.rounds < 1 || config_.handSize < 1) {
        throw std::invalid_argument("SushiGoGame: rounds and hand size must be positive");
    }
    if (config_.playerCount * config_.handSize * config_.rounds > config_.deckSize()) {
        throw std::invalid_argument("SushiGoGame: deck too small for the configured deal");
    }
    reset(seed);
}

void SushiGoGame::reset(uint32_t seed) {
    int n = config_.playerCount;
    rng_.seed(seed);

    drawPile_.clear();
    drawPile_.reserve(config_.deckSize());
    for (int type = 0; type < CARD_TYPE_COUNT; type++) {
        for (int i = 0; i < config_.deckCounts[type]; i++) {
            drawPile_.push_back(static_cast<CardType>(type));
        }
    }
    std::shuffle(drawPile_.begin(), drawPile_.end(), rng_);

    hands_.assign(n, {});
    fields_.assign(n, {});
    pending_.assign(n, {});
    usedChopsticks_.assign(n, false);
    wasabiAvailable_.assign(n, 0);
    nigiriPoints_.assign(n, 0);
    puddings_.assign(n, 0);
    scores_.assign(n, 0);

    currentPlayer_ = 0;
    round_ = 0;
    turn_ = 0;
    gameOver_ = false;

    dealRound();
}

void SushiGoGame::dealRound() {
    for (int p = 0; p < config_.playerCount; p++) {
        hands_[p].clear();
        for (int i = 0; i < config_.handSize; i++) {
            hands_[p].push_back(drawPile_.back());
            drawPile_.pop_back();
        }
    }
}

void SushiGoGame::setHand(int player, const std::vector<CardType>& cards) {
    if (player < 0 || player >= config_.playerCount) {
        throw std::invalid_argument("SushiGoGame::setHand: no such player");
    }
    for (int p = 0; p < config_.playerCount; p++) {
        if (p != player && hands_[p].size() != cards.size()) {
            throw std::invalid_argument("SushiGoGame::setHand: hand size differs from the other hands");
        }
    }
    hands_[player] = cards;
}

// ============================================================================
// GameState interface
// ============================================================================

std::unique_ptr<GameState> SushiGoGame::copy() const {
    return std::make_unique<SushiGoGame>(*this);
}

ActionList SushiGoGame::getLegalActions() const {
    ActionList actions;
    if (gameOver_) {
        return actions;
    }

    int p = currentPlayer_;
    std::array<int, CARD_TYPE_COUNT> inHand{};
    for (CardType card : hands_[p]) {
        inHand[card]++;
    }

    for (int type = 0; type < CARD_TYPE_COUNT; type++) {
        if (inHand[type] > 0) {
            actions.push_back(std::make_unique<PlayCardAction>(p, static_cast<CardType>(type)));
        }
    }

    // Chopsticks on the field allow two picks; order matters for Wasabi
    if (countOnField(p, CHOPSTICKS) > 0 && hands_[p].size() >= 2) {
        for (int first = 0; first < CARD_TYPE_COUNT; first++) {
            if (inHand[first] == 0) continue;
            for (int second = 0; second < CARD_TYPE_COUNT; second++) {
                if (inHand[second] == 0 || (first == second && inHand[first] < 2)) continue;
                actions.push_back(std::make_unique<ChopsticksAction>(
                    p, static_cast<CardType>(first), static_cast<CardType>(second)));
            }
        }
    }

    return actions;
}

void SushiGoGame::applyAction(const Action& action) {
    if (gameOver_) {
        throw std::invalid_argument("SushiGoGame::applyAction: game is over");
    }

    int p = currentPlayer_;
    if (const auto* play = dynamic_cast<const PlayCardAction*>(&action)) {
        if (play->playerId != p || !removeFromHand(p, play->cardType)) {
            throw std::invalid_argument("SushiGoGame::applyAction: illegal " + play->toString());
        }
        pending_[p].push_back(play->cardType);
    } else if (const auto* chop = dynamic_cast<const ChopsticksAction*>(&action)) {
        if (chop->playerId != p || countOnField(p, CHOPSTICKS) == 0) {
            throw std::invalid_argument("SushiGoGame::applyAction: illegal " + chop->toString());
        }
        if (!removeFromHand(p, chop->first)) {
            throw std::invalid_argument("SushiGoGame::applyAction: illegal " + chop->toString());
        }
        if (!removeFromHand(p, chop->second)) {
            hands_[p].push_back(chop->first);
            throw std::invalid_argument("SushiGoGame::applyAction: illegal " + chop->toString());
        }
        pending_[p].push_back(chop->first);
        pending_[p].push_back(chop->second);
        usedChopsticks_[p] = true;
    } else {
        throw std::invalid_argument("SushiGoGame::applyAction: not a Sushi Go action: " + action.toString());
    }

    currentPlayer_++;
    if (currentPlayer_ == config_.playerCount) {
        currentPlayer_ = 0;
        revealTurn();
    }
}

double SushiGoGame::getTerminalResult(int playerId) const {
    if (!gameOver_) {
        throw std::logic_error("SushiGoGame::getTerminalResult: game is not over");
    }

    // Highest score wins, most puddings breaks ties
    int bestScore = *std::max_element(scores_.begin(), scores_.end());
    int bestPuddings = -1;
    for (int p = 0; p < config_.playerCount; p++) {
        if (scores_[p] == bestScore) bestPuddings = std::max(bestPuddings, puddings_[p]);
    }

    int winners = 0;
    for (int p = 0; p < config_.playerCount; p++) {
        if (scores_[p] == bestScore && puddings_[p] == bestPuddings) winners++;
    }

    if (scores_[playerId] != bestScore || puddings_[playerId] != bestPuddings) {
        return LOSS_RESULT;
    }
    return winners == 1 ? WIN_RESULT : DRAW_RESULT;
}

double SushiGoGame::getGameScore(int playerId) const {
    return scores_[playerId] + fieldScore(playerId);
}

// ============================================================================
// Turn and round flow
// ============================================================================

void SushiGoGame::revealTurn() {
    int n = config_.playerCount;
    for (int p = 0; p < n; p++) {
        for (CardType card : pending_[p]) {
            playToField(p, card);
        }
        pending_[p].clear();

        if (usedChopsticks_[p]) {
            auto it = std::find(fields_[p].begin(), fields_[p].end(), CHOPSTICKS);
            fields_[p].erase(it);
            hands_[p].push_back(CHOPSTICKS);
            usedChopsticks_[p] = false;
        }
    }

    // Pass hands to the next seat
    std::vector<std::vector<CardType>> passed(n);
    for (int p = 0; p < n; p++) {
        passed[(p + 1) % n] = std::move(hands_[p]);
    }
    hands_ = std::move(passed);
    turn_++;

    if (hands_[0].empty()) {
        endRound();
    }
}

void SushiGoGame::playToField(int player, CardType card) {
    switch (card) {
        case SQUID_NIGIRI:
        case SALMON_NIGIRI:
        case EGG_NIGIRI:
            if (wasabiAvailable_[player] > 0) {
                wasabiAvailable_[player]--;
                nigiriPoints_[player] += 3 * nigiriValue(card);
            } else {
                nigiriPoints_[player] += nigiriValue(card);
            }
            break;
        case WASABI:
            wasabiAvailable_[player]++;
            break;
        case PUDDING:
            puddings_[player]++;
            break;
        default:
            break;
    }
    fields_[player].push_back(card);
}

void SushiGoGame::endRound() {
    int n = config_.playerCount;

    std::vector<int> maki(n);
    for (int p = 0; p < n; p++) {
        maki[p] = getMakiOnField(p);
        scores_[p] += fieldScore(p);
    }
    std::vector<int> makiPoints = scoreMaki(maki);
    for (int p = 0; p < n; p++) {
        scores_[p] += makiPoints[p];
        fields_[p].clear();
        wasabiAvailable_[p] = 0;
        nigiriPoints_[p] = 0;
    }

    round_++;
    turn_ = 0;
    if (round_ >= config_.rounds) {
        std::vector<int> puddingPoints = scorePuddings(puddings_);
        for (int p = 0; p < n; p++) {
            scores_[p] += puddingPoints[p];
        }
        gameOver_ = true;
        return;
    }
    dealRound();
}

// Completed sets and nigiri on the current field; maki and pudding are
// comparative and only scored at round and game end
int SushiGoGame::fieldScore(int player) const {
    return scoreTempura(countOnField(player, TEMPURA)) +
           scoreSashimi(countOnField(player, SASHIMI)) +
           scoreDumplings(countOnField(player, DUMPLING)) +
           nigiriPoints_[player];
}

bool SushiGoGame::removeFromHand(int player, CardType card) {
    auto& hand = hands_[player];
    auto it = std::find(hand.begin(), hand.end(), card);
    if (it == hand.end()) {
        return false;
    }
    hand.erase(it);
    return true;
}

// ============================================================================
// Queries
// ============================================================================

int SushiGoGame::countInHand(int player, CardType type) const {
    return static_cast<int>(std::count(hands_[player].begin(), hands_[player].end(), type));
}

int SushiGoGame::countOnField(int player, CardType type) const {
    return static_cast<int>(std::count(fields_[player].begin(), fields_[player].end(), type));
}

int SushiGoGame::getMakiOnField(int player) const {
    int icons = 0;
    for (CardType card : fields_[player]) {
        icons += makiIcons(card);
    }
    return icons;
}

SushiGoGame::CardCounts SushiGoGame::countAvailable() const {
    CardCounts counts{};
    for (const auto& hand : hands_) {
        for (CardType card : hand) {
            counts[card]++;
        }
    }
    return counts;
}

bool SushiGoGame::hasSeenHand(int observer, int owner) const {
    int n = config_.playerCount;
    // The hand in `owner`'s seat started the round in seat (owner - turn)
    int seatsBehind = ((observer - owner + turn_) % n + n) % n;
    return seatsBehind <= turn_;
}

bool SushiGoGame::hasSeenAllHands(int observer) const {
    for (int p = 0; p < config_.playerCount; p++) {
        if (!hasSeenHand(observer, p)) return false;
    }
    return true;
}

// ============================================================================
// Scoring rules
// ============================================================================

int SushiGoGame::scoreTempura(int count) {
    return (count / 2) * 5;
}

int SushiGoGame::scoreSashimi(int count) {
    return (count / 3) * 10;
}

int SushiGoGame::scoreDumplings(int count) {
    static const int table[] = {0, 1, 3, 6, 10, 15};
    return table[std::min(count, 5)];
}

int SushiGoGame::nigiriValue(CardType type) {
    switch (type) {
        case SQUID_NIGIRI: return 3;
        case SALMON_NIGIRI: return 2;
        case EGG_NIGIRI: return 1;
        default: return 0;
    }
}

int SushiGoGame::makiIcons(CardType type) {
    switch (type) {
        case MAKI_1: return 1;
        case MAKI_2: return 2;
        case MAKI_3: return 3;
        default: return 0;
    }
}

std::vector<int> SushiGoGame::scoreMaki(const std::vector<int>& makiCounts) {
    std::vector<int> points(makiCounts.size(), 0);
    if (makiCounts.empty()) return points;

    int most = *std::max_element(makiCounts.begin(), makiCounts.end());
    if (most <= 0) return points;

    int nMost = static_cast<int>(std::count(makiCounts.begin(), makiCounts.end(), most));
    for (size_t p = 0; p < makiCounts.size(); p++) {
        if (makiCounts[p] == most) points[p] = 6 / nMost;
    }
    // A shared first place takes the runner-up points with it
    if (nMost > 1) return points;

    int second = 0;
    for (int count : makiCounts) {
        if (count < most) second = std::max(second, count);
    }
    if (second <= 0) return points;

    int nSecond = static_cast<int>(std::count(makiCounts.begin(), makiCounts.end(), second));
    for (size_t p = 0; p < makiCounts.size(); p++) {
        if (makiCounts[p] == second) points[p] = 3 / nSecond;
    }
    return points;
}

std::vector<int> SushiGoGame::scorePuddings(const std::vector<int>& puddings) {
    std::vector<int> points(puddings.size(), 0);
    if (puddings.empty()) return points;

    int most = *std::max_element(puddings.begin(), puddings.end());
    int least = *std::min_element(puddings.begin(), puddings.end());
    if (most == least) return points;

    int nMost = static_cast<int>(std::count(puddings.begin(), puddings.end(), most));
    int nLeast = static_cast<int>(std::count(puddings.begin(), puddings.end(), least));
    for (size_t p = 0; p < puddings.size(); p++) {
        if (puddings[p] == most) {
            points[p] = 6 / nMost;
        } else if (puddings[p] == least && puddings.size() > 2) {
            // No penalty in a two player game
            points[p] = -(6 / nLeast);
        }
    }
    return points;
}

// ============================================================================
// Display
// ============================================================================

const char* SushiGoGame::cardName(CardType type) {
    switch (type) {
        case MAKI_1: return "Maki-1";
        case MAKI_2: return "Maki-2";
        case MAKI_3: return "Maki-3";
        case TEMPURA: return "Tempura";
        case SASHIMI: return "Sashimi";
        case DUMPLING: return "Dumpling";
        case SQUID_NIGIRI: return "SquidNigiri";
        case SALMON_NIGIRI: return "SalmonNigiri";
        case EGG_NIGIRI: return "EggNigiri";
        case WASABI: return "Wasabi";
        case CHOPSTICKS: return "Chopsticks";
        case PUDDING: return "Pudding";
        default: return "?";
    }
}

std::string SushiGoGame::toString() const {
    std::ostringstream out;
    out << "Round " << std::min(round_ + 1, config_.rounds) << "/" << config_.rounds
        << ", turn " << (turn_ + 1) << "\n";
    for (int p = 0; p < config_.playerCount; p++) {
        out << (p == currentPlayer_ && !gameOver_ ? "> " : "  ")
            << "Player " << p << ": " << static_cast<int>(getGameScore(p)) << " pts, "
            << puddings_[p] << " pudding, maki " << getMakiOnField(p) << "\n";
        out << "    hand: ";
        for (CardType card : hands_[p]) out << cardName(card) << " ";
        out << "\n    field: ";
        for (CardType card : fields_[p]) out << cardName(card) << " ";
        out << "\n";
    }
    return out.str();
}

// ============================================================================
// Actions
// ============================================================================

std::unique_ptr<Action> PlayCardAction::copy() const {
    return std::make_unique<PlayCardAction>(playerId, cardType);
}

bool PlayCardAction::equals(const Action& other) const {
    const auto* o = dynamic_cast<const PlayCardAction*>(&other);
    return o != nullptr && o->playerId == playerId && o->cardType == cardType;
}

std::string PlayCardAction::toString() const {
    return "P" + std::to_string(playerId) + " play " + SushiGoGame::cardName(cardType);
}

std::unique_ptr<Action> ChopsticksAction::copy() const {
    return std::make_unique<ChopsticksAction>(playerId, first, second);
}

bool ChopsticksAction::equals(const Action& other) const {
    const auto* o = dynamic_cast<const ChopsticksAction*>(&other);
    return o != nullptr && o->playerId == playerId && o->first == first && o->second == second;
}

std::string ChopsticksAction::toString() const {
    return "P" + std::to_string(playerId) + " chopsticks " + SushiGoGame::cardName(first) +
           " + " + SushiGoGame::cardName(second);
}
