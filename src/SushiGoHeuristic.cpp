#include "SushiGoHeuristic.hpp"
#include <algorithm>
#include <limits>
#include <utility>

SushiGoHeuristic::SushiGoHeuristic() : SushiGoHeuristic(Config()) {
}

SushiGoHeuristic::SushiGoHeuristic(const Config& config) : config_(config) {
}

double SushiGoHeuristic::evaluateState(const GameState& state, int playerId) {
    if (state.isTerminal()) {
        return state.getTerminalResult(playerId);
    }

    const auto* game = dynamic_cast<const SushiGoGame*>(&state);
    if (game == nullptr) {
        return fallback_.evaluateState(state, playerId);
    }

    std::vector<double> modifiers = roundModifiers(*game);
    auto modifiedScore = [&](int p) {
        return game->getGameScore(p) + config_.modifierFactor * modifiers[p];
    };

    double ownScore = modifiedScore(playerId);
    double bestOther = std::numeric_limits<double>::lowest();
    double maxScore = ownScore;
    for (int p = 0; p < game->getPlayerCount(); p++) {
        if (p == playerId) continue;
        double score = modifiedScore(p);
        bestOther = std::max(bestOther, score);
        maxScore = std::max(maxScore, score);
    }

    // Lead scaled by the leading score
    return (ownScore - bestOther) / std::max(maxScore, 1.0);
}

std::vector<double> SushiGoHeuristic::roundModifiers(const SushiGoGame& game) const {
    using Card = SushiGoGame::CardType;
    static const int dumplingScore[] = {1, 3, 6, 10, 15};

    int n = game.getPlayerCount();
    std::vector<double> modifiers(n, 0.0);
    SushiGoGame::CardCounts available = game.countAvailable();

    std::vector<int> maki(n);
    std::vector<int> puddings(n);

    for (int p = 0; p < n; p++) {
        const auto& hand = game.getHand(p);
        auto inHand = [&](Card type) {
            return std::find(hand.begin(), hand.end(), type) != hand.end();
        };

        // Half a Tempura pair, unless this hand completes it or none are left
        if (game.countOnField(p, SushiGoGame::TEMPURA) % 2 == 1 &&
            !inHand(SushiGoGame::TEMPURA) && available[SushiGoGame::TEMPURA] > 0) {
            modifiers[p] += config_.singleTempura;
        }

        int sashimi = game.countOnField(p, SushiGoGame::SASHIMI) % 3;
        if (sashimi == 1 && available[SushiGoGame::SASHIMI] > 2) {
            modifiers[p] += config_.singleSashimi;
        } else if (sashimi == 2 && !inHand(SushiGoGame::SASHIMI) && available[SushiGoGame::SASHIMI] > 0) {
            modifiers[p] += config_.doubleSashimi;
        }

        // An open Wasabi is worth the best nigiri that may still come round;
        // a nigiri in this hand is already counted once played
        if (game.getWasabiAvailable(p) > 0) {
            const std::pair<Card, double> nigiri[] = {
                {SushiGoGame::SQUID_NIGIRI, config_.wasabiSquid},
                {SushiGoGame::SALMON_NIGIRI, config_.wasabiSalmon},
                {SushiGoGame::EGG_NIGIRI, config_.wasabiEgg},
            };
            for (const auto& [type, value] : nigiri) {
                if (inHand(type)) break;
                if (available[type] > 0) {
                    modifiers[p] += value;
                    break;
                }
            }
        }

        // Chopsticks pay off once per remaining turn but the last
        if (game.countOnField(p, SushiGoGame::CHOPSTICKS) > 0) {
            modifiers[p] += std::max(0, static_cast<int>(hand.size()) - 1);
        }

        // Dumplings on the field are valued at the best per-card average reachable
        int dumplings = game.countOnField(p, SushiGoGame::DUMPLING);
        if (dumplings > 0 && dumplings < 5) {
            int reachable = std::min(dumplings + available[SushiGoGame::DUMPLING], 5);
            modifiers[p] += static_cast<double>(dumplings) * dumplingScore[reachable - 1] / reachable -
                            dumplingScore[dumplings - 1];
        }

        maki[p] = game.getMakiOnField(p);
        puddings[p] = game.getPuddings(p);
    }

    // Maki as if the round ended now; a shared first place leaves no runner-up
    int mostMaki = *std::max_element(maki.begin(), maki.end());
    int secondMaki = 0;
    for (int count : maki) {
        if (count < mostMaki) secondMaki = std::max(secondMaki, count);
    }
    int nMostMaki = static_cast<int>(std::count(maki.begin(), maki.end(), mostMaki));
    int nSecondMaki = static_cast<int>(std::count(maki.begin(), maki.end(), secondMaki));
    for (int p = 0; p < n; p++) {
        if (mostMaki > 0 && maki[p] == mostMaki) {
            modifiers[p] += config_.winningMaki / nMostMaki;
        } else if (nMostMaki == 1 && secondMaki > 0 && maki[p] == secondMaki) {
            modifiers[p] += config_.runnerupMaki / nSecondMaki;
        }
    }

    // Puddings as if the game ended now; the fewest only cost points with more than two players
    int mostPuddings = *std::max_element(puddings.begin(), puddings.end());
    int leastPuddings = *std::min_element(puddings.begin(), puddings.end());
    if (mostPuddings != leastPuddings) {
        int nMost = static_cast<int>(std::count(puddings.begin(), puddings.end(), mostPuddings));
        int nLeast = static_cast<int>(std::count(puddings.begin(), puddings.end(), leastPuddings));
        for (int p = 0; p < n; p++) {
            if (puddings[p] == mostPuddings) {
                modifiers[p] += config_.mostPuddings / nMost;
            } else if (n > 2 && puddings[p] == leastPuddings) {
                modifiers[p] += config_.leastPuddings / nLeast;
            }
        }
    }

    return modifiers;
}
