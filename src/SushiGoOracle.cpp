#include "SushiGoOracle.hpp"

bool SushiGoOracle::isNoGain(const GameState& state, const Action& action) const {
    const auto* game = dynamic_cast<const SushiGoGame*>(&state);
    const auto* play = dynamic_cast<const PlayCardAction*>(&action);
    if (game == nullptr || play == nullptr) {
        return false;
    }

    int player = game->getCurrentPlayer();
    if (!game->hasSeenAllHands(player)) {
        return false;
    }

    int n = game->getPlayerCount();
    SushiGoGame::CardCounts available = game->countAvailable();

    switch (play->cardType) {
        case SushiGoGame::MAKI_1:
        case SushiGoGame::MAKI_2:
        case SushiGoGame::MAKI_3:
            return !canWinMakiRace(*game, player);

        case SushiGoGame::WASABI:
            return available[SushiGoGame::SQUID_NIGIRI] + available[SushiGoGame::SALMON_NIGIRI] +
                   available[SushiGoGame::EGG_NIGIRI] == 0;

        case SushiGoGame::TEMPURA:
            if (available[SushiGoGame::TEMPURA] != 1) return false;
            for (int p = 0; p < n; p++) {
                if (game->countOnField(p, SushiGoGame::TEMPURA) % 2 == 1) return false;
            }
            return true;

        case SushiGoGame::SASHIMI: {
            int left = available[SushiGoGame::SASHIMI];
            if (left != 1 && left != 2) return false;
            // One left completes only a set at 2; two left also complete a set at 1
            for (int p = 0; p < n; p++) {
                int partial = game->countOnField(p, SushiGoGame::SASHIMI) % 3;
                if (partial == 2 || (left == 2 && partial == 1)) return false;
            }
            return true;
        }

        case SushiGoGame::CHOPSTICKS:
            return game->getHand(player).size() == 2;

        default:
            return false;
    }
}

bool SushiGoOracle::canWinMakiRace(const SushiGoGame& game, int player) {
    SushiGoGame::CardCounts available = game.countAvailable();
    int bestCase = game.getMakiOnField(player) +
                   available[SushiGoGame::MAKI_1] * SushiGoGame::makiIcons(SushiGoGame::MAKI_1) +
                   available[SushiGoGame::MAKI_2] * SushiGoGame::makiIcons(SushiGoGame::MAKI_2) +
                   available[SushiGoGame::MAKI_3] * SushiGoGame::makiIcons(SushiGoGame::MAKI_3);

    int playersAhead = 0;
    for (int p = 0; p < game.getPlayerCount(); p++) {
        if (p != player && game.getMakiOnField(p) > bestCase) playersAhead++;
    }
    return playersAhead < 2;
}
