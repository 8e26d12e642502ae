#ifndef SUSHIGOORACLE_HPP
#define SUSHIGOORACLE_HPP

#include "DominanceOracle.hpp"
#include "SushiGoGame.hpp"

// ============================================================================
// SushiGoOracle - card picks that cannot score for anyone
// ============================================================================
// Only applies once the mover has seen every hand in the round, so that the
// cards still available are public knowledge. Single-card plays only:
//   Maki        two or more opponents stay ahead even if the mover took
//               every Maki still in the hands
//   Wasabi      no Nigiri left to put on it
//   Tempura     the last one, and nobody has an unpaired Tempura
//   Sashimi     too few left for anybody to finish a set
//   Chopsticks  only two cards left in the hand, so no turn to use them

class SushiGoOracle : public DominanceOracle {
public:
    bool isNoGain(const GameState& state, const Action& action) const override;

    // Whether the mover can still finish at most one place behind on Maki
    static bool canWinMakiRace(const SushiGoGame& game, int player);
};

#endif // SUSHIGOORACLE_HPP
