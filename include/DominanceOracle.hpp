#ifndef DOMINANCEORACLE_HPP
#define DOMINANCEORACLE_HPP

#include "GameState.hpp"

// Game-specific pruning hook. An action reported as "no gain" can never
// improve the mover's result given what is publicly known in `state`, so the
// selector scores it below every other action.
//
// Implementations only understand their own game's vocabulary: a state or
// action of an unknown kind must be answered with false (no pruning).
class DominanceOracle {
public:
    virtual ~DominanceOracle() = default;

    virtual bool isNoGain(const GameState& state, const Action& action) const = 0;
};

#endif // DOMINANCEORACLE_HPP
