#ifndef EVALUATOR_HPP
#define EVALUATOR_HPP

#include "GameState.hpp"

// Abstract interface for position evaluation
class Evaluator {
public:
    virtual ~Evaluator() = default;

    // Value of `state` from `playerId`'s perspective. Must be finite; the
    // search treats anything else as a broken evaluator.
    virtual double evaluateState(const GameState& state, int playerId) = 0;
};

// Baseline - terminal result when the game is over, otherwise the score
// lead over the best opponent normalised by the leading score
class ScoreDifferenceEvaluator : public Evaluator {
public:
    ScoreDifferenceEvaluator() = default;
    ~ScoreDifferenceEvaluator() override = default;
    double evaluateState(const GameState& state, int playerId) override;
};

#endif // EVALUATOR_HPP
