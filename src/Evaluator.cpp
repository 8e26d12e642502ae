#include "Evaluator.hpp"
#include <algorithm>

// ============================================================================
// ScoreDifferenceEvaluator Implementation
// ============================================================================

double ScoreDifferenceEvaluator::evaluateState(const GameState& state, int playerId) {
    if (state.isTerminal()) {
        return state.getTerminalResult(playerId);
    }

    double ownScore = state.getGameScore(playerId);
    double bestOther = -1.0;
    double maxScore = ownScore;
    for (int i = 0; i < state.getPlayerCount(); i++) {
        if (i == playerId) continue;
        double score = state.getGameScore(i);
        bestOther = std::max(bestOther, score);
        maxScore = std::max(maxScore, score);
    }

    // Single-player games have no opponent to compare against
    if (state.getPlayerCount() < 2) {
        return ownScore / std::max(maxScore, 1.0);
    }
    return (ownScore - bestOther) / std::max(maxScore, 1.0);
}
