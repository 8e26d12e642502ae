#ifndef SUSHIGOHEURISTIC_HPP
#define SUSHIGOHEURISTIC_HPP

#include "Evaluator.hpp"
#include "SushiGoGame.hpp"
#include <vector>

// ============================================================================
// SushiGoHeuristic - score lead with credit for unfinished sets
// ============================================================================
// The game score only counts completed sets. Cards that are worth something
// only once combined (a lone Tempura, an unused Wasabi, Maki and Pudding
// majorities) get an estimated value, scaled by modifierFactor, before the
// lead over the best opponent is measured.

class SushiGoHeuristic : public Evaluator {
public:
    struct Config {
        double singleTempura = 2.5;
        double singleSashimi = 10.0 / 3.0;
        double doubleSashimi = 20.0 / 3.0;
        double wasabiSquid = 6.0;
        double wasabiSalmon = 4.0;
        double wasabiEgg = 2.0;
        double winningMaki = 6.0;
        double runnerupMaki = 3.0;
        double mostPuddings = 6.0;
        double leastPuddings = -6.0;
        double modifierFactor = 0.21;
    };

    SushiGoHeuristic();
    explicit SushiGoHeuristic(const Config& config);
    ~SushiGoHeuristic() override = default;

    // Terminal states give the game result; other games fall back to the
    // plain score difference
    double evaluateState(const GameState& state, int playerId) override;

    // Estimated value of each player's unfinished cards this round
    std::vector<double> roundModifiers(const SushiGoGame& game) const;

    const Config& getConfig() const { return config_; }

private:
    Config config_;
    ScoreDifferenceEvaluator fallback_;
};

#endif // SUSHIGOHEURISTIC_HPP
