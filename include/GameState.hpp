#ifndef GAMESTATE_HPP
#define GAMESTATE_HPP

#include <memory>
#include <string>
#include <vector>

// ============================================================================
// Game model interface consumed by the search engine
// ============================================================================

// A move in some game. Actions are immutable values once created; the engine
// keeps its own copies and never hands the stored copy to applyAction().
class Action {
public:
    virtual ~Action() = default;

    virtual std::unique_ptr<Action> copy() const = 0;
    virtual bool equals(const Action& other) const = 0;
    virtual std::string toString() const = 0;
};

using ActionList = std::vector<std::unique_ptr<Action>>;

// A complete, fully observable game position.
class GameState {
public:
    // Terminal results reported by getTerminalResult()
    static constexpr double WIN_RESULT = 1.0;
    static constexpr double DRAW_RESULT = 0.5;
    static constexpr double LOSS_RESULT = -1.0;

    virtual ~GameState() = default;

    // Deep copy, safe to mutate independently of this state
    virtual std::unique_ptr<GameState> copy() const = 0;

    // Legal actions for the current player, empty when terminal.
    // Every returned action must be distinct under Action::equals().
    virtual ActionList getLegalActions() const = 0;

    // Advances this state in place
    virtual void applyAction(const Action& action) = 0;

    virtual bool isTerminal() const = 0;
    virtual int getCurrentPlayer() const = 0;
    virtual int getPlayerCount() const = 0;

    // WIN_RESULT / DRAW_RESULT / LOSS_RESULT for a finished game
    virtual double getTerminalResult(int playerId) const = 0;

    // Points currently held by a player (meaningful at any time)
    virtual double getGameScore(int playerId) const = 0;

    virtual std::string toString() const = 0;
};

#endif // GAMESTATE_HPP
