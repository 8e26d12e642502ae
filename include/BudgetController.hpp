#ifndef BUDGETCONTROLLER_HPP
#define BUDGETCONTROLLER_HPP

#include <chrono>
#include <cstdint>

enum class BudgetType {
    TIME,                 // Wall-clock milliseconds
    ITERATIONS,           // Completed treePolicy/rollOut/backUp cycles
    FORWARD_MODEL_CALLS   // State advances during expansion and rollouts
};

const char* budgetTypeName(BudgetType type);

// ============================================================================
// BudgetController - decides when a search stops
// ============================================================================
// Idle -> Running (start) -> Done (budget exhausted). The stop check runs after
// each completed iteration, so a search always performs at least one.

class BudgetController {
public:
    enum class State { IDLE, RUNNING, DONE };

    BudgetController(BudgetType type, int64_t budget, int breakMs = 10, double iterationTimeFactor = 2.0);

    void start();
    void beginIteration();

    // Records a completed iteration; returns true once the budget is exhausted
    bool endIteration(int64_t forwardModelCalls);

    // Time policy: stop when the time left is within the safety margin or
    // within `iterationTimeFactor` average iterations of the deadline
    static bool timeExhausted(double remainingMs, double avgIterationMs, double breakMs, double iterationTimeFactor);

    State getState() const { return state_; }
    int getIterations() const { return iterations_; }
    double getElapsedMs() const;
    double getAverageIterationMs() const;

private:
    using Clock = std::chrono::steady_clock;

    BudgetType type_;
    int64_t budget_;
    int breakMs_;
    double iterationTimeFactor_;

    State state_ = State::IDLE;
    int iterations_ = 0;
    double accumulatedIterationMs_ = 0.0;
    Clock::time_point searchStart_;
    Clock::time_point iterationStart_;
};

#endif // BUDGETCONTROLLER_HPP
