#include "BudgetController.hpp"
#include <iostream>
#include <stdexcept>

const char* budgetTypeName(BudgetType type) {
    switch (type) {
        case BudgetType::TIME: return "time";
        case BudgetType::ITERATIONS: return "iterations";
        case BudgetType::FORWARD_MODEL_CALLS: return "fm-calls";
    }
    return "unknown";
}

BudgetController::BudgetController(BudgetType type, int64_t budget, int breakMs, double iterationTimeFactor)
    : type_(type)
    , budget_(budget)
    , breakMs_(breakMs)
    , iterationTimeFactor_(iterationTimeFactor) {
}

void BudgetController::start() {
    if (state_ != State::IDLE) {
        std::cerr << "Error: BudgetController started twice.\n";
        throw std::logic_error("BudgetController::start: already started");
    }
    state_ = State::RUNNING;
    iterations_ = 0;
    accumulatedIterationMs_ = 0.0;
    searchStart_ = Clock::now();
}

void BudgetController::beginIteration() {
    iterationStart_ = Clock::now();
}

bool BudgetController::endIteration(int64_t forwardModelCalls) {
    if (state_ != State::RUNNING) {
        std::cerr << "Error: Iteration recorded while the budget controller is not running.\n";
        throw std::logic_error("BudgetController::endIteration: not running");
    }

    auto now = Clock::now();
    iterations_++;
    accumulatedIterationMs_ += std::chrono::duration<double, std::milli>(now - iterationStart_).count();

    bool stop = false;
    switch (type_) {
        case BudgetType::TIME: {
            double remainingMs = static_cast<double>(budget_) -
                                 std::chrono::duration<double, std::milli>(now - searchStart_).count();
            stop = timeExhausted(remainingMs, getAverageIterationMs(), breakMs_, iterationTimeFactor_);
            break;
        }
        case BudgetType::ITERATIONS:
            stop = iterations_ >= budget_;
            break;
        case BudgetType::FORWARD_MODEL_CALLS:
            stop = forwardModelCalls > budget_;
            break;
    }

    if (stop) {
        state_ = State::DONE;
    }
    return stop;
}

bool BudgetController::timeExhausted(double remainingMs, double avgIterationMs, double breakMs, double iterationTimeFactor) {
    return remainingMs <= iterationTimeFactor * avgIterationMs || remainingMs <= breakMs;
}

double BudgetController::getElapsedMs() const {
    if (state_ == State::IDLE) return 0.0;
    return std::chrono::duration<double, std::milli>(Clock::now() - searchStart_).count();
}

double BudgetController::getAverageIterationMs() const {
    return iterations_ > 0 ? accumulatedIterationMs_ / iterations_ : 0.0;
}
