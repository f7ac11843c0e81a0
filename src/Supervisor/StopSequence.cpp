/**
 * @file StopSequence.cpp
 * @brief StopSequence transitions
 * @version 1.0
 * @date 2025-01-01
 */

#include "StopSequence.hpp"

StopSequence::StopSequence(int tickBudget)
    : budget_(tickBudget < 0 ? 0 : tickBudget) {}

StopSequence::State StopSequence::observe(bool alive) {
    switch (state_) {
        case State::Waiting:
            ++ticks_;
            if (!alive) {
                state_ = State::Confirmed;
            } else if (ticks_ > budget_) {
                state_ = State::Escalating;
            }
            break;

        case State::Escalating:
            forced_ = true;
            state_ = alive ? State::Failed : State::Confirmed;
            break;

        case State::Confirmed:
        case State::Failed:
            break;
    }
    return state_;
}

const char* stateName(StopSequence::State state) {
    switch (state) {
        case StopSequence::State::Waiting:    return "waiting";
        case StopSequence::State::Confirmed:  return "confirmed";
        case StopSequence::State::Escalating: return "escalating";
        case StopSequence::State::Failed:     return "failed";
    }
    return "unknown";
}
