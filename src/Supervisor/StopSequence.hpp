/**
 * @file StopSequence.hpp
 * @brief Bounded polling state machine for graceful-then-forced shutdown
 * @version 1.0
 * @date 2025-01-01
 */

#pragma once

/**
 * @brief Tracks one stop attempt, one liveness observation at a time
 *
 * Waiting    - SIGTERM sent, polling. Dead -> Confirmed. Alive after the
 *              tick budget is spent -> Escalating.
 * Escalating - SIGKILL sent. Dead -> Confirmed (forced). Alive -> Failed.
 * Confirmed and Failed are terminal.
 *
 * With a budget of N the process is observed N + 1 times before escalation,
 * the caller sleeping one poll interval between observations, so SIGKILL is
 * sent N intervals after SIGTERM.
 */
class StopSequence {
public:
    enum class State { Waiting, Confirmed, Escalating, Failed };

    explicit StopSequence(int tickBudget);

    /**
     * @brief Feed one liveness observation
     * @return State after the transition
     */
    State observe(bool alive);

    State state() const { return state_; }
    int ticks() const { return ticks_; }
    bool forced() const { return forced_; }
    bool finished() const { return state_ == State::Confirmed || state_ == State::Failed; }

private:
    int   budget_;
    int   ticks_ = 0;
    bool  forced_ = false;
    State state_ = State::Waiting;
};

const char* stateName(StopSequence::State state);
