/**
 * @file Reporter.hpp
 * @brief Lifecycle events emitted by the supervisor and their console output
 * @version 1.0
 * @date 2025-01-01
 */

#pragma once

#include <iostream>
#include <string>
#include <sys/types.h>
#include "entry.hpp"

enum class Action { Start, Stop, Status };

/**
 * @brief Discrete lifecycle event
 */
enum class EventKind {
    Starting,           ///< About to launch
    AlreadyRunning,
    Launched,           ///< Child forked, PID file written, verification pending
    Started,
    StartupFailed,
    HealthCheckFailed,  ///< Process alive but its health URL did not answer 200
    Skipped,            ///< Not attempted after an earlier start failure
    NotRunning,
    StaleState,         ///< PID file without a process, file removed
    Stopping,           ///< SIGTERM sent, stop sequence Waiting
    StopTimeout,        ///< Stop sequence Escalating, SIGKILL sent
    StoppedGracefully,
    StoppedForced,
    ForceStopFailed,
    Running
};

const char* eventName(EventKind kind);

struct Event {
    EventKind   Kind;
    std::string Entry;
    pid_t       Pid = -1;
    std::string LogFile;
    std::string Detail;
};

/**
 * @brief Receives supervisor events
 *
 * Every state change of a start or stop attempt is delivered as one event;
 * beginRun/endRun bracket the aggregate operations.
 */
class Reporter {
public:
    virtual ~Reporter() = default;

    virtual void event(const Event& e) = 0;
    virtual void beginRun(Action action) { (void)action; }
    virtual void endRun(Action action, const RunSummary& summary) { (void)action; (void)summary; }
};

/**
 * @brief Prints events the way the command-line tool reports everything
 */
class ConsoleReporter : public Reporter {
public:
    explicit ConsoleReporter(std::ostream& out = std::cout, std::ostream& err = std::cerr);

    void event(const Event& e) override;
    void beginRun(Action action) override;
    void endRun(Action action, const RunSummary& summary) override;

private:
    std::ostream& out_;
    std::ostream& err_;

    void banner(const std::string& title);
};
