/**
 * @file Supervisor.hpp
 * @brief Start, stop and status of PID-file tracked processes
 * @version 1.0
 * @date 2025-01-01
 */

#pragma once

#include <chrono>
#include "entry.hpp"
#include "ProcessRunner.hpp"
#include "Reporter.hpp"

/**
 * @brief Process supervisor
 *
 * Applies start/stop/status to the configured entries, in order, one at a
 * time. PID files are the only state carried between invocations; liveness
 * is re-derived from the OS on every call. Per-entry failures never escape
 * as exceptions: they come back as an EntryResult and are counted by the
 * aggregate runs.
 */
class Supervisor {
public:
    /**
     * @param config Paths, entries and timing
     * @param runner Process primitives (spawn, liveness, signals)
     * @param reporter Receives every lifecycle event
     */
    Supervisor(SupervisorConfig config, ProcessRunner& runner, Reporter& reporter);

    // Disable copy constructor and assignment operator
    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    /**
     * @brief Start one entry unless it is already running
     * @return AlreadyRunning, Started or StartupFailed
     *
     * Writes the PID file as soon as the child exists, waits the entry's
     * startup delay and re-checks liveness (then the health URL, if any).
     * On failure the PID file is removed.
     */
    EntryResult start(const ProcessEntry& entry);

    /**
     * @brief Stop one entry: SIGTERM, poll, escalate to SIGKILL
     * @return NotRunning, StaleState, StoppedGracefully, StoppedForced or
     *         ForceStopFailed
     *
     * The PID file is removed on every outcome except ForceStopFailed, where
     * it is left for inspection.
     */
    EntryResult stop(const ProcessEntry& entry);

    /**
     * @brief Report whether an entry is running
     * @return Running, NotRunning or StaleState (stale PID file removed)
     */
    EntryResult status(const ProcessEntry& entry);

    /**
     * @brief Start every entry in order, stopping at the first failure
     *
     * Entries after a StartupFailed are reported as Skipped and not counted.
     */
    RunSummary startAll();

    /**
     * @brief Stop every entry in order, continuing past failures
     */
    RunSummary stopAll();

    RunSummary statusAll();

    const SupervisorConfig& config() const { return config_; }

private:
    SupervisorConfig config_;
    ProcessRunner&   runner_;
    Reporter&        reporter_;

    EntryResult terminate(const ProcessEntry& entry, pid_t pid);
    EntryResult finish(const ProcessEntry& entry, Outcome outcome, EventKind kind,
                       pid_t pid, const std::string& detail = "");
    void emit(EventKind kind, const ProcessEntry& entry, pid_t pid, const std::string& detail = "");
    static void pause(std::chrono::milliseconds duration);
};
