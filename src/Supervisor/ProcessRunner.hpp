/**
 * @file ProcessRunner.hpp
 * @brief OS process primitives: detached launch, liveness probe, signals
 * @version 1.0
 * @date 2025-01-01
 */

#pragma once

#include <string>
#include <vector>
#include <sys/types.h>
#include "entry.hpp"

/**
 * @brief Process management primitives used by the supervisor
 *
 * Holds no state of its own: every PID it works with comes from the caller,
 * so liveness is always re-derived from the OS. Methods are virtual so the
 * supervisor can be driven against a fake in tests.
 */
class ProcessRunner {
public:
    ProcessRunner() = default;
    virtual ~ProcessRunner() = default;

    // Disable copy constructor and assignment operator
    ProcessRunner(const ProcessRunner&) = delete;
    ProcessRunner& operator=(const ProcessRunner&) = delete;

    /**
     * @brief Launch the entry's command detached from the controlling session
     * @param entry Process to launch
     * @param err_out Error description on failure
     * @return Process ID on success, -1 on failure
     *
     * The child runs in a new session (setsid), in entry.Folder, with
     * entry.Environment applied, stdin from /dev/null and stdout/stderr
     * appended to entry.LogFile. If exec fails the child writes the reason to
     * the log file and exits with status 127.
     */
    virtual pid_t start(const ProcessEntry& entry, std::string& err_out);

    /**
     * @brief Check if a process is currently running
     * @param pid Process ID
     * @return true if the process exists
     *
     * Reaps the process first if it is an exited child of ours, so a zombie
     * is never reported as running. EPERM from kill(pid, 0) counts as alive.
     */
    virtual bool isAlive(pid_t pid);

    /**
     * @brief Deliver a signal
     * @return true if the signal was sent
     */
    virtual bool sendSignal(pid_t pid, int signal);

    /**
     * @brief Split command line into individual arguments
     * @param cmdline Command line string to split
     * @return Vector of command arguments
     *
     * Splits on whitespace; single or double quotes group a word and are
     * removed. A backslash inside double quotes escapes the next character.
     */
    static std::vector<std::string> splitCommand(const std::string& cmdline);
};
