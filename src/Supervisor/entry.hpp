/**
 * @file entry.hpp
 * @brief Supervised process entry, supervisor configuration and outcome types
 * @version 1.0
 * @date 2025-01-01
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <sys/types.h>

/**
 * @brief Structure representing one supervised process
 *
 * Holds everything needed to launch, locate and stop a process across
 * invocations. The PID file is the only state that survives a run.
 */
struct ProcessEntry {
    std::string Name;                        ///< Identifier ("fastapi", "celery")
    std::string Command;                     ///< Command line, split on whitespace (quotes group)
    std::string Folder = ".";                ///< Working directory for the child
    std::vector<std::string> Environment;    ///< KEY=VALUE overrides applied before exec
    std::string PidFile;                     ///< Path of the PID file
    std::string LogFile;                     ///< Combined stdout/stderr destination
    int         GracefulTimeout = 10;        ///< Seconds to wait after SIGTERM
    int         StartupDelay = 2;            ///< Seconds to wait before verifying startup
    std::string HealthUrl;                   ///< Optional readiness URL, empty for none

    ProcessEntry() = default;

    ProcessEntry(const std::string& name, const std::string& cmd,
                 const std::string& pidFile, const std::string& logFile,
                 int gracefulTimeout = 10, int startupDelay = 2)
        : Name(name), Command(cmd), PidFile(pidFile), LogFile(logFile),
          GracefulTimeout(gracefulTimeout), StartupDelay(startupDelay) {}
};

/**
 * @brief Everything the supervisor needs, passed at construction
 */
struct SupervisorConfig {
    std::string ProjectDir;
    std::string LogDir;
    std::string PidDir;
    std::vector<ProcessEntry> Entries;       ///< Start and stop order

    std::chrono::milliseconds PollInterval{1000};   ///< Stop sequence tick
    std::chrono::milliseconds ForceKillWait{1000};  ///< Wait after SIGKILL
    int HealthTimeout = 5;                          ///< Seconds, connect and read
    int ReadyTimeout = 30;                          ///< Seconds to keep retrying the health URL
};

/**
 * @brief Per-entry outcome of a supervisor operation
 */
enum class Outcome {
    AlreadyRunning,     ///< Start found a live process, nothing done
    Started,            ///< Launched and verified
    StartupFailed,      ///< Launch failed or process died before verification
    Skipped,            ///< Not attempted because an earlier start failed
    NotRunning,         ///< Stop/status found no PID file
    StaleState,         ///< PID file without a live process, file removed
    StoppedGracefully,  ///< Exited after SIGTERM
    StoppedForced,      ///< Exited after SIGKILL
    ForceStopFailed,    ///< Survived SIGKILL, PID file left in place
    Running             ///< Status: PID file present and process live
};

const char* outcomeName(Outcome outcome);

/**
 * @brief True for outcomes that count as failures in an aggregate run
 */
inline bool isFailure(Outcome outcome) {
    return outcome == Outcome::StartupFailed || outcome == Outcome::ForceStopFailed;
}

struct EntryResult {
    std::string Name;
    Outcome     Result = Outcome::NotRunning;
    pid_t       Pid = -1;
    std::string LogFile;
    std::string Message;
};

/**
 * @brief Aggregate of a StartAll/StopAll/StatusAll run
 */
struct RunSummary {
    std::vector<EntryResult> Results;
    int Succeeded = 0;
    int Failed = 0;

    bool ok() const { return Failed == 0; }
};
