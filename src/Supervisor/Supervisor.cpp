/**
 * @file Supervisor.cpp
 * @brief Implementation of the Supervisor start/stop/status operations
 * @version 1.0
 * @date 2025-01-01
 */

#include "Supervisor.hpp"

#include <signal.h>     // SIGTERM, SIGKILL
#include <thread>
#include <utility>

#include "HealthProbe.hpp"
#include "PidFile.hpp"
#include "StopSequence.hpp"

const char* outcomeName(Outcome outcome) {
    switch (outcome) {
        case Outcome::AlreadyRunning:    return "already running";
        case Outcome::Started:           return "started";
        case Outcome::StartupFailed:     return "failed to start";
        case Outcome::Skipped:           return "skipped";
        case Outcome::NotRunning:        return "not running";
        case Outcome::StaleState:        return "was not running";
        case Outcome::StoppedGracefully: return "stopped gracefully";
        case Outcome::StoppedForced:     return "stopped (forced)";
        case Outcome::ForceStopFailed:   return "failed to stop";
        case Outcome::Running:           return "running";
    }
    return "unknown";
}

Supervisor::Supervisor(SupervisorConfig config, ProcessRunner& runner, Reporter& reporter)
    : config_(std::move(config)), runner_(runner), reporter_(reporter) {}

void Supervisor::pause(std::chrono::milliseconds duration) {
    if (duration.count() > 0) {
        std::this_thread::sleep_for(duration);
    }
}

void Supervisor::emit(EventKind kind, const ProcessEntry& entry, pid_t pid, const std::string& detail) {
    Event e;
    e.Kind = kind;
    e.Entry = entry.Name;
    e.Pid = pid;
    e.LogFile = entry.LogFile;
    e.Detail = detail;
    reporter_.event(e);
}

EntryResult Supervisor::finish(const ProcessEntry& entry, Outcome outcome, EventKind kind,
                               pid_t pid, const std::string& detail) {
    emit(kind, entry, pid, detail);

    EntryResult result;
    result.Name = entry.Name;
    result.Result = outcome;
    result.Pid = pid;
    result.LogFile = entry.LogFile;
    result.Message = detail.empty() ? outcomeName(outcome) : detail;
    return result;
}

EntryResult Supervisor::start(const ProcessEntry& entry) {
    pid_t existing = PidFile::read(entry.PidFile);
    if (existing > 0 && runner_.isAlive(existing)) {
        return finish(entry, Outcome::AlreadyRunning, EventKind::AlreadyRunning, existing);
    }

    emit(EventKind::Starting, entry, -1);

    std::string err;
    pid_t pid = runner_.start(entry, err);
    if (pid <= 0) {
        PidFile::remove(entry.PidFile);
        return finish(entry, Outcome::StartupFailed, EventKind::StartupFailed, -1, err);
    }

    if (!PidFile::write(entry.PidFile, pid, err)) {
        // Every running child must be tracked by its PID file
        if (!runner_.sendSignal(pid, SIGKILL)) {
            err += ", child " + std::to_string(pid) + " could not be killed";
        }
        PidFile::remove(entry.PidFile);
        return finish(entry, Outcome::StartupFailed, EventKind::StartupFailed, pid, err);
    }

    emit(EventKind::Launched, entry, pid);

    pause(std::chrono::seconds(entry.StartupDelay));

    if (!runner_.isAlive(pid)) {
        PidFile::remove(entry.PidFile);
        return finish(entry, Outcome::StartupFailed, EventKind::StartupFailed, pid,
                      "process exited during startup");
    }

    if (!entry.HealthUrl.empty()) {
        HealthProbe probe(config_.HealthTimeout);
        if (!probe.waitReady(entry.HealthUrl, std::chrono::seconds(config_.ReadyTimeout),
                             config_.PollInterval, err)) {
            emit(EventKind::HealthCheckFailed, entry, pid, err);
            EntryResult stopped = terminate(entry, pid);
            std::string detail = "health check failed (" + err + ")";
            if (stopped.Result == Outcome::ForceStopFailed) {
                detail += ", process could not be stopped";
            }
            return finish(entry, Outcome::StartupFailed, EventKind::StartupFailed, pid, detail);
        }
    }

    return finish(entry, Outcome::Started, EventKind::Started, pid);
}

EntryResult Supervisor::terminate(const ProcessEntry& entry, pid_t pid) {
    StopSequence sequence(entry.GracefulTimeout);

    if (!runner_.sendSignal(pid, SIGTERM)) {
        if (!runner_.isAlive(pid)) {
            PidFile::remove(entry.PidFile);
            return finish(entry, Outcome::StoppedGracefully, EventKind::StoppedGracefully, pid,
                          "exited before SIGTERM");
        }
        return finish(entry, Outcome::ForceStopFailed, EventKind::ForceStopFailed, pid,
                      "SIGTERM could not be delivered");
    }
    emit(EventKind::Stopping, entry, pid);

    std::string detail;
    while (sequence.observe(runner_.isAlive(pid)) == StopSequence::State::Waiting) {
        pause(config_.PollInterval);
    }

    if (sequence.state() == StopSequence::State::Escalating) {
        emit(EventKind::StopTimeout, entry, pid,
             "still running after " + std::to_string(entry.GracefulTimeout) + "s");
        if (runner_.sendSignal(pid, SIGKILL)) {
            pause(config_.ForceKillWait);
        } else {
            detail = "SIGKILL could not be delivered";
        }
        sequence.observe(runner_.isAlive(pid));
    }

    if (sequence.state() == StopSequence::State::Failed) {
        return finish(entry, Outcome::ForceStopFailed, EventKind::ForceStopFailed, pid, detail);
    }

    PidFile::remove(entry.PidFile);
    if (sequence.forced()) {
        return finish(entry, Outcome::StoppedForced, EventKind::StoppedForced, pid);
    }
    return finish(entry, Outcome::StoppedGracefully, EventKind::StoppedGracefully, pid);
}

EntryResult Supervisor::stop(const ProcessEntry& entry) {
    if (!PidFile::exists(entry.PidFile)) {
        return finish(entry, Outcome::NotRunning, EventKind::NotRunning, -1);
    }

    pid_t pid = PidFile::read(entry.PidFile);
    if (pid <= 0 || !runner_.isAlive(pid)) {
        PidFile::remove(entry.PidFile);
        return finish(entry, Outcome::StaleState, EventKind::StaleState, pid);
    }

    return terminate(entry, pid);
}

EntryResult Supervisor::status(const ProcessEntry& entry) {
    if (!PidFile::exists(entry.PidFile)) {
        return finish(entry, Outcome::NotRunning, EventKind::NotRunning, -1);
    }

    pid_t pid = PidFile::read(entry.PidFile);
    if (pid <= 0 || !runner_.isAlive(pid)) {
        PidFile::remove(entry.PidFile);
        return finish(entry, Outcome::StaleState, EventKind::StaleState, pid);
    }

    return finish(entry, Outcome::Running, EventKind::Running, pid);
}

RunSummary Supervisor::startAll() {
    RunSummary summary;
    reporter_.beginRun(Action::Start);

    bool aborted = false;
    for (const auto& entry : config_.Entries) {
        if (aborted) {
            summary.Results.push_back(finish(entry, Outcome::Skipped, EventKind::Skipped, -1));
            continue;
        }

        EntryResult result = start(entry);
        if (isFailure(result.Result)) {
            ++summary.Failed;
            aborted = true;
        } else {
            ++summary.Succeeded;
        }
        summary.Results.push_back(result);
    }

    reporter_.endRun(Action::Start, summary);
    return summary;
}

RunSummary Supervisor::stopAll() {
    RunSummary summary;
    reporter_.beginRun(Action::Stop);

    for (const auto& entry : config_.Entries) {
        EntryResult result = stop(entry);
        if (isFailure(result.Result)) {
            ++summary.Failed;
        } else if (result.Result == Outcome::StoppedGracefully ||
                   result.Result == Outcome::StoppedForced) {
            ++summary.Succeeded;
        }
        summary.Results.push_back(result);
    }

    reporter_.endRun(Action::Stop, summary);
    return summary;
}

RunSummary Supervisor::statusAll() {
    RunSummary summary;
    reporter_.beginRun(Action::Status);

    for (const auto& entry : config_.Entries) {
        EntryResult result = status(entry);
        if (result.Result == Outcome::Running) {
            ++summary.Succeeded;
        } else {
            ++summary.Failed;
        }
        summary.Results.push_back(result);
    }

    reporter_.endRun(Action::Status, summary);
    return summary;
}
