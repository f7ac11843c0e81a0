/**
 * @file Reporter.cpp
 * @brief Console output for supervisor events
 * @version 1.0
 * @date 2025-01-01
 */

#include "Reporter.hpp"

const char* eventName(EventKind kind) {
    switch (kind) {
        case EventKind::Starting:          return "starting";
        case EventKind::AlreadyRunning:    return "already-running";
        case EventKind::Launched:          return "launched";
        case EventKind::Started:           return "started";
        case EventKind::StartupFailed:     return "startup-failed";
        case EventKind::HealthCheckFailed: return "health-check-failed";
        case EventKind::Skipped:           return "skipped";
        case EventKind::NotRunning:        return "not-running";
        case EventKind::StaleState:        return "stale-state";
        case EventKind::Stopping:          return "stopping";
        case EventKind::StopTimeout:       return "stop-timeout";
        case EventKind::StoppedGracefully: return "stopped-gracefully";
        case EventKind::StoppedForced:     return "stopped-forced";
        case EventKind::ForceStopFailed:   return "force-stop-failed";
        case EventKind::Running:           return "running";
    }
    return "unknown";
}

ConsoleReporter::ConsoleReporter(std::ostream& out, std::ostream& err)
    : out_(out), err_(err) {}

void ConsoleReporter::banner(const std::string& title) {
    out_ << "========================================" << std::endl;
    out_ << "  " << title << std::endl;
    out_ << "========================================" << std::endl;
    out_ << std::endl;
}

void ConsoleReporter::beginRun(Action action) {
    switch (action) {
        case Action::Start:  banner("Starting services"); break;
        case Action::Stop:   banner("Stopping services"); break;
        case Action::Status: banner("Service status"); break;
    }
}

void ConsoleReporter::event(const Event& e) {
    const std::string pid = " (PID: " + std::to_string(e.Pid) + ")";

    switch (e.Kind) {
        case EventKind::Starting:
            out_ << "🚀 Starting " << e.Entry << "..." << std::endl;
            break;
        case EventKind::AlreadyRunning:
            out_ << "⚠️  " << e.Entry << " is already running" << pid << std::endl << std::endl;
            break;
        case EventKind::Launched:
            out_ << "📝 " << e.Entry << " launched" << pid << ", verifying..." << std::endl;
            break;
        case EventKind::Started:
            out_ << "✅ " << e.Entry << " started successfully" << pid << std::endl;
            out_ << "   Log: " << e.LogFile << std::endl << std::endl;
            break;
        case EventKind::StartupFailed:
            err_ << "❌ " << e.Entry << " failed to start";
            if (!e.Detail.empty()) {
                err_ << ": " << e.Detail;
            }
            err_ << std::endl;
            err_ << "   Check log: " << e.LogFile << std::endl << std::endl;
            break;
        case EventKind::HealthCheckFailed:
            err_ << "❌ " << e.Entry << " health check failed: " << e.Detail << std::endl;
            break;
        case EventKind::Skipped:
            out_ << "⚠️  " << e.Entry << " skipped" << std::endl;
            break;
        case EventKind::NotRunning:
            out_ << "⚠️  " << e.Entry << " is not running" << std::endl << std::endl;
            break;
        case EventKind::StaleState:
            out_ << "⚠️  " << e.Entry << " PID file exists but process not running" << std::endl << std::endl;
            break;
        case EventKind::Stopping:
            out_ << "🛑 Stopping " << e.Entry << pid << "..." << std::endl;
            break;
        case EventKind::StopTimeout:
            out_ << "⚠️  Force killing " << e.Entry << "..." << std::endl;
            break;
        case EventKind::StoppedGracefully:
            out_ << "✅ " << e.Entry << " stopped gracefully" << std::endl << std::endl;
            break;
        case EventKind::StoppedForced:
            out_ << "✅ " << e.Entry << " stopped (forced)" << std::endl << std::endl;
            break;
        case EventKind::ForceStopFailed:
            err_ << "❌ Failed to stop " << e.Entry << pid;
            if (!e.Detail.empty()) {
                err_ << ": " << e.Detail;
            }
            err_ << std::endl << std::endl;
            break;
        case EventKind::Running:
            out_ << "  " << e.Entry << ": Running" << pid << std::endl;
            break;
    }
}

void ConsoleReporter::endRun(Action action, const RunSummary& summary) {
    out_ << "========================================" << std::endl;

    if (action == Action::Start) {
        if (!summary.ok()) {
            err_ << "❌ Startup aborted, " << summary.Failed << " service(s) failed to start" << std::endl;
            out_ << "========================================" << std::endl;
            return;
        }

        out_ << "✅ All services started successfully!" << std::endl;
        out_ << "========================================" << std::endl << std::endl;
        out_ << "Service Status:" << std::endl;
        for (const auto& r : summary.Results) {
            out_ << "  " << r.Name << ": Running (PID: " << r.Pid << ")" << std::endl;
        }
        out_ << std::endl << "Logs:" << std::endl;
        for (const auto& r : summary.Results) {
            out_ << "  " << r.Name << ": tail -f " << r.LogFile << std::endl;
        }
        out_ << std::endl << "To stop services: service-supervisor stop" << std::endl;
        return;
    }

    if (action == Action::Stop) {
        if (summary.ok()) {
            out_ << "✅ All services stopped successfully!" << std::endl;
        } else {
            err_ << "⚠️  " << summary.Failed << " service(s) failed to stop" << std::endl;
        }
        out_ << "========================================" << std::endl << std::endl;
        out_ << "Stopped: " << summary.Succeeded << std::endl;
        out_ << "Failed:  " << summary.Failed << std::endl << std::endl;
        out_ << "To start services: service-supervisor start" << std::endl;
        return;
    }

    out_ << "Running: " << summary.Succeeded << "/" << summary.Results.size() << std::endl;
}
