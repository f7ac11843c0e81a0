/**
 * @file Cli.cpp
 * @brief Command-line front end of the service supervisor
 * @version 1.0
 * @date 2025-01-01
 */

#include "Cli.hpp"

#include <exception>
#include <filesystem>
#include <utility>

#include "Reporter.hpp"
#include "Supervisor.hpp"

void printUsage(const char* programName, std::ostream& out) {
    out << "Usage: " << programName << " [OPTIONS] <start|stop|status>" << std::endl;
    out << std::endl;
    out << "Actions:" << std::endl;
    out << "  start                  Start all services (aborts on the first failure)" << std::endl;
    out << "  stop                   Stop all services" << std::endl;
    out << "  status                 Show which services are running" << std::endl;
    out << std::endl;
    out << "Options:" << std::endl;
    out << "  -h, --help             Show this help message" << std::endl;
    out << "  -c, --config FILE      Configuration file path" << std::endl;
    out << "  -d, --project-dir DIR  Project root (default: " << DEFAULT_PROJECT_DIR << ")" << std::endl;
    out << std::endl;
    out << "Without --config, DIR/" << DEFAULT_CONFIG_FILE
        << " is used if it exists, otherwise the built-in services rooted at DIR." << std::endl;
}

bool parseArguments(int argc, const char* const argv[], CliOptions& options, std::string& err_out) {
    err_out.clear();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            options.Help = true;
            return true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                err_out = "--config requires a file path";
                return false;
            }
            options.ConfigPath = argv[++i];
        } else if (arg == "--project-dir" || arg == "-d") {
            if (i + 1 >= argc) {
                err_out = "--project-dir requires a directory";
                return false;
            }
            options.ProjectDir = argv[++i];
        } else if (options.Action.empty() && (arg == "start" || arg == "stop" || arg == "status")) {
            options.Action = arg;
        } else {
            err_out = "Unknown argument " + arg;
            return false;
        }
    }

    if (options.Action.empty()) {
        err_out = "an action is required";
        return false;
    }
    return true;
}

bool resolveConfiguration(const CliOptions& options, SupervisorConfig& config,
                          std::ostream& out, std::string& err_out) {
    std::string path = options.ConfigPath;
    if (path.empty()) {
        std::filesystem::path candidate = std::filesystem::path(options.ProjectDir) / DEFAULT_CONFIG_FILE;
        if (std::filesystem::exists(candidate)) {
            path = candidate.string();
        }
    }

    if (path.empty()) {
        config = defaultConfig(options.ProjectDir);
        out << "📋 Using built-in services (project: " << config.ProjectDir << ")" << std::endl;
        return true;
    }

    if (!loadConfiguration(path, config, err_out)) {
        return false;
    }

    out << "📋 Using configuration file: " << path << std::endl;
    for (const auto& entry : config.Entries) {
        out << "📝 Loaded: " << entry.Name << " (" << entry.Command << ")" << std::endl;
    }
    return true;
}

int runCli(int argc, const char* const argv[], ProcessRunner& runner,
           std::ostream& out, std::ostream& err) {
    const char* programName = argc > 0 ? argv[0] : "service-supervisor";

    CliOptions options;
    std::string error;
    if (!parseArguments(argc, argv, options, error)) {
        err << "Error: " << error << std::endl;
        printUsage(programName, err);
        return EXIT_USAGE;
    }

    if (options.Help) {
        printUsage(programName, out);
        return EXIT_OK;
    }

    try {
        SupervisorConfig config;
        if (!resolveConfiguration(options, config, out, error)) {
            err << "❌ " << error << std::endl;
            return EXIT_USAGE;
        }
        out << std::endl;

        ConsoleReporter reporter(out, err);
        Supervisor supervisor(std::move(config), runner, reporter);

        RunSummary summary;
        if (options.Action == "start") {
            summary = supervisor.startAll();
        } else if (options.Action == "stop") {
            summary = supervisor.stopAll();
        } else {
            summary = supervisor.statusAll();
        }

        return summary.ok() ? EXIT_OK : EXIT_FAILED;

    } catch (const std::exception& e) {
        err << "❌ " << e.what() << std::endl;
        return EXIT_USAGE;
    }
}
