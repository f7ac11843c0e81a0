/**
 * @file Config.cpp
 * @brief Built-in service list and configuration file loader
 * @version 1.0
 * @date 2025-01-01
 */

#include "Config.hpp"

#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <utility>

#include "HealthProbe.hpp"

namespace {

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

bool parseNonNegative(const std::string& text, int& out) {
    try {
        size_t used = 0;
        out = std::stoi(text, &used);
        return used == text.size() && out >= 0;
    } catch (const std::exception&) {
        return false;
    }
}

// Absolute, normalized form of path; relative paths are taken from base
std::string absolutePath(const std::string& path, const std::filesystem::path& base) {
    std::filesystem::path p(path);
    if (p.is_relative()) {
        p = base / p;
    }
    std::string out = p.lexically_normal().string();
    if (out.size() > 1 && out.back() == '/') {
        out.pop_back();
    }
    return out;
}

// Resolve the relative entries ("./x", "../x") of a colon-separated value
std::string resolvePathList(const std::string& value, const std::filesystem::path& base) {
    std::string result;
    size_t pos = 0;

    while (true) {
        size_t colon = value.find(':', pos);
        std::string part = value.substr(pos, colon == std::string::npos ? std::string::npos : colon - pos);
        if (part == "." || part == ".." || part.rfind("./", 0) == 0 || part.rfind("../", 0) == 0) {
            part = absolutePath(part, base);
        }
        result += part;

        if (colon == std::string::npos) {
            break;
        }
        result += ':';
        pos = colon + 1;
    }

    return result;
}

std::vector<std::string> venvEnvironment(const std::string& projectDir) {
    const std::string venv = projectDir + "/.venv";
    return {
        "VIRTUAL_ENV=" + venv,
        expandVariables("PATH=" + venv + "/bin:${PATH}"),
    };
}

}  // namespace

std::string expandVariables(const std::string& value) {
    std::string result;
    size_t pos = 0;

    while (pos < value.size()) {
        size_t open = value.find("${", pos);
        if (open == std::string::npos) {
            result += value.substr(pos);
            break;
        }
        size_t close = value.find('}', open + 2);
        if (close == std::string::npos) {
            result += value.substr(pos);
            break;
        }

        result += value.substr(pos, open - pos);
        std::string name = value.substr(open + 2, close - open - 2);
        const char* env = std::getenv(name.c_str());
        if (env) {
            result += env;
        }
        pos = close + 1;
    }

    return result;
}

SupervisorConfig defaultConfig(const std::string& dir) {
    // The child runs inside projectDir, so every path handed to it is absolute
    const std::string projectDir = absolutePath(dir, std::filesystem::current_path());

    SupervisorConfig config;
    config.ProjectDir = projectDir;
    config.LogDir = projectDir + "/logs";
    config.PidDir = projectDir + "/pids";

    ProcessEntry fastapi("fastapi", "python run_server.py",
                         config.PidDir + "/fastapi.pid", config.LogDir + "/fastapi.log", 10, 2);
    fastapi.Folder = projectDir;
    fastapi.Environment = venvEnvironment(projectDir);

    ProcessEntry celery("celery",
                        "celery -A tasks worker --loglevel=info --concurrency=4 "
                        "--queues=default,state,messages,status,media --max-tasks-per-child=100",
                        config.PidDir + "/celery.pid", config.LogDir + "/celery.log", 15, 3);
    celery.Folder = projectDir;
    celery.Environment = venvEnvironment(projectDir);

    config.Entries.push_back(std::move(fastapi));
    config.Entries.push_back(std::move(celery));
    return config;
}

bool loadConfiguration(const std::string& path, SupervisorConfig& config, std::string& err_out) {
    err_out.clear();

    std::ifstream file(path);
    if (!file.is_open()) {
        err_out = "Failed to open configuration file: " + path;
        return false;
    }

    const std::filesystem::path base = std::filesystem::absolute(path).parent_path();

    std::deque<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        lines.push_back(line);
    }

    auto next = [&lines](std::string& out) {
        if (lines.empty()) {
            return false;
        }
        out = lines.front();
        lines.pop_front();
        return true;
    };

    std::string countLine;
    int numEntries = 0;
    if (!next(countLine) || !parseNonNegative(countLine, numEntries)) {
        err_out = "Invalid number of entries in configuration file";
        return false;
    }

    std::vector<ProcessEntry> entries;
    std::set<std::string> names;
    std::set<std::string> pidFiles;

    for (int i = 0; i < numEntries; ++i) {
        ProcessEntry entry;
        std::string timeout, delay, env, health;
        const std::string where = " for entry " + std::to_string(i);

        if (!next(entry.Name) || !next(entry.Command) || !next(entry.Folder) ||
            !next(entry.PidFile) || !next(entry.LogFile) || !next(timeout) ||
            !next(delay) || !next(env) || !next(health)) {
            err_out = "Unexpected end of configuration file" + where;
            return false;
        }

        entry.Folder = absolutePath(entry.Folder, base);
        entry.PidFile = absolutePath(entry.PidFile, base);
        entry.LogFile = absolutePath(entry.LogFile, base);

        if (!parseNonNegative(timeout, entry.GracefulTimeout)) {
            err_out = "Invalid graceful timeout '" + timeout + "'" + where;
            return false;
        }
        if (!parseNonNegative(delay, entry.StartupDelay)) {
            err_out = "Invalid startup delay '" + delay + "'" + where;
            return false;
        }

        if (env != "-") {
            std::istringstream iss(env);
            std::string assignment;
            while (iss >> assignment) {
                if (assignment.find('=') == std::string::npos || assignment[0] == '=') {
                    err_out = "Invalid environment override '" + assignment + "'" + where;
                    return false;
                }
                size_t eq = assignment.find('=');
                entry.Environment.push_back(expandVariables(
                    assignment.substr(0, eq + 1) + resolvePathList(assignment.substr(eq + 1), base)));
            }
        }

        if (health != "-") {
            HealthUrl parsed;
            if (!HealthProbe::parseUrl(health, parsed)) {
                err_out = "Invalid health URL '" + health + "'" + where;
                return false;
            }
            entry.HealthUrl = health;
        }

        if (!names.insert(entry.Name).second) {
            err_out = "Duplicate entry name '" + entry.Name + "'";
            return false;
        }
        if (!pidFiles.insert(entry.PidFile).second) {
            err_out = "PID file " + entry.PidFile + " used by more than one entry";
            return false;
        }

        entries.push_back(std::move(entry));
    }

    if (!lines.empty()) {
        err_out = "Unexpected content after " + std::to_string(numEntries) + " entries: " + lines.front();
        return false;
    }

    config.Entries = std::move(entries);
    if (!config.Entries.empty()) {
        config.LogDir = std::filesystem::path(config.Entries.front().LogFile).parent_path().string();
        config.PidDir = std::filesystem::path(config.Entries.front().PidFile).parent_path().string();
        config.ProjectDir = config.Entries.front().Folder;
    }
    return true;
}
