/**
 * @file Config.hpp
 * @brief Built-in service list and configuration file loader
 * @version 1.0
 * @date 2025-01-01
 */

#pragma once

#include <string>
#include "entry.hpp"

constexpr const char* DEFAULT_CONFIG_FILE = "config/services.conf";   ///< Relative to the project dir
constexpr const char* DEFAULT_PROJECT_DIR = ".";

/**
 * @brief The two backend services: API server first, then the task worker
 * @param projectDir Project root; logs/, pids/ and .venv/ live under it.
 *        A relative root is made absolute against the current directory.
 *
 * fastapi: "python run_server.py", 10s graceful timeout, 2s startup delay.
 * celery:  "celery -A tasks worker ...", 15s graceful timeout, 3s startup delay.
 * Both run in projectDir with the virtual environment's bin/ first on PATH.
 */
SupervisorConfig defaultConfig(const std::string& projectDir);

/**
 * @brief Load entries from a configuration file
 * @param path File to read
 * @param config Receives the entries (ProjectDir/LogDir/PidDir are derived
 *        from the first entry's file locations)
 * @param err_out Error description on failure
 * @return true on success
 *
 * Configuration file format:
 * Line 1: Number of entries (N)
 * For each entry (N times), one value per line:
 *   Name
 *   Command line
 *   Working directory
 *   PID file path
 *   Log file path
 *   Graceful timeout in seconds
 *   Startup verify delay in seconds
 *   Environment overrides, KEY=VALUE separated by spaces, or "-"
 *   Health URL, or "-"
 * Blank lines and lines starting with '#' are skipped. Relative paths
 * (working directory, PID and log files, and "./" or "../" entries of
 * colon-separated environment values) are resolved against the directory
 * holding the configuration file. ${VAR} in environment values is then
 * replaced from the supervisor's environment.
 */
bool loadConfiguration(const std::string& path, SupervisorConfig& config, std::string& err_out);

/**
 * @brief Replace ${NAME} with the value of environment variable NAME
 *
 * Unset variables expand to an empty string; an unterminated "${" is kept
 * literally.
 */
std::string expandVariables(const std::string& value);
