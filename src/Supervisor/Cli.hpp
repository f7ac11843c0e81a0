/**
 * @file Cli.hpp
 * @brief Command-line front end: argument parsing, configuration lookup, exit codes
 * @version 1.0
 * @date 2025-01-01
 */

#pragma once

#include <iostream>
#include <string>

#include "Config.hpp"
#include "ProcessRunner.hpp"
#include "entry.hpp"

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

/**
 * @brief Parsed command line
 */
struct CliOptions {
    std::string ConfigPath;                       ///< -c/--config, empty if not given
    std::string ProjectDir = DEFAULT_PROJECT_DIR; ///< -d/--project-dir
    std::string Action;                           ///< start, stop or status
    bool        Help = false;
};

/**
 * @brief Print usage information
 */
void printUsage(const char* programName, std::ostream& out);

/**
 * @brief Parse the command line
 * @param err_out Error description on failure
 * @return false on an unknown argument, a missing option value or a
 *         missing action (unless --help was given)
 */
bool parseArguments(int argc, const char* const argv[], CliOptions& options, std::string& err_out);

/**
 * @brief Resolve the configuration
 *
 * An explicit --config file wins. Otherwise <project dir>/config/services.conf
 * is used if it exists, else the built-in services rooted at the project dir.
 */
bool resolveConfiguration(const CliOptions& options, SupervisorConfig& config,
                          std::ostream& out, std::string& err_out);

/**
 * @brief Run the tool
 * @param runner Process primitives used by the supervisor
 * @return EXIT_OK, EXIT_FAILED or EXIT_USAGE
 */
int runCli(int argc, const char* const argv[], ProcessRunner& runner,
           std::ostream& out = std::cout, std::ostream& err = std::cerr);
