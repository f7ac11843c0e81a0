/**
 * @file main.cpp
 * @brief Service Supervisor - start, stop and inspect the backend services
 * @version 1.0
 * @date 2025-01-01
 *
 * Starts the API server and the task worker in order, stops them with a
 * graceful-then-forced shutdown, and reports their status. PID files under
 * the project's pids/ directory are the only state kept between runs.
 *
 * Exit codes:
 * - 0: every service reached the requested state
 * - 1: at least one service failed to start or stop (or is not running, for status)
 * - 2: usage or configuration error
 */

#include "Cli.hpp"
#include "ProcessRunner.hpp"

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    ProcessRunner runner;
    return runCli(argc, argv, runner);
}
