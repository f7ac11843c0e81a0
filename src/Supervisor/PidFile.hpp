/**
 * @file PidFile.hpp
 * @brief Reading, writing and removing PID files
 * @version 1.0
 * @date 2025-01-01
 */

#pragma once

#include <string>
#include <sys/types.h>

namespace PidFile {

/**
 * @brief Read the PID recorded in a file
 * @param path PID file path
 * @return Recorded PID, or -1 if the file is missing or does not hold a
 *         positive decimal integer
 */
pid_t read(const std::string& path);

/**
 * @brief Write a PID as decimal text, replacing any previous content
 * @param path PID file path (parent directories are created)
 * @param pid Process ID to record
 * @param err_out Error description on failure
 * @return true on success
 */
bool write(const std::string& path, pid_t pid, std::string& err_out);

bool exists(const std::string& path);

/**
 * @brief Remove the PID file if present
 */
void remove(const std::string& path);

}  // namespace PidFile
