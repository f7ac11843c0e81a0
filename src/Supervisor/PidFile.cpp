/**
 * @file PidFile.cpp
 * @brief PID file helpers
 * @version 1.0
 * @date 2025-01-01
 */

#include "PidFile.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

namespace PidFile {

pid_t read(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return -1;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string text = buffer.str();

    // Trim surrounding whitespace (echo leaves a trailing newline)
    text.erase(0, text.find_first_not_of(" \t\r\n"));
    text.erase(text.find_last_not_of(" \t\r\n") + 1);

    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c); })) {
        return -1;
    }

    try {
        long value = std::stol(text);
        if (value <= 0 || static_cast<pid_t>(value) != value) {
            return -1;
        }
        return static_cast<pid_t>(value);
    } catch (const std::exception&) {
        return -1;
    }
}

bool write(const std::string& path, pid_t pid, std::string& err_out) {
    err_out.clear();

    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            err_out = "cannot create " + parent.string() + ": " + ec.message();
            return false;
        }
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        err_out = "cannot open PID file " + path;
        return false;
    }
    file << pid << '\n';
    file.flush();
    if (!file) {
        err_out = "cannot write PID file " + path;
        return false;
    }
    return true;
}

bool exists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

void remove(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::remove(path, ec) && ec) {
        std::cerr << "Failed to remove PID file " << path << ": " << ec.message() << std::endl;
    }
}

}  // namespace PidFile
