/**
 * @file ProcessRunner.cpp
 * @brief Implementation of ProcessRunner process primitives
 * @version 1.0
 * @date 2025-01-01
 */

#include "ProcessRunner.hpp"

#include <unistd.h>     // fork, execvp, chdir, setsid, dup2
#include <signal.h>     // kill
#include <fcntl.h>      // open
#include <sys/wait.h>   // waitpid
#include <cstring>      // strerror
#include <cerrno>       // errno
#include <cstdlib>      // setenv
#include <iostream>     // std::cerr
#include <filesystem>
#include <system_error>

std::vector<std::string> ProcessRunner::splitCommand(const std::string& cmdline) {
    std::vector<std::string> tokens;
    std::string token;
    bool inToken = false;
    char quote = '\0';

    for (size_t i = 0; i < cmdline.size(); ++i) {
        char c = cmdline[i];

        if (quote != '\0') {
            if (c == quote) {
                quote = '\0';
            } else if (quote == '"' && c == '\\' && i + 1 < cmdline.size()) {
                token += cmdline[++i];
            } else {
                token += c;
            }
            continue;
        }

        if (c == '\'' || c == '"') {
            quote = c;
            inToken = true;
        } else if (c == ' ' || c == '\t' || c == '\n') {
            if (inToken) {
                tokens.push_back(token);
                token.clear();
                inToken = false;
            }
        } else {
            token += c;
            inToken = true;
        }
    }

    if (inToken) {
        tokens.push_back(token);
    }

    return tokens;
}

pid_t ProcessRunner::start(const ProcessEntry& entry, std::string& err_out) {
    err_out.clear();

    auto parts = splitCommand(entry.Command);
    if (parts.empty()) {
        err_out = "empty command";
        return -1;
    }

    // Log directory must exist before the child can redirect into it
    std::filesystem::path logParent = std::filesystem::path(entry.LogFile).parent_path();
    if (!logParent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(logParent, ec);
        if (ec) {
            err_out = "cannot create " + logParent.string() + ": " + ec.message();
            return -1;
        }
    }

    int logFd = ::open(entry.LogFile.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (logFd < 0) {
        err_out = "cannot open log file " + entry.LogFile + ": " + std::strerror(errno);
        return -1;
    }

    // Prepare argv array
    std::vector<char*> argv;
    argv.reserve(parts.size() + 1);
    for (auto& part : parts) {
        argv.push_back(const_cast<char*>(part.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        err_out = std::string("fork failed: ") + std::strerror(errno);
        ::close(logFd);
        return -1;
    }

    if (pid == 0) {
        // CHILD PROCESS

        // Detach from the controlling terminal and the supervisor's session
        ::setsid();

        int nullFd = ::open("/dev/null", O_RDONLY);
        if (nullFd >= 0) {
            ::dup2(nullFd, STDIN_FILENO);
            ::close(nullFd);
        }
        ::dup2(logFd, STDOUT_FILENO);
        ::dup2(logFd, STDERR_FILENO);

        if (!entry.Folder.empty() && entry.Folder != ".") {
            if (chdir(entry.Folder.c_str()) != 0) {
                std::cerr << "chdir " << entry.Folder << " failed: " << std::strerror(errno) << std::endl;
                _exit(127);
            }
        }

        for (const auto& assignment : entry.Environment) {
            size_t eq = assignment.find('=');
            if (eq == std::string::npos || eq == 0) {
                continue;
            }
            ::setenv(assignment.substr(0, eq).c_str(), assignment.substr(eq + 1).c_str(), 1);
        }

        execvp(argv[0], argv.data());
        std::cerr << "exec " << argv[0] << " failed: " << std::strerror(errno) << std::endl;
        _exit(127);
    }

    // PARENT PROCESS
    ::close(logFd);
    return pid;
}

bool ProcessRunner::isAlive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }

    // Our own exited child stays a zombie until reaped
    int status = 0;
    if (::waitpid(pid, &status, WNOHANG) == pid) {
        return false;
    }

    if (::kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

bool ProcessRunner::sendSignal(pid_t pid, int signal) {
    if (pid <= 0) {
        return false;
    }
    return ::kill(pid, signal) == 0;
}
