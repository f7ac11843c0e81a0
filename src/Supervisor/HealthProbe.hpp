/**
 * @file HealthProbe.hpp
 * @brief HTTP readiness probe run after a process passes its liveness check
 * @version 1.0
 * @date 2025-01-01
 */

#pragma once

#include <chrono>
#include <string>

/**
 * @brief Parsed form of an http:// health URL
 */
struct HealthUrl {
    std::string Host;
    int         Port = 80;
    std::string Path = "/";
};

class HealthProbe {
public:
    /**
     * @param timeoutSeconds Connection and read timeout
     */
    explicit HealthProbe(int timeoutSeconds = 5);

    /**
     * @brief Parse "http://host[:port][/path]"
     * @param url URL to parse
     * @param out Parsed result
     * @return false if the scheme is not http, the host is empty or the port
     *         is not a plain decimal number in 1..65535
     *
     * https:// is not accepted: the client is built without TLS support.
     */
    static bool parseUrl(const std::string& url, HealthUrl& out);

    /**
     * @brief Issue one GET request
     * @param url Health URL
     * @param err_out Error description on failure
     * @return true if the server answered 200
     */
    bool check(const std::string& url, std::string& err_out) const;

    /**
     * @brief Repeat check() until it succeeds or the window runs out
     * @param url Health URL
     * @param window Total time allowed for the server to become ready
     * @param interval Pause between attempts
     * @param err_out Error of the last attempt on failure
     * @return true once the server answered 200
     */
    bool waitReady(const std::string& url, std::chrono::milliseconds window,
                   std::chrono::milliseconds interval, std::string& err_out) const;

private:
    int timeoutSeconds_;
};
