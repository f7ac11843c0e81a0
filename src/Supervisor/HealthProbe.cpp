/**
 * @file HealthProbe.cpp
 * @brief HTTP readiness probe using cpp-httplib
 * @version 1.0
 * @date 2025-01-01
 */

#include "HealthProbe.hpp"

#include <thread>

#include "httplib.h"

HealthProbe::HealthProbe(int timeoutSeconds)
    : timeoutSeconds_(timeoutSeconds) {}

bool HealthProbe::parseUrl(const std::string& url, HealthUrl& out) {
    const std::string scheme = "http://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        return false;
    }

    std::string rest = url.substr(scheme.size());
    size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    out.Path = (slash == std::string::npos) ? "/" : rest.substr(slash);

    size_t colon = authority.rfind(':');
    if (colon == std::string::npos) {
        out.Host = authority;
        out.Port = 80;
    } else {
        out.Host = authority.substr(0, colon);
        std::string portStr = authority.substr(colon + 1);
        if (portStr.empty() || portStr.size() > 5 ||
            portStr.find_first_not_of("0123456789") != std::string::npos) {
            return false;
        }
        out.Port = std::stoi(portStr);
        if (out.Port <= 0 || out.Port > 65535) {
            return false;
        }
    }

    return !out.Host.empty();
}

bool HealthProbe::check(const std::string& url, std::string& err_out) const {
    err_out.clear();

    HealthUrl target;
    if (!parseUrl(url, target)) {
        err_out = "invalid health URL: " + url;
        return false;
    }

    httplib::Client client(target.Host, target.Port);
    client.set_connection_timeout(timeoutSeconds_, 0);
    client.set_read_timeout(timeoutSeconds_, 0);

    auto response = client.Get(target.Path.c_str());
    if (!response) {
        err_out = "no response from " + url + " (" + httplib::to_string(response.error()) + ")";
        return false;
    }

    if (response->status != 200) {
        err_out = url + " returned " + std::to_string(response->status);
        return false;
    }

    return true;
}

bool HealthProbe::waitReady(const std::string& url, std::chrono::milliseconds window,
                            std::chrono::milliseconds interval, std::string& err_out) const {
    HealthUrl target;
    if (!parseUrl(url, target)) {
        err_out = "invalid health URL: " + url;
        return false;
    }

    const auto deadline = std::chrono::steady_clock::now() + window;
    while (!check(url, err_out)) {
        if (std::chrono::steady_clock::now() + interval > deadline) {
            return false;
        }
        std::this_thread::sleep_for(interval);
    }
    return true;
}
