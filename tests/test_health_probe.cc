// -------------------------------------------------------------------------
#include <catch2/catch.hpp>
#include <atomic>
#include <thread>
#include "httplib.h"
#include "HealthProbe.hpp"
#include "TestHelpers.hpp"
// -------------------------------------------------------------------------
// Local HTTP server answering /health with 200 and /degraded with 503
class TestServer
{
public:
    TestServer()
    {
        server.Get("/health", []( const httplib::Request&, httplib::Response & res )
        {
            res.set_content("OK", "text/plain");
        });

        server.Get("/degraded", []( const httplib::Request&, httplib::Response & res )
        {
            res.status = 503;
            res.set_content("unhealthy", "text/plain");
        });

        // 503 for the first three requests, then 200
        server.Get("/warming", [this]( const httplib::Request&, httplib::Response & res )
        {
            if( ++warmingHits <= 3 )
                res.status = 503;
            else
                res.set_content("OK", "text/plain");
        });

        port = server.bind_to_any_port("127.0.0.1");
        thread = std::thread([this] { server.listen_after_bind(); });
        waitFor([this] { return server.is_running(); });
    }

    ~TestServer()
    {
        server.stop();

        if( thread.joinable() )
            thread.join();
    }

    std::string url( const std::string& path ) const
    {
        return "http://127.0.0.1:" + std::to_string(port) + path;
    }

    httplib::Server server;
    std::atomic<int> warmingHits{0};
    int port = -1;
    std::thread thread;
};
// -------------------------------------------------------------------------
TEST_CASE("HealthProbe: parseUrl", "[health]")
{
    HealthUrl u;

    REQUIRE(HealthProbe::parseUrl("http://127.0.0.1:5000/health", u));
    REQUIRE(u.Host == "127.0.0.1");
    REQUIRE(u.Port == 5000);
    REQUIRE(u.Path == "/health");

    REQUIRE(HealthProbe::parseUrl("http://localhost", u));
    REQUIRE(u.Host == "localhost");
    REQUIRE(u.Port == 80);
    REQUIRE(u.Path == "/");

    REQUIRE(HealthProbe::parseUrl("http://example.org/a/b?x=1", u));
    REQUIRE(u.Path == "/a/b?x=1");

    REQUIRE_FALSE(HealthProbe::parseUrl("https://example.org/", u));
    REQUIRE_FALSE(HealthProbe::parseUrl("example.org/health", u));
    REQUIRE_FALSE(HealthProbe::parseUrl("http://:5000/", u));
    REQUIRE_FALSE(HealthProbe::parseUrl("http://host:port/", u));
    REQUIRE_FALSE(HealthProbe::parseUrl("http://host:70000/", u));
    REQUIRE_FALSE(HealthProbe::parseUrl("http://host:0/", u));
    REQUIRE_FALSE(HealthProbe::parseUrl("http://host:/", u));
    REQUIRE_FALSE(HealthProbe::parseUrl("http://host: 80/", u));
    REQUIRE_FALSE(HealthProbe::parseUrl("http://host:+80/", u));
    REQUIRE_FALSE(HealthProbe::parseUrl("http://host:-80/", u));
    REQUIRE_FALSE(HealthProbe::parseUrl("http://host:0080000/", u));
}
// -------------------------------------------------------------------------
TEST_CASE("HealthProbe: healthy endpoint", "[health]")
{
    TestServer srv;
    REQUIRE(srv.port > 0);

    HealthProbe probe(2);
    std::string err;
    REQUIRE(probe.check(srv.url("/health"), err));
    REQUIRE(err.empty());
}
// -------------------------------------------------------------------------
TEST_CASE("HealthProbe: non-200 status", "[health]")
{
    TestServer srv;
    HealthProbe probe(2);
    std::string err;

    REQUIRE_FALSE(probe.check(srv.url("/degraded"), err));
    REQUIRE(err.find("503") != std::string::npos);

    REQUIRE_FALSE(probe.check(srv.url("/missing"), err));
    REQUIRE(err.find("404") != std::string::npos);
}
// -------------------------------------------------------------------------
TEST_CASE("HealthProbe: nothing listening", "[health]")
{
    int port = -1;
    {
        // grab a free port, then release it
        httplib::Server tmp;
        port = tmp.bind_to_any_port("127.0.0.1");
    }
    REQUIRE(port > 0);

    HealthProbe probe(1);
    std::string err;
    REQUIRE_FALSE(probe.check("http://127.0.0.1:" + std::to_string(port) + "/health", err));
    REQUIRE(err.find("no response") != std::string::npos);
}
// -------------------------------------------------------------------------
TEST_CASE("HealthProbe: invalid URL", "[health]")
{
    HealthProbe probe(1);
    std::string err;
    REQUIRE_FALSE(probe.check("ftp://x", err));
    REQUIRE(err.find("invalid health URL") != std::string::npos);
}
// -------------------------------------------------------------------------
TEST_CASE("HealthProbe: waitReady retries until the server answers 200", "[health]")
{
    TestServer srv;
    HealthProbe probe(2);
    std::string err;

    REQUIRE(probe.waitReady(srv.url("/warming"), std::chrono::seconds(5), std::chrono::milliseconds(50), err));
    REQUIRE(srv.warmingHits == 4);
}
// -------------------------------------------------------------------------
TEST_CASE("HealthProbe: waitReady gives up after the window", "[health]")
{
    TestServer srv;
    HealthProbe probe(1);
    std::string err;

    auto begin = std::chrono::steady_clock::now();
    REQUIRE_FALSE(probe.waitReady(srv.url("/degraded"), std::chrono::milliseconds(500),
                                  std::chrono::milliseconds(100), err));
    auto elapsed = std::chrono::steady_clock::now() - begin;

    REQUIRE(err.find("503") != std::string::npos);
    REQUIRE(elapsed >= std::chrono::milliseconds(400));
    REQUIRE(elapsed < std::chrono::seconds(3));

    // an invalid URL is not retried
    REQUIRE_FALSE(probe.waitReady("https://x/health", std::chrono::seconds(5), std::chrono::milliseconds(100), err));
    REQUIRE(err.find("invalid health URL") != std::string::npos);
}
