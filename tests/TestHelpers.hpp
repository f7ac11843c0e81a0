// -------------------------------------------------------------------------
// Shared fixtures for the supervisor tests
// -------------------------------------------------------------------------
#pragma once

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>

#include "ProcessRunner.hpp"
#include "Reporter.hpp"
#include "entry.hpp"
// -------------------------------------------------------------------------
// Temporary directory removed on destruction
class TempDir
{
public:
    TempDir()
    {
        std::string tmpl = (std::filesystem::temp_directory_path() / "supervisor-test-XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');

        if( ::mkdtemp(buf.data()) == nullptr )
            throw std::runtime_error("mkdtemp failed");

        path_ = buf.data();
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    std::string file( const std::string& name ) const
    {
        return (std::filesystem::path(path_) / name).string();
    }

    const std::string& path() const
    {
        return path_;
    }

private:
    std::string path_;
};
// -------------------------------------------------------------------------
inline ProcessEntry makeEntry( const TempDir& dir, const std::string& name, const std::string& cmd )
{
    ProcessEntry e(name, cmd, dir.file("pids/" + name + ".pid"), dir.file("logs/" + name + ".log"), 5, 0);
    e.Folder = dir.path();
    return e;
}
// -------------------------------------------------------------------------
inline SupervisorConfig fastConfig( const TempDir& dir )
{
    SupervisorConfig cfg;
    cfg.ProjectDir = dir.path();
    cfg.LogDir = dir.file("logs");
    cfg.PidDir = dir.file("pids");
    cfg.PollInterval = std::chrono::milliseconds(100);
    cfg.ForceKillWait = std::chrono::milliseconds(200);
    cfg.HealthTimeout = 2;
    cfg.ReadyTimeout = 2;
    return cfg;
}
// -------------------------------------------------------------------------
// Changes the working directory, restores it on destruction
class ScopedCwd
{
public:
    explicit ScopedCwd( const std::string& dir ):
        saved_(std::filesystem::current_path())
    {
        std::filesystem::current_path(dir);
    }

    ~ScopedCwd()
    {
        std::error_code ec;
        std::filesystem::current_path(saved_, ec);
    }

private:
    std::filesystem::path saved_;
};
// -------------------------------------------------------------------------
inline std::string readFile( const std::string& path )
{
    std::ifstream f(path);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}
// -------------------------------------------------------------------------
inline void writeFile( const std::string& path, const std::string& text )
{
    std::filesystem::create_directories(std::filesystem::path(path).parent_path());
    std::ofstream f(path, std::ios::trunc);
    f << text;
}
// -------------------------------------------------------------------------
// PID of a process that has already exited and been reaped
inline pid_t deadPid()
{
    pid_t pid = fork();

    if( pid == 0 )
        _exit(0);

    int status = 0;
    waitpid(pid, &status, 0);
    return pid;
}
// -------------------------------------------------------------------------
// Poll until the predicate holds or the timeout expires
template<typename Pred>
bool waitFor( Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000) )
{
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while( std::chrono::steady_clock::now() < deadline )
    {
        if( pred() )
            return true;

        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    return pred();
}
// -------------------------------------------------------------------------
class RecordingReporter : public Reporter
{
public:
    void event( const Event& e ) override
    {
        events.push_back(e);
    }

    void beginRun( Action a ) override
    {
        begun.push_back(a);
    }

    void endRun( Action a, const RunSummary& s ) override
    {
        ended.push_back(a);
        last = s;
    }

    std::vector<EventKind> kinds( const std::string& entry ) const
    {
        std::vector<EventKind> out;

        for( const auto& e : events )
        {
            if( e.Entry == entry )
                out.push_back(e.Kind);
        }

        return out;
    }

    std::vector<Event> events;
    std::vector<Action> begun;
    std::vector<Action> ended;
    RunSummary last;
};
// -------------------------------------------------------------------------
// Real process primitives, with every call counted
class CountingRunner : public ProcessRunner
{
public:
    pid_t start( const ProcessEntry& entry, std::string& err_out ) override
    {
        starts.push_back(entry.Name);
        pid_t pid = ProcessRunner::start(entry, err_out);

        if( pid > 0 )
            spawned.push_back(pid);

        return pid;
    }

    bool sendSignal( pid_t pid, int sig ) override
    {
        signals.emplace_back(pid, sig);
        return ProcessRunner::sendSignal(pid, sig);
    }

    // kill whatever a failing test left behind
    ~CountingRunner() override
    {
        for( auto pid : spawned )
        {
            if( ProcessRunner::isAlive(pid) )
            {
                ::kill(pid, SIGKILL);
                int status = 0;
                ::waitpid(pid, &status, 0);
            }
        }
    }

    std::vector<std::string> starts;
    std::vector<std::pair<pid_t, int>> signals;
    std::vector<pid_t> spawned;
};
// -------------------------------------------------------------------------
// Simulated processes: no fork, no real signals
class FakeRunner : public ProcessRunner
{
public:
    // Unsignalable: alive, every signal refused (EPERM)
    // Vanishes: exits just before SIGTERM arrives (ESRCH)
    enum class Behaviour { Graceful, IgnoresTerm, Immortal, Unsignalable, Vanishes };

    void add( pid_t pid, Behaviour b )
    {
        alive[pid] = true;
        behaviour[pid] = b;
    }

    pid_t start( const ProcessEntry& entry, std::string& err_out ) override
    {
        starts.push_back(entry.Name);
        err_out.clear();
        pid_t pid = nextPid++;
        add(pid, startBehaviour);
        return pid;
    }

    bool isAlive( pid_t pid ) override
    {
        auto it = alive.find(pid);
        return it != alive.end() && it->second;
    }

    bool sendSignal( pid_t pid, int sig ) override
    {
        signals.emplace_back(pid, sig);

        if( !isAlive(pid) )
            return false;

        Behaviour b = behaviour[pid];

        if( b == Behaviour::Unsignalable )
            return false;

        if( b == Behaviour::Vanishes )
        {
            alive[pid] = false;
            return false;
        }

        if( sig == SIGTERM && b == Behaviour::Graceful )
            alive[pid] = false;
        else if( sig == SIGKILL && b != Behaviour::Immortal )
            alive[pid] = false;

        return true;
    }

    std::map<pid_t, bool> alive;
    std::map<pid_t, Behaviour> behaviour;
    std::vector<std::string> starts;
    std::vector<std::pair<pid_t, int>> signals;
    pid_t nextPid = 50000;
    Behaviour startBehaviour = Behaviour::Graceful;
};
// -------------------------------------------------------------------------
