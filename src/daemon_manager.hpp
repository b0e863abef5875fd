#pragma once
#include "config.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <sys/types.h>

namespace bashbuddy {

enum class LifecycleStatus {
    ok,
    already_running,
    not_running,
    startup_timeout,
    startup_failed,
    spawn_failed
};

struct LifecycleResult {
    LifecycleStatus status = LifecycleStatus::ok;
    std::string message;
    int pid = 0;

    bool ok() const { return status == LifecycleStatus::ok; }
};

enum class DaemonState { stopped, running, unresponsive };

struct DaemonStatus {
    DaemonState state = DaemonState::stopped;
    int pid = 0;
    std::string message;
};

struct DaemonPaths {
    std::string socket_path;
    std::string pid_path;
    std::string log_path;
    std::string lock_path;        // held by the running daemon for its lifetime
    std::string start_lock_path;  // held by a client while it starts or restarts one

    static DaemonPaths defaults();
};

// Exclusive flock() on a file, released when the object is destroyed.
class FileLock {
public:
    explicit FileLock(std::string path);
    ~FileLock();
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    // With wait=false, fails at once when another process holds the lock.
    bool acquire(bool wait);
    const std::string& error() const { return error_; }

private:
    std::string path_;
    int fd_ = -1;
    std::string error_;
};

// Client-side control of the background daemon: spawns it detached, tracks
// it through the PID marker and checks readiness with ping.
class DaemonManager {
public:
    // `executable` is the binary started with the "daemon" argument;
    // empty means the running executable itself.
    DaemonManager(DaemonPaths paths, const Config& cfg, std::string executable = "");

    LifecycleResult start();
    LifecycleResult stop();
    DaemonStatus status();
    LifecycleResult ensure_running();

    // PID recorded in the marker, or 0.
    int read_pid() const;

    // Marker present and naming a live process of our executable.
    // Any other marker is stale and removed.
    bool is_running();

    // True when the daemon answered at all; a "Daemon busy" error frame
    // still proves it is alive.
    bool ping() const;

    const DaemonPaths& paths() const { return paths_; }

private:
    LifecycleResult start_locked();
    bool owns_process(pid_t pid) const;
    pid_t spawn(std::string& error);
    std::string log_since(uintmax_t offset) const;
    void remove_markers() const;

    DaemonPaths paths_;
    int attempts_;
    int interval_ms_;
    int timeout_sec_;
    std::string executable_;
    std::string expected_exe_;
};

// Liveness of a pid; reaps it when it is our exited child.
bool process_alive(pid_t pid);

std::string self_executable();

// Target of /proc/<pid>/exe, or "" when it cannot be read.
std::string process_executable(pid_t pid);

} // namespace bashbuddy
