#include "daemon_manager.hpp"
#include "client.hpp"
#include "utils.hpp"
#include <iostream>
#include <thread>
#include <chrono>
#include <cerrno>
#include <cstring>
#include <csignal>
#include <fcntl.h>
#include <unistd.h>
#include <sys/file.h>
#include <sys/wait.h>

namespace bashbuddy {

DaemonPaths DaemonPaths::defaults() {
    return {default_socket_path(), default_pid_path(), default_log_path(),
            default_lock_path(), default_start_lock_path()};
}

// ── FileLock ──────────────────────────────────────────────────────────

FileLock::FileLock(std::string path) : path_(std::move(path)) {}

FileLock::~FileLock() {
    if (fd_ >= 0) close(fd_);
}

bool FileLock::acquire(bool wait) {
    if (fd_ < 0) {
        fd_ = open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
        if (fd_ < 0) {
            error_ = "open " + path_ + ": " + std::strerror(errno);
            return false;
        }
    }
    int op = LOCK_EX | (wait ? 0 : LOCK_NB);
    while (flock(fd_, op) != 0) {
        if (errno == EINTR) continue;
        error_ = errno == EWOULDBLOCK ? path_ + " is held by another process"
                                      : "flock " + path_ + ": " + std::strerror(errno);
        return false;
    }
    return true;
}

// ── process helpers ───────────────────────────────────────────────────

std::string self_executable() {
    char buf[4096];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len > 0) { buf[len] = '\0'; return buf; }
    return "bashbuddy";
}

std::string process_executable(pid_t pid) {
    std::string link = "/proc/" + std::to_string(pid) + "/exe";
    char buf[4096];
    ssize_t len = readlink(link.c_str(), buf, sizeof(buf) - 1);
    if (len <= 0) return "";
    std::string target(buf, static_cast<size_t>(len));

    // The binary was replaced on disk while the process kept running
    const std::string deleted = " (deleted)";
    if (target.size() > deleted.size()
        && target.compare(target.size() - deleted.size(), deleted.size(), deleted) == 0) {
        target.erase(target.size() - deleted.size());
    }
    return target;
}

bool process_alive(pid_t pid) {
    if (pid <= 0) return false;
    int status = 0;
    pid_t r = waitpid(pid, &status, WNOHANG);
    if (r == pid) return false;     // exited child, now reaped
    if (r == 0) return true;        // our child, still running
    // not our child
    return kill(pid, 0) == 0 || errno == EPERM;
}

static LifecycleResult make_result(LifecycleStatus status, std::string message, int pid = 0) {
    LifecycleResult r;
    r.status = status;
    r.message = std::move(message);
    r.pid = pid;
    return r;
}

static void sleep_ms(int ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

DaemonManager::DaemonManager(DaemonPaths paths, const Config& cfg, std::string executable)
    : paths_(std::move(paths))
    , attempts_(cfg.startup_attempts)
    , interval_ms_(cfg.startup_interval_ms)
    , timeout_sec_(cfg.client_timeout_sec)
    , executable_(executable.empty() ? self_executable() : std::move(executable)) {
    std::error_code ec;
    expected_exe_ = fs::weakly_canonical(executable_, ec).string();
    if (ec) expected_exe_ = executable_;
}

int DaemonManager::read_pid() const {
    std::string text = trim(read_file(paths_.pid_path));
    if (text.empty()) return 0;
    try {
        int pid = std::stoi(text);
        return pid > 0 ? pid : 0;
    } catch (const std::exception&) {
        return 0;
    }
}

bool DaemonManager::owns_process(pid_t pid) const {
    return process_executable(pid) == expected_exe_;
}

bool DaemonManager::is_running() {
    if (!fs::exists(paths_.pid_path)) return false;
    int pid = read_pid();
    if (pid > 0 && process_alive(pid)) {
        if (owns_process(pid)) return true;
        std::cerr << "[manager] PID " << pid << " in " << paths_.pid_path
                  << " is not a bashbuddy daemon, ignoring it\n";
    }

    std::error_code ec;
    fs::remove(paths_.pid_path, ec);
    return false;
}

bool DaemonManager::ping() const {
    DaemonClient client(paths_.socket_path, timeout_sec_);
    return client.ping().transport_ok();
}

void DaemonManager::remove_markers() const {
    std::error_code ec;
    fs::remove(paths_.pid_path, ec);
    fs::remove(paths_.socket_path, ec);
}

std::string DaemonManager::log_since(uintmax_t offset) const {
    std::string text = read_file(paths_.log_path);
    if (offset < text.size()) text = text.substr(offset);
    else text.clear();
    return trim(text);
}

pid_t DaemonManager::spawn(std::string& error) {
    // Everything the child needs is prepared before fork
    std::string exe = executable_;
    std::string log_path = paths_.log_path;
    std::vector<std::string> argv_strs = {exe, "daemon"};
    std::vector<char*> argv;
    for (auto& s : argv_strs) argv.push_back(const_cast<char*>(s.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid == 0) {
        setsid();
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) { dup2(devnull, STDIN_FILENO); close(devnull); }
        int log_fd = open(log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0600);
        if (log_fd >= 0) {
            dup2(log_fd, STDOUT_FILENO);
            dup2(log_fd, STDERR_FILENO);
            close(log_fd);
        }
        execv(exe.c_str(), argv.data());
        const char msg[] = "[manager] exec of daemon binary failed\n";
        ssize_t n = write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)n;
        _exit(127);
    }
    if (pid < 0) {
        error = std::string("fork: ") + std::strerror(errno);
    }
    return pid;
}

LifecycleResult DaemonManager::start() {
    FileLock lock(paths_.start_lock_path);
    if (!lock.acquire(true)) {
        return make_result(LifecycleStatus::spawn_failed, "Failed to start daemon: " + lock.error());
    }
    return start_locked();
}

LifecycleResult DaemonManager::start_locked() {
    if (is_running()) {
        return make_result(LifecycleStatus::already_running, "Daemon is already running", read_pid());
    }

    std::error_code ec;
    uintmax_t log_offset = fs::exists(paths_.log_path) ? fs::file_size(paths_.log_path, ec) : 0;
    if (ec) log_offset = 0;

    std::string error;
    pid_t pid = spawn(error);
    if (pid < 0) {
        return make_result(LifecycleStatus::spawn_failed, "Failed to start daemon: " + error);
    }

    {
        std::ofstream f(paths_.pid_path, std::ios::trunc);
        f << pid;
        if (!f) {
            kill(pid, SIGKILL);
            process_alive(pid);
            return make_result(LifecycleStatus::spawn_failed,
                               "Failed to start daemon: could not write " + paths_.pid_path);
        }
    }
    std::cerr << "[manager] spawned daemon (PID " << pid << ")\n";

    bool alive = true;
    for (int attempt = 0; attempt < attempts_; attempt++) {
        sleep_ms(interval_ms_);
        if (!process_alive(pid)) { alive = false; break; }
        if (ping()) {
            return make_result(LifecycleStatus::ok, "Daemon started successfully", pid);
        }
    }

    if (alive && process_alive(pid)) {
        return make_result(LifecycleStatus::startup_timeout,
                           "Daemon started but not responding (timeout)", pid);
    }

    if (read_pid() == pid) {
        std::error_code rm_ec;
        fs::remove(paths_.pid_path, rm_ec);
    }
    std::string diag = log_since(log_offset);
    if (diag.empty()) diag = "Unknown error";
    return make_result(LifecycleStatus::startup_failed, "Failed to start daemon: " + diag);
}

LifecycleResult DaemonManager::stop() {
    if (!is_running()) {
        return make_result(LifecycleStatus::not_running, "Daemon is not running");
    }

    int pid = read_pid();
    if (kill(pid, SIGTERM) != 0 && errno != ESRCH) {
        return make_result(LifecycleStatus::not_running,
                           std::string("Failed to stop daemon: ") + std::strerror(errno), pid);
    }

    for (int i = 0; i < 10 && process_alive(pid); i++) {
        sleep_ms(200);
    }

    if (process_alive(pid)) {
        std::cerr << "[manager] daemon did not exit after SIGTERM, sending SIGKILL\n";
        kill(pid, SIGKILL);
        for (int i = 0; i < 10 && process_alive(pid); i++) {
            sleep_ms(50);
        }
    }

    remove_markers();
    return make_result(LifecycleStatus::ok, "Daemon stopped", pid);
}

DaemonStatus DaemonManager::status() {
    DaemonStatus st;
    if (!is_running()) {
        st.state = DaemonState::stopped;
        st.message = "Daemon is not running";
        return st;
    }
    st.pid = read_pid();
    if (ping()) {
        st.state = DaemonState::running;
        st.message = "Daemon is running";
    } else {
        st.state = DaemonState::unresponsive;
        st.message = "Daemon process exists but not responding";
    }
    return st;
}

LifecycleResult DaemonManager::ensure_running() {
    // Serialised with other clients so none of them restarts a daemon
    // another one is still bringing up
    FileLock lock(paths_.start_lock_path);
    if (!lock.acquire(true)) {
        return make_result(LifecycleStatus::spawn_failed, "Failed to start daemon: " + lock.error());
    }

    if (is_running()) {
        if (ping()) {
            return make_result(LifecycleStatus::ok, "Daemon is running", read_pid());
        }
        std::cerr << "[manager] daemon not responding, restarting\n";
        stop();
        sleep_ms(500);
    }

    return start_locked();
}

} // namespace bashbuddy
