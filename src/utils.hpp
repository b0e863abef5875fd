#pragma once
#include <string>
#include <cstdlib>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <chrono>
#include <atomic>
#include <cstdint>

namespace bashbuddy {

namespace fs = std::filesystem;

inline std::string home_dir() {
    const char* h = std::getenv("HOME");
    return h ? std::string(h) : ".";
}

// Per-user runtime directory; BASHBUDDY_HOME overrides ~/.bashbuddy.
// Created on first use.
inline std::string runtime_dir() {
    const char* override_dir = std::getenv("BASHBUDDY_HOME");
    std::string dir = (override_dir && *override_dir) ? std::string(override_dir)
                                                      : home_dir() + "/.bashbuddy";
    std::error_code ec;
    fs::create_directories(dir, ec);
    return dir;
}

inline std::string default_config_path() { return runtime_dir() + "/config.json"; }
inline std::string default_socket_path() { return runtime_dir() + "/daemon.sock"; }
inline std::string default_pid_path()    { return runtime_dir() + "/daemon.pid"; }
inline std::string default_log_path()    { return runtime_dir() + "/daemon.log"; }
inline std::string default_lock_path()   { return runtime_dir() + "/daemon.lock"; }
inline std::string default_start_lock_path() { return runtime_dir() + "/start.lock"; }

inline std::string read_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return "";
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

inline std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    return s.substr(start, end - start);
}

inline std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

inline int64_t epoch_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

inline std::string generate_tool_call_id() {
    static std::atomic<int> counter{0};
    return "call_" + std::to_string(epoch_now()) + "_" + std::to_string(counter++);
}

} // namespace bashbuddy
