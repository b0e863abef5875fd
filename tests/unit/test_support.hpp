#pragma once
#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <unistd.h>

namespace bashbuddy_test {

// Short paths under /tmp keep socket paths within sun_path limits.
class TempDir {
public:
    explicit TempDir(const std::string& tag = "bb") {
        static std::atomic<int> counter{0};
        root_ = std::filesystem::temp_directory_path() /
                (tag + "_" + std::to_string(getpid()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(root_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }
    std::string path(const std::string& name) const { return (root_ / name).string(); }

    void write(const std::string& name, const std::string& content) const {
        std::ofstream out(root_ / name);
        out << content;
    }

private:
    std::filesystem::path root_;
};

// Sets (or unsets, with nullopt) an environment variable for one scope.
class ScopedEnv {
public:
    ScopedEnv(std::string name, const std::optional<std::string>& value) : name_(std::move(name)) {
        const char* old = std::getenv(name_.c_str());
        if (old) previous_ = std::string(old);
        if (value) setenv(name_.c_str(), value->c_str(), 1);
        else unsetenv(name_.c_str());
    }

    ~ScopedEnv() {
        if (previous_) setenv(name_.c_str(), previous_->c_str(), 1);
        else unsetenv(name_.c_str());
    }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    std::string name_;
    std::optional<std::string> previous_;
};

} // namespace bashbuddy_test
