#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "utils.hpp"

namespace bashbuddy {

struct ProviderConfig {
    std::string api_key;
    std::string api_base;
};

struct Config {
    std::string model = "gemini-2.0-flash";
    ProviderConfig provider{"", "https://generativelanguage.googleapis.com/v1beta/openai"};
    int max_tokens = 2048;
    double temperature = 0.2;
    int max_iterations = 10;     // orchestration loop cap per ask
    int max_retries = 2;         // transient provider errors only
    int request_timeout_sec = 50; // provider HTTP read timeout

    // Daemon / transport
    int max_connections = 16;
    int client_timeout_sec = 60;
    int startup_attempts = 10;
    int startup_interval_ms = 300;

    // Local tools
    int man_timeout_sec = 5;
    int man_max_lines = 100;
    int list_files_limit = 20;

    // Environment (GEMINI_API_KEY, BASHBUDDY_API_KEY) wins over the file.
    std::string resolve_api_key() const;

    static Config make_default();
    static Config load(const std::string& path);
    void save(const std::string& path) const;
    nlohmann::json to_json() const;
    static Config from_json(const nlohmann::json& j);
};

} // namespace bashbuddy
