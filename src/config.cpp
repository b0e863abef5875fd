#include "config.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace bashbuddy {

std::string Config::resolve_api_key() const {
    for (auto name : {"GEMINI_API_KEY", "BASHBUDDY_API_KEY"}) {
        const char* v = std::getenv(name);
        if (v && *v) return v;
    }
    return provider.api_key;
}

Config Config::make_default() {
    return Config{};
}

nlohmann::json Config::to_json() const {
    nlohmann::json j;
    j["model"] = model;
    j["max_tokens"] = max_tokens;
    j["temperature"] = temperature;
    j["max_iterations"] = max_iterations;
    j["max_retries"] = max_retries;
    j["request_timeout_sec"] = request_timeout_sec;

    j["provider"] = {{"api_base", provider.api_base}};
    if (!provider.api_key.empty()) j["provider"]["api_key"] = provider.api_key;

    auto& d = j["daemon"];
    d["max_connections"] = max_connections;
    d["client_timeout_sec"] = client_timeout_sec;
    d["startup_attempts"] = startup_attempts;
    d["startup_interval_ms"] = startup_interval_ms;

    auto& t = j["tools"];
    t["man_timeout_sec"] = man_timeout_sec;
    t["man_max_lines"] = man_max_lines;
    t["list_files_limit"] = list_files_limit;
    return j;
}

Config Config::from_json(const nlohmann::json& j) {
    Config c;
    c.model = j.value("model", c.model);
    c.max_tokens = j.value("max_tokens", c.max_tokens);
    c.temperature = j.value("temperature", c.temperature);
    c.max_iterations = j.value("max_iterations", c.max_iterations);
    c.max_retries = j.value("max_retries", c.max_retries);
    c.request_timeout_sec = j.value("request_timeout_sec", c.request_timeout_sec);

    if (j.contains("provider") && j["provider"].is_object()) {
        auto& p = j["provider"];
        c.provider.api_base = p.value("api_base", c.provider.api_base);
        c.provider.api_key = p.value("api_key", c.provider.api_key);
    }

    if (j.contains("daemon") && j["daemon"].is_object()) {
        auto& d = j["daemon"];
        c.max_connections = d.value("max_connections", c.max_connections);
        c.client_timeout_sec = d.value("client_timeout_sec", c.client_timeout_sec);
        c.startup_attempts = d.value("startup_attempts", c.startup_attempts);
        c.startup_interval_ms = d.value("startup_interval_ms", c.startup_interval_ms);
    }

    if (j.contains("tools") && j["tools"].is_object()) {
        auto& t = j["tools"];
        c.man_timeout_sec = t.value("man_timeout_sec", c.man_timeout_sec);
        c.man_max_lines = t.value("man_max_lines", c.man_max_lines);
        c.list_files_limit = t.value("list_files_limit", c.list_files_limit);
    }

    if (c.max_iterations < 1) c.max_iterations = 1;
    if (c.max_connections < 1) c.max_connections = 1;
    if (c.max_retries < 0) c.max_retries = 0;
    return c;
}

Config Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        return make_default();
    }
    try {
        nlohmann::json j = nlohmann::json::parse(f);
        return from_json(j);
    } catch (const std::exception& e) {
        std::cerr << "[warn] Failed to parse config " << path << ": " << e.what() << ", using defaults\n";
        return make_default();
    }
}

void Config::save(const std::string& path) const {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream f(path);
    f << to_json().dump(2) << std::endl;
}

} // namespace bashbuddy
