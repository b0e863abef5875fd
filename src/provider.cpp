#include "provider.hpp"
#include "utils.hpp"
#include "framing.hpp"
#include <httplib.h>
#include <iostream>

namespace bashbuddy {

// ── Error classification ───────────────────────────────────────────────

static bool text_contains_any(const std::string& text, std::initializer_list<const char*> patterns) {
    for (auto p : patterns) {
        if (text.find(p) != std::string::npos) return true;
    }
    return false;
}

ProviderErrorKind classify_provider_error(const std::string& error_text) {
    if (error_text.empty()) return ProviderErrorKind::unknown;

    std::string lower = to_lower(error_text);

    if (text_contains_any(lower, {"rate limit", "rate_limit", "too many requests", "429",
                                   "quota exceeded", "resource_exhausted"}))
        return ProviderErrorKind::rate_limit;

    if (text_contains_any(lower, {"overloaded", "503", "unavailable"}))
        return ProviderErrorKind::overloaded;

    if (text_contains_any(lower, {"context window", "prompt too large", "token limit",
                                   "maximum context", "input too large"}))
        return ProviderErrorKind::context_overflow;

    if (text_contains_any(lower, {"timeout", "timed out", "deadline exceeded"}))
        return ProviderErrorKind::timeout;

    if (text_contains_any(lower, {"401", "403", "unauthorized", "forbidden",
                                   "invalid api key", "api_key_invalid", "permission_denied"}))
        return ProviderErrorKind::auth;

    if (text_contains_any(lower, {"402", "payment required", "billing"}))
        return ProviderErrorKind::billing;

    return ProviderErrorKind::unknown;
}

bool is_retryable_error(ProviderErrorKind kind) {
    return kind == ProviderErrorKind::rate_limit ||
           kind == ProviderErrorKind::timeout ||
           kind == ProviderErrorKind::overloaded;
}

// ── URL handling ───────────────────────────────────────────────────────

static void parse_url(const std::string& url, std::string& scheme, std::string& host, int& port, std::string& path_prefix) {
    scheme = "http";
    host = "127.0.0.1";
    port = 80;
    path_prefix = "";

    size_t pos = 0;
    if (url.compare(0, 8, "https://") == 0) {
        scheme = "https"; pos = 8; port = 443;
    } else if (url.compare(0, 7, "http://") == 0) {
        scheme = "http"; pos = 7; port = 80;
    }

    size_t slash = url.find('/', pos);
    std::string host_port = (slash != std::string::npos) ? url.substr(pos, slash - pos) : url.substr(pos);
    if (slash != std::string::npos) {
        path_prefix = url.substr(slash);
        while (!path_prefix.empty() && path_prefix.back() == '/') path_prefix.pop_back();
    }

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        host = host_port.substr(0, colon);
        try {
            port = std::stoi(host_port.substr(colon + 1));
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid port in provider api_base: " + url);
        }
    } else {
        host = host_port;
    }
}

Provider::Provider(const Config& cfg)
    : api_key_(cfg.resolve_api_key())
    , model_(cfg.model)
    , max_tokens_(cfg.max_tokens)
    , temperature_(cfg.temperature)
    , read_timeout_sec_(cfg.request_timeout_sec) {
    parse_url(cfg.provider.api_base, scheme_, host_, port_, path_prefix_);
    base_url_ = scheme_ + "://" + host_ + ":" + std::to_string(port_);
}

// ── Inline tool-call recovery (no regex) ───────────────────────────────

// Drops trailing commas before } or ] outside of strings.
static std::string fix_json(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool in_string = false;
    bool escape = false;
    for (size_t i = 0; i < s.size(); i++) {
        char c = s[i];
        if (escape) { out += c; escape = false; continue; }
        if (c == '\\' && in_string) { out += c; escape = true; continue; }
        if (c == '"') { in_string = !in_string; out += c; continue; }
        if (in_string) { out += c; continue; }
        if (c == ',') {
            size_t j = i + 1;
            while (j < s.size() && (s[j] == ' ' || s[j] == '\t' || s[j] == '\n' || s[j] == '\r')) j++;
            if (j < s.size() && (s[j] == '}' || s[j] == ']')) continue;
        }
        out += c;
    }
    return out;
}

static bool try_parse_tool_call(const nlohmann::json& j, ToolCall& tc) {
    tc.id = generate_tool_call_id();
    tc.name = j.value("name", "");
    if (tc.name.empty()) return false;
    for (auto key : {"arguments", "parameters", "args"}) {
        if (j.contains(key)) {
            tc.arguments = j[key].is_string() ? j[key].get<std::string>() : j[key].dump();
            break;
        }
    }
    return true;
}

// Find matching closing brace for a JSON object starting at pos (s[pos] == '{')
static size_t find_json_object_end(const std::string& s, size_t pos) {
    if (pos >= s.size() || s[pos] != '{') return std::string::npos;
    int depth = 0;
    bool in_str = false;
    bool esc = false;
    for (size_t i = pos; i < s.size(); i++) {
        char c = s[i];
        if (esc) { esc = false; continue; }
        if (c == '\\' && in_str) { esc = true; continue; }
        if (c == '"') { in_str = !in_str; continue; }
        if (in_str) continue;
        if (c == '{') depth++;
        else if (c == '}') { depth--; if (depth == 0) return i; }
    }
    return std::string::npos;
}

static bool parse_object_at(const std::string& text, size_t brace, ToolCall& tc) {
    size_t brace_end = find_json_object_end(text, brace);
    if (brace_end == std::string::npos) return false;
    auto j = nlohmann::json::parse(fix_json(text.substr(brace, brace_end - brace + 1)), nullptr, false);
    if (j.is_discarded() || !j.is_object()) return false;
    return try_parse_tool_call(j, tc);
}

static std::vector<ToolCall> parse_tagged_tool_calls(const std::string& text) {
    static const std::string open_tag = "<tool_call>";
    static const std::string close_tag = "</tool_call>";
    std::vector<ToolCall> calls;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t tag_start = text.find(open_tag, pos);
        if (tag_start == std::string::npos) break;
        size_t content_start = tag_start + open_tag.size();
        size_t tag_end = text.find(close_tag, content_start);
        if (tag_end == std::string::npos) break;

        std::string inner = text.substr(content_start, tag_end - content_start);
        size_t brace = inner.find('{');
        ToolCall tc;
        if (brace != std::string::npos && parse_object_at(inner, brace, tc)) {
            calls.push_back(std::move(tc));
        }
        pos = tag_end + close_tag.size();
    }
    return calls;
}

// ```json blocks whose object carries a "name"
static std::vector<ToolCall> parse_markdown_json_blocks(const std::string& text) {
    std::vector<ToolCall> calls;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t fence_start = text.find("```", pos);
        if (fence_start == std::string::npos) break;
        size_t line_end = text.find('\n', fence_start);
        if (line_end == std::string::npos) break;

        std::string lang = trim(text.substr(fence_start + 3, line_end - fence_start - 3));
        size_t fence_end = text.find("\n```", line_end);
        if (fence_end == std::string::npos) break;

        std::string block = text.substr(line_end + 1, fence_end - line_end - 1);
        pos = fence_end + 4;

        if (!lang.empty() && lang != "json" && lang != "tool") continue;
        size_t brace = block.find('{');
        if (brace == std::string::npos) continue;
        ToolCall tc;
        if (parse_object_at(block, brace, tc)) calls.push_back(std::move(tc));
    }
    return calls;
}

static std::string strip_tool_content(const std::string& text) {
    std::string result = text;
    for (;;) {
        size_t s = result.find("<tool_call>");
        if (s == std::string::npos) break;
        size_t e = result.find("</tool_call>", s);
        if (e == std::string::npos) break;
        result.erase(s, e + 12 - s);
    }
    return trim(result);
}

ProviderResponse parse_chat_completion(const std::string& body) {
    ProviderResponse resp;
    try {
        auto j = nlohmann::json::parse(body);
        if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
            throw std::runtime_error("response has no choices");
        }
        auto& msg = j["choices"][0]["message"];
        resp.content = msg.contains("content") && msg["content"].is_string()
                       ? msg["content"].get<std::string>() : "";

        if (msg.contains("tool_calls") && msg["tool_calls"].is_array()) {
            for (auto& tc : msg["tool_calls"]) {
                ToolCall t;
                t.id = tc.value("id", "");
                if (t.id.empty()) t.id = generate_tool_call_id();
                if (tc.contains("function")) {
                    auto& fn = tc["function"];
                    t.name = fn.value("name", "");
                    if (fn.contains("arguments")) {
                        t.arguments = fn["arguments"].is_string()
                            ? fn["arguments"].get<std::string>() : fn["arguments"].dump();
                    }
                }
                if (!t.name.empty()) resp.tool_calls.push_back(std::move(t));
            }
        }
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("Failed to parse provider response: ") + e.what());
    }

    if (resp.tool_calls.empty() && !resp.content.empty()) {
        auto fallback = parse_tagged_tool_calls(resp.content);
        if (fallback.empty()) fallback = parse_markdown_json_blocks(resp.content);
        if (!fallback.empty()) {
            resp.tool_calls = std::move(fallback);
            resp.content = strip_tool_content(resp.content);
        }
    }
    return resp;
}

ProviderResponse Provider::generate(const std::vector<Message>& messages,
                                    const nlohmann::json& tools_spec) {
    httplib::Client cli(base_url_);
    cli.set_connection_timeout(10);
    cli.set_read_timeout(read_timeout_sec_);

    nlohmann::json body;
    body["model"] = model_;
    body["max_tokens"] = max_tokens_;
    body["temperature"] = temperature_;

    auto& msgs = body["messages"];
    msgs = nlohmann::json::array();
    for (auto& m : messages) {
        msgs.push_back(m.to_json());
    }

    if (tools_spec.is_array() && !tools_spec.empty()) {
        body["tools"] = tools_spec;
    }

    std::string path = path_prefix_ + "/chat/completions";

    httplib::Headers headers;
    if (!api_key_.empty()) {
        headers.emplace("Authorization", "Bearer " + api_key_);
    }

    auto res = cli.Post(path, headers, dump_lossy(body), "application/json");
    if (!res) {
        throw std::runtime_error("Provider request failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw std::runtime_error("Provider returned status " + std::to_string(res->status) + ": " + res->body);
    }
    return parse_chat_completion(res->body);
}

} // namespace bashbuddy
