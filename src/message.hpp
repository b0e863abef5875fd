#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace bashbuddy {

struct ToolCall {
    std::string id;
    std::string name;
    std::string arguments; // JSON string
};

// One entry of the wire-level context sent to the generation service.
struct Message {
    std::string role;       // "system", "user", "assistant", "tool"
    std::string content;
    std::string tool_call_id;       // for role="tool"
    std::vector<ToolCall> tool_calls; // for role="assistant" with tool calls

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["role"] = role;
        if (!content.empty() || tool_calls.empty()) j["content"] = content;
        if (!tool_call_id.empty()) j["tool_call_id"] = tool_call_id;
        if (!tool_calls.empty()) {
            auto& arr = j["tool_calls"];
            for (auto& tc : tool_calls) {
                arr.push_back({
                    {"id", tc.id},
                    {"type", "function"},
                    {"function", {{"name", tc.name}, {"arguments", tc.arguments}}}
                });
            }
        }
        return j;
    }
};

// A completed exchange entry in the daemon's conversation history.
struct ConversationTurn {
    std::string role;   // "user" or "assistant"
    std::string content;

    nlohmann::json to_json() const {
        return {{"role", role}, {"content", content}};
    }
};

// Diagnostic record of one tool invocation within a single ask.
struct ToolCallRecord {
    std::string name;
    nlohmann::json args = nlohmann::json::object();

    nlohmann::json to_json() const {
        return {{"name", name}, {"args", args}};
    }
};

} // namespace bashbuddy
