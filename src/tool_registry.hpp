#pragma once
#include <string>
#include <map>
#include <vector>
#include <variant>
#include <optional>
#include <functional>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace bashbuddy {

// ── Typed tool arguments (one shape per tool name) ─────────────────────

struct GetCurrentDirectoryArgs {};

struct ListFilesArgs {
    std::string path = ".";
};

struct CheckCommandExistsArgs {
    std::string command;
};

struct GetManPageArgs {
    std::string command;
    std::string section;  // empty = man's default search order
};

struct SuggestedCommandArgs {
    std::string command;
    std::string explanation;
};

using ToolArgs = std::variant<GetCurrentDirectoryArgs,
                              ListFilesArgs,
                              CheckCommandExistsArgs,
                              GetManPageArgs,
                              SuggestedCommandArgs>;

// Raised by a parser when the model's arguments do not fit the tool's shape.
class ToolArgumentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

using ToolParser = std::function<ToolArgs(const nlohmann::json&)>;

struct ToolDef {
    std::string name;
    std::string description;
    nlohmann::json parameters;  // JSON schema, or null for no parameters
    ToolParser parse;
};

class ToolRegistry {
public:
    void register_tool(ToolDef def) {
        tools_[def.name] = std::move(def);
        spec_dirty_ = true;
    }

    // Returns nullopt for names that were never declared.
    // Throws ToolArgumentError when the arguments are malformed.
    std::optional<ToolArgs> parse(const std::string& name, const nlohmann::json& args) const {
        auto it = tools_.find(name);
        if (it == tools_.end()) return std::nullopt;
        return it->second.parse(args.is_object() ? args : nlohmann::json::object());
    }

    // OpenAI-style "tools" array.
    nlohmann::json tools_spec() const {
        if (!spec_dirty_) return cached_spec_;
        nlohmann::json arr = nlohmann::json::array();
        for (auto& [name, def] : tools_) {
            nlohmann::json fn = {
                {"name", def.name},
                {"description", def.description}
            };
            fn["parameters"] = def.parameters.is_null()
                ? nlohmann::json{{"type", "object"}, {"properties", nlohmann::json::object()}}
                : def.parameters;
            arr.push_back({{"type", "function"}, {"function", std::move(fn)}});
        }
        cached_spec_ = std::move(arr);
        spec_dirty_ = false;
        return cached_spec_;
    }

    std::vector<std::string> tool_names() const {
        std::vector<std::string> names;
        for (auto& [n, _] : tools_) names.push_back(n);
        return names;
    }

private:
    std::map<std::string, ToolDef> tools_;
    mutable nlohmann::json cached_spec_;
    mutable bool spec_dirty_ = true;
};

} // namespace bashbuddy
