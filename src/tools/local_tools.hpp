#pragma once
#include "../tool_registry.hpp"
#include "../config.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace bashbuddy {

inline constexpr const char* FINAL_ANSWER_TOOL = "suggested_command";

// Declares get_current_directory, list_files, check_command_exists,
// get_man_page and suggested_command.
void register_local_tools(ToolRegistry& reg);

// Per-request context. An empty cwd means the daemon's own working directory.
struct ToolContext {
    std::string cwd;
};

struct ToolOutcome {
    nlohmann::json result;
    bool final_answer = false;
};

class LocalToolExecutor {
public:
    LocalToolExecutor(const ToolRegistry& registry, const Config& cfg);

    // Never throws for expected failures: unknown tools, bad arguments and
    // filesystem or process errors come back as {"error": ...} payloads.
    ToolOutcome execute(const std::string& name, const nlohmann::json& args,
                        const ToolContext& ctx = {}) const;

    nlohmann::json get_current_directory(const ToolContext& ctx) const;
    nlohmann::json list_files(const ListFilesArgs& args, const ToolContext& ctx) const;
    nlohmann::json check_command_exists(const CheckCommandExistsArgs& args) const;
    nlohmann::json get_man_page(const GetManPageArgs& args) const;
    nlohmann::json suggested_command(const SuggestedCommandArgs& args) const;

private:
    const ToolRegistry& registry_;
    int list_limit_;
    int man_timeout_sec_;
    int man_max_lines_;
};

} // namespace bashbuddy
