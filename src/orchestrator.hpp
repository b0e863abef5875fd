#pragma once
#include "provider.hpp"
#include "tool_registry.hpp"
#include "tools/local_tools.hpp"
#include "config.hpp"
#include "message.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace bashbuddy {

extern const char* const SYSTEM_INSTRUCTION;
extern const char* const CORRECTIVE_INSTRUCTION;

struct AskResult {
    bool is_command = false;     // answered through the final-answer tool
    bool exhausted = false;      // iteration cap hit
    std::string command;
    std::string explanation;
    std::string message;         // plain answer (or warning-prefixed text when exhausted)
    std::string recorded_turn;   // assistant turn to append to the history
    std::vector<ToolCallRecord> function_calls;
    int iterations = 0;

    nlohmann::json function_calls_json() const;
};

// Drives one ask against the generation service until the model delivers
// its answer through suggested_command, falls back to plain text after one
// corrective turn, or runs out of iterations.
// Provider failures that survive the retry policy propagate as exceptions.
class Orchestrator {
public:
    Orchestrator(GenerationService& service, const ToolRegistry& registry,
                 const LocalToolExecutor& executor, const Config& cfg);

    AskResult run(const std::vector<ConversationTurn>& history, const ToolContext& ctx = {});

    // system instruction + history as user / assistant messages
    static std::vector<Message> build_context(const std::vector<ConversationTurn>& history);

private:
    ProviderResponse call_with_retry(const std::vector<Message>& messages);

    GenerationService& service_;
    const LocalToolExecutor& executor_;
    nlohmann::json tools_spec_;
    int max_iterations_;
    int max_retries_;
};

} // namespace bashbuddy
