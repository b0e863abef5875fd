#include "orchestrator.hpp"
#include "session.hpp"
#include "framing.hpp"
#include "utils.hpp"
#include <iostream>
#include <thread>
#include <chrono>

namespace bashbuddy {

const char* const SYSTEM_INSTRUCTION =
    "You are BashBuddy, a bash command assistant. CRITICAL RULES:\n\n"
    "1. DO NOT EXPLAIN what you will do - JUST DO IT by calling functions immediately.\n"
    "2. NEVER say 'I will' or 'First I need to' - just call the function.\n"
    "3. Call functions silently without announcing your intentions.\n\n"
    "Available functions:\n"
    "- get_current_directory() - get current working directory\n"
    "- list_files(path) - list files in a directory\n"
    "- check_command_exists(command) - check if command is installed\n"
    "- get_man_page(command) - read manual page for detailed options\n"
    "- suggested_command(command, explanation) - provide final answer\n\n"
    "Workflow:\n"
    "1. If you need info, call the appropriate function(s) RIGHT NOW (don't announce it)\n"
    "2. Once you have the info, call suggested_command() with:\n"
    "   - command: the exact bash command to run\n"
    "   - explanation: educational breakdown of what each part does, why it works,\n"
    "     what output to expect, and any relevant alternatives\n\n"
    "Examples:\n"
    "User: 'list files here'\n"
    "You: [call list_files('.'), then call suggested_command('ls', 'explanation...')]\n\n"
    "User: 'how do I use find?'\n"
    "You: [call get_man_page('find'), then call suggested_command('find...', 'explanation...')]\n\n"
    "FORBIDDEN: Returning text like 'I will help you' or 'First let me check'. Just call functions.";

const char* const CORRECTIVE_INSTRUCTION =
    "CRITICAL: You MUST call the suggested_command() function now. "
    "Do NOT respond with text. Your response above should be converted "
    "to a suggested_command(command, explanation) function call. "
    "Extract the command and explanation from your text and call the function.";

static const char* NO_RESPONSE_TEXT = "No response generated";

nlohmann::json AskResult::function_calls_json() const {
    nlohmann::json arr = nlohmann::json::array();
    for (auto& rec : function_calls) arr.push_back(rec.to_json());
    return arr;
}

Orchestrator::Orchestrator(GenerationService& service, const ToolRegistry& registry,
                           const LocalToolExecutor& executor, const Config& cfg)
    : service_(service)
    , executor_(executor)
    , tools_spec_(registry.tools_spec())
    , max_iterations_(cfg.max_iterations)
    , max_retries_(cfg.max_retries) {}

std::vector<Message> Orchestrator::build_context(const std::vector<ConversationTurn>& history) {
    std::vector<Message> messages;
    Message sys;
    sys.role = "system";
    sys.content = SYSTEM_INSTRUCTION;
    messages.push_back(sys);

    for (auto& turn : history) {
        Message m;
        m.role = turn.role == "assistant" ? "assistant" : "user";
        m.content = turn.content;
        messages.push_back(m);
    }
    return messages;
}

ProviderResponse Orchestrator::call_with_retry(const std::vector<Message>& messages) {
    for (int retry = 0;; retry++) {
        try {
            return service_.generate(messages, tools_spec_);
        } catch (const std::exception& e) {
            auto kind = classify_provider_error(e.what());
            if (!is_retryable_error(kind) || retry >= max_retries_) throw;

            // Exponential backoff: 1s, 2s, 4s
            int delay_ms = 1000 * (1 << retry);
            std::cerr << "[orchestrator] provider error (retry " << retry + 1 << "/"
                      << max_retries_ << " in " << delay_ms << "ms): " << e.what() << "\n";
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        }
    }
}

AskResult Orchestrator::run(const std::vector<ConversationTurn>& history, const ToolContext& ctx) {
    AskResult result;
    auto messages = build_context(history);

    bool corrected = false;
    std::string last_text;
    bool have_text = false;

    for (int iteration = 0; iteration < max_iterations_; iteration++) {
        result.iterations = iteration + 1;
        ProviderResponse resp = call_with_retry(messages);

        if (resp.has_tool_calls()) {
            // One tool call per model turn
            const ToolCall& tc = resp.tool_calls.front();

            ToolOutcome outcome;
            nlohmann::json args = nlohmann::json::object();
            if (!trim(tc.arguments).empty()) {
                args = nlohmann::json::parse(tc.arguments, nullptr, false);
            }
            if (args.is_discarded()) {
                args = nlohmann::json::object();
                outcome.result = {{"error", "arguments for " + tc.name + " are not valid JSON"}};
            } else {
                outcome = executor_.execute(tc.name, args, ctx);
            }

            std::cerr << "[orchestrator] iteration " << result.iterations << ": "
                      << tc.name << "(" << dump_lossy(args) << ")\n";

            if (outcome.final_answer) {
                result.is_command = true;
                result.command = outcome.result.value("command", "");
                result.explanation = outcome.result.value("explanation", "");
                result.recorded_turn = format_command_turn(result.command, result.explanation);
                return result;
            }

            result.function_calls.push_back({tc.name, args});

            Message assistant;
            assistant.role = "assistant";
            assistant.content = resp.content;
            assistant.tool_calls = {tc};
            messages.push_back(assistant);

            Message tool_msg;
            tool_msg.role = "tool";
            tool_msg.tool_call_id = tc.id;
            tool_msg.content = dump_lossy(outcome.result);
            messages.push_back(tool_msg);
            continue;
        }

        last_text = resp.content;
        have_text = true;

        if (!corrected) {
            corrected = true;
            std::cerr << "[orchestrator] iteration " << result.iterations
                      << ": text instead of a function call, asking again\n";

            Message assistant;
            assistant.role = "assistant";
            assistant.content = resp.content;
            messages.push_back(assistant);

            Message nudge;
            nudge.role = "user";
            nudge.content = CORRECTIVE_INSTRUCTION;
            messages.push_back(nudge);
            continue;
        }

        result.message = resp.content;
        result.recorded_turn = resp.content;
        return result;
    }

    std::cerr << "[orchestrator] hit max iterations (" << max_iterations_ << "), "
              << result.function_calls.size() << " function calls made\n";

    std::string text = have_text ? last_text : NO_RESPONSE_TEXT;
    result.exhausted = true;
    result.message = "[Warning: Exceeded function call limit after " +
                     std::to_string(result.function_calls.size()) +
                     " function calls]\n\n" + text;
    result.recorded_turn = text;
    return result;
}

} // namespace bashbuddy
