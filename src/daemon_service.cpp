#include "daemon_service.hpp"
#include "utils.hpp"
#include <iostream>

namespace bashbuddy {

DaemonService::DaemonService(Orchestrator& orchestrator, SessionState& session,
                             int max_pending_asks)
    : orchestrator_(orchestrator)
    , session_(session)
    , max_pending_asks_(max_pending_asks < 1 ? 1 : max_pending_asks) {}

nlohmann::json DaemonService::error_response(const std::string& message) {
    return {{"status", "error"}, {"message", message}};
}

nlohmann::json DaemonService::handle(const nlohmann::json& request) {
    if (!request.is_object() || !request.contains("command") || !request["command"].is_string()) {
        return error_response("Request is missing a 'command' field");
    }
    std::string command = request["command"].get<std::string>();

    if (command == "ask") return handle_ask(request);
    if (command == "ping") return {{"status", "ok"}, {"message", "pong"}};
    if (command == "status") return {{"status", "ok"}, {"message", "Daemon is running"}};
    if (command == "reset") return handle_reset();
    if (command == "history") return handle_history();
    return error_response("Unknown command: " + command);
}

nlohmann::json DaemonService::handle_ask(const nlohmann::json& request) {
    if (!request.contains("message") || !request["message"].is_string()) {
        return error_response("ask requires a 'message' string");
    }
    std::string message = request["message"].get<std::string>();
    if (trim(message).empty()) {
        return error_response("ask requires a non-empty 'message'");
    }

    bool force_fresh = false;
    if (request.contains("force_fresh") && request["force_fresh"].is_boolean()) {
        force_fresh = request["force_fresh"].get<bool>();
    }

    ToolContext ctx;
    if (request.contains("cwd") && request["cwd"].is_string()) {
        ctx.cwd = request["cwd"].get<std::string>();
    }

    if (pending_asks_.fetch_add(1) >= max_pending_asks_) {
        pending_asks_--;
        std::cerr << "[daemon] rejecting ask, " << max_pending_asks_ << " already pending\n";
        return error_response("Daemon busy: too many pending questions, try again");
    }
    struct PendingRelease {
        std::atomic<int>& count;
        ~PendingRelease() { count--; }
    } release{pending_asks_};

    return answer(message, force_fresh, ctx);
}

nlohmann::json DaemonService::answer(const std::string& message, bool force_fresh,
                                     const ToolContext& ctx) {
    std::lock_guard<std::mutex> gate(ask_gate_);

    if (!force_fresh) {
        if (auto cached = session_.lookup(message)) {
            std::cerr << "[daemon] cache hit for query: " << message.substr(0, 50) << "\n";
            return {
                {"status", "ok"},
                {"type", "command"},
                {"command", cached->command},
                {"explanation", cached->explanation},
                {"cached", true},
                {"history_length", session_.size()}
            };
        }
    }

    AskTicket ticket = session_.begin_ask(message);

    AskResult result;
    try {
        result = orchestrator_.run(ticket.snapshot, ctx);
    } catch (const std::exception& e) {
        std::cerr << "[daemon] ask failed: " << e.what() << "\n";
        return error_response(std::string("Failed to generate response: ") + e.what());
    }

    if (!session_.complete_ask(ticket, result.recorded_turn)) {
        std::cerr << "[daemon] history was reset during ask, answer not recorded\n";
    }

    nlohmann::json resp;
    resp["status"] = "ok";
    if (result.is_command) {
        resp["command"] = result.command;
        resp["explanation"] = result.explanation;
    } else {
        resp["message"] = result.message;
    }
    resp["history_length"] = session_.size();
    resp["function_calls"] = result.function_calls_json();
    return resp;
}

nlohmann::json DaemonService::handle_reset() {
    session_.reset();
    std::cerr << "[daemon] conversation history cleared\n";
    return {{"status", "ok"}, {"message", "Conversation history cleared"}};
}

nlohmann::json DaemonService::handle_history() const {
    auto turns = session_.history();
    nlohmann::json arr = nlohmann::json::array();
    for (auto& t : turns) arr.push_back(t.to_json());
    return {{"status", "ok"}, {"history", arr}, {"count", turns.size()}};
}

} // namespace bashbuddy
