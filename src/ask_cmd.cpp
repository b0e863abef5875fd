#include "ask_cmd.hpp"
#include "config.hpp"
#include "client.hpp"
#include "daemon_manager.hpp"
#include "utils.hpp"
#include <iostream>

namespace bashbuddy {

// Makes sure a responsive daemon exists and returns a client for it.
static bool connect_daemon(DaemonClient& out) {
    Config cfg = Config::load(default_config_path());
    DaemonManager mgr(DaemonPaths::defaults(), cfg);
    auto result = mgr.ensure_running();
    if (!result.ok()) {
        std::cerr << "Error: " << result.message << "\n";
        return false;
    }
    out = DaemonClient(mgr.paths().socket_path, cfg.client_timeout_sec);
    return true;
}

static int report_failure(const ClientResponse& resp) {
    std::cerr << "Error: " << resp.message() << "\n";
    return 1;
}

int cmd_ask(const std::string& message, const std::string& command, bool fresh) {
    if (trim(message).empty()) {
        std::cerr << "Error: no question given\n";
        return 1;
    }
    std::string query = command.empty()
        ? message
        : "Help for command '" + command + "': " + message;

    DaemonClient client("");
    if (!connect_daemon(client)) return 1;

    std::error_code ec;
    std::string cwd = fs::current_path(ec).string();
    auto resp = client.ask(query, fresh, ec ? "" : cwd);
    if (!resp.ok()) return report_failure(resp);

    auto& body = resp.body;
    if (body.contains("command")) {
        std::cout << body.value("command", "") << "\n\n";
        std::string explanation = body.value("explanation", "");
        if (!explanation.empty()) std::cout << explanation << "\n";
        if (body.value("cached", false)) std::cout << "\n(cached answer)\n";
    } else {
        std::cout << body.value("message", "") << "\n";
    }

    if (body.contains("function_calls") && body["function_calls"].is_array()
        && !body["function_calls"].empty()) {
        std::cerr << "\n[tools]";
        for (auto& call : body["function_calls"]) {
            std::cerr << " " << call.value("name", "?");
        }
        std::cerr << "\n";
    }
    return 0;
}

int cmd_reset() {
    DaemonClient client("");
    if (!connect_daemon(client)) return 1;
    auto resp = client.reset();
    if (!resp.ok()) return report_failure(resp);
    std::cout << resp.message() << "\n";
    return 0;
}

int cmd_history() {
    DaemonClient client("");
    if (!connect_daemon(client)) return 1;
    auto resp = client.history();
    if (!resp.ok()) return report_failure(resp);

    auto& body = resp.body;
    int count = body.value("count", 0);
    if (count == 0) {
        std::cout << "No conversation history\n";
        return 0;
    }
    std::cout << "Conversation history (" << count << " turns):\n\n";
    for (auto& turn : body["history"]) {
        std::string role = turn.value("role", "");
        std::cout << (role == "user" ? "You" : "BashBuddy") << ": "
                  << turn.value("content", "") << "\n\n";
    }
    return 0;
}

} // namespace bashbuddy
