#pragma once
#include "orchestrator.hpp"
#include "session.hpp"
#include <mutex>
#include <atomic>
#include <nlohmann/json.hpp>

namespace bashbuddy {

// Request handlers behind the socket. Every handler returns a response
// object carrying "status"; none of them throws.
class DaemonService {
public:
    // At most `max_pending_asks` asks may be running or waiting on the gate;
    // each one occupies a connection worker, so the daemon passes
    // max_connections - 1 and ping/status always find a free worker.
    DaemonService(Orchestrator& orchestrator, SessionState& session,
                  int max_pending_asks = 15);

    nlohmann::json handle(const nlohmann::json& request);

    nlohmann::json handle_ask(const nlohmann::json& request);
    nlohmann::json handle_reset();
    nlohmann::json handle_history() const;

    static nlohmann::json error_response(const std::string& message);

private:
    nlohmann::json answer(const std::string& message, bool force_fresh, const ToolContext& ctx);

    Orchestrator& orchestrator_;
    SessionState& session_;
    // Held across a whole ask so concurrent asks keep user/assistant pairs
    // adjacent. History reads and resets only take the session's own lock.
    std::mutex ask_gate_;
    int max_pending_asks_;
    std::atomic<int> pending_asks_{0};
};

} // namespace bashbuddy
