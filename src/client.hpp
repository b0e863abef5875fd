#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace bashbuddy {

enum class TransportError {
    none,
    socket_missing,
    connection_refused,
    broken_pipe,
    timeout,
    connection_closed,
    protocol_error,
    io_error
};

struct ClientResponse {
    TransportError error = TransportError::none;
    nlohmann::json body;  // daemon response, or {status:"error", message} on transport failure

    bool transport_ok() const { return error == TransportError::none; }
    bool ok() const { return transport_ok() && body.value("status", "") == "ok"; }
    std::string message() const { return body.value("message", ""); }
};

// One request/response exchange per connection.
class DaemonClient {
public:
    explicit DaemonClient(std::string socket_path, int timeout_sec = 60);

    ClientResponse send(const nlohmann::json& request) const;
    ClientResponse send_command(const std::string& command,
                                nlohmann::json fields = nlohmann::json::object()) const;

    ClientResponse ping() const { return send_command("ping"); }
    ClientResponse ask(const std::string& message, bool force_fresh = false,
                       const std::string& cwd = "") const;
    ClientResponse reset() const { return send_command("reset"); }
    ClientResponse history() const { return send_command("history"); }

    const std::string& socket_path() const { return socket_path_; }

private:
    std::string socket_path_;
    int timeout_sec_;
};

} // namespace bashbuddy
