#include "client.hpp"
#include "framing.hpp"
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>

namespace bashbuddy {

static ClientResponse failure(TransportError err, const std::string& message) {
    ClientResponse r;
    r.error = err;
    r.body = {{"status", "error"}, {"message", message}};
    return r;
}

static ClientResponse failure_from_errno(int err) {
    if (err == EAGAIN || err == EWOULDBLOCK || err == ETIMEDOUT)
        return failure(TransportError::timeout, "Request timed out (API may be slow or rate limited)");
    if (err == ECONNREFUSED || err == ENOENT)
        return failure(TransportError::connection_refused, "Could not connect to daemon");
    if (err == EPIPE || err == ECONNRESET)
        return failure(TransportError::broken_pipe,
                       "Connection broken (daemon may have crashed). Try restarting: bashbuddy stop && bashbuddy start");
    return failure(TransportError::io_error, std::string("Communication error: ") + std::strerror(err));
}

// Closes the descriptor on every path out of send()
struct FdGuard {
    int fd;
    ~FdGuard() { if (fd >= 0) close(fd); }
};

DaemonClient::DaemonClient(std::string socket_path, int timeout_sec)
    : socket_path_(std::move(socket_path)), timeout_sec_(timeout_sec) {}

ClientResponse DaemonClient::send(const nlohmann::json& request) const {
    struct stat st;
    if (stat(socket_path_.c_str(), &st) != 0) {
        return failure(TransportError::socket_missing, "Daemon not running. Start it with: bashbuddy start");
    }

    sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (socket_path_.size() >= sizeof(addr.sun_path)) {
        return failure(TransportError::io_error, "Communication error: socket path too long");
    }
    std::memcpy(addr.sun_path, socket_path_.c_str(), socket_path_.size() + 1);

    FdGuard guard{socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0)};
    if (guard.fd < 0) return failure_from_errno(errno);

    timeval tv{timeout_sec_, 0};
    setsockopt(guard.fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(guard.fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    if (connect(guard.fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        return failure_from_errno(errno);
    }

    std::string out = encode_frame(request);
    size_t sent = 0;
    while (sent < out.size()) {
        ssize_t n = ::send(guard.fd, out.data() + sent, out.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return failure_from_errno(errno);
        }
        sent += static_cast<size_t>(n);
    }

    FrameBuffer buffer;
    char chunk[4096];
    while (!buffer.has_frame()) {
        if (buffer.overflowed()) {
            return failure(TransportError::protocol_error, "Communication error: response frame too large");
        }
        ssize_t n = recv(guard.fd, chunk, sizeof(chunk), 0);
        if (n > 0) {
            buffer.append(chunk, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) break;
        if (errno == EINTR) continue;
        return failure_from_errno(errno);
    }

    auto payload = buffer.take_frame();
    if (!payload) {
        if (buffer.empty()) {
            return failure(TransportError::connection_closed,
                           "Daemon closed connection (possibly crashed). Try: bashbuddy stop && bashbuddy start");
        }
        return failure(TransportError::protocol_error, "Communication error: incomplete response frame");
    }

    ClientResponse resp;
    try {
        resp.body = decode_frame(*payload);
    } catch (const std::exception& e) {
        return failure(TransportError::protocol_error, std::string("Communication error: ") + e.what());
    }
    return resp;
}

ClientResponse DaemonClient::send_command(const std::string& command, nlohmann::json fields) const {
    if (!fields.is_object()) fields = nlohmann::json::object();
    fields["command"] = command;
    return send(fields);
}

ClientResponse DaemonClient::ask(const std::string& message, bool force_fresh,
                                 const std::string& cwd) const {
    nlohmann::json fields = {{"message", message}, {"force_fresh", force_fresh}};
    if (!cwd.empty()) fields["cwd"] = cwd;
    return send_command("ask", std::move(fields));
}

} // namespace bashbuddy
