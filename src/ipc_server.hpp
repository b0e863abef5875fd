#pragma once
#include "worker_pool.hpp"
#include <string>
#include <set>
#include <mutex>
#include <atomic>
#include <memory>
#include <functional>
#include <nlohmann/json.hpp>

namespace bashbuddy {

// Cancellation channel for the accept loop. request_stop() only writes one
// byte to a pipe, so it may be called from a signal handler.
class StopToken {
public:
    StopToken();
    ~StopToken();
    StopToken(const StopToken&) = delete;
    StopToken& operator=(const StopToken&) = delete;

    void request_stop() noexcept;
    bool stop_requested() const noexcept { return stopped_.load(); }
    int wait_fd() const { return fds_[0]; }

private:
    int fds_[2] = {-1, -1};
    std::atomic<bool> stopped_{false};
};

using RequestHandler = std::function<nlohmann::json(const nlohmann::json&)>;

struct IpcServerOptions {
    std::string socket_path;
    size_t max_connections = 16;
    int receive_timeout_sec = 60;
};

class IpcServer {
public:
    IpcServer(IpcServerOptions opts, RequestHandler handler);
    ~IpcServer();
    IpcServer(const IpcServer&) = delete;
    IpcServer& operator=(const IpcServer&) = delete;

    // Creates the socket file (mode 0600). Throws std::runtime_error.
    void listen();

    // Accepts until the token is stopped; then closes the listening socket,
    // removes the socket file and shuts down open connections.
    void serve(StopToken& stop);

    // True when something accepts connections on `path`.
    static bool socket_in_use(const std::string& path);

private:
    void handle_connection(int fd);
    void reject_busy(int fd);
    void close_listener();

    IpcServerOptions opts_;
    RequestHandler handler_;
    int listen_fd_ = -1;
    std::unique_ptr<WorkerPool> pool_;
    std::mutex conn_mu_;
    std::set<int> open_conns_;
};

} // namespace bashbuddy
