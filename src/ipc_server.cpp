#include "ipc_server.hpp"
#include "framing.hpp"
#include <iostream>
#include <stdexcept>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>

namespace bashbuddy {

// ── StopToken ─────────────────────────────────────────────────────────

StopToken::StopToken() {
    if (pipe2(fds_, O_CLOEXEC | O_NONBLOCK) != 0) {
        throw std::runtime_error(std::string("pipe2 failed: ") + std::strerror(errno));
    }
}

StopToken::~StopToken() {
    if (fds_[0] >= 0) close(fds_[0]);
    if (fds_[1] >= 0) close(fds_[1]);
}

void StopToken::request_stop() noexcept {
    stopped_.store(true);
    char b = 1;
    ssize_t n = write(fds_[1], &b, 1);
    (void)n;  // a full pipe already wakes the loop
}

// ── helpers ───────────────────────────────────────────────────────────

static bool fill_address(const std::string& path, sockaddr_un& addr) {
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (path.size() >= sizeof(addr.sun_path)) return false;
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);
    return true;
}

static void set_timeouts(int fd, int recv_sec, int send_sec) {
    timeval rtv{recv_sec, 0};
    timeval stv{send_sec, 0};
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &rtv, sizeof(rtv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &stv, sizeof(stv));
}

static bool send_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

static void send_error(int fd, const std::string& message) {
    nlohmann::json err = {{"status", "error"}, {"message", message}};
    if (!send_all(fd, encode_frame(err))) {
        std::cerr << "[ipc] could not deliver error frame: " << std::strerror(errno) << "\n";
    }
}

// ── IpcServer ─────────────────────────────────────────────────────────

IpcServer::IpcServer(IpcServerOptions opts, RequestHandler handler)
    : opts_(std::move(opts)), handler_(std::move(handler)) {}

IpcServer::~IpcServer() {
    close_listener();
    // joins the workers
    pool_.reset();
}

bool IpcServer::socket_in_use(const std::string& path) {
    sockaddr_un addr;
    if (!fill_address(path, addr)) return false;
    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return false;
    bool in_use = connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
    close(fd);
    return in_use;
}

void IpcServer::listen() {
    sockaddr_un addr;
    if (!fill_address(opts_.socket_path, addr)) {
        throw std::runtime_error("Socket path too long: " + opts_.socket_path);
    }

    listen_fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (listen_fd_ < 0) {
        throw std::runtime_error(std::string("socket failed: ") + std::strerror(errno));
    }

    // stale file from a daemon that did not shut down cleanly
    unlink(opts_.socket_path.c_str());

    if (bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string err = std::strerror(errno);
        close(listen_fd_);
        listen_fd_ = -1;
        throw std::runtime_error("bind " + opts_.socket_path + " failed: " + err);
    }
    chmod(opts_.socket_path.c_str(), S_IRUSR | S_IWUSR);

    if (::listen(listen_fd_, 16) < 0) {
        std::string err = std::strerror(errno);
        close_listener();
        throw std::runtime_error("listen failed: " + err);
    }

    pool_ = std::make_unique<WorkerPool>(opts_.max_connections);
}

void IpcServer::close_listener() {
    if (listen_fd_ < 0) return;
    close(listen_fd_);
    listen_fd_ = -1;
    unlink(opts_.socket_path.c_str());
}

void IpcServer::serve(StopToken& stop) {
    if (listen_fd_ < 0) listen();
    std::cerr << "[ipc] listening on " << opts_.socket_path
              << " (max " << opts_.max_connections << " connections)\n";

    while (!stop.stop_requested()) {
        pollfd fds[2];
        fds[0] = {listen_fd_, POLLIN, 0};
        fds[1] = {stop.wait_fd(), POLLIN, 0};

        int rc = poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[ipc] poll failed: " << std::strerror(errno) << "\n";
            break;
        }
        if (fds[1].revents & POLLIN) break;
        if (!(fds[0].revents & POLLIN)) continue;

        int client = accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client < 0) {
            if (errno != EINTR && errno != EAGAIN && errno != ECONNABORTED) {
                std::cerr << "[ipc] accept failed: " << std::strerror(errno) << "\n";
            }
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(conn_mu_);
            open_conns_.insert(client);
        }
        bool queued = pool_->try_submit([this, client] { handle_connection(client); });
        if (!queued) {
            {
                std::lock_guard<std::mutex> lock(conn_mu_);
                open_conns_.erase(client);
            }
            reject_busy(client);
        }
    }

    std::cerr << "[ipc] shutting down\n";
    close_listener();

    // Wake workers blocked reading from idle clients
    std::lock_guard<std::mutex> lock(conn_mu_);
    for (int fd : open_conns_) shutdown(fd, SHUT_RDWR);
}

void IpcServer::reject_busy(int fd) {
    std::cerr << "[ipc] rejecting connection, " << pool_->capacity() << " already in flight\n";
    set_timeouts(fd, 1, 1);
    send_error(fd, "Daemon busy: too many concurrent requests, try again");
    close(fd);
}

void IpcServer::handle_connection(int fd) {
    set_timeouts(fd, opts_.receive_timeout_sec, opts_.receive_timeout_sec);

    FrameBuffer buffer;
    char chunk[4096];
    bool closed = false;
    bool timed_out = false;
    bool failed = false;
    int recv_errno = 0;

    while (!buffer.has_frame() && !buffer.overflowed()) {
        ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
        if (n > 0) {
            buffer.append(chunk, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) { closed = true; break; }
        if (errno == EINTR) continue;
        recv_errno = errno;
        if (recv_errno == EAGAIN || recv_errno == EWOULDBLOCK) timed_out = true;
        else failed = true;
        break;
    }

    try {
        if (auto payload = buffer.take_frame()) {
            nlohmann::json response;
            try {
                auto request = decode_frame(*payload);
                response = handler_(request);
            } catch (const nlohmann::json::exception& e) {
                response = {{"status", "error"}, {"message", std::string("Invalid request: ") + e.what()}};
            } catch (const std::exception& e) {
                std::cerr << "[ipc] error handling request: " << e.what() << "\n";
                response = {{"status", "error"}, {"message", std::string("Failed to generate response: ") + e.what()}};
            }
            if (!send_all(fd, encode_frame(response))) {
                std::cerr << "[ipc] client went away before the response was sent\n";
            }
        } else if (buffer.overflowed()) {
            send_error(fd, "Request exceeds " + std::to_string(MAX_FRAME_BYTES) + " bytes");
        } else if (timed_out) {
            send_error(fd, "Timed out waiting for request");
        } else if (failed) {
            std::cerr << "[ipc] recv failed: " << std::strerror(recv_errno) << "\n";
            send_error(fd, "Failed to read request");
        } else if (closed && !buffer.empty()) {
            send_error(fd, "Incomplete request frame");
        }
    } catch (const std::exception& e) {
        std::cerr << "[ipc] connection fault: " << e.what() << "\n";
        send_error(fd, std::string("Internal error: ") + e.what());
    }

    {
        std::lock_guard<std::mutex> lock(conn_mu_);
        open_conns_.erase(fd);
    }
    close(fd);
}

} // namespace bashbuddy
