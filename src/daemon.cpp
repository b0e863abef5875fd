#include "daemon.hpp"
#include "config.hpp"
#include "provider.hpp"
#include "tool_registry.hpp"
#include "tools/local_tools.hpp"
#include "orchestrator.hpp"
#include "session.hpp"
#include "daemon_service.hpp"
#include "ipc_server.hpp"
#include "daemon_manager.hpp"
#include "utils.hpp"
#include <iostream>
#include <memory>
#include <csignal>
#include <cstring>
#include <unistd.h>

namespace bashbuddy {

static StopToken* g_stop = nullptr;

static void on_signal(int) {
    if (g_stop) g_stop->request_stop();
}

static void install_signal_handlers() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    std::signal(SIGPIPE, SIG_IGN);
}

// Drops the PID marker only when it still names this process.
static void remove_own_pid_marker(const std::string& pid_path) {
    std::string text = trim(read_file(pid_path));
    if (text == std::to_string(getpid())) {
        std::error_code ec;
        fs::remove(pid_path, ec);
    }
}

int cmd_daemon() {
    std::string cfg_path = default_config_path();
    Config cfg = Config::load(cfg_path);

    if (cfg.resolve_api_key().empty()) {
        std::cerr << "[daemon] No API key found. Set GEMINI_API_KEY or provider.api_key in "
                  << cfg_path << "\n";
        return 1;
    }

    std::string socket_path = default_socket_path();
    std::string pid_path = default_pid_path();

    // Held until exit; a second daemon stops here before touching the socket
    FileLock instance_lock(default_lock_path());
    if (!instance_lock.acquire(false)) {
        std::cerr << "[daemon] Another daemon is already running (" << instance_lock.error() << ")\n";
        return 1;
    }

    if (IpcServer::socket_in_use(socket_path)) {
        std::cerr << "[daemon] Another daemon is already listening on " << socket_path << "\n";
        return 1;
    }

    ToolRegistry registry;
    register_local_tools(registry);
    LocalToolExecutor executor(registry, cfg);

    std::unique_ptr<Provider> provider;
    try {
        provider = std::make_unique<Provider>(cfg);
    } catch (const std::exception& e) {
        std::cerr << "[daemon] " << e.what() << "\n";
        return 1;
    }

    Orchestrator orchestrator(*provider, registry, executor, cfg);
    SessionState session;
    DaemonService service(orchestrator, session, cfg.max_connections - 1);

    IpcServerOptions opts;
    opts.socket_path = socket_path;
    opts.max_connections = static_cast<size_t>(cfg.max_connections);
    opts.receive_timeout_sec = cfg.client_timeout_sec;

    StopToken stop;
    IpcServer server(opts, [&service](const nlohmann::json& req) { return service.handle(req); });
    try {
        server.listen();
    } catch (const std::exception& e) {
        std::cerr << "[daemon] " << e.what() << "\n";
        return 1;
    }

    g_stop = &stop;
    install_signal_handlers();

    std::cerr << "[daemon] BashBuddy daemon started (PID " << getpid()
              << ", model " << cfg.model << ", socket " << socket_path << ")\n";

    server.serve(stop);

    remove_own_pid_marker(pid_path);
    std::cerr << "[daemon] stopped\n";
    g_stop = nullptr;
    return 0;
}

} // namespace bashbuddy
