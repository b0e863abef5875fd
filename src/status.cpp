#include "status.hpp"
#include <iostream>

namespace bashbuddy {

static DaemonManager make_manager() {
    Config cfg = Config::load(default_config_path());
    return DaemonManager(DaemonPaths::defaults(), cfg);
}

int cmd_start() {
    auto mgr = make_manager();
    auto result = mgr.start();
    if (!result.ok()) {
        std::cerr << "Error: " << result.message << "\n";
        return 1;
    }
    std::cout << result.message << " (PID " << result.pid << ")\n";
    return 0;
}

int cmd_stop() {
    auto mgr = make_manager();
    auto result = mgr.stop();
    if (!result.ok()) {
        std::cerr << "Error: " << result.message << "\n";
        return 1;
    }
    std::cout << result.message << "\n";
    return 0;
}

int cmd_status() {
    std::string cfg_path = default_config_path();
    Config cfg = Config::load(cfg_path);
    DaemonManager mgr(DaemonPaths::defaults(), cfg);
    auto st = mgr.status();

    std::cout << "=== bashbuddy status ===\n";
    std::cout << "Config path  : " << cfg_path << "\n";
    std::cout << "Model        : " << cfg.model << "\n";
    std::cout << "API key      : " << (cfg.resolve_api_key().empty() ? "(missing)" : "set") << "\n";
    std::cout << "Socket       : " << mgr.paths().socket_path << "\n";
    std::cout << "Log          : " << mgr.paths().log_path << "\n";

    switch (st.state) {
        case DaemonState::running:
            std::cout << "Daemon       : running (PID " << st.pid << ")\n";
            return 0;
        case DaemonState::unresponsive:
            std::cout << "Daemon       : unresponsive (PID " << st.pid << ")\n";
            return 1;
        case DaemonState::stopped:
            std::cout << "Daemon       : stopped\n";
            return 0;
    }
    return 0;
}

} // namespace bashbuddy
