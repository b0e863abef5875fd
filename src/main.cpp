#include <iostream>
#include <string>
#include <vector>
#include "daemon.hpp"
#include "status.hpp"
#include "ask_cmd.hpp"

static void print_usage() {
    std::cout << "Usage: bashbuddy <command> [options]\n\n"
              << "Commands:\n"
              << "  ask [-c CMD] [--fresh] MESSAGE\n"
              << "                              Ask for a bash command\n"
              << "  reset                       Clear the conversation history\n"
              << "  history                     Show the conversation history\n"
              << "  start                       Start the background daemon\n"
              << "  stop                        Stop the background daemon\n"
              << "  status                      Show daemon status\n"
              << "  daemon                      Run the daemon in the foreground\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string cmd = argv[1];
    std::vector<std::string> args;
    for (int i = 2; i < argc; i++) {
        args.push_back(argv[i]);
    }

    if (cmd == "daemon") {
        return bashbuddy::cmd_daemon();
    }
    else if (cmd == "start") {
        return bashbuddy::cmd_start();
    }
    else if (cmd == "stop") {
        return bashbuddy::cmd_stop();
    }
    else if (cmd == "status") {
        return bashbuddy::cmd_status();
    }
    else if (cmd == "ask") {
        std::string command;
        std::string message;
        bool fresh = false;
        for (size_t i = 0; i < args.size(); i++) {
            if ((args[i] == "-c" || args[i] == "--command") && i + 1 < args.size()) {
                command = args[++i];
            } else if (args[i] == "--fresh" || args[i] == "-f") {
                fresh = true;
            } else {
                if (!message.empty()) message += " ";
                message += args[i];
            }
        }
        return bashbuddy::cmd_ask(message, command, fresh);
    }
    else if (cmd == "reset") {
        return bashbuddy::cmd_reset();
    }
    else if (cmd == "history") {
        return bashbuddy::cmd_history();
    }
    else if (cmd == "-h" || cmd == "--help" || cmd == "help") {
        print_usage();
        return 0;
    }
    else {
        std::cerr << "Unknown command: " << cmd << "\n";
        print_usage();
        return 1;
    }
}
