#pragma once
#include <string>

namespace bashbuddy {
// `command` non-empty composes "Help for command '<command>': <message>".
int cmd_ask(const std::string& message, const std::string& command, bool fresh);
int cmd_reset();
int cmd_history();
} // namespace bashbuddy
