#pragma once
#include "config.hpp"
#include "daemon_manager.hpp"

namespace bashbuddy {
int cmd_start();
int cmd_stop();
int cmd_status();
} // namespace bashbuddy
