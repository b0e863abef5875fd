#pragma once

namespace bashbuddy {
// Runs the daemon in the foreground until SIGINT/SIGTERM.
int cmd_daemon();
} // namespace bashbuddy
