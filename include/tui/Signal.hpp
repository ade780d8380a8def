#ifndef TUI_SIGNAL_HPP
#define TUI_SIGNAL_HPP

#include <atomic>

// Set by the SIGINT/SIGTERM handler so the main loop can exit and restore the terminal.
extern std::atomic_bool g_stop_requested;

// Installs the stop handler for SIGINT and SIGTERM and ignores SIGPIPE,
// so a child that closes its stdin early (sudo) cannot kill the session.
void InitSignalHandlers();

#endif // TUI_SIGNAL_HPP
