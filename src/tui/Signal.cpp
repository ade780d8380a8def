#include "tui/Signal.hpp"

#include <csignal>

std::atomic_bool g_stop_requested{false};

static void StopHandler(int) {
    g_stop_requested.store(true, std::memory_order_relaxed);
}

void InitSignalHandlers() {
    g_stop_requested.store(false, std::memory_order_relaxed);

    struct sigaction action {};
    action.sa_handler = StopHandler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    struct sigaction ignore {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    sigaction(SIGPIPE, &ignore, nullptr);
}
