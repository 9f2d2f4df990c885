// signals.cpp - Signal handling and shared cancel flag.

#include "system/signals.hpp"

#include <csignal>
#include <signal.h>

namespace peel {

std::atomic_bool g_cancel{false};

static void HandleSignal(int) {
    g_cancel.store(true, std::memory_order_relaxed);
}

void InstallSignalHandlers() {
    struct sigaction sa{};
    sa.sa_handler = HandleSignal;
    sigemptyset(&sa.sa_mask);
    // No SA_RESTART: a blocking poll()/read() must return EINTR so the cancel flag is seen.
    sa.sa_flags = 0;
    ::sigaction(SIGINT, &sa, nullptr);
    ::sigaction(SIGTERM, &sa, nullptr);
    std::signal(SIGPIPE, SIG_DFL);
}

} // namespace peel
