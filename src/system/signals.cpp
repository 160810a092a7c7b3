// signals.cpp - cancel flag driven by SIGINT/SIGTERM.

#include "system/signals.hpp"

#include <csignal>

namespace wdi {

std::atomic_bool g_cancel{false};

namespace {

void HandleCancel(int) {
    g_cancel.store(true, std::memory_order_relaxed);
}

} // namespace

void InstallSignalHandlers() {
    struct sigaction sa{};
    sa.sa_handler = HandleCancel;
    sigemptyset(&sa.sa_mask);
    // No SA_RESTART: a blocked poll() in a child-process wait returns EINTR and rechecks.
    sa.sa_flags = 0;
    ::sigaction(SIGINT, &sa, nullptr);
    ::sigaction(SIGTERM, &sa, nullptr);

    // A peer closing a TLS connection must not kill the process.
    struct sigaction ign{};
    ign.sa_handler = SIG_IGN;
    sigemptyset(&ign.sa_mask);
    ::sigaction(SIGPIPE, &ign, nullptr);
}

} // namespace wdi
