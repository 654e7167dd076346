#include "system/signals.hpp"

#include <csignal>
#include <cstring>

namespace takeout {

std::atomic_bool g_cancel{false};

namespace {

void RequestCancel(int) {
    g_cancel.store(true, std::memory_order_relaxed);
}

} // namespace

void InstallSignalHandlers() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = RequestCancel;
    sigemptyset(&sa.sa_mask);
    // One-shot: a second Ctrl-C gets the default action and kills the process.
    sa.sa_flags = SA_RESETHAND;

    ::sigaction(SIGINT, &sa, nullptr);
    ::sigaction(SIGTERM, &sa, nullptr);
}

} // namespace takeout
