// signals.cpp - SIGINT/SIGTERM turn into a cancel request for the CLI.

#include "system/signals.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>

namespace otafetch {

std::atomic_bool g_cancel{false};

namespace {

std::atomic_int g_signal{0};

void HandleCancel(int sig) {
    g_signal.store(sig, std::memory_order_relaxed);
    g_cancel.store(true, std::memory_order_relaxed);
}

bool Install(int sig, void (*handler)(int)) {
    struct sigaction sa{};
    sa.sa_handler = handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (::sigaction(sig, &sa, nullptr) != 0) {
        LogError("sigaction(%d) failed: %s", sig, std::strerror(errno));
        return false;
    }
    return true;
}

} // namespace

bool InstallSignalHandlers() {
    bool ok = Install(SIGINT, HandleCancel);
    ok = Install(SIGTERM, HandleCancel) && ok;
    ok = Install(SIGPIPE, SIG_IGN) && ok;
    return ok;
}

int CancelSignal() { return g_signal.load(std::memory_order_relaxed); }

} // namespace otafetch
