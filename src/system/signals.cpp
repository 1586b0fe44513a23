// signals.cpp - Signal handlers for the update trigger and shutdown flags.

#include "system/signals.hpp"

#include <csignal>

namespace kiosk {

std::atomic_bool g_update_requested{false};
std::atomic_bool g_stop_requested{false};

static void HandleStop(int) {
    g_stop_requested.store(true, std::memory_order_relaxed);
}

static void HandleUpdate(int) {
    g_update_requested.store(true, std::memory_order_relaxed);
}

void InstallSignalHandlers() {
    std::signal(SIGINT, HandleStop);
    std::signal(SIGTERM, HandleStop);
    std::signal(SIGUSR1, HandleUpdate);
}

} // namespace kiosk
