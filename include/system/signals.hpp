#pragma once

#include <atomic>

namespace kiosk {

// Set from signal handlers, polled by the daemon loop.
extern std::atomic_bool g_update_requested;  // SIGUSR1
extern std::atomic_bool g_stop_requested;    // SIGINT, SIGTERM

void InstallSignalHandlers();

} // namespace kiosk
