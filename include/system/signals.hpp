#pragma once

#include <atomic>

namespace otafetch {

// Set by SIGINT/SIGTERM.
extern std::atomic_bool g_cancel;

// Installs the cancel handler for SIGINT/SIGTERM and ignores SIGPIPE.
// Returns false when sigaction fails.
bool InstallSignalHandlers();

// Number of the signal that set g_cancel, 0 if none arrived.
int CancelSignal();

} // namespace otafetch
