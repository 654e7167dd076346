#pragma once

#include <atomic>

namespace takeout {

// Set by the first SIGINT/SIGTERM; long running loops poll it and abort with
// Cancelled. A second signal terminates the process.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

inline bool CancelRequested() { return g_cancel.load(std::memory_order_relaxed); }

} // namespace takeout
