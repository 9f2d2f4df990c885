#pragma once

#include <atomic>

namespace peel {

// Set by SIGINT/SIGTERM; polled by the process runner.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

} // namespace peel
