#pragma once

#include <atomic>

namespace pkgrepo {

// Set by SIGINT/SIGTERM; polled by the orchestrator between stages.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

} // namespace pkgrepo
