#pragma once

#include <atomic>

namespace wdi {

// Set by SIGINT/SIGTERM; downloads and archive reads poll it.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

} // namespace wdi
