#pragma once
// =============================================================================
// AutoFrame — Logging
// Process-wide named spdlog logger. Created on first use.
// =============================================================================

#include <spdlog/spdlog.h>

#include <memory>

namespace AutoFrame
{

// The "autoframe" logger (stderr, colored). Falls back to spdlog's default
// logger if the sink cannot be created.
std::shared_ptr<spdlog::logger> logger();

// Parses "trace"/"debug"/"info"/"warn"/"error"/"off"; unknown names → info.
void setLogLevel(const char* levelName);

} // namespace AutoFrame
