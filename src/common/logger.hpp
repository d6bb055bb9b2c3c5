#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace shortlink {

// ── Logger façade ─────────────────────────────────────────────────────────────
//
// Every logger made here writes through one colored stdout sink, so lines
// from the resolver, the reconciler and the Redis/RocksDB adapters never
// interleave mid-line.

// Install the process-wide default logger named "shortlink".  Safe to call
// again; the previous default is replaced.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Create (or retrieve if already exists) a per-component logger, e.g.
// "reconciler" or "redis".  An existing logger keeps its level.
std::shared_ptr<spdlog::logger> make_component_logger(
    const std::string& component,
    spdlog::level::level_enum level = spdlog::level::info);

// Parse a level name, case-insensitively: trace, debug, info, warn (or
// warning), error (or err), critical, off.
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

// True if parse_log_level() recognises `s`.
bool is_log_level(const std::string& s);

} // namespace shortlink
