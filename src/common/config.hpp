#pragma once

#include <cstdint>
#include <string>

#include <boost/program_options.hpp>

namespace shortlink {

// ── ServiceConfig ─────────────────────────────────────────────────────────────
// Full configuration for one shortlinkd process.
// Populated by parse_config() from CLI arguments and SHORTLINK_* environment
// variables (command line wins).

struct ServiceConfig {
    std::string log_level;                 // spdlog level string

    std::string engine;                    // Durable link store: "memory" or "rocksdb"
    std::string data_dir;                  // RocksDB directory parent

    std::string counter_backend;           // Counter + lease store: "memory" or "redis"
    std::string redis_host;
    uint16_t    redis_port;
    uint32_t    redis_timeout_ms;          // Per-command deadline for Redis I/O

    uint32_t    reconcile_interval_ms;     // Delay between reconciliation passes
    uint32_t    lease_ttl_ms;              // Reconciliation lease time-to-live
    uint32_t    max_consecutive_failures;  // Durable failures before a pass backs off
    uint32_t    cache_capacity;            // Resolver LRU entries

    std::string owner_id;                  // Lease owner identity of this process
};

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments (and environment fallbacks) into a ServiceConfig.
//
// On success: returns a fully validated ServiceConfig.
// On error  : throws std::runtime_error with a human-readable message.
//             --help also throws, carrying the option description.
//
// Environment variables are named SHORTLINK_<OPTION>, upper-cased with dashes
// turned into underscores: --redis-host  <->  SHORTLINK_REDIS_HOST.

[[nodiscard]] ServiceConfig parse_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate an options_description with shortlinkd options.
// Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

// Maps an environment variable name to an option name of `desc`, or returns an
// empty string if the variable is not one of ours.
[[nodiscard]] std::string env_to_option(
    const std::string& env_name,
    const boost::program_options::options_description& desc);

// "<hostname>-<pid>", used when --owner-id is not given.
[[nodiscard]] std::string default_owner_id();

} // namespace shortlink
