#include "common/config.hpp"
#include "common/logger.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <unistd.h>

#include <boost/program_options.hpp>
#include <spdlog/fmt/fmt.h>

namespace po = boost::program_options;

namespace shortlink {

namespace {

constexpr std::string_view kEnvPrefix = "SHORTLINK_";

void validate_positive(uint32_t value, std::string_view field_name) {
    if (value == 0) {
        throw std::runtime_error(fmt::format("{} must be > 0", field_name));
    }
}

// Validate the fully populated ServiceConfig.
void validate(const ServiceConfig& cfg) {
    if (!is_log_level(cfg.log_level)) {
        throw std::runtime_error(
            fmt::format("--log-level '{}' is not a known level", cfg.log_level));
    }

    if (cfg.engine != "memory" && cfg.engine != "rocksdb") {
        throw std::runtime_error(
            fmt::format("--engine must be 'memory' or 'rocksdb', got '{}'", cfg.engine));
    }
    if (cfg.engine == "rocksdb" && cfg.data_dir.empty()) {
        throw std::runtime_error("--data-dir must not be empty with --engine rocksdb");
    }

    if (cfg.counter_backend != "memory" && cfg.counter_backend != "redis") {
        throw std::runtime_error(
            fmt::format("--counter-backend must be 'memory' or 'redis', got '{}'",
                        cfg.counter_backend));
    }
    if (cfg.counter_backend == "redis") {
        if (cfg.redis_host.empty()) {
            throw std::runtime_error("--redis-host must not be empty");
        }
        if (cfg.redis_port == 0) {
            throw std::runtime_error("--redis-port must be in [1, 65535], got 0");
        }
        // Deltas from every process would be reconciled against a link table
        // only this process can see, and discarded as orphans.
        if (cfg.engine == "memory") {
            throw std::runtime_error(
                "--counter-backend redis needs a shared link store; use --engine rocksdb");
        }
    }

    validate_positive(cfg.redis_timeout_ms,         "--redis-timeout-ms");
    validate_positive(cfg.reconcile_interval_ms,    "--reconcile-interval-ms");
    validate_positive(cfg.lease_ttl_ms,             "--lease-ttl-ms");
    validate_positive(cfg.max_consecutive_failures, "--max-consecutive-failures");
    validate_positive(cfg.cache_capacity,           "--cache-capacity");

    if (cfg.owner_id.empty()) {
        throw std::runtime_error("--owner-id must not be empty");
    }
    if (std::any_of(cfg.owner_id.begin(), cfg.owner_id.end(),
                    [](unsigned char c) { return std::isspace(c) || std::iscntrl(c); })) {
        throw std::runtime_error(
            fmt::format("--owner-id must not contain whitespace, got '{}'", cfg.owner_id));
    }
}

} // anonymous namespace

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("log-level",
            po::value<std::string>()->default_value("info"),
            "Log level: trace|debug|info|warn|error|critical|off")
        ("engine",
            po::value<std::string>()->default_value("memory"),
            "Durable link store: memory (default) or rocksdb")
        ("data-dir",
            po::value<std::string>()->default_value("./data"),
            "Directory holding the RocksDB link database")
        ("counter-backend",
            po::value<std::string>()->default_value("memory"),
            "Visit counter and lease store: memory (default) or redis")
        ("redis-host",
            po::value<std::string>()->default_value("127.0.0.1"),
            "Redis host for --counter-backend redis")
        ("redis-port",
            po::value<uint16_t>()->default_value(6379),
            "Redis port for --counter-backend redis")
        ("redis-timeout-ms",
            po::value<uint32_t>()->default_value(250),
            "Deadline for a single Redis command")
        ("reconcile-interval-ms",
            po::value<uint32_t>()->default_value(300000),
            "Delay between reconciliation passes")
        ("lease-ttl-ms",
            po::value<uint32_t>()->default_value(60000),
            "Time-to-live of the reconciliation lease")
        ("max-consecutive-failures",
            po::value<uint32_t>()->default_value(8),
            "Durable store failures in a row before a pass stops early")
        ("cache-capacity",
            po::value<uint32_t>()->default_value(10000),
            "Resolver read-through cache size (entries)")
        ("owner-id",
            po::value<std::string>(),
            "Lease owner identity (default: <hostname>-<pid>)");
}

// ── Environment mapping ───────────────────────────────────────────────────────

std::string env_to_option(const std::string& env_name,
                          const po::options_description& desc) {
    if (!env_name.starts_with(kEnvPrefix)) {
        return {};
    }

    std::string name = env_name.substr(kEnvPrefix.size());
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
        return c == '_' ? '-' : static_cast<char>(std::tolower(c));
    });

    if (name.empty() || name == "help") {
        return {};
    }
    return desc.find_nothrow(name, false) != nullptr ? name : std::string{};
}

std::string default_owner_id() {
    char host[256] = {};
    if (::gethostname(host, sizeof(host) - 1) != 0 || host[0] == '\0') {
        return fmt::format("shortlinkd-{}", ::getpid());
    }
    return fmt::format("{}-{}", host, ::getpid());
}

// ── parse_config ──────────────────────────────────────────────────────────────

ServiceConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("shortlinkd options");
    add_options(desc);

    po::variables_map vm;
    try {
        // First store wins: command line takes precedence over environment.
        po::store(po::parse_command_line(argc, argv, desc), vm);

        // Handle --help before notify() so validation doesn't error.
        if (vm.count("help")) {
            std::ostringstream oss;
            oss << desc;
            throw std::runtime_error(oss.str());
        }

        po::store(
            po::parse_environment(desc, [&desc](const std::string& env_name) {
                return env_to_option(env_name, desc);
            }),
            vm);

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    ServiceConfig cfg;
    cfg.log_level                = vm["log-level"].as<std::string>();
    cfg.engine                   = vm["engine"].as<std::string>();
    cfg.data_dir                 = vm["data-dir"].as<std::string>();
    cfg.counter_backend          = vm["counter-backend"].as<std::string>();
    cfg.redis_host               = vm["redis-host"].as<std::string>();
    cfg.redis_port               = vm["redis-port"].as<uint16_t>();
    cfg.redis_timeout_ms         = vm["redis-timeout-ms"].as<uint32_t>();
    cfg.reconcile_interval_ms    = vm["reconcile-interval-ms"].as<uint32_t>();
    cfg.lease_ttl_ms             = vm["lease-ttl-ms"].as<uint32_t>();
    cfg.max_consecutive_failures = vm["max-consecutive-failures"].as<uint32_t>();
    cfg.cache_capacity           = vm["cache-capacity"].as<uint32_t>();
    cfg.owner_id                 = vm.count("owner-id")
        ? vm["owner-id"].as<std::string>()
        : default_owner_id();

    validate(cfg);
    return cfg;
}

} // namespace shortlink
