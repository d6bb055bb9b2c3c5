#include "common/clock.hpp"
#include "common/config.hpp"
#include "common/logger.hpp"
#include "counter/counter_keys.hpp"
#include "counter/memory_counter_store.hpp"
#include "counter/redis_counter_store.hpp"
#include "lease/memory_lease_store.hpp"
#include "lease/redis_lease_store.hpp"
#include "link/memory_link_store.hpp"
#include "link/rocksdb_link_store.hpp"
#include "network/resp_client.hpp"
#include "reconcile/reconcile_scheduler.hpp"
#include "reconcile/reconciler.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace asio = boost::asio;

// shortlinkd: the reconciliation worker.  Request-serving processes embed
// Resolver/LinkService against the same stores; this process drains their
// visit deltas into the durable link store on a fixed interval.

int main(int argc, char* argv[]) {
    // ── Parse CLI arguments ──────────────────────────────────────────────────
    shortlink::ServiceConfig cfg;
    try {
        cfg = shortlink::parse_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    // ── Logging ──────────────────────────────────────────────────────────────
    const auto level = shortlink::parse_log_level(cfg.log_level);
    shortlink::init_default_logger(level);
    auto logger = shortlink::make_component_logger("shortlinkd", level);

    logger->info("shortlinkd starting – owner={} engine={} counters={} interval={}ms lease_ttl={}ms",
                 cfg.owner_id, cfg.engine, cfg.counter_backend,
                 cfg.reconcile_interval_ms, cfg.lease_ttl_ms);

    // ── Durable link store ───────────────────────────────────────────────────
    std::unique_ptr<shortlink::LinkStore> links;
    if (cfg.engine == "rocksdb") {
        namespace fs = std::filesystem;
        const fs::path data_dir{cfg.data_dir};
        std::error_code fs_ec;
        fs::create_directories(data_dir, fs_ec);
        if (fs_ec) {
            logger->error("Failed to create data directory {}: {}",
                          data_dir.string(), fs_ec.message());
            return 1;
        }

        const auto db_path = data_dir / "links";
        try {
            links = std::make_unique<shortlink::RocksDBLinkStore>(
                db_path, shortlink::make_component_logger("rocksdb", level));
        } catch (const std::runtime_error& e) {
            logger->error("Failed to open RocksDB link store: {}", e.what());
            return 1;
        }
    } else {
        links = std::make_unique<shortlink::MemoryLinkStore>();
        logger->info("Using in-memory link store");
    }

    // ── Counter + lease stores ───────────────────────────────────────────────
    shortlink::SteadyClock clock;
    std::unique_ptr<shortlink::network::RespClient> redis;
    std::unique_ptr<shortlink::CounterStore> counters;
    std::unique_ptr<shortlink::LeaseStore> leases;

    if (cfg.counter_backend == "redis") {
        auto redis_logger = shortlink::make_component_logger("redis", level);
        redis = std::make_unique<shortlink::network::RespClient>(
            cfg.redis_host, cfg.redis_port,
            std::chrono::milliseconds{cfg.redis_timeout_ms}, redis_logger);
        counters = std::make_unique<shortlink::RedisCounterStore>(*redis, redis_logger);
        leases = std::make_unique<shortlink::RedisLeaseStore>(
            *redis, std::string{shortlink::kReconcileLeaseKey}, redis_logger);
        logger->info("Using Redis counters at {}:{} (timeout {}ms)",
                     cfg.redis_host, cfg.redis_port, cfg.redis_timeout_ms);
    } else {
        counters = std::make_unique<shortlink::MemoryCounterStore>();
        leases = std::make_unique<shortlink::MemoryLeaseStore>(clock);
        logger->warn("Using in-process counters: visits recorded by other processes are not seen");
    }

    // ── Reconciler + scheduler ───────────────────────────────────────────────
    asio::io_context ioc{2};

    shortlink::ReconcilerOptions options;
    options.owner_id                 = cfg.owner_id;
    options.lease_ttl                = std::chrono::milliseconds{cfg.lease_ttl_ms};
    options.max_consecutive_failures = cfg.max_consecutive_failures;
    // Keep the lease across the idle interval so the same process runs the
    // next pass; it lapses after two missed intervals if this process dies.
    options.hold_lease_for           = std::chrono::milliseconds{cfg.reconcile_interval_ms} * 2;

    shortlink::Reconciler reconciler{
        *links, *counters, *leases, clock, options,
        shortlink::make_component_logger("reconciler", level)};

    shortlink::ReconcileScheduler scheduler{
        ioc, reconciler,
        std::chrono::milliseconds{cfg.reconcile_interval_ms}, logger};

    // ── Signal handling ──────────────────────────────────────────────────────
    asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            logger->info("Received signal {}, shutting down...", signo);
            scheduler.stop();
        }
    });

    scheduler.start();

    // ── Run the event loop ───────────────────────────────────────────────────
    // A pass blocks the strand it runs on; the second thread keeps signal
    // delivery responsive while it does.
    std::thread helper([&ioc] { ioc.run(); });
    ioc.run();
    helper.join();

    logger->info("shortlinkd stopped after {} passes", scheduler.passes_run());
    return 0;
}
