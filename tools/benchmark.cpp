// Resolver throughput benchmark with a live reconciler.
//
// Creates C links in an in-memory link store, then T threads resolve random
// codes (N resolutions in total), each with visit details for the visit log,
// while a background thread runs reconciliation passes back to back.  The cache is sized to a quarter of the
// links so misses and evictions stay on the measured path.
//
// Prints: total ops, elapsed time, ops/sec, latency percentiles (p50, p90,
// p99, p999), cache hit ratio, visit log throughput, and verifies that every resolution ended up
// either committed or still pending.
//
// Usage: shortlink-bench [resolutions] [threads] [links]

#include "common/clock.hpp"
#include "common/error.hpp"
#include "core/link_service.hpp"
#include "core/resolver.hpp"
#include "core/visit_recorder.hpp"
#include "counter/memory_counter_store.hpp"
#include "lease/memory_lease_store.hpp"
#include "link/memory_link_store.hpp"
#include "reconcile/reconciler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace {

using clock_type = std::chrono::high_resolution_clock;
using ns         = std::chrono::nanoseconds;

struct BenchResult {
    std::size_t total_ops   = 0;
    double      elapsed_sec = 0;
    double      ops_per_sec = 0;
    double      avg_us      = 0;
    double      p50_us      = 0;
    double      p90_us      = 0;
    double      p99_us      = 0;
    double      p999_us     = 0;
};

BenchResult compute_stats(std::vector<int64_t>& latencies_ns, double elapsed_sec) {
    BenchResult r;
    if (latencies_ns.empty()) return r;

    std::sort(latencies_ns.begin(), latencies_ns.end());

    int64_t total_ns = 0;
    for (auto l : latencies_ns) total_ns += l;

    r.total_ops   = latencies_ns.size();
    r.elapsed_sec = elapsed_sec;
    r.ops_per_sec = static_cast<double>(r.total_ops) / r.elapsed_sec;
    r.avg_us      = static_cast<double>(total_ns) / static_cast<double>(r.total_ops) / 1000.0;

    auto percentile = [&](double p) -> double {
        auto idx = static_cast<std::size_t>(p * static_cast<double>(latencies_ns.size() - 1));
        return static_cast<double>(latencies_ns[idx]) / 1000.0; // ns → µs
    };

    r.p50_us  = percentile(0.50);
    r.p90_us  = percentile(0.90);
    r.p99_us  = percentile(0.99);
    r.p999_us = percentile(0.999);

    return r;
}

void print_result(const char* label, const BenchResult& r) {
    fprintf(stdout,
        "\n── %s ──\n"
        "  Total ops:    %zu\n"
        "  Elapsed:      %.3f s\n"
        "  Throughput:   %.0f ops/sec\n"
        "  Avg latency:  %.1f µs\n"
        "  p50:          %.1f µs\n"
        "  p90:          %.1f µs\n"
        "  p99:          %.1f µs\n"
        "  p99.9:        %.1f µs\n",
        label, r.total_ops, r.elapsed_sec, r.ops_per_sec,
        r.avg_us, r.p50_us, r.p90_us, r.p99_us, r.p999_us);
}

std::size_t arg_or(int argc, char* argv[], int index, std::size_t fallback) {
    if (argc <= index) return fallback;
    const auto v = static_cast<std::size_t>(std::atol(argv[index]));
    return v == 0 ? fallback : v;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::warn);

    const std::size_t num_ops     = arg_or(argc, argv, 1, 200'000);
    const std::size_t num_threads = arg_or(argc, argv, 2, 8);
    const std::size_t num_links   = arg_or(argc, argv, 3, 1'000);

    fprintf(stdout,
        "Shortlink Resolver Benchmark\n"
        "============================\n"
        "Resolutions: %zu\n"
        "Threads:     %zu\n"
        "Links:       %zu (cache %zu)\n",
        num_ops, num_threads, num_links, std::max<std::size_t>(1, num_links / 4));

    shortlink::MemoryLinkStore    links;
    shortlink::MemoryCounterStore counters;
    shortlink::SteadyClock        steady;
    shortlink::MemoryLeaseStore   leases{steady};

    shortlink::Resolver    resolver{links, counters, std::max<std::size_t>(1, num_links / 4)};
    shortlink::VisitRecorder recorder{links};
    resolver.set_visit_recorder(&recorder);
    shortlink::LinkService service{links, counters, resolver};

    std::vector<std::string> codes;
    codes.reserve(num_links);
    for (std::size_t i = 0; i < num_links; ++i) {
        shortlink::ShortLink created;
        std::string code = "b" + std::to_string(i);
        if (auto ec = service.create_link(code, "https://example.com/" + code, std::nullopt, created)) {
            fprintf(stderr, "create %s failed: %s\n", code.c_str(), ec.message().c_str());
            return 1;
        }
        codes.push_back(std::move(code));
    }

    shortlink::ReconcilerOptions options;
    options.owner_id  = "bench";
    options.lease_ttl = std::chrono::milliseconds{5000};
    shortlink::Reconciler reconciler{links, counters, leases, steady, options};

    std::atomic<bool> load_done{false};
    std::size_t passes = 0;
    std::thread reconcile_thread([&] {
        while (!load_done.load(std::memory_order_acquire)) {
            reconciler.run_pass();
            ++passes;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    });

    std::vector<std::vector<int64_t>> per_thread(num_threads);
    std::atomic<std::size_t> failures{0};
    std::vector<std::thread> workers;
    workers.reserve(num_threads);

    const auto start = clock_type::now();
    for (std::size_t t = 0; t < num_threads; ++t) {
        const std::size_t share = num_ops / num_threads + (t < num_ops % num_threads ? 1 : 0);
        workers.emplace_back([&, t, share] {
            std::mt19937_64 rng{t + 1};
            std::uniform_int_distribution<std::size_t> pick{0, codes.size() - 1};
            auto& latencies = per_thread[t];
            latencies.reserve(share);

            std::string target;
            shortlink::VisitDetails details;
            details.ip_address = "10.0.0." + std::to_string(t + 1);
            details.user_agent = "shortlink-bench";
            for (std::size_t i = 0; i < share; ++i) {
                const auto& code = codes[pick(rng)];
                auto t0 = clock_type::now();
                auto ec = resolver.resolve(code, details, target);
                auto t1 = clock_type::now();
                if (ec) failures.fetch_add(1, std::memory_order_relaxed);
                latencies.push_back(std::chrono::duration_cast<ns>(t1 - t0).count());
            }
        });
    }
    for (auto& w : workers) w.join();
    const double elapsed = std::chrono::duration<double>(clock_type::now() - start).count();

    load_done.store(true, std::memory_order_release);
    reconcile_thread.join();
    reconciler.run_pass();

    std::vector<int64_t> latencies;
    latencies.reserve(num_ops);
    for (auto& v : per_thread) latencies.insert(latencies.end(), v.begin(), v.end());
    print_result("Resolve", compute_stats(latencies, elapsed));

    const auto hits   = resolver.cache().hits();
    const auto misses = resolver.cache().misses();
    fprintf(stdout,
        "\n── Cache ──\n"
        "  Hits:         %llu\n"
        "  Misses:       %llu\n"
        "  Hit ratio:    %.1f%%\n"
        "  Evictions:    %llu\n",
        static_cast<unsigned long long>(hits),
        static_cast<unsigned long long>(misses),
        hits + misses ? 100.0 * static_cast<double>(hits) / static_cast<double>(hits + misses) : 0.0,
        static_cast<unsigned long long>(resolver.cache().evictions()));

    recorder.flush();
    fprintf(stdout,
        "\n── Visit log ──\n"
        "  Written:      %llu\n"
        "  Dropped:      %llu\n"
        "  Failed:       %llu\n",
        static_cast<unsigned long long>(recorder.written()),
        static_cast<unsigned long long>(recorder.dropped()),
        static_cast<unsigned long long>(recorder.failed()));

    // Conservation: committed + pending must equal successful resolutions.
    std::vector<shortlink::LinkStats> stats;
    if (auto ec = service.all_stats(stats)) {
        fprintf(stderr, "stats failed: %s\n", ec.message().c_str());
        return 1;
    }
    uint64_t accounted = 0;
    for (const auto& s : stats) accounted += s.total();
    const uint64_t expected = num_ops - failures.load();

    fprintf(stdout,
        "\n── Conservation ──\n"
        "  Reconcile passes: %zu\n"
        "  Resolutions:      %llu\n"
        "  Accounted visits: %llu  %s\n\n",
        passes + 1,
        static_cast<unsigned long long>(expected),
        static_cast<unsigned long long>(accounted),
        accounted == expected ? "OK" : "MISMATCH");

    return accounted == expected ? 0 : 1;
}
