#pragma once

#include "core/lru_cache.hpp"
#include "core/visit_recorder.hpp"
#include "counter/counter_store.hpp"
#include "link/link_store.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace shortlink {

// ── Resolver ─────────────────────────────────────────────────────────────────
//
// Hot path: short code -> target URL, plus one visit recorded in the counter
// store.
//
//   1. Read-through LRU cache (target URLs never change, so no invalidation).
//   2. Cache miss: LinkStore::get(); the result populates the cache.
//   3. After a successful lookup, CounterStore::increment(code, 1).  Counter
//      failures are logged and swallowed – the redirect never fails because
//      of visit accounting.
//   4. When the caller passes VisitDetails and a VisitRecorder is attached,
//      the visit is queued for the visit log.
//
// Errors: Errc::not_found (unknown or malformed code, no visit recorded),
//         Errc::durable_store_unavailable (cache miss and store failure).
//
// Thread-safe; intended to be shared by every request-serving thread.

class Resolver {
public:
    Resolver(LinkStore& links,
             CounterStore& counters,
             std::size_t cache_capacity,
             std::shared_ptr<spdlog::logger> logger = {});

    Resolver(const Resolver&)            = delete;
    Resolver& operator=(const Resolver&) = delete;

    [[nodiscard]] std::error_code resolve(std::string_view code, std::string& target_url);

    [[nodiscard]] std::error_code resolve(std::string_view code,
                                          const VisitDetails& details,
                                          std::string& target_url);

    // Attach the visit log writer (not owned).  Call before the resolver is
    // shared between threads.
    void set_visit_recorder(VisitRecorder* recorder) noexcept { recorder_ = recorder; }

    // Seed the cache with a freshly created link.
    void prime(std::string code, std::string target_url);

    [[nodiscard]] const LruCache<std::string>& cache() const noexcept { return cache_; }

    // Increments that failed and were dropped since construction.
    [[nodiscard]] uint64_t dropped_visits() const noexcept {
        return dropped_visits_.load(std::memory_order_relaxed);
    }

private:
    std::error_code resolve_impl(std::string_view code,
                                 const VisitDetails* details,
                                 std::string& target_url);

    void record_visit(std::string_view code);

    LinkStore&                      links_;
    CounterStore&                   counters_;
    LruCache<std::string>           cache_;
    std::shared_ptr<spdlog::logger> logger_;
    VisitRecorder*                  recorder_ = nullptr;
    std::atomic<uint64_t>           dropped_visits_{0};
};

} // namespace shortlink
