#pragma once

#include "common/clock.hpp"
#include "counter/counter_store.hpp"
#include "lease/lease_store.hpp"
#include "link/link_store.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace shortlink {

// ── PassReport ───────────────────────────────────────────────────────────────
// Outcome of one reconciliation pass.

struct PassReport {
    bool        lease_acquired = false;  // false: another owner ran (or store down)
    bool        lease_lost     = false;  // renewal failed mid-pass
    bool        backed_off     = false;  // stopped after consecutive durable failures
    bool        stopped        = false;  // request_stop() honoured mid-pass

    std::size_t codes_scanned  = 0;      // pending codes listed
    std::size_t codes_merged   = 0;      // non-zero deltas applied
    uint64_t    visits_merged  = 0;      // sum of applied deltas
    std::size_t compensated    = 0;      // durable failure, delta restored
    std::size_t orphaned       = 0;      // delta for a code with no link, discarded
    std::size_t parked         = 0;      // durable failure AND restore failed; stays in flight
    std::size_t skipped        = 0;      // counter store failure, left for next pass
    std::size_t uncommitted    = 0;      // merged, but the in-flight slot could not be dropped

    // Durable store trouble in this pass (the scheduler tracks streaks).
    [[nodiscard]] bool degraded() const noexcept {
        return backed_off || compensated > 0 || parked > 0;
    }
};

struct ReconcilerOptions {
    std::string               owner_id;
    std::chrono::milliseconds lease_ttl{60000};
    uint32_t                  max_consecutive_failures = 8;

    // After a completed pass, keep the lease for this long instead of
    // releasing it, so the same owner runs the next pass.  Zero releases.
    std::chrono::milliseconds hold_lease_for{0};
};

// ── Reconciler ───────────────────────────────────────────────────────────────
//
// Folds pending visit deltas from the counter store into the durable visit
// counts.  One run_pass():
//
//   acquire lease ─ denied ──> return (another process is reconciling)
//        │
//   pending_codes()
//        │
//   for each code (independently):
//        take_and_reset ─ fails ──> skip, retried next pass
//        delta == 0     ──> nothing to do
//        add_to_visit_count(delta)
//           ok                         ──> commit_taken: merged
//           not_found                  ──> commit_taken: orphaned delta discarded
//           durable_store_unavailable  ──> restore_taken: compensated
//        │
//   release lease (or hold it for `hold_lease_for`)
//
// A taken delta stays in the counter store's in-flight slot until it is
// committed or restored, so a take whose reply was lost, or a restore that
// failed, is picked up again by the next take of that code.
//
// The lease is renewed before a code unit once a third of its TTL has passed;
// a failed renewal ends the pass.  request_stop() is checked only between code
// units, so a captured delta is always either applied or restored.
//
// run_pass() must not be called concurrently on the same instance.

class Reconciler {
public:
    Reconciler(LinkStore& links,
               CounterStore& counters,
               LeaseStore& leases,
               const Clock& clock,
               ReconcilerOptions options,
               std::shared_ptr<spdlog::logger> logger = {});

    Reconciler(const Reconciler&)            = delete;
    Reconciler& operator=(const Reconciler&) = delete;

    PassReport run_pass();

    // Give up a lease kept by `hold_lease_for`.  Called once the owner stops
    // running passes.
    void release_lease();

    // Ask an in-flight (or the next) pass to stop at the next code boundary.
    // Safe to call from any thread.
    void request_stop() noexcept { stop_requested_.store(true, std::memory_order_release); }

    [[nodiscard]] bool stop_requested() const noexcept {
        return stop_requested_.load(std::memory_order_acquire);
    }

    [[nodiscard]] const ReconcilerOptions& options() const noexcept { return options_; }

private:
    // Result of one take/merge/compensate unit.
    enum class UnitResult : uint8_t {
        Empty,
        Merged,
        Orphaned,
        Compensated,
        Parked,
        Skipped,
    };

    UnitResult reconcile_code(const std::string& code, int64_t& delta, bool& committed);

    LinkStore&                      links_;
    CounterStore&                   counters_;
    LeaseStore&                     leases_;
    const Clock&                    clock_;
    ReconcilerOptions               options_;
    std::shared_ptr<spdlog::logger> logger_;
    std::atomic<bool>               stop_requested_{false};
};

} // namespace shortlink
