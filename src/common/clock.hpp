#pragma once

#include <atomic>
#include <chrono>

namespace shortlink {

// ── Clock ────────────────────────────────────────────────────────────────────
//
// Monotonic time as seen by lease bookkeeping: MemoryLeaseStore decides
// expiry with it and the Reconciler decides when a held lease is due for
// renewal.  Redis-backed leases expire on the server's clock instead.

class Clock {
public:
    using duration   = std::chrono::steady_clock::duration;
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    [[nodiscard]] virtual time_point now() const = 0;

    [[nodiscard]] duration elapsed_since(time_point earlier) const {
        return now() - earlier;
    }
};

class SteadyClock final : public Clock {
public:
    [[nodiscard]] time_point now() const override {
        return std::chrono::steady_clock::now();
    }
};

// ── MockClock ────────────────────────────────────────────────────────────────
//
// Starts at the epoch and moves only through advance().  The tick count is
// atomic so a test thread may advance it while a pass reads it, as the
// reconciler's lease-renewal tests do from inside a store hook.

class MockClock final : public Clock {
public:
    [[nodiscard]] time_point now() const override {
        return time_point{duration{ticks_.load(std::memory_order_acquire)}};
    }

    void advance(std::chrono::milliseconds delta) {
        ticks_.fetch_add(std::chrono::duration_cast<duration>(delta).count(),
                         std::memory_order_acq_rel);
    }

private:
    std::atomic<duration::rep> ticks_{0};
};

} // namespace shortlink
