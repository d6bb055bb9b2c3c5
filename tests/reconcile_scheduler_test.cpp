#include "reconcile/reconcile_scheduler.hpp"
#include "common/clock.hpp"
#include "counter/memory_counter_store.hpp"
#include "lease/memory_lease_store.hpp"
#include "link/memory_link_store.hpp"
#include "reconcile/interval_timer.hpp"
#include "reconcile/reconciler.hpp"

#include "test_doubles.hpp"

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace shortlink {

using namespace std::chrono_literals;

// Elapses immediately and records the interval it was asked for; cancels
// itself after `budget` waits.
class RecordingTimer final : public IntervalTimer {
public:
    explicit RecordingTimer(std::vector<std::chrono::milliseconds>& requested, int budget)
        : requested_(requested), budget_(budget) {}

    boost::asio::awaitable<bool> wait(std::chrono::milliseconds interval) override {
        if (cancelled_) co_return false;
        requested_.push_back(interval);
        if (--budget_ < 0) cancelled_ = true;
        co_return !cancelled_;
    }
    void cancel() override { cancelled_ = true; }
    [[nodiscard]] bool cancelled() const override { return cancelled_; }

private:
    std::vector<std::chrono::milliseconds>& requested_;
    int  budget_;
    bool cancelled_ = false;
};

// ── Fixture ───────────────────────────────────────────────────────────────────

class ReconcileSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ShortLink link;
        link.code       = "abc123";
        link.target_url = "https://example.com";
        ASSERT_FALSE(memory_links_.create(link));
    }

    void add_pending(int64_t n) {
        int64_t v = 0;
        ASSERT_FALSE(memory_counters_.increment("abc123", n, v));
    }

    uint64_t committed() {
        ShortLink link;
        EXPECT_FALSE(memory_links_.get("abc123", link));
        return link.visit_count;
    }

    static ReconcilerOptions options() {
        ReconcilerOptions opts;
        opts.owner_id  = "worker-a";
        opts.lease_ttl = 3000ms;
        return opts;
    }

    boost::asio::io_context ioc_;
    MockClock               clock_;
    MemoryLinkStore         memory_links_;
    MemoryCounterStore      memory_counters_;
    testing::FlakyLinkStore links_{memory_links_};
    MemoryLeaseStore        leases_{clock_};
    Reconciler              reconciler_{links_, memory_counters_, leases_, clock_, options()};
};

// ── Periodic passes ───────────────────────────────────────────────────────────

TEST_F(ReconcileSchedulerTest, RunsPassesOnInterval) {
    ReconcileScheduler scheduler{ioc_, reconciler_, 10ms};
    add_pending(4);

    int seen = 0;
    scheduler.set_on_pass([&](const PassReport&) {
        if (++seen == 3) scheduler.stop();
    });
    scheduler.start();
    ioc_.run();

    EXPECT_EQ(scheduler.passes_run(), 3u);
    EXPECT_EQ(committed(), 4u);
}

TEST_F(ReconcileSchedulerTest, PicksUpVisitsBetweenPasses) {
    ReconcileScheduler scheduler{ioc_, reconciler_, 10ms};
    add_pending(1);

    int seen = 0;
    scheduler.set_on_pass([&](const PassReport& report) {
        EXPECT_TRUE(report.lease_acquired);
        if (++seen == 3) {
            scheduler.stop();
        } else {
            add_pending(2);
        }
    });
    scheduler.start();
    ioc_.run();

    EXPECT_EQ(committed(), 5u);
}

TEST_F(ReconcileSchedulerTest, WaitsConfiguredIntervalBeforeEveryPass) {
    std::vector<std::chrono::milliseconds> requested;
    ReconcileScheduler scheduler{ioc_, reconciler_, 5min, nullptr,
                                 std::make_unique<RecordingTimer>(requested, 2)};
    add_pending(6);
    scheduler.start();
    ioc_.run();

    EXPECT_EQ(scheduler.passes_run(), 2u);
    ASSERT_EQ(requested.size(), 3u);
    for (const auto& interval : requested) {
        EXPECT_EQ(interval, std::chrono::milliseconds{5min});
    }
    EXPECT_EQ(committed(), 6u);
}

// ── Stop ──────────────────────────────────────────────────────────────────────

TEST_F(ReconcileSchedulerTest, StopCancelsPendingWait) {
    ReconcileScheduler scheduler{ioc_, reconciler_, 10s};
    scheduler.start();

    boost::asio::steady_timer stopper{ioc_, 20ms};
    stopper.async_wait([&](const boost::system::error_code&) { scheduler.stop(); });

    const auto start = std::chrono::steady_clock::now();
    ioc_.run();

    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    EXPECT_EQ(scheduler.passes_run(), 0u);
    EXPECT_TRUE(reconciler_.stop_requested());
}

TEST_F(ReconcileSchedulerTest, StopIsIdempotent) {
    ReconcileScheduler scheduler{ioc_, reconciler_, 10ms};
    scheduler.set_on_pass([&](const PassReport&) {
        scheduler.stop();
        scheduler.stop();
    });
    scheduler.start();
    ioc_.run();
    scheduler.stop();

    EXPECT_EQ(scheduler.passes_run(), 1u);
}

// The lease is kept between passes and given up when the scheduler stops.
TEST_F(ReconcileSchedulerTest, HeldLeaseIsReleasedOnStop) {
    auto held = options();
    held.hold_lease_for = 1s;
    Reconciler reconciler{links_, memory_counters_, leases_, clock_, held};
    ReconcileScheduler scheduler{ioc_, reconciler, 5ms};
    add_pending(2);

    int seen = 0;
    scheduler.set_on_pass([&](const PassReport& report) {
        EXPECT_TRUE(report.lease_acquired);
        EXPECT_EQ(leases_.holder(), std::optional<std::string>("worker-a"));
        if (++seen == 2) scheduler.stop();
    });
    scheduler.start();
    ioc_.run();

    EXPECT_EQ(scheduler.passes_run(), 2u);
    EXPECT_FALSE(leases_.holder().has_value());
    EXPECT_EQ(committed(), 2u);
}

// ── Degraded streaks ──────────────────────────────────────────────────────────

TEST_F(ReconcileSchedulerTest, CountsConsecutiveDegradedPasses) {
    ReconcileScheduler scheduler{ioc_, reconciler_, 5ms};
    add_pending(3);
    links_.fail_merges = true;

    // One full alarm period of failing passes, then a healthy one.
    constexpr uint32_t kFailing = ReconcileScheduler::kDegradedAlarmEvery + 1;
    uint32_t peak = 0;
    uint32_t seen = 0;
    scheduler.set_on_pass([&](const PassReport& report) {
        ++seen;
        if (seen <= kFailing) {
            EXPECT_TRUE(report.degraded());
            peak = scheduler.consecutive_degraded();
        }
        if (seen == kFailing) {
            links_.fail_merges = false;  // store recovers
        }
        if (seen == kFailing + 1) {
            scheduler.stop();
        }
    });
    scheduler.start();
    ioc_.run();

    EXPECT_EQ(peak, kFailing);
    EXPECT_EQ(scheduler.consecutive_degraded(), 0u);
    EXPECT_EQ(committed(), 3u);
}

} // namespace shortlink
