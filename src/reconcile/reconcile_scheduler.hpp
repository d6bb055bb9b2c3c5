#pragma once

#include "reconcile/reconciler.hpp"
#include "reconcile/interval_timer.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace shortlink {

// ── ReconcileScheduler ───────────────────────────────────────────────────────
//
// Runs Reconciler::run_pass() every `interval` from a coroutine on a strand
// of the given io_context.  The first pass happens one interval after start().
//
// stop() is safe from any thread (e.g. a signal handler): it asks the
// Reconciler to finish its current code unit and cancels the interval timer,
// after which the coroutine returns, giving up a lease the Reconciler was
// holding between passes.
//
// The wait between passes goes through an IntervalTimer; by default a
// SteadyIntervalTimer bound to the scheduler's strand.
//
// Consecutive degraded passes (durable store failing) are counted; every
// kDegradedAlarmEvery-th one in a row is logged at error level.

class ReconcileScheduler {
public:
    static constexpr uint32_t kDegradedAlarmEvery = 12;

    using PassCallback = std::function<void(const PassReport&)>;

    ReconcileScheduler(boost::asio::io_context& ioc,
                       Reconciler& reconciler,
                       std::chrono::milliseconds interval,
                       std::shared_ptr<spdlog::logger> logger = {},
                       std::unique_ptr<IntervalTimer> timer = {});

    ReconcileScheduler(const ReconcileScheduler&)            = delete;
    ReconcileScheduler& operator=(const ReconcileScheduler&) = delete;

    // Invoked on the strand after every pass.  Set before start().
    void set_on_pass(PassCallback cb) { on_pass_ = std::move(cb); }

    // Spawn the periodic loop.  Call once.
    void start();

    // Request shutdown; idempotent.
    void stop();

    [[nodiscard]] uint64_t passes_run() const noexcept {
        return passes_run_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] uint32_t consecutive_degraded() const noexcept {
        return consecutive_degraded_.load(std::memory_order_relaxed);
    }

private:
    boost::asio::awaitable<void> run_loop();

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    Reconciler&                     reconciler_;
    std::unique_ptr<IntervalTimer>  timer_;
    std::chrono::milliseconds       interval_;
    std::shared_ptr<spdlog::logger> logger_;
    PassCallback                    on_pass_;

    std::atomic<bool>               stopped_{false};
    std::atomic<uint64_t>           passes_run_{0};
    std::atomic<uint32_t>           consecutive_degraded_{0};
};

} // namespace shortlink
