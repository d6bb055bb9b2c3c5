#pragma once

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>

namespace shortlink {

// ── IntervalTimer ────────────────────────────────────────────────────────────
//
// What the reconcile scheduler sleeps on between passes.  Cancellation is
// sticky: once cancel() has been called, the pending wait and every later
// one complete with false.

class IntervalTimer {
public:
    virtual ~IntervalTimer() = default;

    // Suspend for `interval`.  Returns true if the interval elapsed, false if
    // the timer was cancelled before or during the wait.
    virtual boost::asio::awaitable<bool> wait(std::chrono::milliseconds interval) = 0;

    virtual void cancel() = 0;

    [[nodiscard]] virtual bool cancelled() const = 0;
};

// ── SteadyIntervalTimer ──────────────────────────────────────────────────────
//
// Backed by a boost::asio::steady_timer.  Not thread-safe: wait() and cancel()
// must run on the executor the timer was built with (the scheduler's strand).

class SteadyIntervalTimer final : public IntervalTimer {
public:
    explicit SteadyIntervalTimer(boost::asio::any_io_executor executor);

    boost::asio::awaitable<bool> wait(std::chrono::milliseconds interval) override;
    void cancel() override;
    [[nodiscard]] bool cancelled() const override { return cancelled_; }

private:
    boost::asio::steady_timer timer_;
    bool                      cancelled_ = false;
};

} // namespace shortlink
