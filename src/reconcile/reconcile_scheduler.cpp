#include "reconcile/reconcile_scheduler.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/dispatch.hpp>

namespace shortlink {

ReconcileScheduler::ReconcileScheduler(boost::asio::io_context& ioc,
                                       Reconciler& reconciler,
                                       std::chrono::milliseconds interval,
                                       std::shared_ptr<spdlog::logger> logger,
                                       std::unique_ptr<IntervalTimer> timer)
    : strand_(boost::asio::make_strand(ioc)),
      reconciler_(reconciler),
      timer_(timer ? std::move(timer) : std::make_unique<SteadyIntervalTimer>(strand_)),
      interval_(interval),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

void ReconcileScheduler::start() {
    logger_->info("Reconcile scheduler started (interval={}ms, owner={})",
                  interval_.count(), reconciler_.options().owner_id);
    boost::asio::co_spawn(strand_, run_loop(), boost::asio::detached);
}

void ReconcileScheduler::stop() {
    if (stopped_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    reconciler_.request_stop();

    // The timer is only touched on the strand.
    boost::asio::dispatch(strand_, [this]() {
        timer_->cancel();
    });
}

boost::asio::awaitable<void> ReconcileScheduler::run_loop() {
    while (!stopped_.load(std::memory_order_acquire)) {
        const bool elapsed = co_await timer_->wait(interval_);
        if (!elapsed || stopped_.load(std::memory_order_acquire)) {
            break;
        }

        const PassReport report = reconciler_.run_pass();
        passes_run_.fetch_add(1, std::memory_order_relaxed);

        if (report.lease_acquired && report.degraded()) {
            const auto streak = consecutive_degraded_.fetch_add(1, std::memory_order_relaxed) + 1;
            if (streak % kDegradedAlarmEvery == 0) {
                logger_->error("Durable link store degraded for {} consecutive passes; "
                               "visit deltas are accumulating in the counter store",
                               streak);
            }
        } else if (report.lease_acquired) {
            consecutive_degraded_.store(0, std::memory_order_relaxed);
        }

        if (on_pass_) {
            on_pass_(report);
        }
    }

    if (reconciler_.options().hold_lease_for.count() > 0) {
        reconciler_.release_lease();
    }
    logger_->info("Reconcile scheduler stopped after {} passes", passes_run());
}

} // namespace shortlink
