#include "reconcile/reconciler.hpp"

#include "common/error.hpp"

#include <vector>

namespace shortlink {

Reconciler::Reconciler(LinkStore& links,
                       CounterStore& counters,
                       LeaseStore& leases,
                       const Clock& clock,
                       ReconcilerOptions options,
                       std::shared_ptr<spdlog::logger> logger)
    : links_(links),
      counters_(counters),
      leases_(leases),
      clock_(clock),
      options_(std::move(options)),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

// ── One code ──────────────────────────────────────────────────────────────────

Reconciler::UnitResult Reconciler::reconcile_code(const std::string& code, int64_t& delta,
                                                  bool& committed) {
    delta = 0;
    committed = true;
    if (auto ec = counters_.take_and_reset(code, delta)) {
        logger_->warn("'{}': take_and_reset failed ({}), retrying next pass",
                      code, ec.message());
        return UnitResult::Skipped;
    }
    if (delta == 0) {
        return UnitResult::Empty;
    }

    int64_t pending = 0;
    if (delta < 0) {
        // Visit counts never decrease; put the value back for an operator.
        logger_->error("'{}': negative pending delta {}, leaving it untouched", code, delta);
        if (auto ec = counters_.restore_taken(code, pending)) {
            logger_->error("'{}': could not restore delta {} ({}), it stays in flight",
                           code, delta, ec.message());
        }
        return UnitResult::Skipped;
    }

    const auto merge_ec = links_.add_to_visit_count(code, static_cast<uint64_t>(delta));
    if (!merge_ec || merge_ec == Errc::not_found) {
        if (merge_ec) {
            logger_->warn("'{}': no such link, discarding {} orphaned visits", code, delta);
        } else {
            logger_->debug("'{}': merged {} visits", code, delta);
        }
        if (auto ec = counters_.commit_taken(code)) {
            committed = false;
            logger_->error("'{}': could not drop in-flight delta {} ({}), "
                           "it may be applied again", code, delta, ec.message());
        }
        return merge_ec ? UnitResult::Orphaned : UnitResult::Merged;
    }

    // Durable store failed: fold the delta back so the next pass retries it.
    if (auto ec = counters_.restore_taken(code, pending)) {
        logger_->error("'{}': merge failed ({}) and restore failed ({}); "
                       "{} visits stay in flight until the next pass",
                       code, merge_ec.message(), ec.message(), delta);
        return UnitResult::Parked;
    }
    logger_->warn("'{}': merge failed ({}), restored {} visits (pending now {})",
                  code, merge_ec.message(), delta, pending);
    return UnitResult::Compensated;
}

// ── One pass ──────────────────────────────────────────────────────────────────

PassReport Reconciler::run_pass() {
    PassReport report;

    if (stop_requested()) {
        report.stopped = true;
        return report;
    }

    if (auto ec = leases_.acquire(options_.owner_id, options_.lease_ttl)) {
        if (ec == Errc::lease_denied) {
            logger_->debug("Reconcile lease held elsewhere, skipping pass");
        } else {
            logger_->warn("Reconcile lease unavailable ({}), skipping pass", ec.message());
        }
        return report;
    }
    report.lease_acquired = true;
    auto last_renewal = clock_.now();
    const auto renew_after = options_.lease_ttl / 3;

    std::vector<std::string> codes;
    if (auto ec = counters_.pending_codes(codes)) {
        logger_->warn("Listing pending codes failed ({}), skipping pass", ec.message());
        release_lease();
        return report;
    }
    report.codes_scanned = codes.size();

    uint32_t consecutive_failures = 0;
    for (const auto& code : codes) {
        if (stop_requested()) {
            report.stopped = true;
            logger_->info("Stop requested, ending pass early");
            break;
        }

        if (clock_.elapsed_since(last_renewal) >= renew_after) {
            if (auto ec = leases_.renew(options_.owner_id)) {
                report.lease_lost = true;
                logger_->error("Reconcile lease lost mid-pass ({}), ending pass", ec.message());
                break;
            }
            last_renewal = clock_.now();
        }

        int64_t delta = 0;
        bool committed = true;
        switch (reconcile_code(code, delta, committed)) {
            case UnitResult::Empty:
                break;
            case UnitResult::Merged:
                ++report.codes_merged;
                report.visits_merged += static_cast<uint64_t>(delta);
                consecutive_failures = 0;
                break;
            case UnitResult::Orphaned:
                ++report.orphaned;
                break;
            case UnitResult::Compensated:
                ++report.compensated;
                ++consecutive_failures;
                break;
            case UnitResult::Parked:
                ++report.parked;
                ++consecutive_failures;
                break;
            case UnitResult::Skipped:
                ++report.skipped;
                break;
        }
        if (!committed) {
            ++report.uncommitted;
        }

        if (consecutive_failures >= options_.max_consecutive_failures) {
            report.backed_off = true;
            logger_->warn("{} consecutive durable store failures, deferring the rest of the pass",
                          consecutive_failures);
            break;
        }
    }

    if (!report.lease_lost) {
        if (options_.hold_lease_for.count() > 0 && !report.stopped) {
            if (auto ec = leases_.acquire(options_.owner_id, options_.hold_lease_for)) {
                logger_->warn("Could not hold lease until next pass ({})", ec.message());
            }
        } else {
            release_lease();
        }
    }

    logger_->info("Reconcile pass: scanned={} merged={} visits={} compensated={} "
                  "orphaned={} parked={} skipped={} uncommitted={}{}",
                  report.codes_scanned, report.codes_merged, report.visits_merged,
                  report.compensated, report.orphaned, report.parked, report.skipped,
                  report.uncommitted, report.backed_off ? " (backed off)" : "");
    return report;
}

void Reconciler::release_lease() {
    if (auto ec = leases_.release(options_.owner_id)) {
        logger_->warn("Lease release failed ({}), it will expire on its own", ec.message());
    }
}

} // namespace shortlink
