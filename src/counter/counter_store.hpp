#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace shortlink {

// ── CounterStore ─────────────────────────────────────────────────────────────
//
// Fast, shared store of per-code visit deltas accumulated since the last
// reconciliation.  Every mutating operation is a single atomic primitive of
// the backing store; callers never read-modify-write.
//
// Taking a delta is two-phase so that a lost reply never loses visits:
//
//   take_and_reset   delta(code) moves into the code's in-flight slot
//   commit_taken     the slot is dropped once its value is durable
//   restore_taken    or folded back into delta(code) if it could not be
//
// A slot nobody settled (the reply to the take was lost, or the process died)
// is picked up again by the next take of that code.
//
// Implementations must be thread-safe.  Failures are reported as
// Errc::counter_store_unavailable.

class CounterStore {
public:
    virtual ~CounterStore() = default;

    // delta(code) += by; `new_value` receives the post-increment value.
    [[nodiscard]] virtual std::error_code increment(std::string_view code,
                                                    int64_t by,
                                                    int64_t& new_value) = 0;

    // Atomically move delta(code) into the in-flight slot and report the
    // slot's total in `taken` (0 when both are absent).  Increments land
    // either before (and are taken) or after (and remain pending); never
    // both, never neither.
    [[nodiscard]] virtual std::error_code take_and_reset(std::string_view code,
                                                         int64_t& taken) = 0;

    // Drop the in-flight slot of `code`.
    [[nodiscard]] virtual std::error_code commit_taken(std::string_view code) = 0;

    // Atomically add the in-flight slot back to delta(code) and drop the slot.
    // `pending` receives the resulting delta.
    [[nodiscard]] virtual std::error_code restore_taken(std::string_view code,
                                                        int64_t& pending) = 0;

    // Unreconciled visits of `code`: delta plus in-flight (0 when absent).
    [[nodiscard]] virtual std::error_code peek(std::string_view code,
                                               int64_t& value) = 0;

    // Codes that currently have a delta or an in-flight slot.  May include
    // entries whose value is zero; the Reconciler treats those as no-ops.
    [[nodiscard]] virtual std::error_code pending_codes(std::vector<std::string>& out) = 0;
};

} // namespace shortlink
