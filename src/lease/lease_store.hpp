#pragma once

#include <chrono>
#include <string>
#include <system_error>

namespace shortlink {

// ── LeaseStore ───────────────────────────────────────────────────────────────
//
// Time-bounded exclusive token guarding reconciliation passes: at most one
// owner holds an unexpired lease at any instant.  A holder that dies simply
// stops renewing and the lease becomes available once its TTL runs out.
//
// Results:
//   acquire  {} granted (also when `owner_id` already holds it; TTL restarts)
//            Errc::lease_denied               another owner holds it
//   renew    {} TTL restarted from now
//            Errc::lease_expired              not held by `owner_id` any more
//   release  {} (no-op if `owner_id` is not the holder)
// Any of them may fail with Errc::counter_store_unavailable when the backing
// store cannot be reached.

class LeaseStore {
public:
    virtual ~LeaseStore() = default;

    [[nodiscard]] virtual std::error_code acquire(const std::string& owner_id,
                                                  std::chrono::milliseconds ttl) = 0;

    // Extends by the TTL given to the last successful acquire().
    [[nodiscard]] virtual std::error_code renew(const std::string& owner_id) = 0;

    [[nodiscard]] virtual std::error_code release(const std::string& owner_id) = 0;
};

} // namespace shortlink
