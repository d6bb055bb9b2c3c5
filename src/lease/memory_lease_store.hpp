#pragma once

#include "common/clock.hpp"
#include "lease/lease_store.hpp"

#include <mutex>
#include <optional>
#include <string>

namespace shortlink {

// In-process LeaseStore: coordinates Reconcilers that share one process (and
// tests).  Expiry is evaluated against the injected Clock.
class MemoryLeaseStore final : public LeaseStore {
public:
    explicit MemoryLeaseStore(const Clock& clock);

    [[nodiscard]] std::error_code acquire(const std::string& owner_id,
                                          std::chrono::milliseconds ttl) override;
    [[nodiscard]] std::error_code renew(const std::string& owner_id) override;
    [[nodiscard]] std::error_code release(const std::string& owner_id) override;

    // Current unexpired holder, if any.
    [[nodiscard]] std::optional<std::string> holder() const;

private:
    struct Lease {
        std::string               owner;
        Clock::time_point         expires_at;
        std::chrono::milliseconds ttl;
    };

    const Clock&         clock_;
    mutable std::mutex   mutex_;
    std::optional<Lease> lease_;
};

} // namespace shortlink
