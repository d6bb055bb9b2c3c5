#include "lease/memory_lease_store.hpp"

#include "common/error.hpp"

namespace shortlink {

MemoryLeaseStore::MemoryLeaseStore(const Clock& clock)
    : clock_(clock) {}

std::error_code MemoryLeaseStore::acquire(const std::string& owner_id,
                                          std::chrono::milliseconds ttl) {
    std::lock_guard lock(mutex_);
    const auto now = clock_.now();
    if (lease_ && lease_->expires_at > now && lease_->owner != owner_id) {
        return Errc::lease_denied;
    }
    lease_ = Lease{owner_id, now + ttl, ttl};
    return {};
}

std::error_code MemoryLeaseStore::renew(const std::string& owner_id) {
    std::lock_guard lock(mutex_);
    const auto now = clock_.now();
    if (!lease_ || lease_->owner != owner_id || lease_->expires_at <= now) {
        return Errc::lease_expired;
    }
    lease_->expires_at = now + lease_->ttl;
    return {};
}

std::error_code MemoryLeaseStore::release(const std::string& owner_id) {
    std::lock_guard lock(mutex_);
    if (lease_ && lease_->owner == owner_id) {
        lease_.reset();
    }
    return {};
}

std::optional<std::string> MemoryLeaseStore::holder() const {
    std::lock_guard lock(mutex_);
    if (!lease_ || lease_->expires_at <= clock_.now()) {
        return std::nullopt;
    }
    return lease_->owner;
}

} // namespace shortlink
