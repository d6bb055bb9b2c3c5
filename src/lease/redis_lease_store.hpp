#pragma once

#include "lease/lease_store.hpp"
#include "network/resp_client.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <memory>
#include <string>

namespace shortlink {

// ── RedisLeaseStore ──────────────────────────────────────────────────────────
//
// LeaseStore on the shared Redis-compatible server.  The lease is a single
// key whose value is the owner id and whose PX expiry is the TTL:
//
//   acquire  SET <key> <owner> NX PX <ttl>; when the key exists, an
//            owner-checked PEXPIRE script lets the current holder re-acquire
//   renew    EVAL: PEXPIRE only if GET <key> == owner
//   release  EVAL: DEL only if GET <key> == owner
//
// The owner checks run server-side so a lease that expired and was taken
// over is never extended or deleted by its previous holder.

class RedisLeaseStore final : public LeaseStore {
public:
    RedisLeaseStore(network::RespClient& client,
                    std::string lease_key,
                    std::shared_ptr<spdlog::logger> logger = {});

    [[nodiscard]] std::error_code acquire(const std::string& owner_id,
                                          std::chrono::milliseconds ttl) override;
    [[nodiscard]] std::error_code renew(const std::string& owner_id) override;
    [[nodiscard]] std::error_code release(const std::string& owner_id) override;

private:
    [[nodiscard]] std::error_code run(const std::vector<std::string>& args,
                                      network::RespValue& reply);

    // Owner-checked PEXPIRE; `extended` is true when the key was ours.
    [[nodiscard]] std::error_code extend_if_owner(const std::string& owner_id,
                                                  bool& extended);

    network::RespClient&            client_;
    std::string                     lease_key_;
    std::shared_ptr<spdlog::logger> logger_;
    std::atomic<int64_t>            ttl_ms_{0};
};

} // namespace shortlink
