#include "lease/redis_lease_store.hpp"

#include "common/error.hpp"

namespace shortlink {

using network::RespType;
using network::RespValue;

namespace {

constexpr const char* kExtendIfOwnerScript =
    "if redis.call('GET', KEYS[1]) == ARGV[1] then "
    "return redis.call('PEXPIRE', KEYS[1], ARGV[2]) "
    "else return 0 end";

constexpr const char* kReleaseIfOwnerScript =
    "if redis.call('GET', KEYS[1]) == ARGV[1] then "
    "return redis.call('DEL', KEYS[1]) "
    "else return 0 end";

} // anonymous namespace

RedisLeaseStore::RedisLeaseStore(network::RespClient& client,
                                 std::string lease_key,
                                 std::shared_ptr<spdlog::logger> logger)
    : client_(client),
      lease_key_(std::move(lease_key)),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

std::error_code RedisLeaseStore::run(const std::vector<std::string>& args,
                                     RespValue& reply) {
    if (auto ec = client_.execute(args, reply)) {
        logger_->warn("Lease {} on {} failed: {}", args.front(), lease_key_, ec.message());
        return Errc::counter_store_unavailable;
    }
    if (reply.is_error()) {
        logger_->warn("Lease {} on {} rejected: {}", args.front(), lease_key_, reply.str);
        return Errc::counter_store_unavailable;
    }
    return {};
}

std::error_code RedisLeaseStore::extend_if_owner(const std::string& owner_id, bool& extended) {
    RespValue reply;
    if (auto ec = run({"EVAL", kExtendIfOwnerScript, "1", lease_key_, owner_id,
                       std::to_string(ttl_ms_.load())}, reply)) {
        return ec;
    }
    extended = reply.type == RespType::Integer && reply.integer == 1;
    return {};
}

std::error_code RedisLeaseStore::acquire(const std::string& owner_id,
                                         std::chrono::milliseconds ttl) {
    ttl_ms_.store(ttl.count());

    RespValue reply;
    if (auto ec = run({"SET", lease_key_, owner_id, "NX", "PX",
                       std::to_string(ttl.count())}, reply)) {
        return ec;
    }
    if (reply.type == RespType::SimpleString && reply.str == "OK") {
        return {};
    }

    // Key exists: granted only if we are the holder already.
    bool extended = false;
    if (auto ec = extend_if_owner(owner_id, extended)) {
        return ec;
    }
    return extended ? std::error_code{} : make_error_code(Errc::lease_denied);
}

std::error_code RedisLeaseStore::renew(const std::string& owner_id) {
    if (ttl_ms_.load() <= 0) {
        return Errc::lease_expired;  // never acquired
    }
    bool extended = false;
    if (auto ec = extend_if_owner(owner_id, extended)) {
        return ec;
    }
    return extended ? std::error_code{} : make_error_code(Errc::lease_expired);
}

std::error_code RedisLeaseStore::release(const std::string& owner_id) {
    RespValue reply;
    if (auto ec = run({"EVAL", kReleaseIfOwnerScript, "1", lease_key_, owner_id}, reply)) {
        return ec;
    }
    return {};
}

} // namespace shortlink
