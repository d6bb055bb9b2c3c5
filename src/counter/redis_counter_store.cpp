#include "counter/redis_counter_store.hpp"

#include "common/error.hpp"
#include "counter/counter_keys.hpp"

#include <charconv>

namespace shortlink {

using network::RespType;
using network::RespValue;

namespace {

// KEYS[1] = visits:<code>, KEYS[2] = visits-inflight:<code>
constexpr const char* kTakeScript =
    "local v = redis.call('GET', KEYS[1]) "
    "if v then "
    "redis.call('INCRBY', KEYS[2], v) "
    "redis.call('DEL', KEYS[1]) "
    "end "
    "local t = redis.call('GET', KEYS[2]) "
    "if t == '0' then redis.call('DEL', KEYS[2]) end "
    "return t";

// Same keys as kTakeScript.
constexpr const char* kRestoreScript =
    "local t = redis.call('GET', KEYS[2]) "
    "if t then "
    "redis.call('INCRBY', KEYS[1], t) "
    "redis.call('DEL', KEYS[2]) "
    "end "
    "return redis.call('GET', KEYS[1])";

constexpr const char* kScanBatch = "1000";

} // anonymous namespace

RedisCounterStore::RedisCounterStore(network::RespClient& client,
                                     std::shared_ptr<spdlog::logger> logger)
    : client_(client),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

std::error_code RedisCounterStore::run(const std::vector<std::string>& args,
                                       RespValue& reply) {
    if (auto ec = client_.execute(args, reply)) {
        logger_->warn("Counter store {} failed: {}", args.front(), ec.message());
        return Errc::counter_store_unavailable;
    }
    if (reply.is_error()) {
        logger_->warn("Counter store {} rejected: {}", args.front(), reply.str);
        return Errc::counter_store_unavailable;
    }
    return {};
}

void RedisCounterStore::decode_counter(std::string_view code, const RespValue& reply,
                                       int64_t& value) const {
    value = 0;
    if (reply.type == RespType::Integer) {
        value = reply.integer;
        return;
    }
    if (reply.type != RespType::BulkString) {
        return;  // null: no entry
    }
    const auto& s = reply.str;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        logger_->error("Counter for '{}' holds non-integer value '{}'", code, s);
        value = 0;
    }
}

std::error_code RedisCounterStore::increment(std::string_view code, int64_t by,
                                             int64_t& new_value) {
    RespValue reply;
    if (auto ec = run({"INCRBY", counter_key(code), std::to_string(by)}, reply)) {
        return ec;
    }
    if (reply.type != RespType::Integer) {
        logger_->warn("INCRBY for '{}' returned unexpected reply type", code);
        return Errc::counter_store_unavailable;
    }
    new_value = reply.integer;
    return {};
}

std::error_code RedisCounterStore::take_and_reset(std::string_view code, int64_t& taken) {
    RespValue reply;
    if (auto ec = run({"EVAL", kTakeScript, "2", counter_key(code), in_flight_key(code)},
                      reply)) {
        return ec;
    }
    decode_counter(code, reply, taken);
    return {};
}

std::error_code RedisCounterStore::commit_taken(std::string_view code) {
    RespValue reply;
    return run({"DEL", in_flight_key(code)}, reply);
}

std::error_code RedisCounterStore::restore_taken(std::string_view code, int64_t& pending) {
    RespValue reply;
    if (auto ec = run({"EVAL", kRestoreScript, "2", counter_key(code), in_flight_key(code)},
                      reply)) {
        return ec;
    }
    decode_counter(code, reply, pending);
    return {};
}

std::error_code RedisCounterStore::peek(std::string_view code, int64_t& value) {
    RespValue reply;
    if (auto ec = run({"MGET", counter_key(code), in_flight_key(code)}, reply)) {
        return ec;
    }
    if (reply.type != RespType::Array || reply.elements.size() != 2) {
        logger_->warn("MGET for '{}' returned malformed reply", code);
        return Errc::counter_store_unavailable;
    }
    int64_t pending = 0;
    int64_t in_flight = 0;
    decode_counter(code, reply.elements[0], pending);
    decode_counter(code, reply.elements[1], in_flight);
    value = pending + in_flight;
    return {};
}

template <typename KeyToCode>
std::error_code RedisCounterStore::scan_codes(std::string_view pattern,
                                              KeyToCode to_code,
                                              std::unordered_set<std::string>& seen,
                                              std::vector<std::string>& out) {
    std::string cursor = "0";
    do {
        RespValue reply;
        if (auto ec = run({"SCAN", cursor, "MATCH", std::string{pattern},
                           "COUNT", kScanBatch}, reply)) {
            return ec;
        }
        if (reply.type != RespType::Array || reply.elements.size() != 2 ||
            reply.elements[1].type != RespType::Array) {
            logger_->warn("SCAN returned malformed reply");
            return Errc::counter_store_unavailable;
        }

        cursor = reply.elements[0].str;
        for (const auto& key : reply.elements[1].elements) {
            if (auto code = to_code(key.str)) {
                if (seen.insert(*code).second) {  // SCAN may repeat keys
                    out.push_back(std::move(*code));
                }
            }
        }
    } while (cursor != "0");
    return {};
}

std::error_code RedisCounterStore::pending_codes(std::vector<std::string>& out) {
    out.clear();
    std::unordered_set<std::string> seen;

    // Leftover in-flight slots first, so they are settled before new deltas.
    if (auto ec = scan_codes(kInFlightKeyPattern, code_from_in_flight_key, seen, out)) {
        return ec;
    }
    return scan_codes(kCounterKeyPattern, code_from_counter_key, seen, out);
}

} // namespace shortlink
