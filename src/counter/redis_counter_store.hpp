#pragma once

#include "counter/counter_store.hpp"
#include "network/resp_client.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <unordered_set>

namespace shortlink {

// ── RedisCounterStore ────────────────────────────────────────────────────────
//
// CounterStore on a Redis-compatible server shared by every process.
//
//   increment       INCRBY visits:<code> <by>
//   take_and_reset  EVAL: visits:<code> is added to visits-inflight:<code>
//                   and deleted; the in-flight total is returned
//   commit_taken    DEL visits-inflight:<code>
//   restore_taken   EVAL: visits-inflight:<code> is added back to
//                   visits:<code> and deleted
//   peek            MGET visits:<code> visits-inflight:<code>
//   pending_codes   SCAN <cursor> MATCH visits:* (then visits-inflight:*)
//                   COUNT 1000 until cursor 0
//
// Scripts run atomically on the server, so a take that executed but whose
// reply timed out leaves its value in the in-flight key for the next take.
//
// Any transport failure, timeout or error reply maps to
// Errc::counter_store_unavailable.

class RedisCounterStore final : public CounterStore {
public:
    explicit RedisCounterStore(network::RespClient& client,
                               std::shared_ptr<spdlog::logger> logger = {});

    [[nodiscard]] std::error_code increment(std::string_view code, int64_t by,
                                            int64_t& new_value) override;
    [[nodiscard]] std::error_code take_and_reset(std::string_view code,
                                                 int64_t& taken) override;
    [[nodiscard]] std::error_code commit_taken(std::string_view code) override;
    [[nodiscard]] std::error_code restore_taken(std::string_view code,
                                                int64_t& pending) override;
    [[nodiscard]] std::error_code peek(std::string_view code, int64_t& value) override;
    [[nodiscard]] std::error_code pending_codes(std::vector<std::string>& out) override;

private:
    // Execute and map failures/error replies to counter_store_unavailable.
    [[nodiscard]] std::error_code run(const std::vector<std::string>& args,
                                      network::RespValue& reply);

    // Decode a GET-style reply (null, integer or integer text) into `value`.
    void decode_counter(std::string_view code, const network::RespValue& reply,
                        int64_t& value) const;

    // One full SCAN over `pattern`; keys are mapped to codes by `to_code`.
    template <typename KeyToCode>
    [[nodiscard]] std::error_code scan_codes(std::string_view pattern,
                                             KeyToCode to_code,
                                             std::unordered_set<std::string>& seen,
                                             std::vector<std::string>& out);

    network::RespClient&            client_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace shortlink
