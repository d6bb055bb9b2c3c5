#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace shortlink::network {

// ── RESP value ───────────────────────────────────────────────────────────────
//
// One decoded RESP2 reply.  Null bulk strings ($-1) and null arrays (*-1)
// both decode to RespType::Null.

enum class RespType : uint8_t {
    Null         = 0,
    SimpleString = 1,
    Error        = 2,
    Integer      = 3,
    BulkString   = 4,
    Array        = 5,
};

struct RespValue {
    RespType               type = RespType::Null;
    std::string            str;       // SimpleString, Error, BulkString
    int64_t                integer = 0;
    std::vector<RespValue> elements;  // Array

    [[nodiscard]] bool is_null()  const noexcept { return type == RespType::Null; }
    [[nodiscard]] bool is_error() const noexcept { return type == RespType::Error; }
};

// ── Serializer ───────────────────────────────────────────────────────────────

// Encode a command as a RESP array of bulk strings:
//   *N\r\n$len\r\narg\r\n...
[[nodiscard]] std::string serialize_resp_command(const std::vector<std::string>& args);

// ── Incremental parser ───────────────────────────────────────────────────────

enum class ParseStatus : uint8_t {
    Complete   = 0,  // `out` holds one value, `consumed` bytes were used
    Incomplete = 1,  // need more bytes; nothing consumed
    Invalid    = 2,  // protocol violation; the connection must be dropped
};

// Upper bounds accepted from the wire.
inline constexpr int64_t  kMaxBulkLength = 512LL * 1024 * 1024;
inline constexpr int64_t  kMaxArrayCount = 1024 * 1024;
inline constexpr unsigned kMaxNesting    = 8;

// Try to decode one value from the front of `buf`.
[[nodiscard]] ParseStatus parse_resp_value(std::string_view buf,
                                           RespValue& out,
                                           std::size_t& consumed);

} // namespace shortlink::network
