#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace shortlink {

// ── ShortLink ─────────────────────────────────────────────────────────────────
// Durable record for one short code.  Everything except visit_count is
// immutable after creation; visit_count only grows, and only the Reconciler
// grows it.

struct ShortLink {
    std::string                           code;
    std::string                           target_url;
    std::chrono::system_clock::time_point created_at{};
    std::optional<std::string>            owner;
    uint64_t                              visit_count = 0;
};

// ── Visit log ────────────────────────────────────────────────────────────────
// Request metadata kept per visit, next to (not instead of) the visit count.

struct VisitDetails {
    std::string                ip_address;
    std::string                user_agent;
    std::optional<std::string> referrer;
    std::optional<std::string> country;   // ISO 3166-1 alpha-2
    std::optional<std::string> city;
};

struct VisitRecord {
    std::string                           code;
    std::chrono::system_clock::time_point visited_at{};
    VisitDetails                          details;
};

// Limits on what the durable store accepts.
inline constexpr std::size_t kMaxCodeLength      = 64;
inline constexpr std::size_t kMaxTargetUrlLength = 2048;

inline constexpr std::size_t kMaxIpAddressLength = 45;
inline constexpr std::size_t kMaxUserAgentLength = 255;
inline constexpr std::size_t kMaxReferrerLength  = 2048;
inline constexpr std::size_t kCountryCodeLength  = 2;
inline constexpr std::size_t kMaxCityLength      = 255;

// Returns Errc::invalid_code unless `code` is 1..kMaxCodeLength characters of
// [A-Za-z0-9_-].
[[nodiscard]] std::error_code validate_code(std::string_view code);

// Returns Errc::invalid_url unless `url` is an absolute http(s) URL with a
// non-empty host, no whitespace/control characters, and at most
// kMaxTargetUrlLength bytes.
[[nodiscard]] std::error_code validate_target_url(std::string_view url);

// Cut every field of `details` to the limits above.  Visit metadata comes from
// request headers and is stored best-effort, so it is clipped, not rejected.
void truncate_visit_details(VisitDetails& details);

} // namespace shortlink
