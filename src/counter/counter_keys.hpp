#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace shortlink {

// ── Shared key contract ──────────────────────────────────────────────────────
//
// Resolver processes and the Reconciler meet only in the fast store, so both
// sides build and parse keys exclusively through these helpers.  The layout
// matches the keyspace already written by earlier deployments
// ("visits:<code>"), which therefore drains on the first pass.
//
// A delta captured by the Reconciler but not yet settled lives under
// "visits-inflight:<code>"; the pattern "visits:*" does not match it.

inline constexpr std::string_view kCounterKeyPrefix   = "visits:";
inline constexpr std::string_view kCounterKeyPattern  = "visits:*";
inline constexpr std::string_view kInFlightKeyPrefix  = "visits-inflight:";
inline constexpr std::string_view kInFlightKeyPattern = "visits-inflight:*";
inline constexpr std::string_view kReconcileLeaseKey  = "shortlink:reconcile:lease";

// "visits:<code>"
[[nodiscard]] std::string counter_key(std::string_view code);

// Inverse of counter_key().  Returns nullopt for keys outside the contract
// (wrong prefix or empty code).
[[nodiscard]] std::optional<std::string> code_from_counter_key(std::string_view key);

// "visits-inflight:<code>"
[[nodiscard]] std::string in_flight_key(std::string_view code);

// Inverse of in_flight_key().
[[nodiscard]] std::optional<std::string> code_from_in_flight_key(std::string_view key);

} // namespace shortlink
