#pragma once

#include <string>
#include <system_error>
#include <type_traits>

namespace shortlink {

// ── Error codes ──────────────────────────────────────────────────────────────
//
// Every store and service operation reports failure through a std::error_code
// of this category.  Zero is reserved for success.

enum class Errc : int {
    not_found                 = 1,  // code absent from the durable store
    already_exists            = 2,  // code collision on creation
    counter_store_unavailable = 3,  // fast counter store unreachable / timed out
    durable_store_unavailable = 4,  // durable link store I/O failure
    lease_denied              = 5,  // reconciliation lease held by another owner
    lease_expired             = 6,  // renewal attempted on a lost lease
    invalid_code              = 7,  // malformed short code
    invalid_url               = 8,  // target URL failed validation
};

[[nodiscard]] const std::error_category& shortlink_category() noexcept;

[[nodiscard]] std::error_code make_error_code(Errc e) noexcept;

} // namespace shortlink

namespace std {
template <>
struct is_error_code_enum<shortlink::Errc> : true_type {};
} // namespace std
