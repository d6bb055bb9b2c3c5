#pragma once

#include "link/short_link.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <system_error>
#include <vector>

namespace shortlink {

// ── LinkStore ────────────────────────────────────────────────────────────────
//
// Abstract interface for the durable link store: the authoritative mapping
// from short code to target URL, the last-committed visit count, and the log
// of individual visits.
//
// Implementations must be thread-safe.  The concrete engine (in-memory hash
// map, RocksDB) is selected at startup.
//
// Failures are reported as shortlink::Errc values:
//   not_found                 – no link under the code
//   already_exists            – create() on a taken code
//   durable_store_unavailable – underlying I/O failed

class LinkStore {
public:
    virtual ~LinkStore() = default;

    // Fetch the link for `code` into `out`.
    [[nodiscard]] virtual std::error_code get(std::string_view code,
                                              ShortLink& out) const = 0;

    // Insert `link` if its code is free.  The stored visit_count starts at
    // link.visit_count (normally 0).
    [[nodiscard]] virtual std::error_code create(const ShortLink& link) = 0;

    // visit_count += delta, as a single additive update (never an overwrite).
    [[nodiscard]] virtual std::error_code add_to_visit_count(std::string_view code,
                                                             uint64_t delta) = 0;

    // All links owned by `owner` (order unspecified).
    [[nodiscard]] virtual std::error_code list_by_owner(std::string_view owner,
                                                        std::vector<ShortLink>& out) const = 0;

    // All links (order unspecified).
    [[nodiscard]] virtual std::error_code list_all(std::vector<ShortLink>& out) const = 0;

    // Add one entry to the visit log of visit.code.
    [[nodiscard]] virtual std::error_code append_visit(const VisitRecord& visit) = 0;

    // Up to `limit` logged visits of `code`, newest first.
    [[nodiscard]] virtual std::error_code recent_visits(std::string_view code,
                                                        std::size_t limit,
                                                        std::vector<VisitRecord>& out) const = 0;
};

} // namespace shortlink
