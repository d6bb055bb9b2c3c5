#pragma once

#include "core/resolver.hpp"
#include "counter/counter_store.hpp"
#include "link/link_store.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace shortlink {

// Visit figures for one link.  `pending` is the unreconciled delta read from
// the counter store; when that store is unreachable it is reported as 0 with
// pending_known = false.  `recent_visits` is the newest part of the visit
// log, newest first; recent_visits_known is false if it could not be read.
struct LinkStats {
    ShortLink                link;
    uint64_t                 committed           = 0;
    int64_t                  pending             = 0;
    bool                     pending_known       = true;
    std::vector<VisitRecord> recent_visits;
    bool                     recent_visits_known = true;

    [[nodiscard]] uint64_t total() const noexcept {
        return committed + (pending > 0 ? static_cast<uint64_t>(pending) : 0);
    }
};

// ── LinkService ──────────────────────────────────────────────────────────────
//
// Link creation and visit statistics for the request layer.  Creation
// validates the code and URL, writes the durable record, and primes the
// resolver cache so the first redirect skips the store.

class LinkService {
public:
    static constexpr std::size_t kDefaultRecentVisits = 10;

    LinkService(LinkStore& links,
                CounterStore& counters,
                Resolver& resolver,
                std::shared_ptr<spdlog::logger> logger = {},
                std::size_t recent_visits_limit = kDefaultRecentVisits);

    // Errors: invalid_code, invalid_url, already_exists,
    //         durable_store_unavailable.
    [[nodiscard]] std::error_code create_link(std::string code,
                                              std::string target_url,
                                              std::optional<std::string> owner,
                                              ShortLink& out);

    // Errors: not_found, durable_store_unavailable.
    [[nodiscard]] std::error_code link_stats(std::string_view code, LinkStats& out);

    [[nodiscard]] std::error_code owner_stats(std::string_view owner,
                                              std::vector<LinkStats>& out);

    [[nodiscard]] std::error_code all_stats(std::vector<LinkStats>& out);

private:
    LinkStats collect_stats(ShortLink link);

    LinkStore&                      links_;
    CounterStore&                   counters_;
    Resolver&                       resolver_;
    std::shared_ptr<spdlog::logger> logger_;
    std::size_t                     recent_visits_limit_;
};

} // namespace shortlink
