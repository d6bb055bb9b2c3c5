#pragma once

#include "link/link_store.hpp"

#include <deque>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace shortlink {

// Thread-safe link store backed by std::unordered_map.
//
// Concurrency model:
//   - get() / list_*() / recent_visits() acquire a shared (read) lock.
//   - create() / add_to_visit_count() / append_visit() acquire an exclusive
//     (write) lock.
//
// The visit log keeps the newest `max_visits_per_link` entries of each link.
class MemoryLinkStore final : public LinkStore {
public:
    static constexpr std::size_t kDefaultMaxVisitsPerLink = 1000;

    explicit MemoryLinkStore(std::size_t max_visits_per_link = kDefaultMaxVisitsPerLink);

    // Not copyable – copies of a live store would silently race.
    MemoryLinkStore(const MemoryLinkStore&)            = delete;
    MemoryLinkStore& operator=(const MemoryLinkStore&) = delete;

    [[nodiscard]] std::error_code get(std::string_view code,
                                      ShortLink& out) const override;
    [[nodiscard]] std::error_code create(const ShortLink& link) override;
    [[nodiscard]] std::error_code add_to_visit_count(std::string_view code,
                                                     uint64_t delta) override;
    [[nodiscard]] std::error_code list_by_owner(std::string_view owner,
                                                std::vector<ShortLink>& out) const override;
    [[nodiscard]] std::error_code list_all(std::vector<ShortLink>& out) const override;
    [[nodiscard]] std::error_code append_visit(const VisitRecord& visit) override;
    [[nodiscard]] std::error_code recent_visits(std::string_view code,
                                                std::size_t limit,
                                                std::vector<VisitRecord>& out) const override;

    // Number of stored links.
    [[nodiscard]] std::size_t size() const;

private:
    std::size_t               max_visits_per_link_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, ShortLink> links_;
    // Per code, oldest first.
    std::unordered_map<std::string, std::deque<VisitRecord>> visits_;
};

} // namespace shortlink
