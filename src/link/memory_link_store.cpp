#include "link/memory_link_store.hpp"

#include "common/error.hpp"

#include <algorithm>
#include <mutex>
#include <shared_mutex>

namespace shortlink {

MemoryLinkStore::MemoryLinkStore(std::size_t max_visits_per_link)
    : max_visits_per_link_(max_visits_per_link) {}

std::error_code MemoryLinkStore::get(std::string_view code, ShortLink& out) const {
    std::shared_lock lock(mutex_);
    auto it = links_.find(std::string(code));
    if (it == links_.end()) {
        return Errc::not_found;
    }
    out = it->second;
    return {};
}

std::error_code MemoryLinkStore::create(const ShortLink& link) {
    std::unique_lock lock(mutex_);
    auto [it, inserted] = links_.try_emplace(link.code, link);
    if (!inserted) {
        return Errc::already_exists;
    }
    return {};
}

std::error_code MemoryLinkStore::add_to_visit_count(std::string_view code, uint64_t delta) {
    std::unique_lock lock(mutex_);
    auto it = links_.find(std::string(code));
    if (it == links_.end()) {
        return Errc::not_found;
    }
    it->second.visit_count += delta;
    return {};
}

std::error_code MemoryLinkStore::list_by_owner(std::string_view owner,
                                               std::vector<ShortLink>& out) const {
    std::shared_lock lock(mutex_);
    out.clear();
    for (const auto& [_, link] : links_) {
        if (link.owner && *link.owner == owner) {
            out.push_back(link);
        }
    }
    return {};
}

std::error_code MemoryLinkStore::list_all(std::vector<ShortLink>& out) const {
    std::shared_lock lock(mutex_);
    out.clear();
    out.reserve(links_.size());
    for (const auto& [_, link] : links_) {
        out.push_back(link);
    }
    return {};
}

std::error_code MemoryLinkStore::append_visit(const VisitRecord& visit) {
    std::unique_lock lock(mutex_);
    if (!links_.contains(visit.code)) {
        return Errc::not_found;
    }
    if (max_visits_per_link_ == 0) {
        return {};
    }

    auto& log = visits_[visit.code];
    // Keep the log ordered by visit time; appends are almost always at the end.
    auto pos = std::upper_bound(log.begin(), log.end(), visit.visited_at,
                                [](const auto& at, const VisitRecord& v) {
                                    return at < v.visited_at;
                                });
    log.insert(pos, visit);
    while (log.size() > max_visits_per_link_) {
        log.pop_front();
    }
    return {};
}

std::error_code MemoryLinkStore::recent_visits(std::string_view code,
                                               std::size_t limit,
                                               std::vector<VisitRecord>& out) const {
    std::shared_lock lock(mutex_);
    const std::string key(code);
    out.clear();
    if (!links_.contains(key)) {
        return Errc::not_found;
    }
    auto it = visits_.find(key);
    if (it == visits_.end()) {
        return {};
    }
    const auto& log = it->second;
    for (auto v = log.rbegin(); v != log.rend() && out.size() < limit; ++v) {
        out.push_back(*v);
    }
    return {};
}

std::size_t MemoryLinkStore::size() const {
    std::shared_lock lock(mutex_);
    return links_.size();
}

} // namespace shortlink
