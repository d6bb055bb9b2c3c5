#include "core/link_service.hpp"

#include "common/error.hpp"

#include <chrono>

namespace shortlink {

LinkService::LinkService(LinkStore& links,
                         CounterStore& counters,
                         Resolver& resolver,
                         std::shared_ptr<spdlog::logger> logger,
                         std::size_t recent_visits_limit)
    : links_(links),
      counters_(counters),
      resolver_(resolver),
      logger_(logger ? std::move(logger) : spdlog::default_logger()),
      recent_visits_limit_(recent_visits_limit) {}

std::error_code LinkService::create_link(std::string code,
                                         std::string target_url,
                                         std::optional<std::string> owner,
                                         ShortLink& out) {
    if (auto ec = validate_code(code)) {
        return ec;
    }
    if (auto ec = validate_target_url(target_url)) {
        return ec;
    }

    ShortLink link;
    link.code        = std::move(code);
    link.target_url  = std::move(target_url);
    link.created_at  = std::chrono::system_clock::now();
    link.owner       = std::move(owner);
    link.visit_count = 0;

    if (auto ec = links_.create(link)) {
        if (ec == Errc::already_exists) {
            logger_->info("create '{}': code already taken", link.code);
        } else {
            logger_->error("create '{}': {}", link.code, ec.message());
        }
        return ec;
    }

    resolver_.prime(link.code, link.target_url);
    logger_->info("created '{}' -> {}", link.code, link.target_url);
    out = std::move(link);
    return {};
}

LinkStats LinkService::collect_stats(ShortLink link) {
    LinkStats stats;
    stats.committed = link.visit_count;
    if (auto ec = counters_.peek(link.code, stats.pending)) {
        logger_->warn("pending visits for '{}' unknown: {}", link.code, ec.message());
        stats.pending       = 0;
        stats.pending_known = false;
    }
    if (auto ec = links_.recent_visits(link.code, recent_visits_limit_, stats.recent_visits)) {
        logger_->warn("recent visits for '{}' unknown: {}", link.code, ec.message());
        stats.recent_visits.clear();
        stats.recent_visits_known = false;
    }
    stats.link = std::move(link);
    return stats;
}

std::error_code LinkService::link_stats(std::string_view code, LinkStats& out) {
    ShortLink link;
    if (auto ec = links_.get(code, link)) {
        return ec;
    }
    out = collect_stats(std::move(link));
    return {};
}

std::error_code LinkService::owner_stats(std::string_view owner,
                                         std::vector<LinkStats>& out) {
    std::vector<ShortLink> links;
    if (auto ec = links_.list_by_owner(owner, links)) {
        return ec;
    }
    out.clear();
    out.reserve(links.size());
    for (auto& link : links) {
        out.push_back(collect_stats(std::move(link)));
    }
    return {};
}

std::error_code LinkService::all_stats(std::vector<LinkStats>& out) {
    std::vector<ShortLink> links;
    if (auto ec = links_.list_all(links)) {
        return ec;
    }
    out.clear();
    out.reserve(links.size());
    for (auto& link : links) {
        out.push_back(collect_stats(std::move(link)));
    }
    return {};
}

} // namespace shortlink
