#include "core/resolver.hpp"

#include "common/error.hpp"

#include <chrono>

namespace shortlink {

Resolver::Resolver(LinkStore& links,
                   CounterStore& counters,
                   std::size_t cache_capacity,
                   std::shared_ptr<spdlog::logger> logger)
    : links_(links),
      counters_(counters),
      cache_(cache_capacity),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

std::error_code Resolver::resolve(std::string_view code, std::string& target_url) {
    return resolve_impl(code, nullptr, target_url);
}

std::error_code Resolver::resolve(std::string_view code,
                                  const VisitDetails& details,
                                  std::string& target_url) {
    return resolve_impl(code, &details, target_url);
}

std::error_code Resolver::resolve_impl(std::string_view code,
                                       const VisitDetails* details,
                                       std::string& target_url) {
    if (validate_code(code)) {
        return Errc::not_found;
    }

    if (auto cached = cache_.get(code)) {
        target_url = std::move(*cached);
    } else {
        ShortLink link;
        if (auto ec = links_.get(code, link)) {
            if (ec == Errc::not_found) {
                logger_->debug("resolve '{}': not found", code);
            } else {
                logger_->warn("resolve '{}': {}", code, ec.message());
            }
            return ec;
        }
        cache_.put(link.code, link.target_url);
        target_url = std::move(link.target_url);
    }

    record_visit(code);
    if (details && recorder_) {
        recorder_->record(VisitRecord{std::string(code),
                                     std::chrono::system_clock::now(),
                                     *details});
    }
    return {};
}

void Resolver::prime(std::string code, std::string target_url) {
    cache_.put(std::move(code), std::move(target_url));
}

void Resolver::record_visit(std::string_view code) {
    int64_t new_value = 0;
    if (auto ec = counters_.increment(code, 1, new_value)) {
        dropped_visits_.fetch_add(1, std::memory_order_relaxed);
        logger_->warn("visit for '{}' not recorded: {}", code, ec.message());
        return;
    }
    logger_->trace("visit for '{}' recorded, pending={}", code, new_value);
}

} // namespace shortlink
