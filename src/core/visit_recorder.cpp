#include "core/visit_recorder.hpp"

#include "common/error.hpp"

#include <boost/asio/post.hpp>

#include <future>

namespace shortlink {

VisitRecorder::VisitRecorder(LinkStore& links,
                             std::size_t max_queued,
                             std::shared_ptr<spdlog::logger> logger)
    : links_(links),
      max_queued_(max_queued),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

VisitRecorder::~VisitRecorder() {
    pool_.join();
    if (const auto n = dropped()) {
        logger_->warn("Visit recorder dropped {} entries over its lifetime", n);
    }
}

bool VisitRecorder::record(VisitRecord visit) {
    if (queued_.fetch_add(1, std::memory_order_acq_rel) >= max_queued_) {
        queued_.fetch_sub(1, std::memory_order_acq_rel);
        const auto n = dropped_.fetch_add(1, std::memory_order_relaxed) + 1;
        if (n == 1 || n % 1000 == 0) {
            logger_->warn("Visit log queue full, {} entries dropped so far", n);
        }
        return false;
    }

    truncate_visit_details(visit.details);
    boost::asio::post(pool_, [this, visit = std::move(visit)]() {
        write(visit);
        queued_.fetch_sub(1, std::memory_order_acq_rel);
    });
    return true;
}

void VisitRecorder::flush() {
    std::promise<void> done;
    auto future = done.get_future();
    boost::asio::post(pool_, [&done]() { done.set_value(); });
    future.wait();
}

void VisitRecorder::write(const VisitRecord& visit) {
    if (auto ec = links_.append_visit(visit)) {
        failed_.fetch_add(1, std::memory_order_relaxed);
        if (ec == Errc::not_found) {
            logger_->debug("visit log for '{}': no such link", visit.code);
        } else {
            logger_->warn("visit log for '{}' not written: {}", visit.code, ec.message());
        }
        return;
    }
    written_.fetch_add(1, std::memory_order_relaxed);
}

} // namespace shortlink
