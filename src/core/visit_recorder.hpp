#pragma once

#include "link/link_store.hpp"

#include <boost/asio/thread_pool.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace shortlink {

// ── VisitRecorder ────────────────────────────────────────────────────────────
//
// Writes visit log entries to the LinkStore from one background thread, so
// that resolving a code never waits for the durable store.
//
// At most `max_queued` entries wait at a time; record() drops anything beyond
// that and counts it.  A failed write is logged and counted, never retried.
// The destructor waits for every queued entry to be written.

class VisitRecorder {
public:
    static constexpr std::size_t kDefaultMaxQueued = 10000;

    explicit VisitRecorder(LinkStore& links,
                           std::size_t max_queued = kDefaultMaxQueued,
                           std::shared_ptr<spdlog::logger> logger = {});

    ~VisitRecorder();

    VisitRecorder(const VisitRecorder&)            = delete;
    VisitRecorder& operator=(const VisitRecorder&) = delete;

    // Queue one entry.  Returns false if the queue was full.  Thread-safe.
    bool record(VisitRecord visit);

    // Block until every entry queued before the call has been written.
    void flush();

    [[nodiscard]] uint64_t written() const noexcept {
        return written_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] uint64_t dropped() const noexcept {
        return dropped_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] uint64_t failed() const noexcept {
        return failed_.load(std::memory_order_relaxed);
    }

private:
    void write(const VisitRecord& visit);

    LinkStore&                      links_;
    std::size_t                     max_queued_;
    std::shared_ptr<spdlog::logger> logger_;

    std::atomic<std::size_t>        queued_{0};
    std::atomic<uint64_t>           written_{0};
    std::atomic<uint64_t>           dropped_{0};
    std::atomic<uint64_t>           failed_{0};

    boost::asio::thread_pool        pool_{1};
};

} // namespace shortlink
