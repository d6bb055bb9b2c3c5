#pragma once

#include "link/link_store.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

namespace rocksdb {
class DB;
} // namespace rocksdb

namespace shortlink {

// ── RocksDBLinkStore ────────────────────────────────────────────────────────
//
// Persistent link store backed by RocksDB.
//
// Key layout:
//   link:<code>              – serialized proto::LinkRecord (immutable fields)
//   count:<code>             – visit count, little-endian fixed64
//   visit:<code>:<ts><seq>   – serialized proto::VisitEntry; <ts> and <seq>
//                              are big-endian fixed64 so keys sort by time
//
// add_to_visit_count() issues a RocksDB Merge on count:<code>; the registered
// associative merge operator adds operands, so concurrent or retried merges
// stay additive.  create() is serialised by a mutex so that the existence
// check and the write batch are atomic with respect to other creators in this
// process (RocksDB itself locks the directory against other processes).

class RocksDBLinkStore final : public LinkStore {
public:
    // Opens (or creates) a RocksDB database at `db_path`.
    // Throws std::runtime_error if the database cannot be opened.
    explicit RocksDBLinkStore(const std::filesystem::path& db_path,
                              std::shared_ptr<spdlog::logger> logger = {});

    ~RocksDBLinkStore() override;

    // Not copyable or movable – RocksDB owns internal state.
    RocksDBLinkStore(const RocksDBLinkStore&)            = delete;
    RocksDBLinkStore& operator=(const RocksDBLinkStore&) = delete;
    RocksDBLinkStore(RocksDBLinkStore&&)                 = delete;
    RocksDBLinkStore& operator=(RocksDBLinkStore&&)      = delete;

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

private:
    // not_found unless link:<code> exists.
    [[nodiscard]] std::error_code check_link_exists(std::string_view code) const;

    // Read count:<code>; a missing key means zero.
    [[nodiscard]] std::error_code read_visit_count(std::string_view code,
                                                   uint64_t& out) const;

    // Scan link:* and hand every decoded link to `keep`.
    template <typename Predicate>
    [[nodiscard]] std::error_code scan_links(std::vector<ShortLink>& out,
                                             Predicate keep) const;

    std::unique_ptr<rocksdb::DB>    db_;
    std::shared_ptr<spdlog::logger> logger_;
    std::mutex                      create_mutex_;
    // Tie-breaker for visits logged in the same microsecond.
    std::atomic<uint64_t>           visit_seq_;
};

} // namespace shortlink
