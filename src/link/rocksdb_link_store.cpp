#include "link/rocksdb_link_store.hpp"

#include "common/error.hpp"
#include "link_record.pb.h"

#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/merge_operator.h>
#include <rocksdb/options.h>
#include <rocksdb/write_batch.h>

#include <chrono>
#include <stdexcept>

namespace shortlink {

namespace {

constexpr std::string_view kLinkPrefix  = "link:";
constexpr std::string_view kCountPrefix = "count:";
constexpr std::string_view kVisitPrefix = "visit:";

std::string link_key(std::string_view code) {
    std::string key{kLinkPrefix};
    key.append(code);
    return key;
}

std::string count_key(std::string_view code) {
    std::string key{kCountPrefix};
    key.append(code);
    return key;
}

// "visit:<code>:"; codes never contain ':'.
std::string visit_prefix(std::string_view code) {
    std::string key{kVisitPrefix};
    key.append(code);
    key.push_back(':');
    return key;
}

void append_big_endian(std::string& out, uint64_t v) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<char>((v >> shift) & 0xFF));
    }
}

int64_t to_micros(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        tp.time_since_epoch()).count();
}

std::string visit_key(std::string_view code, int64_t visited_at_us, uint64_t seq) {
    std::string key = visit_prefix(code);
    append_big_endian(key, visited_at_us > 0 ? static_cast<uint64_t>(visited_at_us) : 0);
    append_big_endian(key, seq);
    return key;
}

// ── fixed64 little-endian counter encoding ───────────────────────────────────

std::string encode_count(uint64_t v) {
    std::string out(sizeof(uint64_t), '\0');
    for (std::size_t i = 0; i < sizeof(uint64_t); ++i) {
        out[i] = static_cast<char>((v >> (8 * i)) & 0xFF);
    }
    return out;
}

bool decode_count(const rocksdb::Slice& s, uint64_t& v) {
    if (s.size() != sizeof(uint64_t)) {
        return false;
    }
    v = 0;
    for (std::size_t i = 0; i < sizeof(uint64_t); ++i) {
        v |= static_cast<uint64_t>(static_cast<unsigned char>(s[i])) << (8 * i);
    }
    return true;
}

// ── Merge operator: count:<code> += operand ──────────────────────────────────

class VisitCountMergeOperator final : public rocksdb::AssociativeMergeOperator {
public:
    bool Merge(const rocksdb::Slice& /*key*/,
               const rocksdb::Slice* existing_value,
               const rocksdb::Slice& value,
               std::string* new_value,
               rocksdb::Logger* /*logger*/) const override {
        uint64_t existing = 0;
        if (existing_value != nullptr && !decode_count(*existing_value, existing)) {
            return false;
        }
        uint64_t delta = 0;
        if (!decode_count(value, delta)) {
            return false;
        }
        *new_value = encode_count(existing + delta);
        return true;
    }

    const char* Name() const override { return "shortlink.VisitCountAdd"; }
};

// ── LinkRecord <-> ShortLink ─────────────────────────────────────────────────

proto::LinkRecord to_record(const ShortLink& link) {
    proto::LinkRecord rec;
    rec.set_code(link.code);
    rec.set_target_url(link.target_url);
    rec.set_created_at_ms(std::chrono::duration_cast<std::chrono::milliseconds>(
        link.created_at.time_since_epoch()).count());
    if (link.owner) {
        rec.set_owner(*link.owner);
    }
    return rec;
}

ShortLink from_record(const proto::LinkRecord& rec, uint64_t visit_count) {
    ShortLink link;
    link.code       = rec.code();
    link.target_url = rec.target_url();
    link.created_at = std::chrono::system_clock::time_point{
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds{rec.created_at_ms()})};
    if (rec.has_owner()) {
        link.owner = rec.owner();
    }
    link.visit_count = visit_count;
    return link;
}

// ── VisitEntry <-> VisitRecord ───────────────────────────────────────────────

proto::VisitEntry to_entry(const VisitRecord& visit) {
    proto::VisitEntry entry;
    entry.set_visited_at_us(to_micros(visit.visited_at));
    entry.set_ip_address(visit.details.ip_address);
    entry.set_user_agent(visit.details.user_agent);
    if (visit.details.referrer) entry.set_referrer(*visit.details.referrer);
    if (visit.details.country)  entry.set_country(*visit.details.country);
    if (visit.details.city)     entry.set_city(*visit.details.city);
    return entry;
}

VisitRecord from_entry(std::string_view code, const proto::VisitEntry& entry) {
    VisitRecord visit;
    visit.code       = std::string(code);
    visit.visited_at = std::chrono::system_clock::time_point{
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::microseconds{entry.visited_at_us()})};
    visit.details.ip_address = entry.ip_address();
    visit.details.user_agent = entry.user_agent();
    if (entry.has_referrer()) visit.details.referrer = entry.referrer();
    if (entry.has_country())  visit.details.country  = entry.country();
    if (entry.has_city())     visit.details.city     = entry.city();
    return visit;
}

} // anonymous namespace

RocksDBLinkStore::RocksDBLinkStore(const std::filesystem::path& db_path,
                                   std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : spdlog::default_logger()),
      visit_seq_(static_cast<uint64_t>(to_micros(std::chrono::system_clock::now())))
{
    rocksdb::Options options;
    options.create_if_missing = true;
    options.merge_operator    = std::make_shared<VisitCountMergeOperator>();

    options.IncreaseParallelism();
    options.OptimizeLevelStyleCompaction();

    rocksdb::DB* raw_db = nullptr;
    auto status = rocksdb::DB::Open(options, db_path.string(), &raw_db);
    if (!status.ok()) {
        throw std::runtime_error(
            "Failed to open RocksDB at " + db_path.string() + ": " +
            status.ToString());
    }
    db_.reset(raw_db);
    logger_->info("RocksDB link store opened at {}", db_path.string());
}

RocksDBLinkStore::~RocksDBLinkStore() {
    if (db_) {
        logger_->info("Closing RocksDB link store");
    }
}

std::error_code RocksDBLinkStore::read_visit_count(std::string_view code,
                                                   uint64_t& out) const {
    std::string raw;
    auto status = db_->Get(rocksdb::ReadOptions{}, count_key(code), &raw);
    if (status.IsNotFound()) {
        out = 0;
        return {};
    }
    if (!status.ok()) {
        logger_->error("RocksDB Get count for '{}' failed: {}", code, status.ToString());
        return Errc::durable_store_unavailable;
    }
    if (!decode_count(raw, out)) {
        logger_->error("Corrupt visit count for '{}' ({} bytes)", code, raw.size());
        return Errc::durable_store_unavailable;
    }
    return {};
}

std::error_code RocksDBLinkStore::get(std::string_view code, ShortLink& out) const {
    std::string raw;
    auto status = db_->Get(rocksdb::ReadOptions{}, link_key(code), &raw);
    if (status.IsNotFound()) {
        return Errc::not_found;
    }
    if (!status.ok()) {
        logger_->error("RocksDB Get link '{}' failed: {}", code, status.ToString());
        return Errc::durable_store_unavailable;
    }

    proto::LinkRecord rec;
    if (!rec.ParseFromString(raw)) {
        logger_->error("Corrupt link record for '{}'", code);
        return Errc::durable_store_unavailable;
    }

    uint64_t count = 0;
    if (auto ec = read_visit_count(code, count)) {
        return ec;
    }
    out = from_record(rec, count);
    return {};
}

std::error_code RocksDBLinkStore::create(const ShortLink& link) {
    std::string serialized;
    if (!to_record(link).SerializeToString(&serialized)) {
        logger_->error("Failed to serialize link record for '{}'", link.code);
        return Errc::durable_store_unavailable;
    }

    std::lock_guard lock(create_mutex_);

    std::string existing;
    auto get_status = db_->Get(rocksdb::ReadOptions{}, link_key(link.code), &existing);
    if (get_status.ok()) {
        return Errc::already_exists;
    }
    if (!get_status.IsNotFound()) {
        logger_->error("RocksDB Get link '{}' failed: {}", link.code, get_status.ToString());
        return Errc::durable_store_unavailable;
    }

    rocksdb::WriteBatch batch;
    batch.Put(link_key(link.code), serialized);
    batch.Put(count_key(link.code), encode_count(link.visit_count));
    auto status = db_->Write(rocksdb::WriteOptions{}, &batch);
    if (!status.ok()) {
        logger_->error("RocksDB create '{}' failed: {}", link.code, status.ToString());
        return Errc::durable_store_unavailable;
    }
    return {};
}

std::error_code RocksDBLinkStore::check_link_exists(std::string_view code) const {
    std::string existing;
    auto status = db_->Get(rocksdb::ReadOptions{}, link_key(code), &existing);
    if (status.IsNotFound()) {
        return Errc::not_found;
    }
    if (!status.ok()) {
        logger_->error("RocksDB Get link '{}' failed: {}", code, status.ToString());
        return Errc::durable_store_unavailable;
    }
    return {};
}

std::error_code RocksDBLinkStore::add_to_visit_count(std::string_view code, uint64_t delta) {
    if (auto ec = check_link_exists(code)) {
        return ec;
    }
    if (delta == 0) {
        return {};
    }

    auto status = db_->Merge(rocksdb::WriteOptions{}, count_key(code), encode_count(delta));
    if (!status.ok()) {
        logger_->error("RocksDB Merge count '{}' += {} failed: {}",
                       code, delta, status.ToString());
        return Errc::durable_store_unavailable;
    }
    return {};
}

template <typename Predicate>
std::error_code RocksDBLinkStore::scan_links(std::vector<ShortLink>& out,
                                             Predicate keep) const {
    out.clear();
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions{}));
    const rocksdb::Slice prefix{kLinkPrefix.data(), kLinkPrefix.size()};

    for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
        proto::LinkRecord rec;
        if (!rec.ParseFromArray(it->value().data(), static_cast<int>(it->value().size()))) {
            logger_->warn("Skipping corrupt link record at key {}", it->key().ToString());
            continue;
        }
        if (!keep(rec)) {
            continue;
        }
        uint64_t count = 0;
        if (auto ec = read_visit_count(rec.code(), count)) {
            return ec;
        }
        out.push_back(from_record(rec, count));
    }

    if (!it->status().ok()) {
        logger_->error("RocksDB scan failed: {}", it->status().ToString());
        return Errc::durable_store_unavailable;
    }
    return {};
}

std::error_code RocksDBLinkStore::list_by_owner(std::string_view owner,
                                                std::vector<ShortLink>& out) const {
    return scan_links(out, [owner](const proto::LinkRecord& rec) {
        return rec.has_owner() && rec.owner() == owner;
    });
}

std::error_code RocksDBLinkStore::list_all(std::vector<ShortLink>& out) const {
    return scan_links(out, [](const proto::LinkRecord&) { return true; });
}

// ── Visit log ─────────────────────────────────────────────────────────────────

std::error_code RocksDBLinkStore::append_visit(const VisitRecord& visit) {
    if (auto ec = check_link_exists(visit.code)) {
        return ec;
    }

    const auto entry = to_entry(visit);
    std::string serialized;
    if (!entry.SerializeToString(&serialized)) {
        logger_->error("Failed to serialize visit entry for '{}'", visit.code);
        return Errc::durable_store_unavailable;
    }

    const auto key = visit_key(visit.code, entry.visited_at_us(),
                               visit_seq_.fetch_add(1, std::memory_order_relaxed));
    auto status = db_->Put(rocksdb::WriteOptions{}, key, serialized);
    if (!status.ok()) {
        logger_->error("RocksDB Put visit for '{}' failed: {}", visit.code, status.ToString());
        return Errc::durable_store_unavailable;
    }
    return {};
}

std::error_code RocksDBLinkStore::recent_visits(std::string_view code,
                                                std::size_t limit,
                                                std::vector<VisitRecord>& out) const {
    out.clear();
    if (auto ec = check_link_exists(code)) {
        return ec;
    }
    if (limit == 0) {
        return {};
    }

    const std::string prefix = visit_prefix(code);
    const std::string last   = prefix + std::string(2 * sizeof(uint64_t), '\xff');
    const rocksdb::Slice prefix_slice{prefix};

    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions{}));
    for (it->SeekForPrev(last);
         it->Valid() && it->key().starts_with(prefix_slice) && out.size() < limit;
         it->Prev()) {
        proto::VisitEntry entry;
        if (!entry.ParseFromArray(it->value().data(), static_cast<int>(it->value().size()))) {
            logger_->warn("Skipping corrupt visit entry for '{}'", code);
            continue;
        }
        out.push_back(from_entry(code, entry));
    }

    if (!it->status().ok()) {
        logger_->error("RocksDB visit scan for '{}' failed: {}", code, it->status().ToString());
        return Errc::durable_store_unavailable;
    }
    return {};
}

} // namespace shortlink
