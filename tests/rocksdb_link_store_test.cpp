#include "link/rocksdb_link_store.hpp"
#include "common/error.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

namespace shortlink {

namespace fs = std::filesystem;

// ── Fixture ─────────────────────────────────────────────────────────────────
// Creates a temporary directory for each test, opens a RocksDBLinkStore in
// it, and cleans up afterwards.

class RocksDBLinkStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_path_ = fs::temp_directory_path() / ("shortlink_rocksdb_test_" +
            std::to_string(std::hash<std::thread::id>{}(
                std::this_thread::get_id())) +
            "_" + std::to_string(counter_++));
        fs::create_directories(db_path_);
        store_ = std::make_unique<RocksDBLinkStore>(db_path_);
    }

    void TearDown() override {
        store_.reset(); // close DB before removing files
        std::error_code ec;
        fs::remove_all(db_path_, ec);
    }

    // Re-open the DB at the same path (for persistence tests).
    void reopen() {
        store_.reset();
        store_ = std::make_unique<RocksDBLinkStore>(db_path_);
    }

    static ShortLink make_link(std::string code,
                               std::string url,
                               std::optional<std::string> owner = std::nullopt) {
        ShortLink link;
        link.code       = std::move(code);
        link.target_url = std::move(url);
        link.created_at = std::chrono::system_clock::time_point{
            std::chrono::milliseconds{1'700'000'000'123}};
        link.owner      = std::move(owner);
        return link;
    }

    fs::path db_path_;
    std::unique_ptr<RocksDBLinkStore> store_;
    static inline int counter_ = 0;
};

// ── get() / create() ──────────────────────────────────────────────────────────

TEST_F(RocksDBLinkStoreTest, GetMissingIsNotFound) {
    ShortLink out;
    EXPECT_EQ(store_->get("nope", out), Errc::not_found);
}

TEST_F(RocksDBLinkStoreTest, CreateThenGetPreservesFields) {
    const auto link = make_link("abc123", "https://example.com/a?b=c", "alice");
    ASSERT_FALSE(store_->create(link));

    ShortLink out;
    ASSERT_FALSE(store_->get("abc123", out));
    EXPECT_EQ(out.code, "abc123");
    EXPECT_EQ(out.target_url, "https://example.com/a?b=c");
    EXPECT_EQ(out.created_at, link.created_at);
    EXPECT_EQ(out.owner, std::optional<std::string>("alice"));
    EXPECT_EQ(out.visit_count, 0u);
}

TEST_F(RocksDBLinkStoreTest, AnonymousLinkHasNoOwner) {
    ASSERT_FALSE(store_->create(make_link("anon", "https://example.com")));
    ShortLink out;
    ASSERT_FALSE(store_->get("anon", out));
    EXPECT_FALSE(out.owner.has_value());
}

TEST_F(RocksDBLinkStoreTest, DuplicateCodeIsRejected) {
    ASSERT_FALSE(store_->create(make_link("abc", "https://first.example")));
    EXPECT_EQ(store_->create(make_link("abc", "https://second.example")),
              Errc::already_exists);

    ShortLink out;
    ASSERT_FALSE(store_->get("abc", out));
    EXPECT_EQ(out.target_url, "https://first.example");
}

// ── add_to_visit_count() ──────────────────────────────────────────────────────

TEST_F(RocksDBLinkStoreTest, MergesAreAdditive) {
    ASSERT_FALSE(store_->create(make_link("abc", "https://example.com")));
    ASSERT_FALSE(store_->add_to_visit_count("abc", 5));
    ASSERT_FALSE(store_->add_to_visit_count("abc", 0));
    ASSERT_FALSE(store_->add_to_visit_count("abc", 37));

    ShortLink out;
    ASSERT_FALSE(store_->get("abc", out));
    EXPECT_EQ(out.visit_count, 42u);
}

TEST_F(RocksDBLinkStoreTest, AddToVisitCountOnMissingCode) {
    EXPECT_EQ(store_->add_to_visit_count("ghost", 3), Errc::not_found);
}

TEST_F(RocksDBLinkStoreTest, ConcurrentMergesAreNotLost) {
    ASSERT_FALSE(store_->create(make_link("hot", "https://example.com")));

    constexpr int kThreads = 4;
    constexpr int kMerges  = 250;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this] {
            for (int i = 0; i < kMerges; ++i) {
                EXPECT_FALSE(store_->add_to_visit_count("hot", 2));
            }
        });
    }
    for (auto& t : threads) t.join();

    ShortLink out;
    ASSERT_FALSE(store_->get("hot", out));
    EXPECT_EQ(out.visit_count, static_cast<uint64_t>(kThreads * kMerges * 2));
}

// ── Persistence ───────────────────────────────────────────────────────────────

TEST_F(RocksDBLinkStoreTest, LinksAndCountsSurviveReopen) {
    ASSERT_FALSE(store_->create(make_link("abc", "https://example.com", "alice")));
    ASSERT_FALSE(store_->add_to_visit_count("abc", 9));

    reopen();

    ShortLink out;
    ASSERT_FALSE(store_->get("abc", out));
    EXPECT_EQ(out.target_url, "https://example.com");
    EXPECT_EQ(out.visit_count, 9u);

    ASSERT_FALSE(store_->add_to_visit_count("abc", 1));
    ASSERT_FALSE(store_->get("abc", out));
    EXPECT_EQ(out.visit_count, 10u);
}

// ── list_by_owner() / list_all() ──────────────────────────────────────────────

TEST_F(RocksDBLinkStoreTest, ListByOwnerCarriesVisitCounts) {
    ASSERT_FALSE(store_->create(make_link("a1", "https://a.example", "alice")));
    ASSERT_FALSE(store_->create(make_link("a2", "https://a.example/2", "alice")));
    ASSERT_FALSE(store_->create(make_link("b1", "https://b.example", "bob")));
    ASSERT_FALSE(store_->add_to_visit_count("a2", 4));

    std::vector<ShortLink> out;
    ASSERT_FALSE(store_->list_by_owner("alice", out));
    ASSERT_EQ(out.size(), 2u);
    std::sort(out.begin(), out.end(),
              [](const ShortLink& a, const ShortLink& b) { return a.code < b.code; });
    EXPECT_EQ(out[0].code, "a1");
    EXPECT_EQ(out[0].visit_count, 0u);
    EXPECT_EQ(out[1].code, "a2");
    EXPECT_EQ(out[1].visit_count, 4u);
}

TEST_F(RocksDBLinkStoreTest, ListAllIgnoresCounterKeys) {
    ASSERT_FALSE(store_->create(make_link("a1", "https://a.example", "alice")));
    ASSERT_FALSE(store_->create(make_link("anon", "https://anon.example")));
    ASSERT_FALSE(store_->add_to_visit_count("anon", 2));

    std::vector<ShortLink> out;
    ASSERT_FALSE(store_->list_all(out));
    EXPECT_EQ(out.size(), 2u);
}

// ── Open failure ──────────────────────────────────────────────────────────────

TEST(RocksDBLinkStoreOpenTest, ThrowsWhenPathIsAFile) {
    const auto path = fs::temp_directory_path() / "shortlink_rocksdb_not_a_dir";
    {
        std::FILE* f = std::fopen(path.c_str(), "w");
        ASSERT_NE(f, nullptr);
        std::fclose(f);
    }
    EXPECT_THROW(RocksDBLinkStore{path}, std::runtime_error);
    std::error_code ec;
    fs::remove(path, ec);
}

// ── Visit log ─────────────────────────────────────────────────────────────────

static VisitRecord make_visit(std::string code, int64_t micros, std::string ip) {
    VisitRecord v;
    v.code               = std::move(code);
    v.visited_at         = std::chrono::system_clock::time_point{
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::microseconds{micros})};
    v.details.ip_address = std::move(ip);
    v.details.user_agent = "Mozilla/5.0";
    return v;
}

TEST_F(RocksDBLinkStoreTest, VisitLogRoundTripsAllFields) {
    ASSERT_FALSE(store_->create(make_link("abc", "https://example.com")));
    auto visit = make_visit("abc", 1'700'000'000'123'456, "2001:db8::1");
    visit.details.referrer = "https://news.example/";
    visit.details.country  = "PT";
    visit.details.city     = "Porto";
    ASSERT_FALSE(store_->append_visit(visit));

    std::vector<VisitRecord> out;
    ASSERT_FALSE(store_->recent_visits("abc", 10, out));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].code, "abc");
    EXPECT_EQ(out[0].visited_at, visit.visited_at);
    EXPECT_EQ(out[0].details.ip_address, "2001:db8::1");
    EXPECT_EQ(out[0].details.user_agent, "Mozilla/5.0");
    EXPECT_EQ(out[0].details.referrer, std::optional<std::string>("https://news.example/"));
    EXPECT_EQ(out[0].details.country, std::optional<std::string>("PT"));
    EXPECT_EQ(out[0].details.city, std::optional<std::string>("Porto"));
}

TEST_F(RocksDBLinkStoreTest, RecentVisitsAreNewestFirstAndLimited) {
    ASSERT_FALSE(store_->create(make_link("abc", "https://example.com")));
    ASSERT_FALSE(store_->create(make_link("abd", "https://example.com/d")));
    ASSERT_FALSE(store_->append_visit(make_visit("abc", 3'000'000, "c")));
    ASSERT_FALSE(store_->append_visit(make_visit("abc", 1'000'000, "a")));
    ASSERT_FALSE(store_->append_visit(make_visit("abc", 2'000'000, "b")));
    ASSERT_FALSE(store_->append_visit(make_visit("abd", 9'000'000, "other")));

    std::vector<VisitRecord> out;
    ASSERT_FALSE(store_->recent_visits("abc", 2, out));
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].details.ip_address, "c");
    EXPECT_EQ(out[1].details.ip_address, "b");

    // Visits in the same microsecond are all kept.
    ASSERT_FALSE(store_->append_visit(make_visit("abd", 9'000'000, "twin")));
    ASSERT_FALSE(store_->recent_visits("abd", 10, out));
    EXPECT_EQ(out.size(), 2u);
}

TEST_F(RocksDBLinkStoreTest, VisitLogSurvivesReopenAndIsNotListedAsLinks) {
    ASSERT_FALSE(store_->create(make_link("abc", "https://example.com")));
    ASSERT_FALSE(store_->append_visit(make_visit("abc", 5'000'000, "10.0.0.9")));
    reopen();

    std::vector<VisitRecord> visits;
    ASSERT_FALSE(store_->recent_visits("abc", 10, visits));
    ASSERT_EQ(visits.size(), 1u);
    EXPECT_EQ(visits[0].details.ip_address, "10.0.0.9");

    std::vector<ShortLink> links;
    ASSERT_FALSE(store_->list_all(links));
    EXPECT_EQ(links.size(), 1u);
}

TEST_F(RocksDBLinkStoreTest, VisitLogOfUnknownCodeIsNotFound) {
    std::vector<VisitRecord> out;
    EXPECT_EQ(store_->append_visit(make_visit("ghost", 1, "x")), Errc::not_found);
    EXPECT_EQ(store_->recent_visits("ghost", 5, out), Errc::not_found);
}

} // namespace shortlink
