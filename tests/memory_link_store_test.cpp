#include "link/memory_link_store.hpp"
#include "common/error.hpp"

#include <algorithm>
#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

namespace shortlink {

// ── Fixture ───────────────────────────────────────────────────────────────────

class MemoryLinkStoreTest : public ::testing::Test {
protected:
    static ShortLink make_link(std::string code,
                               std::string url,
                               std::optional<std::string> owner = std::nullopt) {
        ShortLink link;
        link.code       = std::move(code);
        link.target_url = std::move(url);
        link.created_at = std::chrono::system_clock::now();
        link.owner      = std::move(owner);
        return link;
    }

    MemoryLinkStore store_;
};

// ── get() / create() ──────────────────────────────────────────────────────────

TEST_F(MemoryLinkStoreTest, GetMissingIsNotFound) {
    ShortLink out;
    EXPECT_EQ(store_.get("nope", out), Errc::not_found);
}

TEST_F(MemoryLinkStoreTest, CreateThenGet) {
    auto link = make_link("abc123", "https://example.com", "alice");
    ASSERT_FALSE(store_.create(link));

    ShortLink out;
    ASSERT_FALSE(store_.get("abc123", out));
    EXPECT_EQ(out.code, "abc123");
    EXPECT_EQ(out.target_url, "https://example.com");
    EXPECT_EQ(out.owner, std::optional<std::string>("alice"));
    EXPECT_EQ(out.created_at, link.created_at);
    EXPECT_EQ(out.visit_count, 0u);
}

TEST_F(MemoryLinkStoreTest, DuplicateCodeIsRejected) {
    ASSERT_FALSE(store_.create(make_link("abc", "https://first.example")));
    EXPECT_EQ(store_.create(make_link("abc", "https://second.example")), Errc::already_exists);

    ShortLink out;
    ASSERT_FALSE(store_.get("abc", out));
    EXPECT_EQ(out.target_url, "https://first.example");
    EXPECT_EQ(store_.size(), 1u);
}

// ── add_to_visit_count() ──────────────────────────────────────────────────────

TEST_F(MemoryLinkStoreTest, AddToVisitCountAccumulates) {
    ASSERT_FALSE(store_.create(make_link("abc", "https://example.com")));
    ASSERT_FALSE(store_.add_to_visit_count("abc", 3));
    ASSERT_FALSE(store_.add_to_visit_count("abc", 4));

    ShortLink out;
    ASSERT_FALSE(store_.get("abc", out));
    EXPECT_EQ(out.visit_count, 7u);
}

TEST_F(MemoryLinkStoreTest, AddToVisitCountOnMissingCode) {
    EXPECT_EQ(store_.add_to_visit_count("ghost", 1), Errc::not_found);
}

TEST_F(MemoryLinkStoreTest, ConcurrentAddsAreNotLost) {
    ASSERT_FALSE(store_.create(make_link("hot", "https://example.com")));

    constexpr int kThreads = 8;
    constexpr int kAdds    = 1000;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this] {
            for (int i = 0; i < kAdds; ++i) {
                EXPECT_FALSE(store_.add_to_visit_count("hot", 1));
            }
        });
    }
    for (auto& t : threads) t.join();

    ShortLink out;
    ASSERT_FALSE(store_.get("hot", out));
    EXPECT_EQ(out.visit_count, static_cast<uint64_t>(kThreads * kAdds));
}

// ── list_by_owner() / list_all() ──────────────────────────────────────────────

TEST_F(MemoryLinkStoreTest, ListByOwnerFilters) {
    ASSERT_FALSE(store_.create(make_link("a1", "https://a.example", "alice")));
    ASSERT_FALSE(store_.create(make_link("a2", "https://a.example/2", "alice")));
    ASSERT_FALSE(store_.create(make_link("b1", "https://b.example", "bob")));
    ASSERT_FALSE(store_.create(make_link("anon", "https://anon.example")));

    std::vector<ShortLink> out;
    ASSERT_FALSE(store_.list_by_owner("alice", out));
    std::vector<std::string> codes;
    for (const auto& l : out) codes.push_back(l.code);
    std::sort(codes.begin(), codes.end());
    EXPECT_EQ(codes, (std::vector<std::string>{"a1", "a2"}));

    ASSERT_FALSE(store_.list_by_owner("carol", out));
    EXPECT_TRUE(out.empty());
}

TEST_F(MemoryLinkStoreTest, ListAllReturnsEverything) {
    ASSERT_FALSE(store_.create(make_link("a1", "https://a.example", "alice")));
    ASSERT_FALSE(store_.create(make_link("anon", "https://anon.example")));

    std::vector<ShortLink> out{make_link("stale", "https://stale.example")};
    ASSERT_FALSE(store_.list_all(out));
    EXPECT_EQ(out.size(), 2u);
}

// ── Visit log ─────────────────────────────────────────────────────────────────

static VisitRecord make_visit(std::string code, int seconds, std::string ip) {
    VisitRecord v;
    v.code                = std::move(code);
    v.visited_at          = std::chrono::system_clock::time_point{std::chrono::seconds{seconds}};
    v.details.ip_address  = std::move(ip);
    v.details.user_agent  = "curl/8.0";
    return v;
}

TEST_F(MemoryLinkStoreTest, RecentVisitsAreNewestFirst) {
    ASSERT_FALSE(store_.create(make_link("abc", "https://example.com")));
    ASSERT_FALSE(store_.append_visit(make_visit("abc", 10, "10.0.0.1")));
    ASSERT_FALSE(store_.append_visit(make_visit("abc", 30, "10.0.0.3")));
    ASSERT_FALSE(store_.append_visit(make_visit("abc", 20, "10.0.0.2")));

    std::vector<VisitRecord> out;
    ASSERT_FALSE(store_.recent_visits("abc", 2, out));
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].details.ip_address, "10.0.0.3");
    EXPECT_EQ(out[1].details.ip_address, "10.0.0.2");
}

TEST_F(MemoryLinkStoreTest, VisitLogKeepsNewestEntriesPerLink) {
    MemoryLinkStore small{3};
    ASSERT_FALSE(small.create(make_link("abc", "https://example.com")));
    for (int i = 0; i < 5; ++i) {
        ASSERT_FALSE(small.append_visit(make_visit("abc", i, "ip" + std::to_string(i))));
    }

    std::vector<VisitRecord> out;
    ASSERT_FALSE(small.recent_visits("abc", 10, out));
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out.front().details.ip_address, "ip4");
    EXPECT_EQ(out.back().details.ip_address, "ip2");
}

TEST_F(MemoryLinkStoreTest, VisitLogOfUnknownCodeIsNotFound) {
    std::vector<VisitRecord> out;
    EXPECT_EQ(store_.append_visit(make_visit("ghost", 1, "10.0.0.1")), Errc::not_found);
    EXPECT_EQ(store_.recent_visits("ghost", 5, out), Errc::not_found);
}

TEST_F(MemoryLinkStoreTest, LinkWithoutVisitsHasEmptyLog) {
    ASSERT_FALSE(store_.create(make_link("abc", "https://example.com")));
    std::vector<VisitRecord> out{make_visit("stale", 0, "x")};
    ASSERT_FALSE(store_.recent_visits("abc", 5, out));
    EXPECT_TRUE(out.empty());
}

} // namespace shortlink
