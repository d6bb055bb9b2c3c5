#include "core/resolver.hpp"
#include "core/visit_recorder.hpp"
#include "common/error.hpp"
#include "counter/memory_counter_store.hpp"
#include "counter/redis_counter_store.hpp"
#include "link/memory_link_store.hpp"
#include "network/resp_client.hpp"

#include "fake_redis_server.hpp"
#include "test_doubles.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

namespace shortlink {

// ── Fixture ───────────────────────────────────────────────────────────────────

class ResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        add_link("abc123", "https://example.com/landing");
    }

    void add_link(const std::string& code, const std::string& url) {
        ShortLink link;
        link.code       = code;
        link.target_url = url;
        link.created_at = std::chrono::system_clock::now();
        ASSERT_FALSE(memory_links_.create(link));
    }

    int64_t pending(const std::string& code) {
        int64_t v = 0;
        EXPECT_FALSE(memory_counters_.peek(code, v));
        return v;
    }

    MemoryLinkStore             memory_links_;
    MemoryCounterStore          memory_counters_;
    testing::FlakyLinkStore     links_{memory_links_};
    testing::FlakyCounterStore  counters_{memory_counters_};
    Resolver                    resolver_{links_, counters_, 4};
};

// ── Happy path ────────────────────────────────────────────────────────────────

TEST_F(ResolverTest, ResolvesAndRecordsOneVisit) {
    std::string url;
    ASSERT_FALSE(resolver_.resolve("abc123", url));
    EXPECT_EQ(url, "https://example.com/landing");
    EXPECT_EQ(pending("abc123"), 1);
}

TEST_F(ResolverTest, EveryResolutionCounts) {
    std::string url;
    for (int i = 0; i < 5; ++i) {
        ASSERT_FALSE(resolver_.resolve("abc123", url));
    }
    EXPECT_EQ(pending("abc123"), 5);
}

TEST_F(ResolverTest, ResolveDoesNotTouchDurableVisitCount) {
    std::string url;
    ASSERT_FALSE(resolver_.resolve("abc123", url));

    ShortLink stored;
    ASSERT_FALSE(memory_links_.get("abc123", stored));
    EXPECT_EQ(stored.visit_count, 0u);
}

// ── Cache ─────────────────────────────────────────────────────────────────────

TEST_F(ResolverTest, SecondResolutionIsServedFromCache) {
    std::string url;
    ASSERT_FALSE(resolver_.resolve("abc123", url));
    ASSERT_FALSE(resolver_.resolve("abc123", url));

    EXPECT_EQ(links_.get_calls.load(), 1u);
    EXPECT_EQ(resolver_.cache().hits(), 1u);
    EXPECT_EQ(pending("abc123"), 2);
}

TEST_F(ResolverTest, CachedLinkSurvivesDurableOutage) {
    std::string url;
    ASSERT_FALSE(resolver_.resolve("abc123", url));

    links_.fail_reads = true;
    ASSERT_FALSE(resolver_.resolve("abc123", url));
    EXPECT_EQ(url, "https://example.com/landing");
}

TEST_F(ResolverTest, CacheIsBounded) {
    for (int i = 0; i < 10; ++i) {
        add_link("c" + std::to_string(i), "https://example.com/" + std::to_string(i));
    }
    std::string url;
    for (int i = 0; i < 10; ++i) {
        ASSERT_FALSE(resolver_.resolve("c" + std::to_string(i), url));
        EXPECT_EQ(url, "https://example.com/" + std::to_string(i));
    }
    EXPECT_EQ(resolver_.cache().size(), 4u);
}

TEST_F(ResolverTest, PrimedCodeSkipsStore) {
    resolver_.prime("fresh", "https://example.com/fresh");
    std::string url;
    ASSERT_FALSE(resolver_.resolve("fresh", url));
    EXPECT_EQ(url, "https://example.com/fresh");
    EXPECT_EQ(links_.get_calls.load(), 0u);
}

// ── Unknown codes ─────────────────────────────────────────────────────────────

TEST_F(ResolverTest, UnknownCodeIsNotFoundAndNotCounted) {
    std::string url = "untouched";
    EXPECT_EQ(resolver_.resolve("zzz999", url), Errc::not_found);
    EXPECT_EQ(url, "untouched");
    EXPECT_EQ(memory_counters_.size(), 0u);
    EXPECT_FALSE(resolver_.cache().contains("zzz999"));
}

TEST_F(ResolverTest, MalformedCodeIsNotFoundWithoutStoreLookup) {
    std::string url;
    EXPECT_EQ(resolver_.resolve("", url), Errc::not_found);
    EXPECT_EQ(resolver_.resolve("visits:*", url), Errc::not_found);
    EXPECT_EQ(resolver_.resolve(std::string(kMaxCodeLength + 1, 'a'), url), Errc::not_found);
    EXPECT_EQ(links_.get_calls.load(), 0u);
    EXPECT_EQ(memory_counters_.size(), 0u);
}

// ── Visit log ─────────────────────────────────────────────────────────────────

TEST_F(ResolverTest, ResolutionWithDetailsIsLogged) {
    VisitRecorder recorder{links_};
    resolver_.set_visit_recorder(&recorder);

    VisitDetails details;
    details.ip_address = "203.0.113.7";
    details.user_agent = "Mozilla/5.0";
    details.referrer   = "https://news.example/";

    std::string url;
    ASSERT_FALSE(resolver_.resolve("abc123", details, url));
    ASSERT_FALSE(resolver_.resolve("abc123", url));  // no details: counted only
    recorder.flush();
    resolver_.set_visit_recorder(nullptr);

    EXPECT_EQ(pending("abc123"), 2);
    std::vector<VisitRecord> visits;
    ASSERT_FALSE(memory_links_.recent_visits("abc123", 10, visits));
    ASSERT_EQ(visits.size(), 1u);
    EXPECT_EQ(visits[0].code, "abc123");
    EXPECT_EQ(visits[0].details.ip_address, "203.0.113.7");
    EXPECT_EQ(visits[0].details.referrer, details.referrer);
}

TEST_F(ResolverTest, UnknownCodeIsNotLogged) {
    VisitRecorder recorder{links_};
    resolver_.set_visit_recorder(&recorder);

    std::string url;
    EXPECT_EQ(resolver_.resolve("zzz999", VisitDetails{"10.0.0.1", "curl", {}, {}, {}}, url),
              Errc::not_found);
    recorder.flush();
    resolver_.set_visit_recorder(nullptr);
    EXPECT_EQ(recorder.written() + recorder.failed(), 0u);
}

// Visit log writes happen off the request thread: a stuck log store does not
// hold up the redirect.
TEST_F(ResolverTest, SlowVisitLogDoesNotDelayResolution) {
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    links_.on_append_visit = [gate](const VisitRecord&) { gate.wait(); };

    VisitRecorder recorder{links_};
    resolver_.set_visit_recorder(&recorder);

    std::string url;
    const auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < 3; ++i) {
        ASSERT_FALSE(resolver_.resolve("abc123", VisitDetails{"10.0.0.1", "curl", {}, {}, {}},
                                       url));
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds{1});

    release.set_value();
    recorder.flush();
    resolver_.set_visit_recorder(nullptr);
    EXPECT_EQ(recorder.written(), 3u);
}

// ── Failures ──────────────────────────────────────────────────────────────────

TEST_F(ResolverTest, CounterFailureDoesNotFailResolution) {
    counters_.fail_increments = true;
    std::string url;
    ASSERT_FALSE(resolver_.resolve("abc123", url));
    EXPECT_EQ(url, "https://example.com/landing");
    EXPECT_EQ(resolver_.dropped_visits(), 1u);
    EXPECT_EQ(memory_counters_.size(), 0u);
}

TEST_F(ResolverTest, DurableOutageOnMissIsReported) {
    links_.fail_reads = true;
    std::string url;
    EXPECT_EQ(resolver_.resolve("abc123", url), Errc::durable_store_unavailable);
    EXPECT_EQ(memory_counters_.size(), 0u);
}

// ── Concurrency ───────────────────────────────────────────────────────────────

TEST_F(ResolverTest, ConcurrentResolutionsAreAllCounted) {
    constexpr int kThreads = 8;
    constexpr int kEach    = 500;
    add_link("xyz", "https://example.com/xyz");

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this, t] {
            std::string url;
            const char* code = (t % 2 == 0) ? "abc123" : "xyz";
            for (int i = 0; i < kEach; ++i) {
                EXPECT_FALSE(resolver_.resolve(code, url));
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(pending("abc123") + pending("xyz"), int64_t{kThreads} * kEach);
}

// A stalled counter server delays each redirect by at most about one counter
// timeout, however many request threads queue on the connection.
TEST_F(ResolverTest, StalledCounterStoreDelaysRedirectsByOneTimeout) {
    using namespace std::chrono_literals;
    constexpr int  kThreads = 8;
    constexpr auto kTimeout = 200ms;

    testing::FakeRedisServer server;
    network::RespClient client{"127.0.0.1", server.port(), kTimeout};
    RedisCounterStore redis_counters{client};
    Resolver resolver{links_, redis_counters, 4};
    resolver.prime("abc123", "https://example.com/landing");

    server.set_stalled(true);

    std::vector<std::chrono::steady_clock::duration> latency(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            std::string url;
            const auto start = std::chrono::steady_clock::now();
            EXPECT_FALSE(resolver.resolve("abc123", url));
            latency[t] = std::chrono::steady_clock::now() - start;
            EXPECT_EQ(url, "https://example.com/landing");
        });
    }
    for (auto& th : threads) th.join();

    const auto worst = *std::max_element(latency.begin(), latency.end());
    EXPECT_LT(worst, 3 * kTimeout);
    EXPECT_EQ(resolver.dropped_visits(), static_cast<uint64_t>(kThreads));
    EXPECT_EQ(links_.get_calls.load(), 0u);
}

} // namespace shortlink
