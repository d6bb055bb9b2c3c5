#pragma once

#include <atomic>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace shortlink {

// ── LruCache ─────────────────────────────────────────────────────────────────
//
// Bounded, thread-safe string -> V cache with least-recently-used eviction.
// Entries are never invalidated; callers only cache immutable values.
//
// A hit moves the entry to the front, so get() takes the exclusive lock too.

template <typename V>
class LruCache {
public:
    explicit LruCache(std::size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    LruCache(const LruCache&)            = delete;
    LruCache& operator=(const LruCache&) = delete;

    [[nodiscard]] std::optional<V> get(std::string_view key) {
        std::lock_guard lock(mutex_);
        auto it = index_.find(std::string(key));
        if (it == index_.end()) {
            misses_.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }
        order_.splice(order_.begin(), order_, it->second);
        hits_.fetch_add(1, std::memory_order_relaxed);
        return it->second->second;
    }

    // Insert or refresh `key`; evicts the least-recently-used entry when full.
    void put(std::string key, V value) {
        std::lock_guard lock(mutex_);
        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->second = std::move(value);
            order_.splice(order_.begin(), order_, it->second);
            return;
        }

        order_.emplace_front(key, std::move(value));
        index_.emplace(std::move(key), order_.begin());

        if (index_.size() > capacity_) {
            index_.erase(order_.back().first);
            order_.pop_back();
            evictions_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    [[nodiscard]] bool contains(std::string_view key) const {
        std::lock_guard lock(mutex_);
        return index_.count(std::string(key)) > 0;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard lock(mutex_);
        return index_.size();
    }

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

    [[nodiscard]] uint64_t hits() const noexcept {
        return hits_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] uint64_t misses() const noexcept {
        return misses_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] uint64_t evictions() const noexcept {
        return evictions_.load(std::memory_order_relaxed);
    }

private:
    using Entry = std::pair<std::string, V>;

    const std::size_t  capacity_;
    mutable std::mutex mutex_;
    std::list<Entry>   order_;  // front = most recently used
    std::unordered_map<std::string, typename std::list<Entry>::iterator> index_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> evictions_{0};
};

} // namespace shortlink
