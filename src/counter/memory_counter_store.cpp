#include "counter/memory_counter_store.hpp"

#include <initializer_list>
#include <unordered_set>

namespace shortlink {

namespace {

int64_t value_or_zero(const std::unordered_map<std::string, int64_t>& map,
                      const std::string& code) {
    auto it = map.find(code);
    return it == map.end() ? 0 : it->second;
}

} // anonymous namespace

std::error_code MemoryCounterStore::increment(std::string_view code, int64_t by,
                                              int64_t& new_value) {
    std::lock_guard lock(mutex_);
    auto& slot = deltas_[std::string(code)];
    slot += by;
    new_value = slot;
    return {};
}

std::error_code MemoryCounterStore::take_and_reset(std::string_view code,
                                                   int64_t& taken) {
    std::lock_guard lock(mutex_);
    const std::string key(code);

    int64_t total = value_or_zero(in_flight_, key);
    if (auto it = deltas_.find(key); it != deltas_.end()) {
        total += it->second;
        deltas_.erase(it);
    }

    if (total == 0) {
        in_flight_.erase(key);
    } else {
        in_flight_[key] = total;
    }
    taken = total;
    return {};
}

std::error_code MemoryCounterStore::commit_taken(std::string_view code) {
    std::lock_guard lock(mutex_);
    in_flight_.erase(std::string(code));
    return {};
}

std::error_code MemoryCounterStore::restore_taken(std::string_view code,
                                                  int64_t& pending) {
    std::lock_guard lock(mutex_);
    const std::string key(code);

    auto it = in_flight_.find(key);
    if (it == in_flight_.end()) {
        pending = value_or_zero(deltas_, key);
        return {};
    }
    auto& slot = deltas_[key];
    slot += it->second;
    in_flight_.erase(it);
    pending = slot;
    return {};
}

std::error_code MemoryCounterStore::peek(std::string_view code, int64_t& value) {
    std::lock_guard lock(mutex_);
    const std::string key(code);
    value = value_or_zero(deltas_, key) + value_or_zero(in_flight_, key);
    return {};
}

std::error_code MemoryCounterStore::pending_codes(std::vector<std::string>& out) {
    std::lock_guard lock(mutex_);
    out.clear();
    std::unordered_set<std::string> seen;
    for (const auto* map : {&in_flight_, &deltas_}) {
        for (const auto& [code, delta] : *map) {
            if (delta != 0 && seen.insert(code).second) {
                out.push_back(code);
            }
        }
    }
    return {};
}

std::size_t MemoryCounterStore::size() const {
    std::lock_guard lock(mutex_);
    std::size_t n = deltas_.size();
    for (const auto& [code, _] : in_flight_) {
        if (!deltas_.contains(code)) {
            ++n;
        }
    }
    return n;
}

std::size_t MemoryCounterStore::in_flight() const {
    std::lock_guard lock(mutex_);
    return in_flight_.size();
}

} // namespace shortlink
