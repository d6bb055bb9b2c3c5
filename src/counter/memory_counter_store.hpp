#pragma once

#include "counter/counter_store.hpp"

#include <mutex>
#include <string>
#include <unordered_map>

namespace shortlink {

// In-process CounterStore.  Each operation holds one mutex for its whole
// duration, which is what makes increment and take_and_reset atomic with
// respect to each other.  Only shared between threads of one process, so it
// suits single-process deployments and tests.
class MemoryCounterStore final : public CounterStore {
public:
    MemoryCounterStore() = default;

    MemoryCounterStore(const MemoryCounterStore&)            = delete;
    MemoryCounterStore& operator=(const MemoryCounterStore&) = delete;

    [[nodiscard]] std::error_code increment(std::string_view code, int64_t by,
                                            int64_t& new_value) override;
    [[nodiscard]] std::error_code take_and_reset(std::string_view code,
                                                 int64_t& taken) override;
    [[nodiscard]] std::error_code commit_taken(std::string_view code) override;
    [[nodiscard]] std::error_code restore_taken(std::string_view code,
                                                int64_t& pending) override;
    [[nodiscard]] std::error_code peek(std::string_view code, int64_t& value) override;
    [[nodiscard]] std::error_code pending_codes(std::vector<std::string>& out) override;

    // Number of codes with a delta or an in-flight slot.
    [[nodiscard]] std::size_t size() const;

    // Number of unsettled in-flight slots.
    [[nodiscard]] std::size_t in_flight() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, int64_t> deltas_;
    std::unordered_map<std::string, int64_t> in_flight_;
};

} // namespace shortlink
