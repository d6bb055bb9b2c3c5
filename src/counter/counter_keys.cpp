#include "counter/counter_keys.hpp"

namespace shortlink {

namespace {

std::string with_prefix(std::string_view prefix, std::string_view code) {
    std::string key;
    key.reserve(prefix.size() + code.size());
    key.append(prefix);
    key.append(code);
    return key;
}

std::optional<std::string> strip_prefix(std::string_view prefix, std::string_view key) {
    if (!key.starts_with(prefix) || key.size() == prefix.size()) {
        return std::nullopt;
    }
    return std::string(key.substr(prefix.size()));
}

} // anonymous namespace

std::string counter_key(std::string_view code) {
    return with_prefix(kCounterKeyPrefix, code);
}

std::optional<std::string> code_from_counter_key(std::string_view key) {
    return strip_prefix(kCounterKeyPrefix, key);
}

std::string in_flight_key(std::string_view code) {
    return with_prefix(kInFlightKeyPrefix, code);
}

std::optional<std::string> code_from_in_flight_key(std::string_view key) {
    return strip_prefix(kInFlightKeyPrefix, key);
}

} // namespace shortlink
