#include "common/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <optional>

namespace shortlink {

namespace {

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%f] [%n] [%^%l%$] %v";

spdlog::sink_ptr shared_sink() {
    static const auto sink = [] {
        auto s = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        s->set_pattern(kPattern);
        return s;
    }();
    return sink;
}

std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            spdlog::level::level_enum level) {
    auto logger = std::make_shared<spdlog::logger>(name, shared_sink());
    logger->set_level(level);
    return logger;
}

std::optional<spdlog::level::level_enum> lookup_level(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (s == "trace")                    return spdlog::level::trace;
    if (s == "debug")                    return spdlog::level::debug;
    if (s == "info")                     return spdlog::level::info;
    if (s == "warn" || s == "warning")   return spdlog::level::warn;
    if (s == "error" || s == "err")      return spdlog::level::err;
    if (s == "critical")                 return spdlog::level::critical;
    if (s == "off")                      return spdlog::level::off;
    return std::nullopt;
}

} // anonymous namespace

void init_default_logger(spdlog::level::level_enum level) {
    spdlog::drop("shortlink");
    spdlog::set_default_logger(make_logger("shortlink", level));
}

std::shared_ptr<spdlog::logger> make_component_logger(
    const std::string& component,
    spdlog::level::level_enum level)
{
    if (auto existing = spdlog::get(component)) {
        return existing;
    }

    auto logger = make_logger(component, level);
    spdlog::register_logger(logger);
    return logger;
}

spdlog::level::level_enum parse_log_level(const std::string& s) {
    return lookup_level(s).value_or(spdlog::level::info);
}

bool is_log_level(const std::string& s) {
    return lookup_level(s).has_value();
}

} // namespace shortlink
