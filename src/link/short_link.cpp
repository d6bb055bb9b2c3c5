#include "link/short_link.hpp"

#include "common/error.hpp"

#include <algorithm>
#include <cctype>

namespace shortlink {

namespace {

bool is_code_char(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_';
}

bool iequals_prefix(std::string_view s, std::string_view prefix) {
    if (s.size() < prefix.size()) return false;
    return std::equal(prefix.begin(), prefix.end(), s.begin(),
                      [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                      });
}

void clip(std::string& s, std::size_t max) {
    if (s.size() > max) {
        s.resize(max);
    }
}

void clip(std::optional<std::string>& s, std::size_t max) {
    if (s) {
        clip(*s, max);
    }
}

} // anonymous namespace

std::error_code validate_code(std::string_view code) {
    if (code.empty() || code.size() > kMaxCodeLength) {
        return Errc::invalid_code;
    }
    if (!std::all_of(code.begin(), code.end(),
                     [](char c) { return is_code_char(static_cast<unsigned char>(c)); })) {
        return Errc::invalid_code;
    }
    return {};
}

std::error_code validate_target_url(std::string_view url) {
    if (url.empty() || url.size() > kMaxTargetUrlLength) {
        return Errc::invalid_url;
    }
    if (std::any_of(url.begin(), url.end(), [](char c) {
            auto uc = static_cast<unsigned char>(c);
            return std::isspace(uc) || std::iscntrl(uc);
        })) {
        return Errc::invalid_url;
    }

    std::string_view rest;
    if (iequals_prefix(url, "https://")) {
        rest = url.substr(8);
    } else if (iequals_prefix(url, "http://")) {
        rest = url.substr(7);
    } else {
        return Errc::invalid_url;
    }

    // Authority ends at the first '/', '?' or '#'.
    const auto end = rest.find_first_of("/?#");
    std::string_view authority = rest.substr(0, end);

    // Strip userinfo, then port.
    if (auto at = authority.rfind('@'); at != std::string_view::npos) {
        authority = authority.substr(at + 1);
    }
    std::string_view host = authority;
    if (!host.empty() && host.front() == '[') {
        // IPv6 literal: [::1]:8080
        const auto close = host.find(']');
        if (close == std::string_view::npos || close == 1) {
            return Errc::invalid_url;
        }
        host = host.substr(1, close - 1);
    } else if (auto colon = host.find(':'); colon != std::string_view::npos) {
        host = host.substr(0, colon);
    }

    if (host.empty()) {
        return Errc::invalid_url;
    }
    return {};
}

void truncate_visit_details(VisitDetails& details) {
    clip(details.ip_address, kMaxIpAddressLength);
    clip(details.user_agent, kMaxUserAgentLength);
    clip(details.referrer,   kMaxReferrerLength);
    clip(details.country,    kCountryCodeLength);
    clip(details.city,       kMaxCityLength);
}

} // namespace shortlink
