#include "common/error.hpp"

namespace shortlink {

namespace {

class ShortlinkCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "shortlink"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
            case Errc::not_found:                 return "short code not found";
            case Errc::already_exists:            return "short code already exists";
            case Errc::counter_store_unavailable: return "counter store unavailable";
            case Errc::durable_store_unavailable: return "durable link store unavailable";
            case Errc::lease_denied:              return "reconciliation lease held by another owner";
            case Errc::lease_expired:             return "reconciliation lease expired";
            case Errc::invalid_code:              return "invalid short code";
            case Errc::invalid_url:               return "invalid target URL";
        }
        return "unknown shortlink error";
    }
};

} // anonymous namespace

const std::error_category& shortlink_category() noexcept {
    static const ShortlinkCategory category;
    return category;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), shortlink_category()};
}

} // namespace shortlink
