#include "network/resp_codec.hpp"

#include <charconv>

namespace shortlink::network {

namespace {

// Parse a signed integer occupying the whole of `sv`.
bool parse_int(std::string_view sv, int64_t& out) {
    if (sv.empty()) return false;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    return ec == std::errc{} && ptr == sv.data() + sv.size();
}

ParseStatus parse_at(std::string_view buf, std::size_t& pos,
                     RespValue& out, unsigned depth) {
    if (depth > kMaxNesting) {
        return ParseStatus::Invalid;
    }

    const auto crlf = buf.find("\r\n", pos);
    if (crlf == std::string_view::npos) {
        return ParseStatus::Incomplete;
    }
    if (crlf == pos) {
        return ParseStatus::Invalid;  // empty line, no type byte
    }

    const char type = buf[pos];
    const std::string_view line = buf.substr(pos + 1, crlf - pos - 1);
    std::size_t next = crlf + 2;

    switch (type) {
        case '+':
            out = RespValue{RespType::SimpleString, std::string{line}, 0, {}};
            break;

        case '-':
            out = RespValue{RespType::Error, std::string{line}, 0, {}};
            break;

        case ':': {
            int64_t v = 0;
            if (!parse_int(line, v)) return ParseStatus::Invalid;
            out = RespValue{RespType::Integer, {}, v, {}};
            break;
        }

        case '$': {
            int64_t len = 0;
            if (!parse_int(line, len) || len < -1 || len > kMaxBulkLength) {
                return ParseStatus::Invalid;
            }
            if (len == -1) {
                out = RespValue{};
                break;
            }
            const auto n = static_cast<std::size_t>(len);
            if (buf.size() < next + n + 2) {
                return ParseStatus::Incomplete;
            }
            if (buf[next + n] != '\r' || buf[next + n + 1] != '\n') {
                return ParseStatus::Invalid;
            }
            out = RespValue{RespType::BulkString, std::string{buf.substr(next, n)}, 0, {}};
            next += n + 2;
            break;
        }

        case '*': {
            int64_t count = 0;
            if (!parse_int(line, count) || count < -1 || count > kMaxArrayCount) {
                return ParseStatus::Invalid;
            }
            if (count == -1) {
                out = RespValue{};
                break;
            }
            RespValue array{RespType::Array, {}, 0, {}};
            array.elements.reserve(static_cast<std::size_t>(count));
            for (int64_t i = 0; i < count; ++i) {
                RespValue element;
                auto status = parse_at(buf, next, element, depth + 1);
                if (status != ParseStatus::Complete) {
                    return status;
                }
                array.elements.push_back(std::move(element));
            }
            out = std::move(array);
            break;
        }

        default:
            return ParseStatus::Invalid;
    }

    pos = next;
    return ParseStatus::Complete;
}

} // anonymous namespace

std::string serialize_resp_command(const std::vector<std::string>& args) {
    std::string out = "*" + std::to_string(args.size()) + "\r\n";
    for (const auto& arg : args) {
        out += "$" + std::to_string(arg.size()) + "\r\n";
        out += arg;
        out += "\r\n";
    }
    return out;
}

ParseStatus parse_resp_value(std::string_view buf, RespValue& out, std::size_t& consumed) {
    std::size_t pos = 0;
    RespValue value;
    auto status = parse_at(buf, pos, value, 0);
    if (status == ParseStatus::Complete) {
        out = std::move(value);
        consumed = pos;
    }
    return status;
}

} // namespace shortlink::network
