#include "mpcopy/storage/wire_format.hpp"

#include <cctype>
#include <charconv>
#include <iomanip>
#include <sstream>
#include <utility>

namespace mpcopy::storage {
namespace {

constexpr std::string_view kRangePrefix = "bytes=";

bool is_unreserved(unsigned char c) {
    if (std::isalnum(c)) {
        return true;
    }
    switch (c) {
        case '-': case '_': case '.': case '!': case '~':
        case '*': case '\'': case '(': case ')':
            return true;
        default:
            return false;
    }
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool parse_offset(std::string_view text, std::int64_t& out) {
    if (text.empty()) {
        return false;
    }
    const auto* begin = text.data();
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, out);
    return ec == std::errc() && ptr == end && out >= 0;
}

CopyError malformed(std::string message, std::string_view input) {
    return make_error(ErrorKind::InvalidInput, std::move(message), {{"input", std::string(input)}});
}

} // namespace

std::string encode_copy_source(const ObjectLocation& source) {
    const std::string raw = source.bucket + "/" + source.key;
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setfill('0');
    for (unsigned char c : raw) {
        if (is_unreserved(c)) {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return oss.str();
}

Result<ObjectLocation> decode_copy_source(std::string_view encoded) {
    std::string decoded;
    decoded.reserve(encoded.size());
    for (std::size_t i = 0; i < encoded.size(); ++i) {
        if (encoded[i] != '%') {
            decoded.push_back(encoded[i]);
            continue;
        }
        if (i + 2 >= encoded.size()) {
            return Err<ObjectLocation>(malformed("Truncated percent escape in copy source", encoded));
        }
        const int high = hex_value(encoded[i + 1]);
        const int low = hex_value(encoded[i + 2]);
        if (high < 0 || low < 0) {
            return Err<ObjectLocation>(malformed("Invalid percent escape in copy source", encoded));
        }
        decoded.push_back(static_cast<char>(high * 16 + low));
        i += 2;
    }

    const auto slash = decoded.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 == decoded.size()) {
        return Err<ObjectLocation>(malformed("Copy source must be <bucket>/<key>", encoded));
    }
    return Ok(ObjectLocation{decoded.substr(0, slash), decoded.substr(slash + 1)});
}

std::string format_copy_source_range(const ByteRange& range) {
    std::ostringstream oss;
    oss << kRangePrefix << range.first << '-' << range.last;
    return oss.str();
}

Result<ByteRange> parse_copy_source_range(std::string_view header) {
    if (header.substr(0, kRangePrefix.size()) != kRangePrefix) {
        return Err<ByteRange>(malformed("Copy source range must start with 'bytes='", header));
    }
    const auto bounds = header.substr(kRangePrefix.size());
    const auto dash = bounds.find('-');
    if (dash == std::string_view::npos) {
        return Err<ByteRange>(malformed("Copy source range must be <first>-<last>", header));
    }

    ByteRange range;
    if (!parse_offset(bounds.substr(0, dash), range.first) || !parse_offset(bounds.substr(dash + 1), range.last)) {
        return Err<ByteRange>(malformed("Copy source range offsets must be non-negative integers", header));
    }
    if (range.last < range.first) {
        return Err<ByteRange>(malformed("Copy source range ends before it starts", header));
    }
    return Ok(range);
}

} // namespace mpcopy::storage
