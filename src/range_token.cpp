#include "range_token.hpp"

#include "errors.hpp"
#include "log.hpp"

#include <charconv>

namespace lisel {

namespace {

[[noreturn]] void malformed(const std::string& detail, std::string_view text, std::uint64_t index_line) {
    throw SelectionError(ErrorKind::MalformedRange, detail, index_line, std::string(text));
}

// Parses a 1-based line number made of decimal digits only.
std::uint64_t parse_line_number(std::string_view digits, std::string_view text, std::uint64_t index_line) {
    for (char c : digits) {
        if (c < '0' || c > '9') malformed("expected N, N1,N2, N, or ,N", text, index_line);
    }

    std::uint64_t value = 0;
    auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec == std::errc::result_out_of_range) malformed("line number out of range", text, index_line);
    if (ec != std::errc() || end != digits.data() + digits.size()) {
        malformed("expected N, N1,N2, N, or ,N", text, index_line);
    }
    if (value == 0) malformed("line numbers start at 1", text, index_line);
    return value;
}

} // namespace

std::string RangeDescriptor::to_string() const {
    std::string token;
    if (start) token += std::to_string(*start);
    if (start && end && *start == *end) return token;
    token += ',';
    if (end) token += std::to_string(*end);
    return token;
}

RangeDescriptor parse_range_token(std::string_view text, std::uint64_t index_line) {
    if (text.empty()) malformed("empty range", text, index_line);

    size_t comma = text.find(',');
    if (comma == std::string_view::npos) {
        std::uint64_t line_number = parse_line_number(text, text, index_line);
        return {line_number, line_number};
    }
    if (text.find(',', comma + 1) != std::string_view::npos) malformed("more than one ','", text, index_line);

    std::string_view left = text.substr(0, comma);
    std::string_view right = text.substr(comma + 1);
    if (left.empty() && right.empty()) malformed("range has neither start nor end", text, index_line);

    RangeDescriptor range;
    if (!left.empty()) range.start = parse_line_number(left, text, index_line);
    if (!right.empty()) range.end = parse_line_number(right, text, index_line);
    return range;
}

void RangeSequenceValidator::validate(const RangeDescriptor& range, std::uint64_t index_line, std::string_view text) {
    if (range.start && range.end && *range.start > *range.end) {
        throw SelectionError(ErrorKind::NonMonotonicRange,
                             "range start " + std::to_string(*range.start) + " is after its end " +
                                 std::to_string(*range.end),
                             index_line, std::string(text));
    }

    std::uint64_t floor = range.floor();
    if (last_floor_ && floor <= *last_floor_) {
        throw SelectionError(ErrorKind::NonMonotonicRange,
                             "range floor " + std::to_string(floor) + " does not exceed previous floor " +
                                 std::to_string(*last_floor_),
                             index_line, std::string(text));
    }

    // ",N" claims everything up to N, so the next range has to start past it.
    last_floor_ = range.start ? *range.start : *range.end;
    LISEL_LOG_TRACE("range", "index line " << index_line << ": accepted " << range.to_string() << ", floor now "
                                           << *last_floor_);
}

} // namespace lisel
