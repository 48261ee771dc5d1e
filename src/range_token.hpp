#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lisel {

/**
 * RangeDescriptor is one numeric-mode INDEX line.
 *
 *   N      -> {N, N}        closed
 *   N1,N2  -> {N1, N2}      closed
 *   N,     -> {N, none}     from N to the end of TARGET
 *   ,N     -> {none, N}     from the first TARGET line to N
 */
struct RangeDescriptor {
    std::optional<std::uint64_t> start;
    std::optional<std::uint64_t> end;

    // First TARGET line the range can select.
    std::uint64_t floor() const { return start.value_or(1); }
    bool open_ended() const { return !end.has_value(); }
    bool contains(std::uint64_t line_number) const {
        return line_number >= floor() && (!end || line_number <= *end);
    }

    std::string to_string() const;
};

/// Throws SelectionError(MalformedRange) carrying index_line and text.
RangeDescriptor parse_range_token(std::string_view text, std::uint64_t index_line);

/**
 * Enforces strictly increasing floors across successive ranges of one run.
 * A closed range with start > end is rejected here as well.
 */
class RangeSequenceValidator {
public:
    /// Throws SelectionError(NonMonotonicRange); leaves the state untouched on failure.
    void validate(const RangeDescriptor& range, std::uint64_t index_line, std::string_view text);

    std::optional<std::uint64_t> last_floor() const { return last_floor_; }

private:
    std::optional<std::uint64_t> last_floor_;
};

} // namespace lisel
