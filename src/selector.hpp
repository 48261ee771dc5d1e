#pragma once

#include "line_source.hpp"
#include "range_token.hpp"
#include "regex_nfa.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace lisel {

enum class SelectionMode {
    RegexCorrespondence,        // INDEX line i decides TARGET line i
    NumericRangeCorrespondence  // INDEX lines are increasing TARGET line ranges
};

const char* selection_mode_name(SelectionMode mode);

// The pattern INDEX lines are tested against when none is given: any non-empty line.
inline constexpr const char* kDefaultIndexPattern = ".+";

/**
 * RunConfiguration is fixed before any line is read.
 */
struct RunConfiguration {
    SelectionMode mode = SelectionMode::RegexCorrespondence;
    std::optional<Regex> regex;  // set in regex mode only
    bool invert = false;

    /**
     * Compiles the pattern (or the default) for regex mode and rejects
     * invert in numeric mode. Throws SelectionError(RegexCompileError) or
     * SelectionError(InvertUnsupportedInNumericMode).
     */
    static RunConfiguration resolve(const std::optional<std::string>& index_pattern, bool invert,
                                    bool line_number_index);
};

/**
 * CorrespondenceEngine selects TARGET lines according to INDEX, pulling
 * both streams forward exactly once.
 *
 * next() yields selected TARGET lines in TARGET order and returns nothing once
 * the pass is over. Errors are thrown as SelectionError from next(); lines
 * handed out before the error stay handed out.
 */
class CorrespondenceEngine {
public:
    CorrespondenceEngine(RunConfiguration config, LineSource& index, LineSource& target);

    std::optional<Line> next();

    /// Drains the engine into the emitter; returns the number of lines emitted.
    std::uint64_t run(OutputEmitter& emitter);

    SelectionMode mode() const;

private:
    struct RegexPass {
        Regex matcher;
        bool invert;
    };

    struct RangePass {
        RangeSequenceValidator validator;
        std::optional<RangeDescriptor> current;
        std::uint64_t cursor = 1;  // number of the next TARGET line
        bool drained = false;      // an open-ended range consumed TARGET
    };

    std::optional<Line> next_by_regex(RegexPass& pass);
    std::optional<Line> next_by_range(RangePass& pass);
    bool load_next_range(RangePass& pass);
    static void advance_past(RangePass& pass, const RangeDescriptor& range);

    std::variant<RegexPass, RangePass> pass_;
    LineSource& index_;
    LineSource& target_;
    bool finished_ = false;
};

} // namespace lisel
