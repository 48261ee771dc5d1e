#include "selector.hpp"

#include "errors.hpp"
#include "log.hpp"

#include <limits>
#include <utility>

namespace lisel {

const char* selection_mode_name(SelectionMode mode) {
    switch (mode) {
        case SelectionMode::RegexCorrespondence: return "regex";
        case SelectionMode::NumericRangeCorrespondence: return "line-number";
    }
    return "unknown";
}

RunConfiguration RunConfiguration::resolve(const std::optional<std::string>& index_pattern, bool invert,
                                           bool line_number_index) {
    RunConfiguration config;
    config.invert = invert;
    if (line_number_index) {
        if (invert) {
            throw SelectionError(ErrorKind::InvertUnsupportedInNumericMode,
                                 "--index-invert-match cannot be combined with --index-line-number");
        }
        config.mode = SelectionMode::NumericRangeCorrespondence;
        return config;
    }
    config.mode = SelectionMode::RegexCorrespondence;
    config.regex = Regex::compile(index_pattern.value_or(kDefaultIndexPattern));
    return config;
}

CorrespondenceEngine::CorrespondenceEngine(RunConfiguration config, LineSource& index, LineSource& target)
    : pass_(RangePass{}), index_(index), target_(target) {
    if (config.mode == SelectionMode::NumericRangeCorrespondence) {
        if (config.invert) {
            throw SelectionError(ErrorKind::InvertUnsupportedInNumericMode,
                                 "inverting line ranges is not supported");
        }
    } else {
        Regex matcher = config.regex ? std::move(*config.regex) : Regex::compile(kDefaultIndexPattern);
        pass_ = RegexPass{std::move(matcher), config.invert};
    }
    LISEL_LOG_DEBUG("select", "mode=" << selection_mode_name(config.mode) << " invert=" << config.invert
                                      << " index=" << index_.name() << " target=" << target_.name());
}

SelectionMode CorrespondenceEngine::mode() const {
    return std::holds_alternative<RegexPass>(pass_) ? SelectionMode::RegexCorrespondence
                                                    : SelectionMode::NumericRangeCorrespondence;
}

std::optional<Line> CorrespondenceEngine::next() {
    if (finished_) return std::nullopt;
    if (auto* regex_pass = std::get_if<RegexPass>(&pass_)) return next_by_regex(*regex_pass);
    return next_by_range(std::get<RangePass>(pass_));
}

std::uint64_t CorrespondenceEngine::run(OutputEmitter& emitter) {
    std::uint64_t emitted = 0;
    while (auto line = next()) {
        emitter.emit(*line);
        ++emitted;
    }
    LISEL_LOG_DEBUG("select", "emitted " << emitted << " lines; read " << index_.consumed() << " index and "
                                         << target_.consumed() << " target lines");
    return emitted;
}

std::optional<Line> CorrespondenceEngine::next_by_regex(RegexPass& pass) {
    while (true) {
        // INDEX first, so TARGET is left unread once INDEX runs out.
        auto index_line = index_.next();
        if (!index_line) break;
        auto target_line = target_.next();
        if (!target_line) break;

        bool matched = pass.matcher.search(index_line->text);
        LISEL_LOG_TRACE("select", "index=" << index_line->number << " matched=" << matched
                                           << " emit=" << (matched != pass.invert));
        if (matched != pass.invert) return target_line;
    }
    finished_ = true;
    return std::nullopt;
}

std::optional<Line> CorrespondenceEngine::next_by_range(RangePass& pass) {
    while (true) {
        if (!pass.current && !load_next_range(pass)) break;
        const RangeDescriptor& range = *pass.current;

        if (range.end && pass.cursor > *range.end) {
            pass.current.reset();
            continue;
        }
        if (target_.exhausted()) {
            // Keep the cursor moving so overlaps are still reported on a short TARGET.
            advance_past(pass, range);
            pass.current.reset();
            continue;
        }

        auto target_line = target_.next();
        if (!target_line) continue;
        std::uint64_t line_number = pass.cursor++;
        if (line_number < range.floor()) {
            LISEL_LOG_TRACE("select", "skip target line " << line_number);
            continue;
        }
        return target_line;
    }
    finished_ = true;
    return std::nullopt;
}

bool CorrespondenceEngine::load_next_range(RangePass& pass) {
    while (auto index_line = index_.next()) {
        RangeDescriptor range = parse_range_token(index_line->text, index_line->number);
        pass.validator.validate(range, index_line->number, index_line->text);

        if (pass.drained) {
            LISEL_LOG_DEBUG("select", "index line " << index_line->number << ": " << range.to_string()
                                                    << " is past the end of target");
            continue;
        }
        if (range.floor() < pass.cursor) {
            throw SelectionError(ErrorKind::NonMonotonicRange,
                                 "range starts at line " + std::to_string(range.floor()) +
                                     " but target lines up to " + std::to_string(pass.cursor - 1) +
                                     " were already consumed",
                                 index_line->number, index_line->text);
        }

        LISEL_LOG_DEBUG("select", "index line " << index_line->number << ": range " << range.to_string());
        pass.current = range;
        return true;
    }
    return false;
}

void CorrespondenceEngine::advance_past(RangePass& pass, const RangeDescriptor& range) {
    if (!range.end || *range.end == std::numeric_limits<std::uint64_t>::max()) {
        pass.drained = true;
        return;
    }
    if (*range.end >= pass.cursor) pass.cursor = *range.end + 1;
}

} // namespace lisel
