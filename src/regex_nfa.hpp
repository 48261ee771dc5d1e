#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lisel {

// --- NFA Opcodes ---
/**
 * Literal states store the byte they match (0..255) as their character code;
 * the constructs below need codes outside that range.
 */
enum RegexOpcode {
    OPCODE_SPLIT = 256,   // epsilon fork, follows both transitions without consuming input
    OPCODE_MATCH_ANY,     // '.'
    OPCODE_MATCH_CLASS,   // '[...]', '\d', '\w', '\s' and their negations
    OPCODE_MATCH_START,   // '^', zero-width
    OPCODE_MATCH_END,     // '$', zero-width
    OPCODE_MATCHED = 1000
};

// --- NFA State Definition ---
struct NfaState {
    int character_code = -1;
    // Indices into the owning Regex's state arena; -1 means no transition.
    int primary_transition = -1;
    int alternative_transition = -1;
    bool negated_class = false;
    std::vector<std::pair<unsigned char, unsigned char>> class_ranges;  // inclusive
};

/**
 * Regex is a compiled expression: a Thompson NFA held in a flat arena of
 * states, simulated one input byte at a time.
 *
 * The subject of a search is one whole line; the search is unanchored unless
 * the pattern itself uses '^' or '$'. A compiled Regex is immutable and can be
 * searched any number of times.
 */
class Regex {
public:
    /// Throws SelectionError(RegexCompileError) naming the offset of the problem.
    static Regex compile(std::string_view pattern);

    bool search(std::string_view subject) const;

    const std::string& pattern() const { return pattern_; }
    std::size_t state_count() const { return states_.size(); }

private:
    Regex() = default;

    std::string pattern_;
    std::vector<NfaState> states_;
    int start_state_ = -1;
};

} // namespace lisel
