#include "regex_nfa.hpp"

#include "errors.hpp"
#include "log.hpp"

#include <cctype>
#include <optional>

namespace lisel {

namespace {

// --- NFA Fragment Definition ---
/**
 * While parsing, the NFA is built from fragments: an entry state plus the
 * transitions that are still unconnected. Each dangling slot is a
 * (state, which-transition) pair patched once the next piece is known.
 */
struct DanglingSlot {
    int state;
    bool alternative;
};

struct NfaFragment {
    int start_state;
    std::vector<DanglingSlot> dangling_outputs;
};

using ClassRanges = std::vector<std::pair<unsigned char, unsigned char>>;

void append_shorthand_class(char name, ClassRanges& ranges) {
    switch (name) {
        case 'd':
            ranges.emplace_back('0', '9');
            break;
        case 'w':
            ranges.emplace_back('0', '9');
            ranges.emplace_back('A', 'Z');
            ranges.emplace_back('_', '_');
            ranges.emplace_back('a', 'z');
            break;
        case 's':
            ranges.emplace_back('\t', '\r');
            ranges.emplace_back(' ', ' ');
            break;
    }
}

bool is_shorthand_class(char c) {
    return c == 'd' || c == 'w' || c == 's';
}

// \D, \W and \S inside a bracket expression: the complement over all bytes.
void append_negated_shorthand_class(char name, ClassRanges& ranges) {
    ClassRanges positive;
    append_shorthand_class(name, positive);
    int next_low = 0;
    for (const auto& [low, high] : positive) {
        if (low > next_low) {
            ranges.emplace_back(static_cast<unsigned char>(next_low), static_cast<unsigned char>(low - 1));
        }
        next_low = high + 1;
    }
    if (next_low <= 255) ranges.emplace_back(static_cast<unsigned char>(next_low), 255);
}

char escaped_literal(char c) {
    if (c == 't') return '\t';
    if (c == 'n') return '\n';
    if (c == 'r') return '\r';
    return c;
}

// --- NFA Construction ---
/**
 * Recursive-descent parser over the pattern, lowest precedence first:
 *
 *   alternation   := concatenation ('|' concatenation)*
 *   concatenation := repetition*
 *   repetition    := primary ('*' | '+' | '?')*
 *   primary       := literal | '.' | '^' | '$' | escape | '[' class ']' | '(' alternation ')'
 */
class NfaCompiler {
public:
    NfaCompiler(std::string_view pattern, std::vector<NfaState>& states) : pattern_(pattern), states_(states) {}

    int compile() {
        NfaFragment complete_fragment = parse_alternation();
        if (!at_end()) {
            if (peek() == ')') fail("unmatched ')'", position_);
            fail("syntax error", position_);
        }

        int matched_state = add_state(OPCODE_MATCHED);
        patch(complete_fragment.dangling_outputs, matched_state);
        return complete_fragment.start_state;
    }

private:
    NfaFragment parse_alternation() {
        NfaFragment left_fragment = parse_concatenation();
        while (!at_end() && peek() == '|') {
            take();
            NfaFragment right_fragment = parse_concatenation();

            int split_state = add_state(OPCODE_SPLIT);
            states_[split_state].primary_transition = left_fragment.start_state;
            states_[split_state].alternative_transition = right_fragment.start_state;

            left_fragment.start_state = split_state;
            left_fragment.dangling_outputs.insert(left_fragment.dangling_outputs.end(),
                                                  right_fragment.dangling_outputs.begin(),
                                                  right_fragment.dangling_outputs.end());
        }
        return left_fragment;
    }

    NfaFragment parse_concatenation() {
        std::optional<NfaFragment> sequence;
        while (!at_end() && peek() != '|' && peek() != ')') {
            NfaFragment next_fragment = parse_repetition();
            if (!sequence) {
                sequence = std::move(next_fragment);
                continue;
            }
            patch(sequence->dangling_outputs, next_fragment.start_state);
            sequence->dangling_outputs = std::move(next_fragment.dangling_outputs);
        }
        return sequence ? std::move(*sequence) : empty_fragment();
    }

    NfaFragment parse_repetition() {
        NfaFragment fragment = parse_primary_element();
        while (!at_end() && (peek() == '*' || peek() == '+' || peek() == '?')) {
            char quantifier = take();
            int split_state = add_state(OPCODE_SPLIT);
            states_[split_state].primary_transition = fragment.start_state;

            switch (quantifier) {
                case '*':
                    // split -> (fragment -> split) | out
                    patch(fragment.dangling_outputs, split_state);
                    fragment = {split_state, {{split_state, true}}};
                    break;
                case '+':
                    // fragment -> split -> (fragment | out)
                    patch(fragment.dangling_outputs, split_state);
                    fragment.dangling_outputs = {{split_state, true}};
                    break;
                default:
                    // split -> fragment | out
                    fragment.start_state = split_state;
                    fragment.dangling_outputs.push_back({split_state, true});
                    break;
            }
        }
        return fragment;
    }

    NfaFragment parse_primary_element() {
        size_t element_position = position_;
        char current_char = take();

        switch (current_char) {
            case '*':
            case '+':
            case '?':
                fail("nothing to repeat", element_position);
            case '.':
                return single_state(OPCODE_MATCH_ANY);
            case '^':
                return single_state(OPCODE_MATCH_START);
            case '$':
                return single_state(OPCODE_MATCH_END);
            case '\\':
                return parse_escape(element_position);
            case '[':
                return parse_bracket_expression(element_position);
            case '(': {
                NfaFragment inner_fragment = parse_alternation();
                if (at_end() || peek() != ')') fail("expected ')' to close group", element_position);
                take();
                return inner_fragment;
            }
            default:
                return single_state(static_cast<unsigned char>(current_char));
        }
    }

    NfaFragment parse_escape(size_t escape_position) {
        if (at_end()) fail("trailing backslash", escape_position);
        char escaped = take();

        // \D, \W and \S are the complements of \d, \w and \s.
        char lowered = static_cast<char>(std::tolower(static_cast<unsigned char>(escaped)));
        if (is_shorthand_class(lowered)) {
            ClassRanges ranges;
            append_shorthand_class(lowered, ranges);
            return class_state(std::move(ranges), lowered != escaped);
        }
        if (std::isdigit(static_cast<unsigned char>(escaped))) {
            fail("backreferences are not supported", escape_position);
        }
        return single_state(static_cast<unsigned char>(escaped_literal(escaped)));
    }

    NfaFragment parse_bracket_expression(size_t open_position) {
        ClassRanges ranges;
        bool is_negated = false;
        if (!at_end() && peek() == '^') {
            is_negated = true;
            take();
        }

        // A ']' right after '[' or '[^' is a literal member.
        bool first_member = true;
        while (true) {
            if (at_end()) fail("unclosed bracket expression", open_position);
            char member = take();
            if (member == ']' && !first_member) break;
            first_member = false;

            unsigned char low = static_cast<unsigned char>(member);
            if (member == '\\') {
                if (at_end()) fail("unclosed bracket expression", open_position);
                char escaped = take();
                if (is_shorthand_class(escaped)) {
                    append_shorthand_class(escaped, ranges);
                    continue;
                }
                char lowered = static_cast<char>(std::tolower(static_cast<unsigned char>(escaped)));
                if (lowered != escaped && is_shorthand_class(lowered)) {
                    append_negated_shorthand_class(lowered, ranges);
                    continue;
                }
                low = static_cast<unsigned char>(escaped_literal(escaped));
            }

            unsigned char high = low;
            if (position_ + 1 < pattern_.size() && peek() == '-' && pattern_[position_ + 1] != ']') {
                size_t range_position = position_;
                take();
                char upper = take();
                if (upper == '\\') {
                    if (at_end()) fail("unclosed bracket expression", open_position);
                    upper = escaped_literal(take());
                }
                high = static_cast<unsigned char>(upper);
                if (high < low) fail("reversed range in bracket expression", range_position);
            }
            ranges.emplace_back(low, high);
        }
        return class_state(std::move(ranges), is_negated);
    }

    NfaFragment single_state(int character_code) {
        int state = add_state(character_code);
        return {state, {{state, false}}};
    }

    NfaFragment class_state(ClassRanges ranges, bool is_negated) {
        int state = add_state(OPCODE_MATCH_CLASS);
        states_[state].class_ranges = std::move(ranges);
        states_[state].negated_class = is_negated;
        return {state, {{state, false}}};
    }

    // Matches the empty string: "()", "a|", or an empty pattern.
    NfaFragment empty_fragment() {
        int state = add_state(OPCODE_SPLIT);
        return {state, {{state, false}}};
    }

    int add_state(int character_code) {
        NfaState state;
        state.character_code = character_code;
        states_.push_back(std::move(state));
        return static_cast<int>(states_.size() - 1);
    }

    void patch(const std::vector<DanglingSlot>& dangling_outputs, int target_state) {
        for (const DanglingSlot& slot : dangling_outputs) {
            NfaState& state = states_[slot.state];
            (slot.alternative ? state.alternative_transition : state.primary_transition) = target_state;
        }
    }

    [[noreturn]] void fail(const std::string& message, size_t offset) const {
        throw SelectionError(ErrorKind::RegexCompileError,
                             message + " at offset " + std::to_string(offset) + " in pattern \"" +
                                 std::string(pattern_) + "\"");
    }

    bool at_end() const { return position_ >= pattern_.size(); }
    char peek() const { return pattern_[position_]; }
    char take() { return pattern_[position_++]; }

    std::string_view pattern_;
    size_t position_ = 0;
    std::vector<NfaState>& states_;
};

// --- NFA Simulation ---
/**
 * Walks the NFA over one subject. Every position holds the set of states
 * that consume the next byte; zero-width states (splits and anchors) are
 * resolved while that set is built. last_list_id stops epsilon loops and
 * duplicate entries within one step.
 */
class NfaSimulation {
public:
    NfaSimulation(const std::vector<NfaState>& states, std::string_view subject)
        : states_(states), subject_(subject), last_list_id_(states.size(), -1) {}

    bool run(int start_state) {
        std::vector<int> current_states;
        std::vector<int> next_states;

        ++list_id_;
        if (add_state_with_epsilon_closure(start_state, 0, current_states)) return true;

        for (size_t position = 0; position < subject_.size();) {
            unsigned char input_char = static_cast<unsigned char>(subject_[position++]);
            ++list_id_;
            next_states.clear();

            for (int state : current_states) {
                if (consumes(states_[state], input_char) &&
                    add_state_with_epsilon_closure(states_[state].primary_transition, position, next_states)) {
                    return true;
                }
            }
            // Unanchored: a new attempt may begin after every byte.
            if (add_state_with_epsilon_closure(start_state, position, next_states)) return true;

            current_states.swap(next_states);
        }
        return false;
    }

private:
    // Returns true as soon as the matched state becomes reachable.
    bool add_state_with_epsilon_closure(int state_index, size_t position, std::vector<int>& active_states) {
        if (state_index < 0 || last_list_id_[state_index] == list_id_) return false;
        last_list_id_[state_index] = list_id_;

        const NfaState& state = states_[state_index];
        switch (state.character_code) {
            case OPCODE_MATCHED:
                return true;
            case OPCODE_SPLIT:
                return add_state_with_epsilon_closure(state.primary_transition, position, active_states) ||
                       add_state_with_epsilon_closure(state.alternative_transition, position, active_states);
            case OPCODE_MATCH_START:
                return position == 0 &&
                       add_state_with_epsilon_closure(state.primary_transition, position, active_states);
            case OPCODE_MATCH_END:
                return position == subject_.size() &&
                       add_state_with_epsilon_closure(state.primary_transition, position, active_states);
            default:
                active_states.push_back(state_index);
                return false;
        }
    }

    static bool consumes(const NfaState& state, unsigned char input_char) {
        switch (state.character_code) {
            case OPCODE_MATCH_ANY:
                return true;
            case OPCODE_MATCH_CLASS: {
                bool in_class = false;
                for (const auto& range : state.class_ranges) {
                    if (input_char >= range.first && input_char <= range.second) {
                        in_class = true;
                        break;
                    }
                }
                return in_class != state.negated_class;
            }
            default:
                return state.character_code == input_char;
        }
    }

    const std::vector<NfaState>& states_;
    std::string_view subject_;
    std::vector<int> last_list_id_;
    int list_id_ = 0;
};

} // namespace

Regex Regex::compile(std::string_view pattern) {
    Regex regex;
    regex.pattern_ = std::string(pattern);
    NfaCompiler compiler(regex.pattern_, regex.states_);
    regex.start_state_ = compiler.compile();
    LISEL_LOG_DEBUG("regex", "compiled \"" << regex.pattern_ << "\" into " << regex.states_.size() << " states");
    return regex;
}

bool Regex::search(std::string_view subject) const {
    NfaSimulation simulation(states_, subject);
    return simulation.run(start_state_);
}

} // namespace lisel
