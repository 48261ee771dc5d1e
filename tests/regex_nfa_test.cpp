//! # Regex Engine Tests
//!
//! Compilation errors and unanchored line search of the NFA engine.

#include "errors.hpp"
#include "regex_nfa.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace lisel;

namespace {

bool matches(const std::string& pattern, const std::string& subject) {
    return Regex::compile(pattern).search(subject);
}

ErrorKind compile_error_kind(const std::string& pattern) {
    try {
        Regex::compile(pattern);
    } catch (const SelectionError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "pattern \"" << pattern << "\" compiled";
    return ErrorKind::Io;
}

} // namespace

// ============================================================================
// Search
// ============================================================================

TEST(RegexSearchTest, DefaultPatternMatchesNonEmptyLines) {
    Regex any = Regex::compile(".+");
    EXPECT_TRUE(any.search("x"));
    EXPECT_TRUE(any.search(" "));
    EXPECT_FALSE(any.search(""));
}

TEST(RegexSearchTest, LiteralIsUnanchored) {
    EXPECT_TRUE(matches("cat", "concatenate"));
    EXPECT_FALSE(matches("cat", "ca t"));
}

TEST(RegexSearchTest, Anchors) {
    EXPECT_TRUE(matches("^$", ""));
    EXPECT_FALSE(matches("^$", "a"));
    EXPECT_TRUE(matches("^ab", "abc"));
    EXPECT_FALSE(matches("^ab", "cab"));
    EXPECT_TRUE(matches("bc$", "abc"));
    EXPECT_FALSE(matches("bc$", "bca"));
    EXPECT_TRUE(matches("a|^b", "xa"));
    EXPECT_FALSE(matches("x^b", "xb"));
}

TEST(RegexSearchTest, Quantifiers) {
    EXPECT_TRUE(matches("^ab*c$", "ac"));
    EXPECT_TRUE(matches("^ab*c$", "abbbc"));
    EXPECT_FALSE(matches("^ab+c$", "ac"));
    EXPECT_TRUE(matches("^ab+c$", "abc"));
    EXPECT_TRUE(matches("^colou?r$", "color"));
    EXPECT_TRUE(matches("^colou?r$", "colour"));
    EXPECT_FALSE(matches("^colou?r$", "colouur"));
}

TEST(RegexSearchTest, AlternationAndGroups) {
    EXPECT_TRUE(matches("^(cat|dog)s?$", "dogs"));
    EXPECT_TRUE(matches("^(cat|dog)s?$", "cat"));
    EXPECT_FALSE(matches("^(cat|dog)s?$", "cow"));
    EXPECT_TRUE(matches("^(ab)+$", "ababab"));
    EXPECT_FALSE(matches("^(ab)+$", "ababa"));
    EXPECT_TRUE(matches("^()$", ""));
    EXPECT_TRUE(matches("a|", "zzz"));
}

TEST(RegexSearchTest, ShorthandClasses) {
    EXPECT_TRUE(matches("^\\d+$", "2024"));
    EXPECT_FALSE(matches("^\\d+$", "20x4"));
    EXPECT_TRUE(matches("^\\w+$", "snake_case9"));
    EXPECT_TRUE(matches("\\s", "a b"));
    EXPECT_FALSE(matches("\\S", " \t "));
    EXPECT_TRUE(matches("^\\D+$", "abc"));
    EXPECT_FALSE(matches("\\W", "abc_1"));
}

TEST(RegexSearchTest, BracketExpressions) {
    EXPECT_TRUE(matches("^[a-c]+$", "abcab"));
    EXPECT_FALSE(matches("^[a-c]+$", "abd"));
    EXPECT_TRUE(matches("^[^,]*$", "no commas"));
    EXPECT_FALSE(matches("^[^,]*$", "a,b"));
    EXPECT_TRUE(matches("[]]", "x]"));
    EXPECT_TRUE(matches("^[a-]+$", "a-a"));
    EXPECT_TRUE(matches("^[\\d.]+$", "3.14"));
}

TEST(RegexSearchTest, NegatedShorthandsInBrackets) {
    EXPECT_TRUE(matches("^[\\D]+$", "abc"));
    EXPECT_FALSE(matches("[\\D]", "123"));
    EXPECT_TRUE(matches("^[\\W]+$", " -."));
    EXPECT_FALSE(matches("[\\W]", "W_9z"));
    EXPECT_TRUE(matches("^[\\S,]+$", "a,b"));
    EXPECT_FALSE(matches("[\\S]", " \t"));
    EXPECT_TRUE(matches("^[^\\S]+$", "  "));
}

TEST(RegexSearchTest, EscapedMetacharacters) {
    EXPECT_TRUE(matches("^a\\.b$", "a.b"));
    EXPECT_FALSE(matches("^a\\.b$", "axb"));
    EXPECT_TRUE(matches("\\(\\)", "f()"));
    EXPECT_TRUE(matches("^\\t", "\tindented"));
}

TEST(RegexSearchTest, EmptyPatternMatchesEverything) {
    EXPECT_TRUE(matches("", ""));
    EXPECT_TRUE(matches("", "anything"));
}

TEST(RegexSearchTest, NestedStarTerminates) {
    EXPECT_TRUE(matches("^(a*)*$", "aaaa"));
    EXPECT_FALSE(matches("^(a*)*$", "aaab"));
}

TEST(RegexSearchTest, CompiledRegexIsReusable) {
    Regex digits = Regex::compile("[0-9]");
    EXPECT_TRUE(digits.search("a1"));
    EXPECT_FALSE(digits.search("ab"));
    EXPECT_TRUE(digits.search("9"));
    EXPECT_EQ(digits.pattern(), "[0-9]");
}

// ============================================================================
// Compile errors
// ============================================================================

TEST(RegexCompileTest, SyntaxErrorsAreRegexCompileErrors) {
    EXPECT_EQ(compile_error_kind("[abc"), ErrorKind::RegexCompileError);
    EXPECT_EQ(compile_error_kind("(abc"), ErrorKind::RegexCompileError);
    EXPECT_EQ(compile_error_kind("abc)"), ErrorKind::RegexCompileError);
    EXPECT_EQ(compile_error_kind("*a"), ErrorKind::RegexCompileError);
    EXPECT_EQ(compile_error_kind("a|+"), ErrorKind::RegexCompileError);
    EXPECT_EQ(compile_error_kind("abc\\"), ErrorKind::RegexCompileError);
    EXPECT_EQ(compile_error_kind("(a)\\1"), ErrorKind::RegexCompileError);
    EXPECT_EQ(compile_error_kind("[z-a]"), ErrorKind::RegexCompileError);
}

TEST(RegexCompileTest, MessageNamesOffsetAndPattern) {
    try {
        Regex::compile("ab)c");
        FAIL() << "expected RegexCompileError";
    } catch (const SelectionError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("unmatched ')'"), std::string::npos) << message;
        EXPECT_NE(message.find("offset 2"), std::string::npos) << message;
        EXPECT_NE(message.find("\"ab)c\""), std::string::npos) << message;
    }
}
