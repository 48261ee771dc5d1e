#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace lisel {

// --- Error Kinds ---
enum class ErrorKind {
    MalformedRange,                  // numeric-mode INDEX line is not N, N, ,N or N1,N2
    NonMonotonicRange,               // range floor does not strictly increase, or start > end
    InvertUnsupportedInNumericMode,  // -v together with -n
    RegexCompileError,               // INDEX pattern does not compile
    Io                               // a line source could not be opened or read
};

const char* error_kind_name(ErrorKind kind);

/**
 * SelectionError is the single exception type raised by the selection core.
 *
 * Per-line errors (MalformedRange, NonMonotonicRange) carry the INDEX line
 * number and its raw text, so the diagnostic is enough to find the problem
 * without re-running with logging enabled.
 */
class SelectionError : public std::runtime_error {
public:
    SelectionError(ErrorKind kind, const std::string& detail);
    SelectionError(ErrorKind kind, const std::string& detail, std::uint64_t index_line, std::string index_text);

    ErrorKind kind() const noexcept { return kind_; }
    std::uint64_t index_line() const noexcept { return index_line_; }
    const std::string& index_text() const noexcept { return index_text_; }
    const std::string& detail() const noexcept { return detail_; }

private:
    ErrorKind kind_;
    std::uint64_t index_line_ = 0;  // 0 when the error is not tied to an INDEX line
    std::string index_text_;
    std::string detail_;
};

// Raised for command-line problems; the caller prints usage alongside it.
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace lisel
