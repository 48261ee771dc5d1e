#include "errors.hpp"

#include <utility>

namespace lisel {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedRange: return "MalformedRange";
        case ErrorKind::NonMonotonicRange: return "NonMonotonicRange";
        case ErrorKind::InvertUnsupportedInNumericMode: return "InvertUnsupportedInNumericMode";
        case ErrorKind::RegexCompileError: return "RegexCompileError";
        case ErrorKind::Io: return "Io";
    }
    return "Unknown";
}

SelectionError::SelectionError(ErrorKind kind, const std::string& detail)
    : std::runtime_error(std::string(error_kind_name(kind)) + ": " + detail),
      kind_(kind),
      detail_(detail) {}

SelectionError::SelectionError(ErrorKind kind, const std::string& detail, std::uint64_t index_line, std::string index_text)
    : std::runtime_error(std::string(error_kind_name(kind)) + ": index line " + std::to_string(index_line) +
                         " \"" + index_text + "\": " + detail),
      kind_(kind),
      index_line_(index_line),
      index_text_(std::move(index_text)),
      detail_(detail) {}

} // namespace lisel
