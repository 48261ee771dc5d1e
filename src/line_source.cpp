#include "line_source.hpp"

#include "errors.hpp"
#include "log.hpp"

#include <utility>

namespace lisel {

LineSource::LineSource(std::istream& input, std::string name) : input_(input), name_(std::move(name)) {}

std::optional<Line> LineSource::next() {
    if (exhausted_) return std::nullopt;

    Line line;
    if (!std::getline(input_, line.text)) {
        if (input_.bad()) {
            throw SelectionError(ErrorKind::Io,
                                 "read failed on " + name_ + " after line " + std::to_string(consumed_));
        }
        exhausted_ = true;
        LISEL_LOG_TRACE("io", name_ << ": end of stream after " << consumed_ << " lines");
        return std::nullopt;
    }

    // getline stops at '\n' or at end of stream; only the former leaves eof clear.
    if (!input_.eof()) {
        line.terminator = "\n";
        if (!line.text.empty() && line.text.back() == '\r') {
            line.text.pop_back();
            line.terminator = "\r\n";
        }
    }
    line.number = ++consumed_;
    return line;
}

void OutputEmitter::emit(const Line& line) {
    output_ << line.text;
    if (line.terminator.empty()) {
        output_ << '\n';
    } else {
        output_ << line.terminator;
    }
    if (!output_) {
        throw SelectionError(ErrorKind::Io, "write failed for target line " + std::to_string(line.number));
    }
    ++emitted_;
}

} // namespace lisel
