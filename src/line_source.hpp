#pragma once

#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>
#include <string>

namespace lisel {

// One line of a stream, numbered from 1. text never includes the terminator.
struct Line {
    std::uint64_t number = 0;
    std::string text;
    std::string terminator;  // "\n", "\r\n", or empty for an unterminated last line
};

/**
 * LineSource reads a stream forward, one line at a time. It never seeks, so
 * standard input and pipes work the same as regular files.
 */
class LineSource {
public:
    LineSource(std::istream& input, std::string name);

    /// Returns nothing at end of stream; throws SelectionError(Io) if the stream fails.
    std::optional<Line> next();

    std::uint64_t consumed() const { return consumed_; }
    bool exhausted() const { return exhausted_; }
    const std::string& name() const { return name_; }

private:
    std::istream& input_;
    std::string name_;
    std::uint64_t consumed_ = 0;
    bool exhausted_ = false;
};

// Writes selected TARGET lines to the output stream in the order received.
class OutputEmitter {
public:
    explicit OutputEmitter(std::ostream& output) : output_(output) {}

    void emit(const Line& line);

    std::uint64_t emitted() const { return emitted_; }

private:
    std::ostream& output_;
    std::uint64_t emitted_ = 0;
};

} // namespace lisel
