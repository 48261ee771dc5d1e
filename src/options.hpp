#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace lisel {

inline constexpr const char* kVersion = "0.3.0";

// Command-line options after parsing; files are in the order given.
struct Options {
    std::vector<std::string> files;
    bool swap_file_role = false;
    std::optional<std::string> index_regex;
    bool invert_match = false;
    bool line_number_index = false;
    bool show_help = false;
    bool show_version = false;
};

/// args excludes the program name. Throws UsageError.
Options parse_options(const std::vector<std::string>& args);

void print_usage(std::ostream& out);
void print_help(std::ostream& out);

/**
 * Runs the whole tool: parses args, binds INDEX and TARGET (a file named "-"
 * or a missing TARGET file means `in`), and writes selected lines to `out`.
 * Diagnostics go to `err`. Returns the process exit status.
 */
int run_lisel(const std::vector<std::string>& args, std::istream& in, std::ostream& out, std::ostream& err);

} // namespace lisel
