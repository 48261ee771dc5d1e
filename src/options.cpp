#include "options.hpp"

#include "errors.hpp"
#include "line_source.hpp"
#include "log.hpp"
#include "selector.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace lisel {

namespace {

const char* const kStdinName = "<stdin>";

std::string require_value(const std::vector<std::string>& args, size_t& arg_index, const std::string& option) {
    if (++arg_index >= args.size()) throw UsageError(option + " requires a pattern argument");
    return args[arg_index];
}

void apply_long_option(const std::vector<std::string>& args, size_t& arg_index, Options& options) {
    std::string name = args[arg_index].substr(2);
    std::optional<std::string> inline_value;
    size_t eq = name.find('=');
    if (eq != std::string::npos) {
        inline_value = name.substr(eq + 1);
        name.resize(eq);
    }

    if (name == "index-regex") {
        options.index_regex = inline_value ? *inline_value : require_value(args, arg_index, "--index-regex");
        return;
    }
    if (inline_value) throw UsageError("option '--" + name + "' does not take a value");

    if (name == "index-invert-match") {
        options.invert_match = true;
    } else if (name == "index-line-number") {
        options.line_number_index = true;
    } else if (name == "swap-file-role") {
        options.swap_file_role = true;
    } else if (name == "help") {
        options.show_help = true;
    } else if (name == "version") {
        options.show_version = true;
    } else {
        throw UsageError("unknown option '--" + name + "'");
    }
}

// Short flags may be clustered ("-sv"); -e takes the rest of the cluster or the next argument.
void apply_short_options(const std::vector<std::string>& args, size_t& arg_index, Options& options) {
    const std::string& cluster = args[arg_index];
    for (size_t flag_index = 1; flag_index < cluster.size(); ++flag_index) {
        switch (cluster[flag_index]) {
            case 'e': {
                std::string attached = cluster.substr(flag_index + 1);
                options.index_regex = attached.empty() ? require_value(args, arg_index, "-e") : attached;
                return;
            }
            case 'v': options.invert_match = true; break;
            case 'n': options.line_number_index = true; break;
            case 's': options.swap_file_role = true; break;
            case 'h': options.show_help = true; break;
            case 'V': options.show_version = true; break;
            default:
                throw UsageError(std::string("unknown option '-") + cluster[flag_index] + "'");
        }
    }
}

// An opened line stream together with the name used in diagnostics.
struct BoundStream {
    std::istream* stream = nullptr;
    std::string name;
};

BoundStream open_input(const std::string& path, std::istream& in, std::unique_ptr<std::ifstream>& storage) {
    if (path == "-") return {&in, kStdinName};

    std::error_code status_error;
    if (fs::is_directory(path, status_error)) throw SelectionError(ErrorKind::Io, path + ": is a directory");
    storage = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!storage->is_open()) throw SelectionError(ErrorKind::Io, "could not open file " + path);
    return {storage.get(), path};
}

} // namespace

Options parse_options(const std::vector<std::string>& args) {
    Options options;
    bool options_done = false;

    for (size_t arg_index = 0; arg_index < args.size(); ++arg_index) {
        const std::string& current_argument = args[arg_index];

        if (options_done || current_argument.size() < 2 || current_argument[0] != '-') {
            options.files.push_back(current_argument);
        } else if (current_argument == "--") {
            options_done = true;
        } else if (current_argument[1] == '-') {
            apply_long_option(args, arg_index, options);
        } else {
            apply_short_options(args, arg_index, options);
        }
    }

    if (options.show_help || options.show_version) return options;

    if (options.files.empty()) throw UsageError("expected an INDEX file");
    if (options.files.size() > 2) {
        throw UsageError("expected one or two files, got " + std::to_string(options.files.size()));
    }
    // With one file the other role is already standard input.
    bool stdin_twice = (options.files.size() == 1) ? options.files[0] == "-"
                                                   : options.files[0] == "-" && options.files[1] == "-";
    if (stdin_twice) throw UsageError("standard input can only be bound to one role");
    if (options.index_regex && options.line_number_index) {
        throw UsageError("--index-regex cannot be used with --index-line-number");
    }
    return options;
}

void print_usage(std::ostream& out) {
    out << "Usage: lisel [-s] [-v] [-e PATTERN | -n] INDEX [TARGET]\n";
}

void print_help(std::ostream& out) {
    out << "lisel " << kVersion << " - select lines from TARGET by INDEX\n\n";
    print_usage(out);
    out << "\n"
           "With two files the first is INDEX and the second TARGET. With one file,\n"
           "that file is INDEX and TARGET is read from standard input.\n\n"
           "Options:\n"
           "  -e, --index-regex PATTERN   emit TARGET line i when INDEX line i matches\n"
           "                              PATTERN (default: " << kDefaultIndexPattern << ")\n"
           "  -v, --index-invert-match    emit TARGET line i when INDEX line i does not match\n"
           "  -n, --index-line-number     read INDEX lines as TARGET line numbers:\n"
           "                                N       line N\n"
           "                                N1,N2   lines N1 to N2\n"
           "                                N,      line N to the end\n"
           "                                ,N      the first line to line N\n"
           "                              each range must start past the previous one\n"
           "  -s, --swap-file-role        swap the INDEX and TARGET roles\n"
           "  -h, --help                  print this help\n"
           "  -V, --version               print the version\n\n"
           "Set LISEL_LOG=debug (or e.g. select=trace,*=warn) for diagnostics on stderr.\n";
}

int run_lisel(const std::vector<std::string>& args, std::istream& in, std::ostream& out, std::ostream& err) {
    Options options;
    try {
        options = parse_options(args);
    } catch (const UsageError& usage_error) {
        err << "lisel: " << usage_error.what() << '\n';
        print_usage(err);
        return 1;
    }

    if (options.show_help) {
        print_help(out);
        return 0;
    }
    if (options.show_version) {
        out << "lisel " << kVersion << '\n';
        return 0;
    }

    try {
        RunConfiguration config =
            RunConfiguration::resolve(options.index_regex, options.invert_match, options.line_number_index);

        std::unique_ptr<std::ifstream> first_file;
        std::unique_ptr<std::ifstream> second_file;
        BoundStream index_binding = open_input(options.files[0], in, first_file);
        BoundStream target_binding = (options.files.size() == 2)
                                         ? open_input(options.files[1], in, second_file)
                                         : BoundStream{&in, kStdinName};
        if (options.swap_file_role) std::swap(index_binding, target_binding);

        LISEL_LOG_INFO("cli", "index=" << index_binding.name << " target=" << target_binding.name);

        LineSource index(*index_binding.stream, index_binding.name);
        LineSource target(*target_binding.stream, target_binding.name);
        CorrespondenceEngine engine(std::move(config), index, target);
        OutputEmitter emitter(out);
        engine.run(emitter);
    } catch (const SelectionError& selection_error) {
        out.flush();
        err << "lisel: " << selection_error.what() << '\n';
        return 1;
    }
    return 0;
}

} // namespace lisel
