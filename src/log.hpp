#pragma once

#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

/**
 * Leveled, module-tagged diagnostics written to standard error.
 *
 *   LISEL_LOG_DEBUG("select", "index=" << n << " matched=" << matched);
 *
 * Configured from the LISEL_LOG environment variable, which holds either a
 * bare level ("debug") or a filter spec ("select=trace,range=debug,*=warn").
 * Standard output is reserved for selected TARGET lines.
 */
namespace lisel::log {

enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5
};

const char* level_name(LogLevel level);

std::optional<LogLevel> level_from_name(std::string_view name);

// Unrecognised names fall back to Warn.
LogLevel parse_level(std::string_view name);

/// Per-module minimum levels with a default for everything else.
class LogFilter {
public:
    /// Format: "module=level,module=level,*=level" or a bare level.
    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) { default_level_ = level; }
    LogLevel default_level() const { return default_level_; }

    /// Level names from the last parse() that fell back to Warn.
    const std::vector<std::string>& unrecognised_levels() const { return unrecognised_levels_; }

private:
    LogLevel level_for(std::string_view name);

    LogLevel default_level_ = LogLevel::Warn;
    std::unordered_map<std::string, LogLevel> module_levels_;
    std::vector<std::string> unrecognised_levels_;
};

class Logger {
public:
    static Logger& instance();

    bool should_log(LogLevel level, std::string_view module) const { return filter_.should_log(level, module); }
    void log(LogLevel level, std::string_view module, const std::string& message);

    void set_filter(std::string_view spec);
    const LogFilter& filter() const { return filter_; }
    void set_level(LogLevel level);
    // The stream must outlive every later log call; tests point this at a stringstream.
    void set_stream(std::ostream& stream) { stream_ = &stream; }

private:
    Logger() = default;

    LogFilter filter_;
    std::ostream* stream_ = &std::cerr;
};

/// Reads LISEL_LOG; leaves the default (warn) in place when it is unset.
/// Unknown level names are reported once as a warning.
void init_from_env();

} // namespace lisel::log

#define LISEL_LOG_IMPL(level, module_str, msg)                                  \
    do {                                                                        \
        auto& logger_ = ::lisel::log::Logger::instance();                       \
        if (logger_.should_log(level, module_str)) {                            \
            std::ostringstream oss_;                                            \
            oss_ << msg;                                                        \
            logger_.log(level, module_str, oss_.str());                         \
        }                                                                       \
    } while (0)

#define LISEL_LOG_TRACE(module, msg) LISEL_LOG_IMPL(::lisel::log::LogLevel::Trace, module, msg)
#define LISEL_LOG_DEBUG(module, msg) LISEL_LOG_IMPL(::lisel::log::LogLevel::Debug, module, msg)
#define LISEL_LOG_INFO(module, msg) LISEL_LOG_IMPL(::lisel::log::LogLevel::Info, module, msg)
#define LISEL_LOG_WARN(module, msg) LISEL_LOG_IMPL(::lisel::log::LogLevel::Warn, module, msg)
#define LISEL_LOG_ERROR(module, msg) LISEL_LOG_IMPL(::lisel::log::LogLevel::Error, module, msg)
