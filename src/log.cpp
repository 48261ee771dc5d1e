#include "log.hpp"

#include <cstdlib>

namespace lisel::log {

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off: return "OFF";
    }
    return "???";
}

std::optional<LogLevel> level_from_name(std::string_view name) {
    if (name == "trace" || name == "TRACE") return LogLevel::Trace;
    if (name == "debug" || name == "DEBUG") return LogLevel::Debug;
    if (name == "info" || name == "INFO") return LogLevel::Info;
    if (name == "warn" || name == "WARN") return LogLevel::Warn;
    if (name == "error" || name == "ERROR") return LogLevel::Error;
    if (name == "off" || name == "OFF") return LogLevel::Off;
    return std::nullopt;
}

LogLevel parse_level(std::string_view name) {
    return level_from_name(name).value_or(LogLevel::Warn);
}

LogLevel LogFilter::level_for(std::string_view name) {
    std::optional<LogLevel> level = level_from_name(name);
    if (!level) {
        unrecognised_levels_.emplace_back(name);
        return LogLevel::Warn;
    }
    return *level;
}

void LogFilter::parse(std::string_view spec) {
    module_levels_.clear();
    unrecognised_levels_.clear();
    while (!spec.empty()) {
        size_t comma = spec.find(',');
        std::string_view entry = spec.substr(0, comma);
        spec = (comma == std::string_view::npos) ? std::string_view{} : spec.substr(comma + 1);
        if (entry.empty()) continue;

        size_t eq = entry.find('=');
        if (eq == std::string_view::npos) {
            // A bare level applies to everything.
            default_level_ = level_for(entry);
            continue;
        }
        std::string_view module = entry.substr(0, eq);
        LogLevel level = level_for(entry.substr(eq + 1));
        if (module == "*") {
            default_level_ = level;
        } else {
            module_levels_[std::string(module)] = level;
        }
    }
}

bool LogFilter::should_log(LogLevel level, std::string_view module) const {
    if (level == LogLevel::Off) return false;
    auto it = module_levels_.find(std::string(module));
    LogLevel threshold = (it != module_levels_.end()) ? it->second : default_level_;
    return threshold != LogLevel::Off && level >= threshold;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::log(LogLevel level, std::string_view module, const std::string& message) {
    *stream_ << "[" << level_name(level) << " " << module << "] " << message << '\n';
}

void Logger::set_filter(std::string_view spec) {
    filter_.parse(spec);
}

void Logger::set_level(LogLevel level) {
    filter_ = LogFilter{};
    filter_.set_default_level(level);
}

void init_from_env() {
    const char* env = std::getenv("LISEL_LOG");
    if (env == nullptr || *env == '\0') return;
    Logger& logger = Logger::instance();
    logger.set_filter(env);
    for (const std::string& name : logger.filter().unrecognised_levels()) {
        LISEL_LOG_WARN("cli", "LISEL_LOG: unknown level \"" << name << "\", using warn");
    }
}

} // namespace lisel::log
