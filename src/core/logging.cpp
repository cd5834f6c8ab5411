#include "taskcli/core/logging.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <nlohmann/json.hpp>

namespace taskcli {

// ============================================================================
// Log Levels
// ============================================================================

std::string_view log_level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Off:   return "OFF";
    }
    return "WARN";
}

LogLevel parse_log_level(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "off") return LogLevel::Off;
    return LogLevel::Warn;
}

// ============================================================================
// Sinks
// ============================================================================

namespace {

const char* level_color(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info:  return "\033[32m";
        case LogLevel::Warn:  return "\033[33m";
        default: return "";
    }
}

// Local wall-clock time with milliseconds, e.g. 2025-03-14 12:00:00.250
std::string local_time(std::chrono::system_clock::time_point tp) {
    auto seconds = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << std::put_time(std::localtime(&seconds), "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

} // anonymous namespace

void ConsoleSink::write(const LogEntry& entry) {
    std::ostringstream line;
    line << local_time(entry.timestamp) << ' ';
    if (colored_) {
        line << level_color(entry.level) << log_level_name(entry.level) << "\033[0m";
    } else {
        line << log_level_name(entry.level);
    }
    line << ' ' << entry.logger_name << ": " << entry.message;
    for (const auto& [key, value] : entry.fields) {
        line << ' ' << key << '=' << value;
    }
    line << '\n';

    out_ << line.str();
}

void JsonSink::write(const LogEntry& entry) {
    nlohmann::json record = {
        {"timestamp", local_time(entry.timestamp)},
        {"level", std::string(log_level_name(entry.level))},
        {"logger", entry.logger_name},
        {"message", entry.message}
    };
    for (const auto& [key, value] : entry.fields) {
        record[key] = value;
    }

    // Invalid UTF-8 in a description must not abort logging
    out_ << record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger(std::string name, LogLevel level, std::shared_ptr<LogSink> sink)
    : name_(std::move(name)), level_(level) {
    if (sink) {
        sinks_.push_back(std::move(sink));
    }
}

Logger& Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
    return *this;
}

Logger& Logger::add_sink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
    return *this;
}

Logger& Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
    return *this;
}

LogEntry Logger::entry(LogLevel level, std::string message) const {
    LogEntry e;
    e.level = level;
    e.timestamp = std::chrono::system_clock::now();
    e.message = std::move(message);
    e.logger_name = name_;
    return e;
}

void Logger::log(const LogEntry& entry) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ == LogLevel::Off || entry.level < level_) {
        return;
    }
    for (const auto& sink : sinks_) {
        sink->write(entry);
    }
}

// ============================================================================
// Global Logger
// ============================================================================

Logger& default_logger() {
    static Logger logger("task-cli", LogLevel::Warn, std::make_shared<ConsoleSink>());
    return logger;
}

void configure_default_logger(LogLevel level, bool json, bool colored) {
    auto& logger = default_logger();
    logger.set_level(level);
    logger.clear_sinks();
    if (json) {
        logger.add_sink(std::make_shared<JsonSink>());
    } else {
        logger.add_sink(std::make_shared<ConsoleSink>(colored));
    }
}

} // namespace taskcli
