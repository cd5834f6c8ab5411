#pragma once

#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace taskcli {

// ============================================================================
// Log Levels
// ============================================================================

// Diagnostics only. User-facing output goes through cli::View, never the logger.
enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Off = 3
};

std::string_view log_level_name(LogLevel level) noexcept;

// Case-insensitive; anything unrecognized selects Warn
LogLevel parse_log_level(std::string_view name);

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level = LogLevel::Info;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    std::string logger_name;
    std::vector<std::pair<std::string, std::string>> fields;

    LogEntry& field(std::string key, std::string value) {
        fields.emplace_back(std::move(key), std::move(value));
        return *this;
    }

    template<typename T>
    LogEntry& field(std::string key, const T& value) {
        std::ostringstream oss;
        oss << value;
        return field(std::move(key), oss.str());
    }
};

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogEntry& entry) = 0;
};

// One line per entry: time, level, logger name, message, then key=value fields
class ConsoleSink : public LogSink {
    std::ostream& out_;
    bool colored_;

public:
    explicit ConsoleSink(bool colored = true, std::ostream& out = std::cerr)
        : out_(out), colored_(colored) {}

    void write(const LogEntry& entry) override;
};

// One JSON object per line; fields become top-level string members
class JsonSink : public LogSink {
    std::ostream& out_;

public:
    explicit JsonSink(std::ostream& out = std::cerr) : out_(out) {}

    void write(const LogEntry& entry) override;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
    std::string name_;
    LogLevel level_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;

public:
    explicit Logger(std::string name, LogLevel level = LogLevel::Info,
                    std::shared_ptr<LogSink> sink = nullptr);

    Logger& set_level(LogLevel level);
    Logger& add_sink(std::shared_ptr<LogSink> sink);
    Logger& clear_sinks();

    LogEntry entry(LogLevel level, std::string message) const;
    void log(const LogEntry& entry) const;

    void debug(std::string message) const { log(entry(LogLevel::Debug, std::move(message))); }
    void warn(std::string message) const { log(entry(LogLevel::Warn, std::move(message))); }
};

// ============================================================================
// Global Logger
// ============================================================================

// "task-cli" logger, Warn and above to a colored stderr console until configured
Logger& default_logger();

// Reset the default logger's level and replace its sinks with a single console or JSON sink
void configure_default_logger(LogLevel level, bool json, bool colored);

inline void log_debug(std::string msg) { default_logger().debug(std::move(msg)); }
inline void log_warn(std::string msg) { default_logger().warn(std::move(msg)); }

} // namespace taskcli
