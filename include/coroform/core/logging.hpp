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

namespace coroform {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

std::string_view log_level_name(LogLevel level) noexcept;
LogLevel parse_log_level(std::string_view name) noexcept;

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level = LogLevel::Info;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    std::string logger_name;

    // Structured fields, in insertion order
    std::vector<std::pair<std::string, std::string>> fields;

    LogEntry& field(std::string key, std::string value) {
        fields.emplace_back(std::move(key), std::move(value));
        return *this;
    }

    LogEntry& field(std::string key, std::string_view value) {
        return field(std::move(key), std::string(value));
    }

    LogEntry& field(std::string key, const char* value) {
        return field(std::move(key), std::string(value));
    }

    template<typename T>
    LogEntry& field(std::string key, const T& value) {
        std::ostringstream oss;
        oss << value;
        return field(std::move(key), oss.str());
    }

    // Value of the first field with this key, empty if absent
    std::string_view get(std::string_view key) const noexcept;
};

// ============================================================================
// Log Sink Interface
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogEntry& entry) = 0;
    virtual void flush() {}
};

// ============================================================================
// Console Sink
// ============================================================================

class ConsoleSink : public LogSink {
    bool colored_ = true;
    std::mutex mutex_;

public:
    explicit ConsoleSink(bool colored = true) : colored_(colored) {}
    void write(const LogEntry& entry) override;
};

// ============================================================================
// JSON Sink (one object per line)
// ============================================================================

class JsonSink : public LogSink {
    std::ostream& out_;
    std::mutex mutex_;

public:
    explicit JsonSink(std::ostream& out = std::cout) : out_(out) {}
    void write(const LogEntry& entry) override;
    void flush() override;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
    std::string name_;
    LogLevel level_ = LogLevel::Info;
    std::vector<std::shared_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;

public:
    Logger() = default;
    explicit Logger(std::string name) : name_(std::move(name)) {}

    Logger& set_level(LogLevel level) { level_ = level; return *this; }
    Logger& add_sink(std::shared_ptr<LogSink> sink);
    Logger& clear_sinks();

    void log(LogLevel level, std::string message) const;

    void debug(std::string message) const { log(LogLevel::Debug, std::move(message)); }
    void info(std::string message) const { log(LogLevel::Info, std::move(message)); }
    void warn(std::string message) const { log(LogLevel::Warn, std::move(message)); }
    void error(std::string message) const { log(LogLevel::Error, std::move(message)); }

    // Structured logging
    LogEntry entry(LogLevel level, std::string message) const;
    void log(const LogEntry& entry) const;

    bool is_enabled(LogLevel level) const { return level >= level_; }

    const std::string& name() const { return name_; }
    LogLevel level() const { return level_; }
};

// ============================================================================
// Global Logger
// ============================================================================

// Named "coroform", console sink, level from COROFORM_LOG_LEVEL (default info)
Logger& default_logger();

} // namespace coroform
