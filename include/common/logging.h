#pragma once

#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>

namespace palisade {
namespace common {

/**
 * @brief Logging levels for conditional debug output
 *
 * Dispatch runs under a compute budget, so hot paths check the level before
 * formatting anything.
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5
};

/// Parse "trace", "debug", "info", "warn", "error" or "critical"
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @brief Structured log entry
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string module;
    std::string message;
    std::string error_code;
    std::unordered_map<std::string, std::string> context;
};

/**
 * @brief Global logging configuration
 *
 * Thread-safe singleton. Entries are written synchronously, one line each, as
 * plain text or JSON to the configured stream (std::cout by default).
 */
class Logger {
public:
    /// Get the singleton logger instance
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    /// Set current logging level
    void set_level(LogLevel level) noexcept {
        current_level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel level() const noexcept {
        return static_cast<LogLevel>(current_level_.load(std::memory_order_relaxed));
    }

    /// Enable/disable structured JSON logging
    void set_json_format(bool enabled) noexcept {
        json_format_.store(enabled, std::memory_order_relaxed);
    }

    /// Redirect output; passing nullptr restores std::cout
    void set_output(std::ostream* stream) {
        std::lock_guard<std::mutex> lock(output_mutex_);
        output_ = stream ? stream : &std::cout;
    }

    /// Check if debug logging is enabled
    bool is_debug_enabled() const noexcept {
        return current_level_.load(std::memory_order_relaxed) <= static_cast<int>(LogLevel::DEBUG);
    }

    /// Check if a specific level is enabled
    bool is_enabled(LogLevel level) const noexcept {
        return static_cast<int>(level) >= current_level_.load(std::memory_order_relaxed);
    }

    /// Log with explicit module
    template<typename... Args>
    void log(LogLevel level, const std::string& module, Args&&... args) {
        if (!is_enabled(level)) return;

        std::ostringstream oss;
        (oss << ... << args);

        LogEntry entry{
            std::chrono::system_clock::now(),
            level,
            module,
            oss.str(),
            "",
            {}
        };

        output_log_entry(entry);
    }

    /// Log a structured message with context
    void log_structured(LogLevel level, const std::string& module,
                        const std::string& message, const std::string& error_code = "",
                        const std::unordered_map<std::string, std::string>& context = {}) {
        if (!is_enabled(level)) return;

        LogEntry entry{
            std::chrono::system_clock::now(),
            level,
            module,
            message,
            error_code,
            context
        };

        output_log_entry(entry);
    }

    std::string format_json(const LogEntry& entry) const;
    std::string format_text(const LogEntry& entry) const;

private:
    Logger() : current_level_(static_cast<int>(LogLevel::INFO)),
               json_format_(false), output_(&std::cout) {}

    std::atomic<int> current_level_;
    std::atomic<bool> json_format_;
    std::mutex output_mutex_;
    std::ostream* output_;

    void output_log_entry(const LogEntry& entry) {
        std::string line = json_format_.load() ? format_json(entry) : format_text(entry);
        std::lock_guard<std::mutex> lock(output_mutex_);
        *output_ << line << std::endl;
    }

    std::string level_to_string(LogLevel level) const;
    std::string escape_json_string(const std::string& input) const;
};

} // namespace common
} // namespace palisade

/**
 * @brief Performance-conscious logging macros
 *
 * The first argument is the module name; the rest are streamed into the
 * message. Nothing is formatted when the level is disabled.
 */
#define LOG_TRACE(...) \
    do { \
        if (palisade::common::Logger::instance().is_enabled(palisade::common::LogLevel::TRACE)) { \
            palisade::common::Logger::instance().log(palisade::common::LogLevel::TRACE, __VA_ARGS__); \
        } \
    } while(0)

#define LOG_DEBUG(...) \
    do { \
        if (palisade::common::Logger::instance().is_debug_enabled()) { \
            palisade::common::Logger::instance().log(palisade::common::LogLevel::DEBUG, __VA_ARGS__); \
        } \
    } while(0)

#define LOG_INFO(...) \
    palisade::common::Logger::instance().log(palisade::common::LogLevel::INFO, __VA_ARGS__)

#define LOG_WARN(...) \
    palisade::common::Logger::instance().log(palisade::common::LogLevel::WARN, __VA_ARGS__)

#define LOG_ERROR(...) \
    palisade::common::Logger::instance().log(palisade::common::LogLevel::ERROR, __VA_ARGS__)

/**
 * @brief Structured logging macros
 */
#define LOG_STRUCTURED(level, module, message, ...) \
    palisade::common::Logger::instance().log_structured(level, module, message, ##__VA_ARGS__)

/**
 * @brief Module-specific logging macros
 */
#define LOG_DISPATCH_ERROR(message, ...) \
    LOG_STRUCTURED(palisade::common::LogLevel::ERROR, "dispatch", message, ##__VA_ARGS__)

#define LOG_REGISTRY_ERROR(message, ...) \
    LOG_STRUCTURED(palisade::common::LogLevel::ERROR, "registry", message, ##__VA_ARGS__)

#define LOG_HOST_ERROR(message, ...) \
    LOG_STRUCTURED(palisade::common::LogLevel::ERROR, "host", message, ##__VA_ARGS__)
