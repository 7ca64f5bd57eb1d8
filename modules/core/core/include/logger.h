#ifndef LOGGER_H
#define LOGGER_H

#include <string>
#include <functional>

// Log level enumeration for conditional logging
enum class LogLevel {
    DEBUG = 0,     // Every message (most verbose)
    INFO = 1,      // Important events
    WARNING = 2,   // Problems only
    ERROR = 3,     // Errors only
    NONE = 4,      // Disable all logging
};

// Tag prepended to every line, e.g. "server" or "client"
void set_log_tag(const std::string& tag);
void nativeLog(const std::string& message);

// Set a callback for log messages (front-ends embedding the core)
// Passing an empty function restores stderr output.
void setLogCallback(std::function<void(const std::string&)> callback);

// Default: INFO (skips debug messages)
void set_log_level(LogLevel level);
LogLevel get_log_level();

// Parses debug|info|warn|warning|error|none, case-insensitive. Unknown values map to INFO.
LogLevel parse_log_level(const std::string& value);

// Async logging: messages go to a queue drained by a background thread
void enable_async_logging();
void disable_async_logging();
bool is_async_logging_enabled();

// Logging macros for conditional compilation
#define LOG_DEBUG(msg) if (get_log_level() <= LogLevel::DEBUG) nativeLog(msg)
#define LOG_INFO(msg)  if (get_log_level() <= LogLevel::INFO) nativeLog(msg)
#define LOG_WARN(msg)  if (get_log_level() <= LogLevel::WARNING) nativeLog(msg)
#define LOG_ERROR(msg) if (get_log_level() <= LogLevel::ERROR) nativeLog(msg)

#endif // LOGGER_H
