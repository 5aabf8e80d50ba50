#ifndef CHUNKFLOW_LOGGER_H
#define CHUNKFLOW_LOGGER_H

#include <string>
#include <functional>

// Log level enumeration for conditional logging
enum class LogLevel {
    DEBUG = 0,     // Every message (most verbose)
    INFO = 1,      // Pipeline milestones
    WARNING = 2,   // Recoverable problems
    ERROR = 3,     // Failures
    NONE = 4,      // Disable all logging
};

// Tag prefixed to every line (e.g. the ingest node name)
void setSessionId(const std::string& session_id);
void nativeLog(const std::string& message);
// Same as nativeLog, with the level label in the line. The LOG_* macros use this.
void log_at(LogLevel level, const std::string& message);

// Receive every formatted line (CLI progress pane, tests capturing output).
// Pass an empty function to remove the callback. The callback must not log.
void setLogCallback(std::function<void(const std::string&)> callback);

// Append formatted lines to a file in addition to stderr. Empty path disables.
bool setLogFile(const std::string& path);

void set_log_level(LogLevel level);
LogLevel get_log_level();

// Parse "debug" / "info" / "warning" / "error" / "none"; unknown values map to INFO.
LogLevel log_level_from_string(const std::string& value);

// Async mode: lines are queued and written by a background thread.
void enable_async_logging();
void disable_async_logging();
bool is_async_logging_enabled();

#define LOG_DEBUG(msg) if (get_log_level() <= LogLevel::DEBUG) log_at(LogLevel::DEBUG, msg)
#define LOG_INFO(msg)  if (get_log_level() <= LogLevel::INFO) log_at(LogLevel::INFO, msg)
#define LOG_WARN(msg)  if (get_log_level() <= LogLevel::WARNING) log_at(LogLevel::WARNING, msg)
#define LOG_ERROR(msg) if (get_log_level() <= LogLevel::ERROR) log_at(LogLevel::ERROR, msg)

#endif // CHUNKFLOW_LOGGER_H
