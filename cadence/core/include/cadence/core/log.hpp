#pragma once

#include <optional>
#include <string>

namespace cadence::core {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

// Log sink interface for custom log handlers
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void log(LogLevel level, const std::string& category, const std::string& message) = 0;
};

void log(LogLevel level, const char* message);
void log(LogLevel level, const std::string& message);
void set_log_level(LogLevel level);
LogLevel get_log_level();

// Register/unregister custom log sinks
void add_log_sink(ILogSink* sink);
void remove_log_sink(ILogSink* sink);

// Level names as used in settings files ("trace", "debug", ...)
const char* to_string(LogLevel level);
std::optional<LogLevel> log_level_from_string(const std::string& name);

} // namespace cadence::core
