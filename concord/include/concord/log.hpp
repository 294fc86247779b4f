#pragma once
// Log: component-tagged diagnostics on stderr
//
//   [14:02:11.384][WARN][acquirer] peer KayGee_1.0 unreachable: Timeout was reached
//
// Printf-style formatting. A single process-wide threshold filters lines;
// a sink can replace stderr (the test suites use one to observe which
// failure class was reported).

#include <functional>
#include <string>

namespace concord {

enum class LogLevel : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

const char* log_level_name(LogLevel level);

using LogSink = std::function<void(LogLevel, const std::string& component,
                                   const std::string& message)>;

void set_log_level(LogLevel level);
LogLevel log_level();

// Empty sink restores stderr output
void set_log_sink(LogSink sink);

void log_debug(const char* component, const char* fmt, ...)
    __attribute__((format(printf, 2, 3)));
void log_info(const char* component, const char* fmt, ...)
    __attribute__((format(printf, 2, 3)));
void log_warn(const char* component, const char* fmt, ...)
    __attribute__((format(printf, 2, 3)));
void log_error(const char* component, const char* fmt, ...)
    __attribute__((format(printf, 2, 3)));

} // namespace concord
