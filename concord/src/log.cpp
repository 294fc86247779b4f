#include <concord/log.hpp>
#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace concord {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_sink_mutex;
LogSink g_sink;

std::string format_message(const char* fmt, va_list args) {
    va_list copy;
    va_copy(copy, args);
    int needed = vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);
    if (needed <= 0) return "";

    std::string out(static_cast<size_t>(needed) + 1, '\0');
    vsnprintf(out.data(), out.size(), fmt, args);
    out.resize(static_cast<size_t>(needed));
    return out;
}

void emit(LogLevel level, const char* component, const char* fmt, va_list args) {
    if (static_cast<int>(level) < g_level.load()) return;

    std::string message = format_message(fmt, args);

    std::lock_guard<std::mutex> lock(g_sink_mutex);
    if (g_sink) {
        g_sink(level, component, message);
        return;
    }

    // Get timestamp with milliseconds
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&now_time_t, &local);
    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &local);

    std::cerr << "[" << time_buf << "." << std::setfill('0') << std::setw(3) << now_ms.count()
              << "][" << log_level_name(level) << "][" << component << "] "
              << message << "\n";
}

}  // anonymous namespace

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

void set_log_level(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_level.load());
}

void set_log_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = std::move(sink);
}

void log_debug(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(LogLevel::Debug, component, fmt, args);
    va_end(args);
}

void log_info(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(LogLevel::Info, component, fmt, args);
    va_end(args);
}

void log_warn(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(LogLevel::Warn, component, fmt, args);
    va_end(args);
}

void log_error(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(LogLevel::Error, component, fmt, args);
    va_end(args);
}

} // namespace concord
