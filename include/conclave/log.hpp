#pragma once

#include <cstdio>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

namespace conclave {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

[[nodiscard]] inline const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

namespace log {

/// Receives every message at or above the configured level.
using LogCallback = std::function<void(LogLevel, std::string_view component, std::string_view message)>;

namespace detail {

struct LogState {
    std::mutex mutex;
    LogLevel min_level = LogLevel::Warn;
    LogCallback callback;
};

inline LogState& state() {
    static LogState instance;
    return instance;
}

} // namespace detail

/**
 * @brief Sets the minimum level that reaches the sink (default: Warn)
 */
inline void set_level(LogLevel level) {
    auto& s = detail::state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.min_level = level;
}

inline LogLevel level() {
    auto& s = detail::state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.min_level;
}

/**
 * @brief Replaces the sink; an empty callback restores stderr output
 */
inline void set_callback(LogCallback callback) {
    auto& s = detail::state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.callback = std::move(callback);
}

/**
 * @brief Delivers one message
 *
 * The sink runs without the logger lock held, so it may log itself.
 */
inline void write(LogLevel level, std::string_view component, std::string_view message) {
    auto& s = detail::state();
    LogCallback callback;
    {
        std::lock_guard<std::mutex> lock(s.mutex);
        if (level < s.min_level) {
            return;
        }
        callback = s.callback;
    }
    if (callback) {
        callback(level, component, message);
        return;
    }
    fprintf(stderr, "[conclave:%s] %.*s: %.*s\n",
            log_level_to_string(level),
            static_cast<int>(component.size()), component.data(),
            static_cast<int>(message.size()), message.data());
}

inline void debug(std::string_view component, std::string_view message) { write(LogLevel::Debug, component, message); }
inline void info(std::string_view component, std::string_view message) { write(LogLevel::Info, component, message); }
inline void warn(std::string_view component, std::string_view message) { write(LogLevel::Warn, component, message); }
inline void error(std::string_view component, std::string_view message) { write(LogLevel::Error, component, message); }

} // namespace log
} // namespace conclave
