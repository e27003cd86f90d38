/**
 * @file Logger.hpp
 * @brief Process-wide game log
 * @author JumpDash Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 JumpDash. All rights reserved.
 *
 * One spdlog logger shared by the simulation, the save store and the
 * front end. It always writes to the console and, when `log_file` is
 * configured, to a size-rotated file as well. Every record carries the
 * source file and line of the JUMPDASH_LOG_* macro that produced it.
 *
 * Until Start() is called (and after Stop()) records are discarded, so
 * library code and tests can log without any setup.
 */

#pragma once

#ifndef JUMPDASH_CORE_LOGGER_HPP
#define JUMPDASH_CORE_LOGGER_HPP

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}

namespace JumpDash {
namespace Core {

enum class LogLevel : uint8_t {
    Trace,      ///< Per-tick detail: spawns, recycles, landings
    Debug,      ///< Cues, save-file reads and writes
    Info,       ///< State changes, level-ups, startup
    Warning,    ///< Ignored save file, rejected config value
    Error,      ///< Save could not be written, GLFW errors
    Critical,   ///< The game cannot start
    Off
};

/**
 * @brief Map a `log_level` config value to a level
 *
 * Case-insensitive; accepts "warn" as well as "warning". Leaves @p level
 * untouched and returns false for anything else.
 */
bool ParseLogLevel(std::string_view name, LogLevel& level);

struct LogSettings {
    LogLevel level = LogLevel::Info;
    std::string filePath;                      ///< Empty: console only
    size_t maxFileBytes = 5 * 1024 * 1024;
    size_t maxFiles = 3;
};

class Logger {
public:
    static Logger& Instance();

    /**
     * @brief (Re)open the sinks
     *
     * Replaces any running configuration. Returns false, leaving logging
     * stopped, if the log file cannot be created.
     */
    bool Start(const LogSettings& settings);

    /// Flush and close every sink
    void Stop();

    bool Enabled(LogLevel level) const;

    void Write(LogLevel level, std::string_view message, const char* file, int line);

    /// printf-style variant behind the JUMPDASH_LOG_*_F macros
    template<typename... Args>
    void Printf(LogLevel level, const char* file, int line, const char* format, Args... args) {
        if (!Enabled(level)) {
            return;
        }
        int length = std::snprintf(nullptr, 0, format, args...);
        if (length < 0) {
            return;
        }
        std::string text(static_cast<size_t>(length), '\0');
        std::snprintf(text.data(), text.size() + 1, format, args...);
        Write(level, text, file, line);
    }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex m_mutex;
    std::shared_ptr<spdlog::logger> m_logger;
    LogLevel m_level = LogLevel::Off;
};

} // namespace Core
} // namespace JumpDash

#ifndef JUMPDASH_DISABLE_LOGGING

#define JUMPDASH_LOG_AT_(lvl, msg) \
    ::JumpDash::Core::Logger::Instance().Write(::JumpDash::Core::LogLevel::lvl, msg, __FILE__, __LINE__)
#define JUMPDASH_LOG_AT_F_(lvl, ...) \
    ::JumpDash::Core::Logger::Instance().Printf(::JumpDash::Core::LogLevel::lvl, __FILE__, __LINE__, __VA_ARGS__)

#define JUMPDASH_LOG_TRACE(msg)    JUMPDASH_LOG_AT_(Trace, msg)
#define JUMPDASH_LOG_DEBUG(msg)    JUMPDASH_LOG_AT_(Debug, msg)
#define JUMPDASH_LOG_INFO(msg)     JUMPDASH_LOG_AT_(Info, msg)
#define JUMPDASH_LOG_WARNING(msg)  JUMPDASH_LOG_AT_(Warning, msg)
#define JUMPDASH_LOG_ERROR(msg)    JUMPDASH_LOG_AT_(Error, msg)
#define JUMPDASH_LOG_CRITICAL(msg) JUMPDASH_LOG_AT_(Critical, msg)

#define JUMPDASH_LOG_TRACE_F(...)    JUMPDASH_LOG_AT_F_(Trace, __VA_ARGS__)
#define JUMPDASH_LOG_DEBUG_F(...)    JUMPDASH_LOG_AT_F_(Debug, __VA_ARGS__)
#define JUMPDASH_LOG_INFO_F(...)     JUMPDASH_LOG_AT_F_(Info, __VA_ARGS__)
#define JUMPDASH_LOG_WARNING_F(...)  JUMPDASH_LOG_AT_F_(Warning, __VA_ARGS__)
#define JUMPDASH_LOG_ERROR_F(...)    JUMPDASH_LOG_AT_F_(Error, __VA_ARGS__)
#define JUMPDASH_LOG_CRITICAL_F(...) JUMPDASH_LOG_AT_F_(Critical, __VA_ARGS__)

#else

#define JUMPDASH_LOG_TRACE(msg)    ((void)0)
#define JUMPDASH_LOG_DEBUG(msg)    ((void)0)
#define JUMPDASH_LOG_INFO(msg)     ((void)0)
#define JUMPDASH_LOG_WARNING(msg)  ((void)0)
#define JUMPDASH_LOG_ERROR(msg)    ((void)0)
#define JUMPDASH_LOG_CRITICAL(msg) ((void)0)

#define JUMPDASH_LOG_TRACE_F(...)    ((void)0)
#define JUMPDASH_LOG_DEBUG_F(...)    ((void)0)
#define JUMPDASH_LOG_INFO_F(...)     ((void)0)
#define JUMPDASH_LOG_WARNING_F(...)  ((void)0)
#define JUMPDASH_LOG_ERROR_F(...)    ((void)0)
#define JUMPDASH_LOG_CRITICAL_F(...) ((void)0)

#endif // JUMPDASH_DISABLE_LOGGING

#endif // JUMPDASH_CORE_LOGGER_HPP
