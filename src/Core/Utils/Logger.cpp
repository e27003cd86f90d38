/**
 * @file Logger.cpp
 * @brief spdlog-backed game log
 * @author JumpDash Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 JumpDash. All rights reserved.
 */

#include <JumpDash/Core/Logger.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <system_error>
#include <utility>
#include <vector>

namespace JumpDash {
namespace Core {

namespace {

constexpr const char* LOG_PATTERN = "[%H:%M:%S.%e] [%^%l%$] [%s:%#] %v";

spdlog::level::level_enum toSpdlog(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return spdlog::level::trace;
        case LogLevel::Debug:    return spdlog::level::debug;
        case LogLevel::Info:     return spdlog::level::info;
        case LogLevel::Warning:  return spdlog::level::warn;
        case LogLevel::Error:    return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off:      break;
    }
    return spdlog::level::off;
}

} // namespace

bool ParseLogLevel(std::string_view name, LogLevel& level) {
    std::string key(name);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const std::pair<const char*, LogLevel> NAMES[] = {
        {"trace", LogLevel::Trace},   {"debug", LogLevel::Debug},
        {"info", LogLevel::Info},     {"warning", LogLevel::Warning},
        {"warn", LogLevel::Warning},  {"error", LogLevel::Error},
        {"critical", LogLevel::Critical}, {"off", LogLevel::Off},
    };
    for (const auto& [text, value] : NAMES) {
        if (key == text) {
            level = value;
            return true;
        }
    }
    return false;
}

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    Stop();
}

bool Logger::Start(const LogSettings& settings) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_logger) {
        m_logger->flush();
        m_logger.reset();
    }
    m_level = LogLevel::Off;

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!settings.filePath.empty()) {
        std::filesystem::path path(settings.filePath);
        std::error_code ec;
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path(), ec);
        }
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                settings.filePath, settings.maxFileBytes, settings.maxFiles));
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "jumpdash: cannot open log file " << settings.filePath
                      << ": " << e.what() << std::endl;
            return false;
        }
    }

    m_logger = std::make_shared<spdlog::logger>("jumpdash", sinks.begin(), sinks.end());
    m_logger->set_pattern(LOG_PATTERN);
    m_logger->set_level(toSpdlog(settings.level));
    // Warnings usually precede a lost save; get them on disk at once
    m_logger->flush_on(spdlog::level::warn);
    m_level = settings.level;
    return true;
}

void Logger::Stop() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_logger) {
        m_logger->flush();
        m_logger.reset();
    }
    m_level = LogLevel::Off;
}

bool Logger::Enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_logger && level != LogLevel::Off && level >= m_level;
}

void Logger::Write(LogLevel level, std::string_view message, const char* file, int line) {
    std::shared_ptr<spdlog::logger> logger;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_logger || level == LogLevel::Off || level < m_level) {
            return;
        }
        logger = m_logger;
    }
    logger->log(spdlog::source_loc{file, line, ""}, toSpdlog(level),
                spdlog::string_view_t(message.data(), message.size()));
}

} // namespace Core
} // namespace JumpDash
