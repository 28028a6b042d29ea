/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace reelforge {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    static void initFromEnv() noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    [[nodiscard]] static LogLevel parseLevel(const std::string& text, LogLevel fallback) noexcept;

private:
    static LogLevel level() noexcept;
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Thread naming for log context ("Render-1", "Scheduler", ...)
void setThreadName(const std::string& name);
std::string laneThreadName(const std::string& lane, int workerId);

}

#define LOG_ERROR(msg) ::reelforge::Logger::log(::reelforge::LogLevel::ERROR, msg)
#define LOG_WARN(msg)  ::reelforge::Logger::log(::reelforge::LogLevel::WARN, msg)
#define LOG_INFO(msg)  ::reelforge::Logger::log(::reelforge::LogLevel::INFO, msg)
#define LOG_DEBUG(msg) ::reelforge::Logger::log(::reelforge::LogLevel::DEBUG, msg)
#define LOG_TRACE(msg) ::reelforge::Logger::log(::reelforge::LogLevel::TRACE, msg)
