/*
 * dummyllm - Deterministic Job Simulator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace dummyllm {

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
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static bool enabled(LogLevel level) noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    [[nodiscard]] static std::optional<LogLevel> parseLevel(const std::string& text) noexcept;

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Thread naming for log context
void setThreadName(const std::string& name);
void clearThreadName();

}

// Message arguments are only built when the level is enabled
#define LOG_ERROR(msg) ::dummyllm::Logger::error(msg)
#define LOG_WARN(msg)  ::dummyllm::Logger::warn(msg)
#define LOG_INFO(msg)  ::dummyllm::Logger::info(msg)
#define LOG_DEBUG(msg) do { if (::dummyllm::Logger::enabled(::dummyllm::LogLevel::DEBUG)) ::dummyllm::Logger::debug(msg); } while (0)
#define LOG_TRACE(msg) do { if (::dummyllm::Logger::enabled(::dummyllm::LogLevel::TRACE)) ::dummyllm::Logger::trace(msg); } while (0)
