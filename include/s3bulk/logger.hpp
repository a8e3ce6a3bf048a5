/*
 * s3bulk - Concurrent Object Store Transfer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <functional>
#include <string>

namespace s3bulk {

enum class LogLevel : uint8_t { 
    ERROR = 0, 
    WARN = 1, 
    INFO = 2, 
    DEBUG = 3, 
    TRACE = 4 
};

// Receives every line that passes the level filter, already formatted.
// Called with the log mutex held; must not log.
using LogHandler = std::function<void(LogLevel level, const std::string& line)>;

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    static void initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;

    // Replace the stderr sink; an empty handler restores it.
    static void setHandler(LogHandler handler) noexcept;
    
    static void log(LogLevel level, const std::string& message) noexcept;
    
    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    [[nodiscard]] static const char* levelToString(LogLevel level) noexcept;

private:
    static LogLevel parseEnvLevel() noexcept;
};

// Thread naming for better logging context
void setThreadName(const std::string& name);
std::string getThreadName(int worker_id);

}

// Convenience macros for common usage
#define LOG_ERROR(msg) ::s3bulk::Logger::error(msg)
#define LOG_WARN(msg)  ::s3bulk::Logger::warn(msg)  
#define LOG_INFO(msg)  ::s3bulk::Logger::info(msg)
#define LOG_DEBUG(msg) ::s3bulk::Logger::debug(msg)
#define LOG_TRACE(msg) ::s3bulk::Logger::trace(msg)
