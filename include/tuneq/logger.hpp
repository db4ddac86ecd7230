/*
 * tuneq - Download Queue Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace tuneq {

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
    
    static void log(LogLevel level, const std::string& message) noexcept;
    
    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Thread naming for better logging context
void setThreadName(const std::string& name);
void clearThreadName();
std::string getThreadName(int worker_id);

// Names the current thread until the scope ends. Thread ids are reused once a
// thread exits, so long-lived processes that churn threads should prefer this.
class ThreadNameScope {
public:
    explicit ThreadNameScope(const std::string& name) { setThreadName(name); }
    ~ThreadNameScope() { clearThreadName(); }

    ThreadNameScope(const ThreadNameScope&) = delete;
    ThreadNameScope& operator=(const ThreadNameScope&) = delete;
};

}

// Convenience macros for common usage
#define LOG_ERROR(msg) ::tuneq::Logger::error(msg)
#define LOG_WARN(msg)  ::tuneq::Logger::warn(msg)  
#define LOG_INFO(msg)  ::tuneq::Logger::info(msg)
#define LOG_DEBUG(msg) ::tuneq::Logger::debug(msg)
#define LOG_TRACE(msg) ::tuneq::Logger::trace(msg)
