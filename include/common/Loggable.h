#pragma once

#include "common/Logger.h"

#include <cstdarg>
#include <cstdio>
#include <string>

namespace CartLink::Common {

// Categories used across the reader and the tool.
namespace LogCategory {
    inline constexpr const char* Reader = "Reader";
    inline constexpr const char* Queue = "Queue";
    inline constexpr const char* Channel = "Channel";
    inline constexpr const char* Flash = "Flash";
    inline constexpr const char* Serial = "Serial";
    inline constexpr const char* Main = "main";
}

/**
 * Mixin for components that log under one fixed category.
 *
 * Messages are printf-formatted; anything past 1 KiB is cut off, so hex
 * dumps of a page should go through LogDebug in page-sized pieces.
 */
class Loggable {
public:
    explicit Loggable(const char* category) : m_category(category) {}
    virtual ~Loggable() = default;

    const std::string& Category() const { return m_category; }

protected:
    void LogDebug(const char* fmt, ...) const {
        // Skip formatting when nobody would see it
        if (Logger::Instance().Level() > LogLevel::Debug) return;
        va_list args;
        va_start(args, fmt);
        Emit(LogLevel::Debug, fmt, args);
        va_end(args);
    }

    void LogInfo(const char* fmt, ...) const {
        va_list args;
        va_start(args, fmt);
        Emit(LogLevel::Info, fmt, args);
        va_end(args);
    }

    void LogWarn(const char* fmt, ...) const {
        va_list args;
        va_start(args, fmt);
        Emit(LogLevel::Warning, fmt, args);
        va_end(args);
    }

    void LogError(const char* fmt, ...) const {
        va_list args;
        va_start(args, fmt);
        Emit(LogLevel::Error, fmt, args);
        va_end(args);
    }

private:
    void Emit(LogLevel level, const char* fmt, va_list args) const {
        char buffer[1024];
        vsnprintf(buffer, sizeof(buffer), fmt, args);
        Logger::Instance().Log(level, m_category, buffer);
    }

    std::string m_category;
};

} // namespace CartLink::Common
