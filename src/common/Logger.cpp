#include "common/Logger.h"

#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>

namespace CartLink::Common {

const char* LevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
    }
    return "INFO";
}

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

void Logger::Log(LogLevel level, const std::string& category, const std::string& message) {
    LogCallback callback;
    LogEntry entry;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (level < m_minLevel) return;
        if (!IsCategoryEnabledLocked(category)) return;

        entry.level = level;
        entry.category = category;
        entry.message = message;
        entry.timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count();

        m_backlog.push_back(entry);
        if (m_backlog.size() > kBacklogSize) {
            m_backlog.pop_front();
        }
        callback = m_callback;
    }

    // Sinks run unlocked so they may log themselves.
    if (callback) {
        callback(entry);
        return;
    }

    std::ostream& out = (level >= LogLevel::Error) ? std::cerr : std::cout;
    out << "[" << LevelName(level) << "] [" << category << "] " << message << std::endl;
}

void Logger::LogFmt(LogLevel level, const std::string& category, const char* fmt, ...) {
    char buffer[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);
    Log(level, category, std::string(buffer));
}

void Logger::SetCallback(LogCallback callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_callback = std::move(callback);
}

void Logger::EnableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_categories[category] = true;
}

void Logger::DisableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_categories[category] = false;
}

bool Logger::IsCategoryEnabled(const std::string& category) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return IsCategoryEnabledLocked(category);
}

bool Logger::IsCategoryEnabledLocked(const std::string& category) const {
    auto it = m_categories.find(category);
    if (it != m_categories.end()) {
        return it->second;
    }
    // Unknown categories are enabled
    return true;
}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_minLevel = level;
}

LogLevel Logger::Level() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_minLevel;
}

void Logger::SetLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_logFilePath = path;
}

void Logger::WriteFailureLog(const std::string& message) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::ofstream file(m_logFilePath, std::ios::trunc);
    if (!file.is_open()) {
        std::cerr << "Failed to open log file: " << m_logFilePath << std::endl;
        return;
    }

    std::time_t now = std::time(nullptr);
    char timeStr[100];
    std::strftime(timeStr, sizeof(timeStr), "%Y-%m-%d %H:%M:%S", std::localtime(&now));

    file << "==========================================================\n";
    file << "CartLink Transfer Failure\n";
    file << "Time: " << timeStr << "\n";
    file << "==========================================================\n\n";
    file << "FAILURE:\n" << message << "\n\n";
    file << "RECENT LOG ENTRIES (last " << m_backlog.size() << " entries):\n\n";

    for (const auto& entry : m_backlog) {
        file << "[" << LevelName(entry.level) << "] [" << entry.category << "] "
             << entry.message << "\n";
    }
    file.close();

    std::cerr << "Failure log written to: " << m_logFilePath << std::endl;
}

void Logger::FlushLogs() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::ofstream file(m_logFilePath, std::ios::trunc);
    if (!file.is_open()) return;

    for (const auto& entry : m_backlog) {
        file << "[" << LevelName(entry.level) << "] [" << entry.category << "] "
             << entry.message << "\n";
    }
}

std::vector<LogEntry> Logger::RecentEntries() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::vector<LogEntry>(m_backlog.begin(), m_backlog.end());
}

void Logger::ClearBacklog() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_backlog.clear();
}

} // namespace CartLink::Common
