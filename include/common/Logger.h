#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace CartLink::Common {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Fatal
};

struct LogEntry {
    LogLevel level;
    std::string category;
    std::string message;
    uint64_t timestamp;
};

const char* LevelName(LogLevel level);

class Logger {
public:
    using LogCallback = std::function<void(const LogEntry&)>;

    // Number of entries kept for WriteFailureLog/FlushLogs.
    static constexpr std::size_t kBacklogSize = 1000;

    static Logger& Instance();

    void Log(LogLevel level, const std::string& category, const std::string& message);
    void LogFmt(LogLevel level, const std::string& category, const char* fmt, ...);

    void SetCallback(LogCallback callback);
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;

    void SetLevel(LogLevel level);
    LogLevel Level() const;

    // Backlog handling for failed transfers
    void SetLogFile(const std::string& path);
    void WriteFailureLog(const std::string& message);
    void FlushLogs();
    std::vector<LogEntry> RecentEntries() const;
    void ClearBacklog();

private:
    Logger() = default;
    ~Logger() = default;

    bool IsCategoryEnabledLocked(const std::string& category) const;

    LogCallback m_callback;
    std::map<std::string, bool> m_categories;
    LogLevel m_minLevel = LogLevel::Info;
    mutable std::mutex m_mutex;
    std::string m_logFilePath = "cartlink_failure.log";
    std::deque<LogEntry> m_backlog;
};

} // namespace CartLink::Common
