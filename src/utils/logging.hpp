#pragma once

#include <fstream>
#include <mutex>
#include <string>
#include <vector>
#include <utility>

namespace autolab::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback = LogLevel::kInfo);

using LogFields = std::vector<std::pair<std::string, std::string>>;

struct LogMessage {
    LogLevel level;
    std::string tag;
    std::string message;
    LogFields fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
    // Append-only research log. Empty disables the file sink.
    std::string file;
    bool echo_to_stderr = true;
};

// Process-wide sink shared by every component. Lines are written whole under a lock so
// worker threads never interleave.
class Logger {
public:
    static Logger& Instance();

    void Configure(const LogConfig& config);
    void Write(const LogMessage& message);
    LogLevel MinLevel() const;

private:
    Logger() = default;

    mutable std::mutex mutex_;
    LogConfig config_{};
    std::ofstream file_;
};

std::string FormatLogLine(const LogMessage& message);

inline void Log(LogLevel level, const std::string& tag, const std::string& message, LogFields fields = {}) {
    Logger::Instance().Write(LogMessage{level, tag, message, std::move(fields)});
}

inline void LogDebug(const std::string& tag, const std::string& message, LogFields fields = {}) {
    Log(LogLevel::kDebug, tag, message, std::move(fields));
}

inline void LogInfo(const std::string& tag, const std::string& message, LogFields fields = {}) {
    Log(LogLevel::kInfo, tag, message, std::move(fields));
}

inline void LogWarn(const std::string& tag, const std::string& message, LogFields fields = {}) {
    Log(LogLevel::kWarn, tag, message, std::move(fields));
}

inline void LogError(const std::string& tag, const std::string& message, LogFields fields = {}) {
    Log(LogLevel::kError, tag, message, std::move(fields));
}

}  // namespace autolab::utils
