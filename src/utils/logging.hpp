#pragma once

#include <map>
#include <string>

namespace gradebox::utils {

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

struct LogMessage {
    LogLevel level = LogLevel::kInfo;
    std::string tag;
    std::string message;
    std::map<std::string, std::string> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

void SetLogConfig(const LogConfig& config);
LogConfig GetLogConfig();

// Writes "[tag] LEVEL message key=value ..." to stderr as one line.
void Log(const LogMessage& message);

inline void LogInfo(const std::string& tag, const std::string& message) {
    Log(LogMessage{LogLevel::kInfo, tag, message, {}});
}

inline void LogWarn(const std::string& tag, const std::string& message) {
    Log(LogMessage{LogLevel::kWarn, tag, message, {}});
}

inline void LogError(const std::string& tag, const std::string& message) {
    Log(LogMessage{LogLevel::kError, tag, message, {}});
}

}  // namespace gradebox::utils
