#pragma once

#include <string>

namespace abstruse::utils {

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

LogLevel LogLevelFromString(const std::string& value, LogLevel fallback = LogLevel::kInfo);

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

void SetLogConfig(const LogConfig& config);
LogConfig GetLogConfig();

// Writes "[tag] message" to stderr. stdout carries the build transcript only.
void Log(LogLevel level, const std::string& tag, const std::string& message);

inline void LogDebug(const std::string& tag, const std::string& message) {
    Log(LogLevel::kDebug, tag, message);
}
inline void LogInfo(const std::string& tag, const std::string& message) {
    Log(LogLevel::kInfo, tag, message);
}
inline void LogWarn(const std::string& tag, const std::string& message) {
    Log(LogLevel::kWarn, tag, message);
}
inline void LogError(const std::string& tag, const std::string& message) {
    Log(LogLevel::kError, tag, message);
}

}  // namespace abstruse::utils
