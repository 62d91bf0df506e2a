#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace abstruse::utils {
namespace {

LogConfig g_log_config{};

}  // namespace

LogLevel LogLevelFromString(const std::string& value, LogLevel fallback) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

void SetLogConfig(const LogConfig& config) {
    g_log_config = config;
}

LogConfig GetLogConfig() {
    return g_log_config;
}

void Log(LogLevel level, const std::string& tag, const std::string& message) {
    if (static_cast<int>(level) < static_cast<int>(g_log_config.min_level)) {
        return;
    }
    std::cerr << "[" << tag << "] ";
    if (level == LogLevel::kWarn || level == LogLevel::kError) {
        std::cerr << ToString(level) << " ";
    }
    std::cerr << message << std::endl;
}

}  // namespace abstruse::utils
