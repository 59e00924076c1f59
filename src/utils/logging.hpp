#pragma once

#include <string>

namespace runbox::utils {

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

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

// Accepts debug|info|warn|warning|error in any case; anything else yields fallback.
LogLevel ParseLogLevel(const std::string& value, LogLevel fallback = LogLevel::kInfo);

void SetLogConfig(const LogConfig& config);
LogConfig GetLogConfig();

// Writes "[tag] message" to stderr when level passes the configured minimum.
void Log(LogLevel level, const std::string& tag, const std::string& message);

}  // namespace runbox::utils
