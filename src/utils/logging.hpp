#pragma once

#include <string>
#include <utility>
#include <vector>

namespace warden::utils {

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

bool ParseLogLevel(const std::string& value, LogLevel& level);

using LogFields = std::vector<std::pair<std::string, std::string>>;

struct LogMessage {
    LogLevel level;
    std::string tag;
    std::string message;
    LogFields fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

void ConfigureLogging(const LogConfig& config);
LogLevel MinLogLevel();

// Writes "[tag] message key=value ..." to stderr when level passes the filter.
void Log(const LogMessage& message);
void Log(LogLevel level, const std::string& tag, const std::string& message, LogFields fields = {});

std::string FormatLogLine(const LogMessage& message);

}  // namespace warden::utils
