#include "utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <sstream>

namespace warden::utils {
namespace {

std::atomic<LogLevel> g_min_level{LogLevel::kInfo};
std::mutex g_sink_mutex;

bool NeedsQuoting(const std::string& value) {
    if (value.empty()) {
        return true;
    }
    return std::any_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isspace(c) || c == '"' || c == '=';
    });
}

}  // namespace

bool ParseLogLevel(const std::string& value, LogLevel& level) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") {
        level = LogLevel::kDebug;
    } else if (lowered == "info") {
        level = LogLevel::kInfo;
    } else if (lowered == "warn" || lowered == "warning") {
        level = LogLevel::kWarn;
    } else if (lowered == "error") {
        level = LogLevel::kError;
    } else {
        return false;
    }
    return true;
}

void ConfigureLogging(const LogConfig& config) {
    g_min_level.store(config.min_level);
}

LogLevel MinLogLevel() {
    return g_min_level.load();
}

std::string FormatLogLine(const LogMessage& message) {
    std::ostringstream line;
    line << "[" << message.tag << "] ";
    if (message.level != LogLevel::kInfo) {
        line << ToString(message.level) << " ";
    }
    line << message.message;
    for (const auto& [key, value] : message.fields) {
        line << " " << key << "=";
        if (NeedsQuoting(value)) {
            line << "\"";
            for (const char c : value) {
                if (c == '"' || c == '\\') {
                    line << '\\';
                }
                line << (c == '\n' ? ' ' : c);
            }
            line << "\"";
        } else {
            line << value;
        }
    }
    return line.str();
}

void Log(const LogMessage& message) {
    if (static_cast<int>(message.level) < static_cast<int>(g_min_level.load())) {
        return;
    }
    const auto line = FormatLogLine(message);
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    std::cerr << line << std::endl;
}

void Log(LogLevel level, const std::string& tag, const std::string& message, LogFields fields) {
    Log(LogMessage{level, tag, message, std::move(fields)});
}

}  // namespace warden::utils
