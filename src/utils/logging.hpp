#pragma once

#include <map>
#include <string>
#include <utility>

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

// Unknown names map to kInfo.
LogLevel ParseLogLevel(const std::string& name);

struct LogMessage {
    LogLevel level = LogLevel::kInfo;
    std::string tag;
    std::string message;
    std::map<std::string, std::string> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

void ConfigureLogging(const LogConfig& config);
bool IsEnabled(LogLevel level);

// Writes "[tag] message key=value ..." to stderr.
void Log(const LogMessage& message);

inline void Log(LogLevel level,
                const std::string& tag,
                const std::string& message,
                std::map<std::string, std::string> fields = {}) {
    Log(LogMessage{level, tag, message, std::move(fields)});
}

}  // namespace runbox::utils
