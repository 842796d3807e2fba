#include "utils/logging.hpp"

#include "utils/common.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <sstream>

namespace runbox::utils {
namespace {

std::atomic<int> g_min_level{static_cast<int>(LogLevel::kInfo)};
std::mutex g_log_mutex;

std::string QuoteIfNeeded(const std::string& value) {
    if (value.empty()) {
        return "\"\"";
    }
    const bool has_space = std::any_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    return has_space ? "\"" + value + "\"" : value;
}

}  // namespace

LogLevel ParseLogLevel(const std::string& name) {
    const auto lowered = ToLower(name);
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return LogLevel::kInfo;
}

void ConfigureLogging(const LogConfig& config) {
    g_min_level.store(static_cast<int>(config.min_level));
}

bool IsEnabled(LogLevel level) {
    return static_cast<int>(level) >= g_min_level.load();
}

void Log(const LogMessage& message) {
    if (!IsEnabled(message.level)) {
        return;
    }
    std::ostringstream line;
    line << "[" << message.tag << "] ";
    if (message.level == LogLevel::kWarn || message.level == LogLevel::kError) {
        line << ToString(message.level) << " ";
    }
    line << message.message;
    for (const auto& [key, value] : message.fields) {
        line << " " << key << "=" << QuoteIfNeeded(value);
    }
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << line.str() << std::endl;
}

}  // namespace runbox::utils
