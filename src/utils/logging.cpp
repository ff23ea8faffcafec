#include "utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>

namespace clubhouse::utils {
namespace {

std::atomic<int> g_min_level{static_cast<int>(LogLevel::kInfo)};
std::mutex g_write_mutex;

}  // namespace

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug" || lowered == "trace") {
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
    g_min_level = static_cast<int>(config.min_level);
}

LogConfig GetLogConfig() {
    LogConfig config{};
    config.min_level = static_cast<LogLevel>(g_min_level.load());
    return config;
}

bool IsEnabled(LogLevel level) {
    return static_cast<int>(level) >= g_min_level.load();
}

void Log(LogLevel level,
         const std::string& tag,
         const std::string& message,
         const std::unordered_map<std::string, std::string>& fields) {
    if (!IsEnabled(level)) {
        return;
    }
    std::ostringstream line;
    line << "[" << tag << "] " << ToString(level) << " " << message;
    // Sorted so that lines are stable across runs.
    const std::map<std::string, std::string> ordered(fields.begin(), fields.end());
    for (const auto& [key, value] : ordered) {
        line << " " << key << "=" << value;
    }
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << line.str() << std::endl;
}

}  // namespace clubhouse::utils
