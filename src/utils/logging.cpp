#include "utils/logging.hpp"

#include <iostream>
#include <mutex>
#include <utility>

#include "utils/common.hpp"

namespace playrun::utils {
namespace {

std::mutex g_log_mutex;
LogConfig g_log_config;
LogSink g_log_sink;

void WriteToStderr(const LogMessage& msg) {
    std::cerr << "[" << msg.tag << "] ";
    if (msg.level != LogLevel::kInfo) {
        std::cerr << ToString(msg.level) << " ";
    }
    std::cerr << msg.message;
    for (const auto& [key, value] : msg.fields) {
        std::cerr << " " << key << "=" << value;
    }
    std::cerr << std::endl;
}

}  // namespace

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    const auto lowered = ToLower(Trim(value));
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

void ConfigureLogging(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_config = config;
}

void SetLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_sink = std::move(sink);
}

void Log(LogLevel level, const std::string& tag, const std::string& message,
         std::unordered_map<std::string, std::string> fields) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (static_cast<int>(level) < static_cast<int>(g_log_config.min_level)) {
        return;
    }
    LogMessage msg{level, tag, message, std::move(fields)};
    if (g_log_sink) {
        g_log_sink(msg);
        return;
    }
    WriteToStderr(msg);
}

}  // namespace playrun::utils
