#include "utils/logging.hpp"

#include <iostream>
#include <mutex>
#include <sstream>

#include "utils/common.hpp"

namespace judgelink::utils {
namespace {

std::mutex& LogMutex() {
    static std::mutex mutex;
    return mutex;
}

LogConfig& MutableConfig() {
    static LogConfig config{};
    return config;
}

LogSink& MutableSink() {
    static LogSink sink;
    return sink;
}

}  // namespace

LogLevel ParseLogLevel(const std::string& text, LogLevel fallback) {
    const auto lowered = ToLower(Trim(text));
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

void Configure(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(LogMutex());
    MutableConfig() = config;
}

LogConfig CurrentConfig() {
    std::lock_guard<std::mutex> lock(LogMutex());
    return MutableConfig();
}

void SetLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(LogMutex());
    MutableSink() = std::move(sink);
}

void ResetLogSink() {
    SetLogSink(nullptr);
}

std::string FormatLogMessage(const LogMessage& message) {
    std::ostringstream oss;
    oss << "[" << message.component << "] " << ToString(message.level) << " " << message.message;
    for (const auto& [key, value] : message.fields) {
        oss << " " << key << "=" << value;
    }
    return oss.str();
}

void Log(const LogMessage& message) {
    std::lock_guard<std::mutex> lock(LogMutex());
    if (message.level < MutableConfig().min_level) {
        return;
    }
    if (MutableSink()) {
        MutableSink()(message);
        return;
    }
    std::cerr << FormatLogMessage(message) << std::endl;
}

std::string MaskSecret(const std::string& secret) {
    if (secret.empty()) {
        return "(none)";
    }
    if (secret.size() <= 8) {
        return "****";
    }
    return secret.substr(0, 4) + "****" + secret.substr(secret.size() - 4);
}

}  // namespace judgelink::utils
