#pragma once

#include <functional>
#include <string>
#include <vector>
#include <utility>

namespace judgelink::utils {

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

using LogFields = std::vector<std::pair<std::string, std::string>>;

struct LogMessage {
    LogLevel level;
    std::string component;
    std::string message;
    LogFields fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

using LogSink = std::function<void(const LogMessage&)>;

LogLevel ParseLogLevel(const std::string& text, LogLevel fallback);

void Configure(const LogConfig& config);
LogConfig CurrentConfig();

// Replaces the stderr writer. Messages below the configured level never reach the sink.
void SetLogSink(LogSink sink);
void ResetLogSink();

std::string FormatLogMessage(const LogMessage& message);
void Log(const LogMessage& message);

inline void LogDebug(const std::string& component, const std::string& message, LogFields fields = {}) {
    Log(LogMessage{LogLevel::kDebug, component, message, std::move(fields)});
}

inline void LogInfo(const std::string& component, const std::string& message, LogFields fields = {}) {
    Log(LogMessage{LogLevel::kInfo, component, message, std::move(fields)});
}

inline void LogWarn(const std::string& component, const std::string& message, LogFields fields = {}) {
    Log(LogMessage{LogLevel::kWarn, component, message, std::move(fields)});
}

inline void LogError(const std::string& component, const std::string& message, LogFields fields = {}) {
    Log(LogMessage{LogLevel::kError, component, message, std::move(fields)});
}

std::string MaskSecret(const std::string& secret);

}  // namespace judgelink::utils
