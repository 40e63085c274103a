#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <string>

namespace judgelink::config {

// Durations are capped at one day so deadline arithmetic cannot overflow.
inline constexpr double kMaxDurationSeconds = 24.0 * 60.0 * 60.0;

inline std::chrono::milliseconds SecondsToMillis(double seconds) {
    if (std::isnan(seconds) || seconds <= 0.0) {
        return std::chrono::milliseconds(0);
    }
    const double clamped = std::min(seconds, kMaxDurationSeconds);
    return std::chrono::milliseconds(static_cast<long long>(clamped * 1000.0));
}

struct Judge0Config {
    std::string api_url = "https://judge0-ce.p.rapidapi.com";
    double request_timeout_s = 10.0;
    double poll_interval_s = 0.75;
    double max_wait_s = 20.0;
    std::string rapidapi_host;
    std::string rapidapi_key;
    std::string api_key;
    std::string ca_bundle_path;
    std::string fallback_ca_bundle_path;
    bool disable_ssl_verify = false;
    bool use_proxy = false;

    std::chrono::milliseconds RequestTimeout() const { return SecondsToMillis(request_timeout_s); }
    std::chrono::milliseconds PollInterval() const { return SecondsToMillis(poll_interval_s); }
    std::chrono::milliseconds MaxWait() const { return SecondsToMillis(max_wait_s); }
};

struct AssistantConfig {
    bool mock = false;
    std::string api_key;
    std::string api_base = "https://api.openai.com/v1";
    std::string model;
    int max_tokens = 800;
    double request_timeout_s = 60.0;
    bool use_proxy = false;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    Judge0Config judge0;
    AssistantConfig assistant;
    LoggingConfig logging;
};

}  // namespace judgelink::config
