#include "config/config_loader.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "utils/common.hpp"
#include "utils/http_util.hpp"
#include "utils/logging.hpp"

namespace judgelink::config {
namespace {

using utils::GetEnv;

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

bool ParseBool(const std::string& value) {
    const auto lowered = utils::ToLower(utils::Trim(value));
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

double ParseDouble(const std::string& value, double fallback) {
    try {
        std::size_t consumed = 0;
        const double parsed = std::stod(value, &consumed);
        if (!std::isfinite(parsed) || !utils::IsBlank(value.substr(consumed))) {
            return fallback;
        }
        return parsed;
    } catch (const std::exception&) {
        return fallback;
    }
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string StripTrailingSlashes(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

void ReadString(const nlohmann::json& source, const char* key, std::string& target) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ReadBool(const nlohmann::json& source, const char* key, bool& target) {
    if (source.contains(key) && source[key].is_boolean()) {
        target = source[key].get<bool>();
    }
}

void ReadDouble(const nlohmann::json& source, const char* key, double& target) {
    if (source.contains(key) && source[key].is_number()) {
        target = source[key].get<double>();
    }
}

void ReadEnvString(const char* primary, const char* secondary, std::string& target) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = value;
    }
}

void ReadEnvBool(const char* primary, const char* secondary, bool& target) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = ParseBool(value);
    }
}

void ReadEnvDouble(const char* primary, const char* secondary, double& target) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = ParseDouble(value, target);
    }
}

std::string ValidUrlOrDefault(const char* key, const std::string& url, const std::string& fallback) {
    auto stripped = StripTrailingSlashes(url);
    try {
        utils::ParseUrl(stripped);
        return stripped;
    } catch (const std::invalid_argument& ex) {
        utils::LogWarn("config", "invalid URL, using default", {{"key", key}, {"url", url}, {"error", ex.what()}});
        return fallback;
    }
}

std::string FindSystemBundle() {
    static const std::vector<std::string> kKnownBundles = {
        "/etc/ssl/certs/ca-certificates.crt",
        "/etc/pki/tls/certs/ca-bundle.crt",
        "/etc/ssl/ca-bundle.pem",
        "/etc/ssl/cert.pem"
    };
    for (const auto& path : kKnownBundles) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(path, ec)) {
            return path;
        }
    }
    return {};
}

}  // namespace

std::filesystem::path GetConfigPath() {
    const auto explicit_path = GetEnv("JUDGELINK_CONFIG");
    if (!explicit_path.empty()) {
        return std::filesystem::path(explicit_path);
    }
    return GetHomePath() / ".judgelink" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("judge0") && data["judge0"].is_object()) {
        const auto& judge0 = data["judge0"];
        ReadString(judge0, "apiUrl", config.judge0.api_url);
        ReadDouble(judge0, "requestTimeout", config.judge0.request_timeout_s);
        ReadDouble(judge0, "pollInterval", config.judge0.poll_interval_s);
        ReadDouble(judge0, "maxWaitSeconds", config.judge0.max_wait_s);
        ReadString(judge0, "rapidApiHost", config.judge0.rapidapi_host);
        ReadString(judge0, "rapidApiKey", config.judge0.rapidapi_key);
        ReadString(judge0, "apiKey", config.judge0.api_key);
        ReadString(judge0, "caBundlePath", config.judge0.ca_bundle_path);
        ReadString(judge0, "fallbackCaBundlePath", config.judge0.fallback_ca_bundle_path);
        ReadBool(judge0, "disableSslVerify", config.judge0.disable_ssl_verify);
        ReadBool(judge0, "useProxy", config.judge0.use_proxy);
    }

    if (data.contains("assistant") && data["assistant"].is_object()) {
        const auto& assistant = data["assistant"];
        ReadBool(assistant, "mock", config.assistant.mock);
        ReadString(assistant, "apiKey", config.assistant.api_key);
        ReadString(assistant, "apiBase", config.assistant.api_base);
        ReadString(assistant, "model", config.assistant.model);
        if (assistant.contains("maxTokens") && assistant["maxTokens"].is_number_integer()) {
            config.assistant.max_tokens = assistant["maxTokens"].get<int>();
        }
        ReadDouble(assistant, "requestTimeout", config.assistant.request_timeout_s);
        ReadBool(assistant, "useProxy", config.assistant.use_proxy);
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        ReadString(data["logging"], "level", config.logging.level);
    }
}

void ApplyConfigFromEnv(Config& config) {
    ReadEnvString("JUDGELINK_JUDGE0__API_URL", "JUDGE0_API_URL", config.judge0.api_url);
    ReadEnvDouble("JUDGELINK_JUDGE0__REQUEST_TIMEOUT", "JUDGE0_REQUEST_TIMEOUT", config.judge0.request_timeout_s);
    ReadEnvDouble("JUDGELINK_JUDGE0__POLL_INTERVAL", "JUDGE0_POLL_INTERVAL", config.judge0.poll_interval_s);
    ReadEnvDouble("JUDGELINK_JUDGE0__MAX_WAIT_SECONDS", "JUDGE0_MAX_WAIT_SECONDS", config.judge0.max_wait_s);
    ReadEnvString("JUDGELINK_JUDGE0__RAPIDAPI_HOST", "JUDGE0_RAPIDAPI_HOST", config.judge0.rapidapi_host);
    ReadEnvString("JUDGELINK_JUDGE0__RAPIDAPI_KEY", "JUDGE0_RAPIDAPI_KEY", config.judge0.rapidapi_key);
    ReadEnvString("JUDGELINK_JUDGE0__API_KEY", "JUDGE0_API_KEY", config.judge0.api_key);
    ReadEnvString("JUDGELINK_JUDGE0__CA_BUNDLE_PATH", "JUDGE0_CA_BUNDLE_PATH", config.judge0.ca_bundle_path);
    ReadEnvString(
        "JUDGELINK_JUDGE0__FALLBACK_CA_BUNDLE_PATH",
        "JUDGE0_FALLBACK_CA_BUNDLE_PATH",
        config.judge0.fallback_ca_bundle_path);
    ReadEnvBool("JUDGELINK_JUDGE0__DISABLE_SSL_VERIFY", "JUDGE0_DISABLE_SSL_VERIFY", config.judge0.disable_ssl_verify);
    ReadEnvBool("JUDGELINK_JUDGE0__USE_PROXY", "JUDGE0_USE_PROXY", config.judge0.use_proxy);

    ReadEnvBool("JUDGELINK_ASSISTANT__MOCK", "OPENAI_MOCK", config.assistant.mock);
    ReadEnvString("JUDGELINK_ASSISTANT__API_KEY", "OPENAI_API_KEY", config.assistant.api_key);
    ReadEnvString("JUDGELINK_ASSISTANT__API_BASE", "OPENAI_API_BASE", config.assistant.api_base);
    ReadEnvString("JUDGELINK_ASSISTANT__MODEL", "OPENAI_MODEL", config.assistant.model);
    const auto max_tokens = GetEnvFallback("JUDGELINK_ASSISTANT__MAX_TOKENS", "OPENAI_MAX_TOKENS");
    if (!max_tokens.empty()) {
        config.assistant.max_tokens = ParseInt(max_tokens, config.assistant.max_tokens);
    }
    ReadEnvBool("JUDGELINK_ASSISTANT__USE_PROXY", "OPENAI_USE_PROXY", config.assistant.use_proxy);

    ReadEnvString("JUDGELINK_LOGGING__LEVEL", "JUDGELINK_LOG_LEVEL", config.logging.level);
}

void FinalizeConfig(Config& config) {
    const Config defaults{};
    config.judge0.api_url = ValidUrlOrDefault("judge0.apiUrl", config.judge0.api_url, defaults.judge0.api_url);
    config.assistant.api_base =
        ValidUrlOrDefault("assistant.apiBase", config.assistant.api_base, defaults.assistant.api_base);
    if (config.judge0.rapidapi_host.empty()) {
        config.judge0.rapidapi_host = utils::ParseUrl(config.judge0.api_url).Authority();
    }
    if (config.judge0.fallback_ca_bundle_path.empty()) {
        config.judge0.fallback_ca_bundle_path = FindSystemBundle();
    }
}

Config LoadConfigFromFile(const std::filesystem::path& path) {
    Config config{};
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return config;
    }
    std::ifstream input(path);
    if (!input.is_open()) {
        utils::LogWarn("config", "unable to open config file", {{"path", path.string()}});
        return config;
    }
    const auto data = nlohmann::json::parse(input, nullptr, false);
    if (data.is_discarded()) {
        utils::LogWarn("config", "invalid JSON in config file, keeping defaults", {{"path", path.string()}});
        return config;
    }
    ApplyConfigFromJson(config, data);
    return config;
}

Config LoadConfig() {
    auto config = LoadConfigFromFile(GetConfigPath());
    ApplyConfigFromEnv(config);
    FinalizeConfig(config);
    return config;
}

}  // namespace judgelink::config
