#include "providers/openai_provider.hpp"

#include <algorithm>
#include <array>

#include "utils/logging.hpp"

namespace judgelink::providers {
namespace {

constexpr const char* kFallbackModel = "gpt-3.5-turbo";

constexpr std::array<const char*, 4> kPreferredModels = {
    "gpt-5",
    "gpt-4o",
    "gpt-4",
    "gpt-3.5-turbo",
};

}  // namespace

OpenAIProvider::OpenAIProvider(const config::AssistantConfig& config)
    : config_(config)
    , endpoint_(utils::ParseUrl(config.api_base))
    , model_(config.model) {}

httplib::Client OpenAIProvider::MakeClient() const {
    httplib::Client client(endpoint_.SchemeHostPort());
    utils::SetTimeout(client, config::SecondsToMillis(config_.request_timeout_s));
    if (config_.use_proxy) {
        utils::ApplyProxyFromEnv(client);
    }
    return client;
}

httplib::Headers OpenAIProvider::MakeHeaders() const {
    httplib::Headers headers{{"Accept", "application/json"}};
    if (!config_.api_key.empty()) {
        headers.emplace("Authorization", "Bearer " + config_.api_key);
    }
    return headers;
}

std::string OpenAIProvider::ChooseModel(const std::vector<std::string>& available) {
    for (const auto* preferred : kPreferredModels) {
        if (std::find(available.begin(), available.end(), preferred) != available.end()) {
            return preferred;
        }
    }
    for (const auto& id : available) {
        if (id.find("gpt") != std::string::npos) {
            return id;
        }
    }
    return kFallbackModel;
}

std::string OpenAIProvider::DiscoverModel() const {
    auto client = MakeClient();
    const auto path = endpoint_.base_path + "/models";
    auto response = client.Get(path, MakeHeaders());
    if (!response) {
        utils::LogWarn("llm", "model discovery failed", {{"error", httplib::to_string(response.error())}});
        return kFallbackModel;
    }
    if (response->status >= 400) {
        utils::LogWarn("llm", "model discovery failed", {{"status", std::to_string(response->status)}});
        return kFallbackModel;
    }
    const auto json = nlohmann::json::parse(response->body, nullptr, false);
    if (json.is_discarded() || !json.contains("data") || !json["data"].is_array()) {
        utils::LogWarn("llm", "model discovery returned an invalid response");
        return kFallbackModel;
    }
    std::vector<std::string> available;
    for (const auto& item : json["data"]) {
        if (item.is_object() && item.contains("id") && item["id"].is_string()) {
            available.push_back(item["id"].get<std::string>());
        }
    }
    return ChooseModel(available);
}

std::string OpenAIProvider::GetModel() const {
    std::call_once(model_once_, [this]() {
        if (model_.empty()) {
            model_ = DiscoverModel();
        }
        utils::LogInfo("llm", "model selected", {{"model", model_}});
    });
    return model_;
}

nlohmann::json OpenAIProvider::Ask(const std::string& prompt, int max_tokens) {
    const auto model = GetModel();
    const auto fail = [&model](const std::string& detail) {
        return ProviderError("OpenAI API error when calling model " + model + ": " + detail);
    };

    nlohmann::json payload;
    payload["model"] = model;
    payload["messages"] = nlohmann::json::array({{{"role", "user"}, {"content", prompt}}});
    payload["max_tokens"] = max_tokens;

    auto client = MakeClient();
    const auto endpoint = endpoint_.base_path + "/chat/completions";
    utils::LogDebug(
        "llm",
        "POST " + endpoint_.SchemeHostPort() + endpoint,
        {{"model", model}, {"api_key", utils::MaskSecret(config_.api_key)}});

    auto response = client.Post(endpoint, MakeHeaders(), payload.dump(), "application/json");
    if (!response) {
        throw fail("request failed (" + httplib::to_string(response.error()) + ")");
    }
    if (response->status >= 400) {
        utils::LogWarn("llm", "HTTP error", {{"status", std::to_string(response->status)}, {"body", response->body}});
        throw fail("HTTP " + std::to_string(response->status));
    }

    const auto json = nlohmann::json::parse(response->body, nullptr, false);
    if (json.is_discarded() || !json.contains("choices") || !json["choices"].is_array() ||
        json["choices"].empty()) {
        throw fail("invalid response");
    }
    const auto& message = json["choices"][0].value("message", nlohmann::json::object());
    if (message.contains("content") && message["content"].is_string()) {
        return message["content"].get<std::string>();
    }
    return std::string();
}

}  // namespace judgelink::providers
