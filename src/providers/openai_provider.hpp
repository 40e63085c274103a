#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "httplib.h"
#include "providers/llm_provider.hpp"
#include "utils/http_util.hpp"

namespace judgelink::providers {

class OpenAIProvider : public LLMProvider {
public:
    explicit OpenAIProvider(const config::AssistantConfig& config);

    nlohmann::json Ask(const std::string& prompt, int max_tokens) override;

    // The configured model, or the first preferred model the account can use.
    std::string GetModel() const override;

    static std::string ChooseModel(const std::vector<std::string>& available);

private:
    std::string DiscoverModel() const;
    httplib::Client MakeClient() const;
    httplib::Headers MakeHeaders() const;

    config::AssistantConfig config_;
    utils::ParsedUrl endpoint_;
    mutable std::once_flag model_once_;
    mutable std::string model_;
};

}  // namespace judgelink::providers
