#pragma once

#include <memory>
#include <stdexcept>
#include <string>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace judgelink::providers {

class ProviderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// "Ask a model, get an answer" contract. The answer is either a JSON string
/// or a structured JSON object, depending on the implementation.
class LLMProvider {
public:
    virtual ~LLMProvider() = default;
    virtual nlohmann::json Ask(const std::string& prompt, int max_tokens) = 0;
    virtual std::string GetModel() const = 0;
};

std::unique_ptr<LLMProvider> CreateProvider(const config::AssistantConfig& config);

}  // namespace judgelink::providers
