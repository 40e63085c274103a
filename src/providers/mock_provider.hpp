#pragma once

#include <string>

#include "providers/llm_provider.hpp"

namespace judgelink::providers {

class MockProvider : public LLMProvider {
public:
    nlohmann::json Ask(const std::string& prompt, int max_tokens) override;
    std::string GetModel() const override { return "mock"; }
};

}  // namespace judgelink::providers
