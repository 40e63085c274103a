#include "providers/llm_provider.hpp"

#include "providers/mock_provider.hpp"
#include "providers/openai_provider.hpp"
#include "utils/logging.hpp"

namespace judgelink::providers {

std::unique_ptr<LLMProvider> CreateProvider(const config::AssistantConfig& config) {
    if (config.mock) {
        utils::LogInfo("llm", "using mock provider");
        return std::make_unique<MockProvider>();
    }
    if (config.api_key.empty()) {
        throw ProviderError(
            "OPENAI_API_KEY not found. Set it in the environment or enable OPENAI_MOCK=1.");
    }
    return std::make_unique<OpenAIProvider>(config);
}

}  // namespace judgelink::providers
