#include "providers/mock_provider.hpp"

#include "utils/common.hpp"

namespace judgelink::providers {

nlohmann::json MockProvider::Ask(const std::string& prompt, int /*max_tokens*/) {
    if (utils::ToLower(prompt).find("curriculum") == std::string::npos) {
        return {{"message", "Mock response"}};
    }
    return {
        {"levels", nlohmann::json::array({
            {
                {"level", "Beginner"},
                {"lessons", nlohmann::json::array({
                    {{"title", "Variables"}, {"summary", "Learn variables and data types."}},
                    {{"title", "Loops"}, {"summary", "Understand iteration."}}
                })}
            },
            {
                {"level", "Intermediate"},
                {"lessons", nlohmann::json::array({
                    {{"title", "Functions"}, {"summary", "Learn modular code."}},
                    {{"title", "Modules"}, {"summary", "Use Python libraries."}}
                })}
            }
        })}
    };
}

}  // namespace judgelink::providers
