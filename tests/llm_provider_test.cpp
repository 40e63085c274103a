#include <gtest/gtest.h>

#include <memory>
#include <mutex>
#include <string>

#include "providers/llm_provider.hpp"
#include "providers/mock_provider.hpp"
#include "providers/openai_provider.hpp"
#include "test_support.hpp"

using judgelink::config::AssistantConfig;
using judgelink::providers::CreateProvider;
using judgelink::providers::MockProvider;
using judgelink::providers::OpenAIProvider;
using judgelink::providers::ProviderError;
using judgelink::testing::ScopedServer;

// NOLINTNEXTLINE
TEST(mock_provider, curriculum_prompt_gets_structured_levels) {
    MockProvider provider;
    const auto answer = provider.Ask("Design a simple 3-level learning CURRICULUM for Rust", 800);
    ASSERT_TRUE(answer.is_object());
    ASSERT_TRUE(answer["levels"].is_array());
    EXPECT_EQ(answer["levels"].size(), 2u);
    EXPECT_EQ(answer["levels"][0]["level"], "Beginner");
    EXPECT_EQ(answer["levels"][1]["lessons"][0]["title"], "Functions");
}

// NOLINTNEXTLINE
TEST(mock_provider, other_prompts_get_generic_message) {
    MockProvider provider;
    EXPECT_EQ(provider.Ask("Explain loops", 100), (nlohmann::json{{"message", "Mock response"}}));
    EXPECT_EQ(provider.GetModel(), "mock");
}

// NOLINTNEXTLINE
TEST(create_provider, mock_flag_selects_mock) {
    AssistantConfig config{};
    config.mock = true;
    auto provider = CreateProvider(config);
    ASSERT_NE(provider, nullptr);
    EXPECT_NE(dynamic_cast<MockProvider*>(provider.get()), nullptr);
}

// NOLINTNEXTLINE
TEST(create_provider, live_without_key_fails) {
    AssistantConfig config{};
    EXPECT_THROW(CreateProvider(config), ProviderError);
}

// NOLINTNEXTLINE
TEST(create_provider, live_with_key_selects_openai) {
    AssistantConfig config{};
    config.api_key = "sk-test";
    config.model = "gpt-4o";
    auto provider = CreateProvider(config);
    EXPECT_NE(dynamic_cast<OpenAIProvider*>(provider.get()), nullptr);
    EXPECT_EQ(provider->GetModel(), "gpt-4o");
}

// NOLINTNEXTLINE
TEST(openai_provider, choose_model_prefers_known_models) {
    EXPECT_EQ(OpenAIProvider::ChooseModel({"davinci", "gpt-4", "gpt-4o"}), "gpt-4o");
    EXPECT_EQ(OpenAIProvider::ChooseModel({"gpt-4-turbo-preview", "whisper-1"}), "gpt-4-turbo-preview");
    EXPECT_EQ(OpenAIProvider::ChooseModel({"whisper-1"}), "gpt-3.5-turbo");
    EXPECT_EQ(OpenAIProvider::ChooseModel({}), "gpt-3.5-turbo");
}

class OpenAIProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto server = std::make_unique<httplib::Server>();
        server->Get("/v1/models", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(R"({"data":[{"id":"whisper-1"},{"id":"gpt-4"}]})", "application/json");
        });
        server->Post("/v1/chat/completions", [this](const httplib::Request& req, httplib::Response& res) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                last_body_ = req.body;
                last_auth_ = req.get_header_value("Authorization");
            }
            if (req.body.find("fail") != std::string::npos) {
                res.status = 500;
                res.set_content("boom", "text/plain");
                return;
            }
            res.set_content(
                R"({"choices":[{"message":{"role":"assistant","content":"Variables hold values."}}]})",
                "application/json");
        });
        server_ = std::make_unique<ScopedServer>(std::move(server));
    }

    AssistantConfig Config() const {
        AssistantConfig config{};
        config.api_key = "sk-test-0123456789";
        config.api_base = server_->Url() + "/v1";
        config.request_timeout_s = 5;
        return config;
    }

    std::unique_ptr<ScopedServer> server_;
    std::mutex mutex_;
    std::string last_body_;
    std::string last_auth_;
};

// NOLINTNEXTLINE
TEST_F(OpenAIProviderTest, discovers_model_and_asks) {
    OpenAIProvider provider(Config());
    EXPECT_EQ(provider.GetModel(), "gpt-4");
    const auto answer = provider.Ask("Explain variables", 64);
    EXPECT_EQ(answer, "Variables hold values.");

    std::lock_guard<std::mutex> lock(mutex_);
    const auto body = nlohmann::json::parse(last_body_);
    EXPECT_EQ(body["model"], "gpt-4");
    EXPECT_EQ(body["max_tokens"], 64);
    EXPECT_EQ(body["messages"][0]["role"], "user");
    EXPECT_EQ(body["messages"][0]["content"], "Explain variables");
    EXPECT_EQ(last_auth_, "Bearer sk-test-0123456789");
}

// NOLINTNEXTLINE
TEST_F(OpenAIProviderTest, http_error_names_the_model) {
    auto config = Config();
    config.model = "gpt-4o";
    OpenAIProvider provider(config);
    try {
        provider.Ask("please fail", 16);
        FAIL() << "expected ProviderError";
    } catch (const ProviderError& ex) {
        const std::string message = ex.what();
        EXPECT_NE(message.find("gpt-4o"), std::string::npos);
        EXPECT_NE(message.find("HTTP 500"), std::string::npos);
    }
}

// NOLINTNEXTLINE
TEST(openai_provider, unreachable_discovery_falls_back) {
    int port = 0;
    {
        ScopedServer closed(std::make_unique<httplib::Server>());
        port = closed.port();
    }
    AssistantConfig config{};
    config.api_key = "sk-test";
    config.api_base = "http://127.0.0.1:" + std::to_string(port) + "/v1";
    config.request_timeout_s = 2;
    OpenAIProvider provider(config);
    EXPECT_EQ(provider.GetModel(), "gpt-3.5-turbo");
    EXPECT_THROW(provider.Ask("hello", 16), ProviderError);
}
