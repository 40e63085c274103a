#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "config/config_loader.hpp"
#include "judge0/errors.hpp"
#include "judge0/judge0_client.hpp"
#include "judge0/language_registry.hpp"
#include "judge0/request_executor.hpp"
#include "nlohmann/json.hpp"
#include "providers/llm_provider.hpp"
#include "utils/logging.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitClientError = 2;
constexpr int kExitUpstreamError = 3;

void PrintUsage() {
    std::cout << "Usage:\n"
              << "  judgelink languages\n"
              << "  judgelink run <language> <source-file|-> [--stdin FILE] [--args ARGS] [--expected FILE]\n"
              << "  judgelink ask \"prompt\"" << std::endl;
}

std::optional<std::string> ReadInput(const std::string& path) {
    if (path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

void ConfigureLogging(const judgelink::config::Config& config) {
    judgelink::utils::LogConfig log_config{};
    log_config.min_level = judgelink::utils::ParseLogLevel(config.logging.level, log_config.min_level);
    judgelink::utils::Configure(log_config);
}

int ListLanguages(const judgelink::judge0::LanguageRegistry& registry) {
    nlohmann::json languages = nlohmann::json::array();
    for (const auto& language : registry.ListSupported()) {
        languages.push_back(judgelink::judge0::ToJson(language));
    }
    std::cout << nlohmann::json{{"languages", languages}}.dump(2) << std::endl;
    return kExitOk;
}

int RunSubmission(
    const judgelink::config::Config& config,
    std::shared_ptr<const judgelink::judge0::LanguageRegistry> registry,
    const std::vector<std::string>& args) {
    if (args.size() < 2) {
        PrintUsage();
        return kExitUsage;
    }

    judgelink::judge0::SubmissionRequest request{};
    request.language = args[0];
    const auto source = ReadInput(args[1]);
    if (!source) {
        std::cerr << "Failed to read source file: " << args[1] << std::endl;
        return kExitUsage;
    }
    request.source_code = *source;

    for (std::size_t i = 2; i < args.size(); ++i) {
        const auto& flag = args[i];
        if (i + 1 >= args.size()) {
            std::cerr << "Missing value for " << flag << std::endl;
            return kExitUsage;
        }
        const auto& value = args[++i];
        if (flag == "--args") {
            request.command_line_arguments = value;
        } else if (flag == "--stdin" || flag == "--expected") {
            const auto content = ReadInput(value);
            if (!content) {
                std::cerr << "Failed to read " << flag << " file: " << value << std::endl;
                return kExitUsage;
            }
            if (flag == "--stdin") {
                request.stdin_data = *content;
            } else {
                request.expected_output = *content;
            }
        } else {
            std::cerr << "Unknown option: " << flag << std::endl;
            return kExitUsage;
        }
    }

    try {
        judgelink::judge0::Judge0Client client(
            std::move(registry),
            judgelink::judge0::HttpRequestExecutor::FromConfig(config.judge0),
            judgelink::judge0::PollSettingsFromConfig(config.judge0));
        const auto result = client.ExecuteSubmission(request);
        std::cout << judgelink::judge0::ToJson(result).dump(2) << std::endl;
        return kExitOk;
    } catch (const judgelink::judge0::Judge0Error& ex) {
        std::cout << nlohmann::json{{"error", ex.what()}, {"kind", judgelink::judge0::ToString(ex.Kind())}}.dump(2)
                  << std::endl;
        return ex.IsClientError() ? kExitClientError : kExitUpstreamError;
    }
}

int Ask(const judgelink::config::Config& config, const std::string& prompt) {
    try {
        auto provider = judgelink::providers::CreateProvider(config.assistant);
        const auto answer = provider->Ask(prompt, config.assistant.max_tokens);
        if (answer.is_string()) {
            std::cout << answer.get<std::string>() << std::endl;
        } else {
            std::cout << answer.dump(2) << std::endl;
        }
        return kExitOk;
    } catch (const judgelink::providers::ProviderError& ex) {
        std::cerr << ex.what() << std::endl;
        return kExitUpstreamError;
    }
}

int Dispatch(const std::string& command, const std::vector<std::string>& args) {
    const auto config = judgelink::config::LoadConfig();
    ConfigureLogging(config);
    const auto registry = std::make_shared<const judgelink::judge0::LanguageRegistry>(
        judgelink::judge0::DefaultLanguageDefinitions());

    if (command == "languages") {
        return ListLanguages(*registry);
    }
    if (command == "run") {
        return RunSubmission(config, registry, args);
    }
    if (command == "ask" && !args.empty()) {
        return Ask(config, args[0]);
    }

    PrintUsage();
    return kExitUsage;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return kExitUsage;
    }

    const std::string command = argv[1];
    const std::vector<std::string> args(argv + 2, argv + argc);
    try {
        return Dispatch(command, args);
    } catch (const std::exception& ex) {
        std::cerr << "[cli] " << ex.what() << std::endl;
        return kExitUsage;
    }
}
