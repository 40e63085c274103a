#include "judge0/judge0_client.hpp"

#include <algorithm>
#include <cstdlib>
#include <thread>
#include <utility>

#include "judge0/errors.hpp"
#include "utils/common.hpp"
#include "utils/http_util.hpp"
#include "utils/logging.hpp"

namespace judgelink::judge0 {
namespace {

std::string TextField(const nlohmann::json& response, const char* key) {
    if (response.contains(key) && response[key].is_string()) {
        return response[key].get<std::string>();
    }
    return {};
}

// nlohmann::json refuses to serialize invalid UTF-8; reject it before any request.
void RequireUtf8(const std::string& field, const std::string& value) {
    try {
        (void)nlohmann::json(value).dump();
    } catch (const nlohmann::json::type_error&) {
        throw InvalidInputError(field + " must be valid UTF-8 text.");
    }
}

std::optional<double> ParseSeconds(const nlohmann::json& value) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        const auto text = value.get<std::string>();
        if (text.empty()) {
            return std::nullopt;
        }
        char* end = nullptr;
        const double parsed = std::strtod(text.c_str(), &end);
        if (end == text.c_str() || *end != '\0') {
            return std::nullopt;
        }
        return parsed;
    }
    return std::nullopt;
}

template <typename T>
std::optional<T> IntegerField(const nlohmann::json& response, const char* key) {
    if (response.contains(key) && response[key].is_number_integer()) {
        return response[key].get<T>();
    }
    return std::nullopt;
}

template <typename T>
nlohmann::json OptionalJson(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

}  // namespace

nlohmann::json ToJson(const ExecutionResult& result) {
    return {
        {"token", result.token},
        {"language", result.language.key},
        {"language_id", result.language.remote_id},
        {"language_name", result.language.display_name},
        {"status", {
            {"id", OptionalJson(result.status.id)},
            {"description", result.status.description}
        }},
        {"stdout", result.stdout_text},
        {"stderr", result.stderr_text},
        {"compile_output", result.compile_output},
        {"message", result.message},
        {"time", OptionalJson(result.time_seconds)},
        {"memory", OptionalJson(result.memory_kilobytes)},
        {"exit_code", OptionalJson(result.exit_code)}
    };
}

SubmissionStatus ParseStatus(const nlohmann::json& response) {
    SubmissionStatus status{};
    if (!response.is_object() || !response.contains("status") || !response["status"].is_object()) {
        return status;
    }
    const auto& raw = response["status"];
    status.id = IntegerField<int>(raw, "id");
    status.description = TextField(raw, "description");
    return status;
}

ExecutionResult ParseExecutionResult(
    const std::string& token,
    const LanguageDefinition& language,
    const nlohmann::json& response) {
    ExecutionResult result{};
    result.token = token;
    result.language = language;
    result.status = ParseStatus(response);
    if (!response.is_object()) {
        return result;
    }
    result.stdout_text = TextField(response, "stdout");
    result.stderr_text = TextField(response, "stderr");
    result.compile_output = TextField(response, "compile_output");
    result.message = TextField(response, "message");
    if (response.contains("time")) {
        result.time_seconds = ParseSeconds(response["time"]);
    }
    result.memory_kilobytes = IntegerField<long long>(response, "memory");
    result.exit_code = IntegerField<int>(response, "exit_code");
    return result;
}

PollSettings PollSettingsFromConfig(const config::Judge0Config& config) {
    return PollSettings{.poll_interval = config.PollInterval(), .max_wait = config.MaxWait()};
}

Judge0Client::Judge0Client(
    std::shared_ptr<const LanguageRegistry> languages,
    std::shared_ptr<RequestExecutor> executor,
    PollSettings settings,
    Sleeper sleeper)
    : languages_(std::move(languages))
    , executor_(std::move(executor))
    , settings_(settings)
    , sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds duration) {
            std::this_thread::sleep_for(duration);
        };
    }
}

const LanguageDefinition& Judge0Client::ResolveLanguage(const std::string& language) const {
    return languages_->Resolve(language);
}

const std::vector<LanguageDefinition>& Judge0Client::ListSupportedLanguages() const {
    return languages_->ListSupported();
}

nlohmann::json Judge0Client::BuildPayload(
    const LanguageDefinition& language,
    const SubmissionRequest& request) const {
    nlohmann::json payload = {
        {"language_id", language.remote_id},
        {"source_code", request.source_code},
        {"stdin", request.stdin_data}
    };
    if (request.command_line_arguments && !request.command_line_arguments->empty()) {
        payload["command_line_arguments"] = *request.command_line_arguments;
    }
    if (request.expected_output) {
        payload["expected_output"] = *request.expected_output;
    }
    return payload;
}

Submission Judge0Client::Submit(const SubmissionRequest& request) {
    if (utils::IsBlank(request.source_code)) {
        throw InvalidInputError("source_code must be provided.");
    }
    RequireUtf8("source_code", request.source_code);
    RequireUtf8("stdin", request.stdin_data);
    if (request.command_line_arguments) {
        RequireUtf8("command_line_arguments", *request.command_line_arguments);
    }
    if (request.expected_output) {
        RequireUtf8("expected_output", *request.expected_output);
    }
    const auto& language = ResolveLanguage(request.language);

    const auto response = executor_->Perform(
        HttpMethod::kPost,
        "/submissions",
        BuildPayload(language, request),
        {{"base64_encoded", "false"}, {"wait", "false"}});

    const auto token = response.is_object() ? TextField(response, "token") : std::string();
    if (token.empty()) {
        throw RemoteServiceError("Judge0 did not return a submission token.");
    }
    utils::LogInfo("judge0", "submission created", {{"token", token}, {"language", language.key}});

    return Submission{
        .token = token,
        .language_key = language.key,
        .source_code = request.source_code,
        .stdin_data = request.stdin_data,
        .command_line_arguments = request.command_line_arguments,
        .expected_output = request.expected_output};
}

ExecutionResult Judge0Client::WaitForResult(const Submission& submission, Clock::time_point deadline) {
    const auto& language = ResolveLanguage(submission.language_key);
    const auto path = "/submissions/" + utils::UrlEncode(submission.token);

    int attempts = 0;
    while (true) {
        const auto response = executor_->Perform(
            HttpMethod::kGet,
            path,
            std::nullopt,
            {{"base64_encoded", "false"}});
        ++attempts;

        const auto status = ParseStatus(response);
        if (!status.IsPending()) {
            utils::LogInfo(
                "judge0",
                "submission finished",
                {{"token", submission.token},
                 {"status", status.id ? std::to_string(*status.id) : "null"},
                 {"description", status.description},
                 {"polls", std::to_string(attempts)}});
            return ParseExecutionResult(submission.token, language, response);
        }

        const auto now = Clock::now();
        if (now >= deadline) {
            utils::LogWarn(
                "judge0",
                "submission still pending at deadline",
                {{"token", submission.token}, {"polls", std::to_string(attempts)}});
            throw TimeoutError(submission.token);
        }
        const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
        sleeper_(std::min(settings_.poll_interval, remaining));
    }
}

ExecutionResult Judge0Client::ExecuteSubmission(
    const SubmissionRequest& request,
    std::optional<Clock::time_point> deadline) {
    const auto submission = Submit(request);
    auto effective_deadline = Clock::now() + settings_.max_wait;
    if (deadline && *deadline < effective_deadline) {
        effective_deadline = *deadline;
    }
    return WaitForResult(submission, effective_deadline);
}

}  // namespace judgelink::judge0
