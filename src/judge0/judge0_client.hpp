#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "judge0/language_registry.hpp"
#include "judge0/request_executor.hpp"
#include "nlohmann/json.hpp"

namespace judgelink::judge0 {

struct SubmissionRequest {
    std::string language;
    std::string source_code;
    std::string stdin_data;
    std::optional<std::string> command_line_arguments;
    std::optional<std::string> expected_output;
};

struct Submission {
    std::string token;
    std::string language_key;
    std::string source_code;
    std::string stdin_data;
    std::optional<std::string> command_line_arguments;
    std::optional<std::string> expected_output;
};

// Judge0 status; ids 1 (In Queue) and 2 (Processing) are pending.
struct SubmissionStatus {
    std::optional<int> id;
    std::string description;

    bool IsPending() const { return id && (*id == 1 || *id == 2); }
};

struct ExecutionResult {
    std::string token;
    LanguageDefinition language;
    SubmissionStatus status;
    std::string stdout_text;
    std::string stderr_text;
    std::string compile_output;
    std::string message;
    std::optional<double> time_seconds;
    std::optional<long long> memory_kilobytes;
    std::optional<int> exit_code;
};

nlohmann::json ToJson(const ExecutionResult& result);

SubmissionStatus ParseStatus(const nlohmann::json& response);
ExecutionResult ParseExecutionResult(
    const std::string& token,
    const LanguageDefinition& language,
    const nlohmann::json& response);

struct PollSettings {
    std::chrono::milliseconds poll_interval{750};
    std::chrono::milliseconds max_wait{20000};
};

PollSettings PollSettingsFromConfig(const config::Judge0Config& config);

/// Submits code to Judge0 and polls until the submission leaves the pending state.
///
/// One ExecuteSubmission call runs sequentially: create, then poll every
/// poll_interval until a terminal status or the deadline. Independent calls
/// may run concurrently; the registry is shared read-only and every request
/// goes through the executor.
class Judge0Client {
public:
    using Clock = std::chrono::steady_clock;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    Judge0Client(
        std::shared_ptr<const LanguageRegistry> languages,
        std::shared_ptr<RequestExecutor> executor,
        PollSettings settings,
        Sleeper sleeper = nullptr);

    const LanguageDefinition& ResolveLanguage(const std::string& language) const;
    const std::vector<LanguageDefinition>& ListSupportedLanguages() const;

    /// Throws InvalidInputError, UnsupportedLanguageError (both before any
    /// request), TransportError, RemoteServiceError or TimeoutError.
    /// The effective deadline is the earlier of `deadline` and now + max_wait.
    ExecutionResult ExecuteSubmission(
        const SubmissionRequest& request,
        std::optional<Clock::time_point> deadline = std::nullopt);

    Submission Submit(const SubmissionRequest& request);
    ExecutionResult WaitForResult(const Submission& submission, Clock::time_point deadline);

    const PollSettings& Settings() const { return settings_; }

private:
    nlohmann::json BuildPayload(const LanguageDefinition& language, const SubmissionRequest& request) const;

    std::shared_ptr<const LanguageRegistry> languages_;
    std::shared_ptr<RequestExecutor> executor_;
    PollSettings settings_;
    Sleeper sleeper_;
};

}  // namespace judgelink::judge0
