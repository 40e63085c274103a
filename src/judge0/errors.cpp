#include "judge0/errors.hpp"

#include <utility>

namespace judgelink::judge0 {

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kInvalidInput: return "invalid_input";
        case ErrorKind::kUnsupportedLanguage: return "unsupported_language";
        case ErrorKind::kTransport: return "transport";
        case ErrorKind::kRemoteService: return "remote_service";
        case ErrorKind::kTimeout: return "timeout";
    }
    return "unknown";
}

UnsupportedLanguageError::UnsupportedLanguageError(std::string language)
    : Judge0Error(ErrorKind::kUnsupportedLanguage, "Unsupported language '" + language + "'."),
      language_(std::move(language)) {}

RemoteServiceError::RemoteServiceError(int status_code, std::string detail)
    : Judge0Error(
          ErrorKind::kRemoteService,
          "Judge0 HTTP error " + std::to_string(status_code) + ": " + detail),
      status_code_(status_code),
      detail_(std::move(detail)) {}

RemoteServiceError::RemoteServiceError(std::string detail)
    : Judge0Error(ErrorKind::kRemoteService, "Judge0 protocol error: " + detail),
      detail_(std::move(detail)) {}

TimeoutError::TimeoutError(std::string token)
    : Judge0Error(
          ErrorKind::kTimeout,
          "Timed out while waiting for Judge0 to finish submission " + token + "."),
      token_(std::move(token)) {}

}  // namespace judgelink::judge0
