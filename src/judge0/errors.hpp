#pragma once

#include <stdexcept>
#include <string>

namespace judgelink::judge0 {

enum class ErrorKind {
    kInvalidInput,
    kUnsupportedLanguage,
    kTransport,
    kRemoteService,
    kTimeout
};

const char* ToString(ErrorKind kind);

class Judge0Error : public std::runtime_error {
public:
    Judge0Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind Kind() const { return kind_; }

    // Errors caused by the caller's request rather than by the remote service.
    bool IsClientError() const {
        return kind_ == ErrorKind::kInvalidInput || kind_ == ErrorKind::kUnsupportedLanguage;
    }

private:
    ErrorKind kind_;
};

class InvalidInputError : public Judge0Error {
public:
    explicit InvalidInputError(const std::string& message)
        : Judge0Error(ErrorKind::kInvalidInput, message) {}
};

class UnsupportedLanguageError : public Judge0Error {
public:
    explicit UnsupportedLanguageError(std::string language);

    const std::string& language() const { return language_; }

private:
    std::string language_;
};

class TransportError : public Judge0Error {
public:
    TransportError(const std::string& message, bool certificate_verification)
        : Judge0Error(ErrorKind::kTransport, message),
          certificate_verification_(certificate_verification) {}

    bool IsCertificateVerification() const { return certificate_verification_; }

private:
    bool certificate_verification_ = false;
};

class RemoteServiceError : public Judge0Error {
public:
    RemoteServiceError(int status_code, std::string detail);
    // 2xx response that violates the protocol (e.g. a missing token)
    explicit RemoteServiceError(std::string detail);

    int status_code() const { return status_code_; }
    const std::string& detail() const { return detail_; }

private:
    int status_code_ = 0;
    std::string detail_;
};

class TimeoutError : public Judge0Error {
public:
    explicit TimeoutError(std::string token);

    const std::string& token() const { return token_; }

private:
    std::string token_;
};

}  // namespace judgelink::judge0
