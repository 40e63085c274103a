#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "config/config_schema.hpp"
#include "httplib.h"
#include "judge0/transport_config.hpp"
#include "nlohmann/json.hpp"
#include "utils/http_util.hpp"

namespace judgelink::judge0 {

enum class HttpMethod {
    kGet,
    kPost,
    kPut,
    kPatch,
    kDelete
};

const char* ToString(HttpMethod method);

class RequestExecutor {
public:
    virtual ~RequestExecutor() = default;

    /// Performs one request/response cycle against the Judge0 base URL.
    ///
    /// Returns the parsed JSON body, or an empty object for an empty 2xx body.
    /// Throws RemoteServiceError for non-2xx responses and TransportError when
    /// no response was received. Never retries.
    virtual nlohmann::json Perform(
        HttpMethod method,
        const std::string& path,
        const std::optional<nlohmann::json>& body,
        const utils::QueryParams& query) = 0;
};

struct HttpExecutorSettings {
    std::string base_url;
    std::chrono::milliseconds request_timeout{10000};
    httplib::Headers headers;
    bool use_proxy = false;
};

class HttpRequestExecutor : public RequestExecutor {
public:
    HttpRequestExecutor(HttpExecutorSettings settings, std::shared_ptr<const TrustConfig> trust);

    static std::shared_ptr<HttpRequestExecutor> FromConfig(const config::Judge0Config& config);

    nlohmann::json Perform(
        HttpMethod method,
        const std::string& path,
        const std::optional<nlohmann::json>& body,
        const utils::QueryParams& query) override;

    std::string BuildTarget(const std::string& path, const utils::QueryParams& query) const;
    const utils::ParsedUrl& Endpoint() const { return endpoint_; }

private:
    HttpExecutorSettings settings_;
    std::shared_ptr<const TrustConfig> trust_;
    utils::ParsedUrl endpoint_;
};

/// Maps a received HTTP response onto the executor contract.
nlohmann::json InterpretResponse(int status, const std::string& reason, const std::string& body);

}  // namespace judgelink::judge0
