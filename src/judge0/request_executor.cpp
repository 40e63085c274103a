#include "judge0/request_executor.hpp"

#include <utility>

#include "judge0/errors.hpp"
#include "utils/logging.hpp"

namespace judgelink::judge0 {
namespace {

bool IsCertificateFailure(httplib::Error err) {
    return err == httplib::Error::SSLServerVerification ||
        err == httplib::Error::SSLServerHostnameVerification;
}

std::string DescribeTransportFailure(httplib::Error err) {
    const auto err_text = httplib::to_string(err);
    if (IsCertificateFailure(err)) {
        return "Judge0 SSL verification failed: " + err_text +
            ". Configure JUDGE0_CA_BUNDLE_PATH to trust your certificate authority "
            "or set JUDGE0_DISABLE_SSL_VERIFY=1 for local testing.";
    }
    return "Judge0 connection error: " + err_text;
}

}  // namespace

const char* ToString(HttpMethod method) {
    switch (method) {
        case HttpMethod::kGet: return "GET";
        case HttpMethod::kPost: return "POST";
        case HttpMethod::kPut: return "PUT";
        case HttpMethod::kPatch: return "PATCH";
        case HttpMethod::kDelete: return "DELETE";
    }
    return "GET";
}

nlohmann::json InterpretResponse(int status, const std::string& reason, const std::string& body) {
    if (status < 200 || status >= 300) {
        std::string message = body;
        if (message.empty()) {
            message = reason;
        }
        if (message.empty()) {
            message = "HTTP " + std::to_string(status);
        }
        throw RemoteServiceError(status, message);
    }
    if (body.empty()) {
        return nlohmann::json::object();
    }
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded()) {
        throw RemoteServiceError("invalid JSON in HTTP " + std::to_string(status) + " response");
    }
    return json;
}

HttpRequestExecutor::HttpRequestExecutor(
    HttpExecutorSettings settings,
    std::shared_ptr<const TrustConfig> trust)
    : settings_(std::move(settings))
    , trust_(std::move(trust))
    , endpoint_(utils::ParseUrl(settings_.base_url)) {}

std::shared_ptr<HttpRequestExecutor> HttpRequestExecutor::FromConfig(const config::Judge0Config& config) {
    HttpExecutorSettings settings{
        .base_url = config.api_url,
        .request_timeout = config.RequestTimeout(),
        .headers = BuildDefaultHeaders(config),
        .use_proxy = config.use_proxy};
    return std::make_shared<HttpRequestExecutor>(std::move(settings), TrustConfig::Build(config));
}

std::string HttpRequestExecutor::BuildTarget(
    const std::string& path,
    const utils::QueryParams& query) const {
    std::string target = endpoint_.base_path;
    if (path.empty() || path.front() != '/') {
        target.push_back('/');
    }
    target += path;
    if (!query.empty()) {
        target += "?" + utils::BuildQueryString(query);
    }
    return target;
}

nlohmann::json HttpRequestExecutor::Perform(
    HttpMethod method,
    const std::string& path,
    const std::optional<nlohmann::json>& body,
    const utils::QueryParams& query) {
    const auto scheme_host_port = endpoint_.SchemeHostPort();
    httplib::Client client(scheme_host_port);
    utils::SetTimeout(client, settings_.request_timeout);
    if (endpoint_.https && trust_) {
        trust_->ApplyTo(client);
    }
    if (settings_.use_proxy) {
        utils::ApplyProxyFromEnv(client);
    }

    httplib::Request request;
    request.method = ToString(method);
    request.path = BuildTarget(path, query);
    request.headers = settings_.headers;
    if (body) {
        try {
            request.body = body->dump();
        } catch (const nlohmann::json::type_error& ex) {
            throw InvalidInputError(std::string("request body is not valid UTF-8: ") + ex.what());
        }
    }

    utils::LogDebug("judge0", "request", {{"method", request.method}, {"url", scheme_host_port + request.path}});

    auto response = client.send(request);
    if (!response) {
        const auto err = response.error();
        utils::LogError(
            "judge0",
            "request failed",
            {{"method", request.method},
             {"path", request.path},
             {"httplib_error", std::to_string(static_cast<int>(err))},
             {"detail", httplib::to_string(err)}});
        throw TransportError(DescribeTransportFailure(err), IsCertificateFailure(err));
    }

    if (response->status < 200 || response->status >= 300) {
        utils::LogWarn(
            "judge0",
            "HTTP error",
            {{"method", request.method},
             {"path", request.path},
             {"status", std::to_string(response->status)},
             {"body", response->body}});
    }
    return InterpretResponse(response->status, response->reason, response->body);
}

}  // namespace judgelink::judge0
