#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include "httplib.h"

namespace judgelink::utils {

struct ParsedUrl {
    bool https = true;
    std::string host;
    int port = 443;
    std::string base_path;

    std::string SchemeHostPort() const;
    // host, plus ":port" when the port is not the scheme default
    std::string Authority() const;
};

using QueryParams = std::vector<std::pair<std::string, std::string>>;

ParsedUrl ParseUrl(const std::string& url);
std::string UrlEncode(const std::string& value);
std::string BuildQueryString(const QueryParams& query);

bool ParseProxyHostPort(const std::string& proxy, std::string& host, int& port);
void ApplyProxyFromEnv(httplib::Client& client);

void SetTimeout(httplib::Client& client, std::chrono::milliseconds timeout);

}  // namespace judgelink::utils
