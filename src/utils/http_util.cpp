#include "utils/http_util.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace judgelink::utils {

std::string ParsedUrl::SchemeHostPort() const {
    std::string scheme_host_port = https ? "https://" : "http://";
    scheme_host_port += host + ":" + std::to_string(port);
    return scheme_host_port;
}

std::string ParsedUrl::Authority() const {
    if ((https && port == 443) || (!https && port == 80)) {
        return host;
    }
    return host + ":" + std::to_string(port);
}

ParsedUrl ParseUrl(const std::string& url) {
    ParsedUrl parsed{};
    std::string working = url;
    if (working.rfind("https://", 0) == 0) {
        parsed.https = true;
        working = working.substr(8);
    } else if (working.rfind("http://", 0) == 0) {
        parsed.https = false;
        parsed.port = 80;
        working = working.substr(7);
    }

    const auto slash_pos = working.find('/');
    std::string host_port = working;
    if (slash_pos != std::string::npos) {
        host_port = working.substr(0, slash_pos);
        parsed.base_path = working.substr(slash_pos);
    }

    const auto colon_pos = host_port.find(':');
    if (colon_pos != std::string::npos) {
        parsed.host = host_port.substr(0, colon_pos);
        const auto port_text = host_port.substr(colon_pos + 1);
        try {
            parsed.port = std::stoi(port_text);
        } catch (const std::exception&) {
            throw std::invalid_argument("invalid port '" + port_text + "' in url " + url);
        }
    } else {
        parsed.host = host_port;
    }

    while (!parsed.base_path.empty() && parsed.base_path.back() == '/') {
        parsed.base_path.pop_back();
    }

    return parsed;
}

std::string UrlEncode(const std::string& value) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else if (c == ' ') {
            encoded << "%20";
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0')
                    << static_cast<int>(c);
        }
    }
    return encoded.str();
}

std::string BuildQueryString(const QueryParams& query) {
    std::vector<std::string> parts;
    parts.reserve(query.size());
    for (const auto& [key, value] : query) {
        parts.push_back(UrlEncode(key) + "=" + UrlEncode(value));
    }
    return Join(parts, "&");
}

bool ParseProxyHostPort(const std::string& proxy, std::string& host, int& port) {
    if (proxy.empty()) {
        return false;
    }
    std::string working = proxy;
    const auto scheme_pos = working.find("://");
    if (scheme_pos != std::string::npos) {
        working = working.substr(scheme_pos + 3);
    }
    const auto slash_pos = working.find('/');
    if (slash_pos != std::string::npos) {
        working = working.substr(0, slash_pos);
    }
    const auto colon_pos = working.rfind(':');
    if (colon_pos == std::string::npos) {
        return false;
    }
    host = working.substr(0, colon_pos);
    try {
        port = std::stoi(working.substr(colon_pos + 1));
    } catch (const std::exception&) {
        return false;
    }
    return !host.empty() && port > 0;
}

void ApplyProxyFromEnv(httplib::Client& client) {
    const char* kProxyVars[] = {"HTTPS_PROXY", "HTTP_PROXY", "https_proxy", "http_proxy"};
    for (const auto* name : kProxyVars) {
        std::string host;
        int port = 0;
        if (ParseProxyHostPort(GetEnv(name), host, port)) {
            client.set_proxy(host, port);
            LogDebug("http", "using proxy", {{"var", name}, {"host", host}, {"port", std::to_string(port)}});
            return;
        }
    }
    if (!GetEnv("ALL_PROXY").empty() || !GetEnv("all_proxy").empty()) {
        LogWarn("http", "ALL_PROXY is set but cpp-httplib only supports HTTP proxy");
    }
}

void SetTimeout(httplib::Client& client, std::chrono::milliseconds timeout) {
    const auto sec = static_cast<time_t>(timeout.count() / 1000);
    const auto usec = static_cast<time_t>((timeout.count() % 1000) * 1000);
    client.set_connection_timeout(sec, usec);
    client.set_read_timeout(sec, usec);
    client.set_write_timeout(sec, usec);
}

}  // namespace judgelink::utils
