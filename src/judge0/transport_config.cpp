#include "judge0/transport_config.hpp"

#include <filesystem>
#include <stdexcept>
#include <utility>

#include <openssl/err.h>

#include "utils/logging.hpp"

namespace judgelink::judge0 {
namespace {

std::string TakeOpenSslError() {
    const auto code = ::ERR_get_error();
    ::ERR_clear_error();
    if (code == 0) {
        return "unknown error";
    }
    char buffer[256];
    ::ERR_error_string_n(code, buffer, sizeof(buffer));
    return buffer;
}

bool LoadBundle(X509_STORE* store, const std::string& path, std::string& error) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        error = "no such file";
        return false;
    }
    if (X509_STORE_load_locations(store, path.c_str(), nullptr) != 1) {
        error = TakeOpenSslError();
        return false;
    }
    return true;
}

}  // namespace

TrustConfig::TrustConfig(
    bool verify_peer,
    std::vector<std::string> trusted_bundles,
    std::shared_ptr<X509_STORE> store)
    : verify_peer_(verify_peer)
    , trusted_bundles_(std::move(trusted_bundles))
    , store_(std::move(store)) {}

std::shared_ptr<const TrustConfig> TrustConfig::Insecure() {
    return std::shared_ptr<const TrustConfig>(new TrustConfig(false, {}, nullptr));
}

std::shared_ptr<const TrustConfig> TrustConfig::Build(const config::Judge0Config& config) {
    if (config.disable_ssl_verify) {
        utils::LogWarn(
            "judge0",
            "Judge0 SSL verification is disabled via JUDGE0_DISABLE_SSL_VERIFY; "
            "this should only be used for local development.");
        return Insecure();
    }

    std::vector<std::string> bundles;
    std::shared_ptr<X509_STORE> store(X509_STORE_new(), X509_STORE_free);
    if (!store) {
        throw std::runtime_error("unable to allocate X509 store: " + TakeOpenSslError());
    }
    if (X509_STORE_set_default_paths(store.get()) != 1) {
        utils::LogWarn("judge0", "unable to load system trust roots", {{"error", TakeOpenSslError()}});
    }

    if (!config.ca_bundle_path.empty()) {
        std::string error;
        if (LoadBundle(store.get(), config.ca_bundle_path, error)) {
            utils::LogDebug("judge0", "loaded custom CA bundle", {{"path", config.ca_bundle_path}});
            bundles.push_back(config.ca_bundle_path);
        } else {
            utils::LogWarn(
                "judge0",
                "failed to load Judge0 CA bundle",
                {{"path", config.ca_bundle_path}, {"error", error}});
        }
    }

    const auto& fallback = config.fallback_ca_bundle_path;
    if (!fallback.empty() && fallback != config.ca_bundle_path) {
        std::error_code ec;
        if (!std::filesystem::exists(fallback, ec)) {
            utils::LogDebug("judge0", "fallback CA bundle not present", {{"path", fallback}});
        } else {
            std::string error;
            if (LoadBundle(store.get(), fallback, error)) {
                utils::LogDebug("judge0", "loaded fallback CA bundle", {{"path", fallback}});
                bundles.push_back(fallback);
            } else {
                utils::LogWarn(
                    "judge0",
                    "unable to load fallback CA bundle",
                    {{"path", fallback}, {"error", error}});
            }
        }
    }

    return std::shared_ptr<const TrustConfig>(new TrustConfig(true, std::move(bundles), std::move(store)));
}

void TrustConfig::ApplyTo(httplib::Client& client) const {
    client.enable_server_certificate_verification(verify_peer_);
    if (verify_peer_ && store_) {
        // the client's SSL context releases one reference when it is destroyed
        X509_STORE_up_ref(store_.get());
        client.set_ca_cert_store(store_.get());
    }
}

httplib::Headers BuildDefaultHeaders(const config::Judge0Config& config) {
    httplib::Headers headers{{"Content-Type", "application/json"}};
    if (!config.rapidapi_key.empty()) {
        headers.emplace("X-RapidAPI-Key", config.rapidapi_key);
        headers.emplace("X-RapidAPI-Host", config.rapidapi_host);
    }
    if (!config.api_key.empty()) {
        // self-hosted Judge0 CE authenticates with X-Auth-Token
        headers.emplace("X-Auth-Token", config.api_key);
    }
    return headers;
}

}  // namespace judgelink::judge0
