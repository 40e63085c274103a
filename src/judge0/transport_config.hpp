#pragma once

#include <memory>
#include <string>
#include <vector>

#include <openssl/x509_vfy.h>

#include "config/config_schema.hpp"
#include "httplib.h"

namespace judgelink::judge0 {

/// TLS trust settings shared by every request to Judge0.
///
/// Built once from configuration, in precedence order: verification bypass,
/// then a custom CA bundle, then the fallback system bundle. Bundles that fail
/// to load are reported as warnings and skipped. Immutable after Build().
class TrustConfig {
public:
    static std::shared_ptr<const TrustConfig> Build(const config::Judge0Config& config);
    static std::shared_ptr<const TrustConfig> Insecure();

    bool VerifyPeer() const { return verify_peer_; }
    const std::vector<std::string>& TrustedBundles() const { return trusted_bundles_; }

    // System roots plus every bundle that loaded at Build() time; null when
    // verification is off. Owned by this TrustConfig.
    X509_STORE* CertStore() const { return store_.get(); }
    void ApplyTo(httplib::Client& client) const;

private:
    TrustConfig(bool verify_peer, std::vector<std::string> trusted_bundles, std::shared_ptr<X509_STORE> store);

    bool verify_peer_ = true;
    std::vector<std::string> trusted_bundles_;
    std::shared_ptr<X509_STORE> store_;
};

httplib::Headers BuildDefaultHeaders(const config::Judge0Config& config);

}  // namespace judgelink::judge0
