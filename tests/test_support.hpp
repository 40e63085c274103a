#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "httplib.h"
#include "utils/logging.hpp"

namespace judgelink::testing {

// Unique directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir();
    ~TempDir();
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

struct TestCertificate {
    std::filesystem::path cert_path;
    std::filesystem::path key_path;
};

// Self-signed RSA certificate valid for 127.0.0.1 and localhost.
TestCertificate WriteSelfSignedCertificate(
    const std::filesystem::path& dir,
    const std::string& subject_alt_names = "IP:127.0.0.1,DNS:localhost");

// Runs an httplib server (plain or TLS) on 127.0.0.1 with an ephemeral port.
class ScopedServer {
public:
    explicit ScopedServer(std::unique_ptr<httplib::Server> server);
    ~ScopedServer();
    ScopedServer(const ScopedServer&) = delete;
    ScopedServer& operator=(const ScopedServer&) = delete;

    int port() const { return port_; }
    std::string Url(bool https = false) const;

private:
    std::unique_ptr<httplib::Server> server_;
    std::thread thread_;
    int port_ = 0;
};

// Sets (or unsets) an environment variable and restores it on destruction.
class ScopedEnv {
public:
    ScopedEnv(std::string name, std::optional<std::string> value);
    ~ScopedEnv();
    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    std::string name_;
    std::optional<std::string> previous_;
};

// Captures every log message at or above kDebug while alive.
class LogCapture {
public:
    LogCapture();
    ~LogCapture();
    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    std::vector<utils::LogMessage> AtLevel(utils::LogLevel level) const;
    bool Contains(utils::LogLevel level, const std::string& needle) const;

private:
    utils::LogConfig previous_config_;
    std::shared_ptr<std::vector<utils::LogMessage>> messages_;
};

}  // namespace judgelink::testing
