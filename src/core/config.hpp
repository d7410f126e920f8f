#pragma once

#include "core/errors.hpp"

#include <string>
#include <vector>

struct AppConfig {
    // OpenVPN engine
    std::string openvpn_binary_path = "/usr/sbin/openvpn";
    std::string openvpn_runtime_dir;     // empty = Config::default_runtime_dir()
    int teardown_timeout_ms = 5000;

    // Authentication
    std::string auth_method = "saml";    // "saml" or "none"
    std::vector<int> callback_ports = {35001};

    // Connect
    int connect_timeout_sec = 0;         // 0 = no timeout
    int progress_interval_ms = 1000;

    // Logging
    std::string log_level = "info";
    std::string log_file;
};

class Config {
public:
    Config();
    ~Config();

    /// Read config.yaml. A missing file is not an error; a malformed one
    /// leaves the defaults in place and reports StorageError.
    OpResult load();

    AppConfig& data();
    const AppConfig& data() const;

    /// Runtime dir from config, or the default one
    std::string runtime_dir() const;

    static std::string config_dir();
    static std::string config_path();
    static std::string default_runtime_dir();
    static std::string expand_home(const std::string& path);

private:
    AppConfig config_;
};
