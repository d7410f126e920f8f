#include "core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

std::string Config::expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

Config::Config() = default;

Config::~Config() = default;

std::string Config::config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && xdg[0] != '\0') {
        return std::string(xdg) + "/awsvpnctl";
    }
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.config/awsvpnctl";
}

std::string Config::config_path() {
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/config.yaml";
}

std::string Config::default_runtime_dir() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg && xdg[0] != '\0') {
        return std::string(xdg) + "/awsvpnctl";
    }
    return "/tmp/awsvpnctl-" + std::to_string(getuid());
}

std::string Config::runtime_dir() const {
    if (config_.openvpn_runtime_dir.empty()) return default_runtime_dir();
    return expand_home(config_.openvpn_runtime_dir);
}

OpResult Config::load() {
    std::string path = config_path();
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) {
        return OpResult::ok();
    }

    // Parse into a copy so a half-read file leaves the defaults untouched
    AppConfig loaded = config_;
    try {
        YAML::Node root = YAML::LoadFile(path);

        if (auto openvpn = root["openvpn"]) {
            loaded.openvpn_binary_path = openvpn["binary_path"].as<std::string>(loaded.openvpn_binary_path);
            loaded.openvpn_runtime_dir = openvpn["runtime_dir"].as<std::string>(loaded.openvpn_runtime_dir);
            loaded.teardown_timeout_ms = openvpn["teardown_timeout_ms"].as<int>(loaded.teardown_timeout_ms);
        }

        if (auto auth = root["auth"]) {
            loaded.auth_method = auth["method"].as<std::string>(loaded.auth_method);
            if (auto ports = auth["callback_ports"]) {
                loaded.callback_ports = ports.as<std::vector<int>>();
            }
        }

        if (auto connect = root["connect"]) {
            loaded.connect_timeout_sec = connect["timeout_sec"].as<int>(loaded.connect_timeout_sec);
            loaded.progress_interval_ms = connect["progress_interval_ms"].as<int>(loaded.progress_interval_ms);
        }

        if (auto log = root["log"]) {
            loaded.log_level = log["level"].as<std::string>(loaded.log_level);
            loaded.log_file = log["file"].as<std::string>(loaded.log_file);
        }
    } catch (const YAML::Exception& e) {
        return OpResult::fail(FailureKind::StorageError,
                              "Invalid config file " + path + ": " + e.what());
    }

    if (loaded.progress_interval_ms <= 0) loaded.progress_interval_ms = 1000;
    if (loaded.teardown_timeout_ms < 0) loaded.teardown_timeout_ms = 0;
    if (loaded.connect_timeout_sec < 0) loaded.connect_timeout_sec = 0;

    config_ = std::move(loaded);
    return OpResult::ok();
}

AppConfig& Config::data() { return config_; }
const AppConfig& Config::data() const { return config_; }
