#pragma once

#include "engine/vpn_engine.hpp"
#include "engine/process_manager.hpp"

#include <spdlog/logger.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <sys/types.h>

struct OpenVpnSettings {
    std::string binary_path = "/usr/sbin/openvpn";
    std::string runtime_dir;            // pid file, log and auth file live here
    int teardown_timeout_ms = 5000;
};

/// Runs the openvpn binary as a detached child and watches its log for the
/// outcome. Once the tunnel is up the child is released, so it outlives this
/// process; a later run finds it again through the pid file.
class OpenVpnEngine : public VpnEngine {
public:
    OpenVpnEngine(OpenVpnSettings settings, std::shared_ptr<spdlog::logger> log);
    ~OpenVpnEngine() override;

    std::future<OpResult> establish(const std::string& config_file,
                                    const Credentials& credentials) override;
    OpResult teardown() override;
    bool tunnel_running() const override;

    std::string pid_path() const;
    std::string log_path() const;
    std::string auth_path() const;

    /// PID recorded in the pid file, -1 if there is none
    pid_t recorded_pid() const;

    /// True if pid is an openvpn started from settings_.binary_path that
    /// writes this engine's pid file. A pid file left by a crashed openvpn
    /// may name an unrelated process by now.
    bool owns_process(pid_t pid) const;

    static constexpr const char* kEstablishedMarker = "Initialization Sequence Completed";
    static constexpr const char* kAuthFailedMarker = "AUTH_FAILED";

private:
    OpenVpnSettings settings_;
    std::shared_ptr<spdlog::logger> log_;

    mutable std::mutex mutex_;
    std::unique_ptr<ProcessManager> process_;
    std::atomic<bool> abort_{false};

    OpResult watch_establishment();
    OpResult write_auth_file(const Credentials& credentials) const;
    void remove_runtime_file(const std::string& path) const;
};
