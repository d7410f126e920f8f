#include "engine/openvpn_engine.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <chrono>
#include <thread>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;

OpenVpnEngine::OpenVpnEngine(OpenVpnSettings settings, std::shared_ptr<spdlog::logger> log)
    : settings_(std::move(settings)), log_(std::move(log)) {}

OpenVpnEngine::~OpenVpnEngine() {
    abort_.store(true);
    std::lock_guard<std::mutex> lock(mutex_);
    // ProcessManager's destructor stops an unreleased child
    process_.reset();
}

std::string OpenVpnEngine::pid_path() const { return settings_.runtime_dir + "/openvpn.pid"; }
std::string OpenVpnEngine::log_path() const { return settings_.runtime_dir + "/openvpn.log"; }
std::string OpenVpnEngine::auth_path() const { return settings_.runtime_dir + "/auth.txt"; }

pid_t OpenVpnEngine::recorded_pid() const {
    std::ifstream in(pid_path());
    if (!in.is_open()) return -1;
    long pid = -1;
    if (!(in >> pid) || pid <= 0) return -1;
    return static_cast<pid_t>(pid);
}

bool OpenVpnEngine::owns_process(pid_t pid) const {
    if (!ProcessManager::pid_alive(pid)) return false;

    std::ifstream in("/proc/" + std::to_string(pid) + "/cmdline", std::ios::binary);
    if (!in.is_open()) return false;
    std::string raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    std::vector<std::string> argv;
    size_t start = 0;
    while (start < raw.size()) {
        size_t end = raw.find('\0', start);
        if (end == std::string::npos) end = raw.size();
        argv.push_back(raw.substr(start, end - start));
        start = end + 1;
    }

    // argv[0] for openvpn itself, argv[1] when the binary is a script
    bool binary_matches = false;
    for (size_t i = 0; i < argv.size() && i < 2; ++i) {
        if (argv[i] == settings_.binary_path) binary_matches = true;
    }
    if (!binary_matches) return false;

    for (size_t i = 0; i + 1 < argv.size(); ++i) {
        if (argv[i] == "--writepid" && argv[i + 1] == pid_path()) return true;
    }
    return false;
}

void OpenVpnEngine::remove_runtime_file(const std::string& path) const {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        log_->warn("Cannot remove {}: {}", path, ec.message());
    }
}

OpResult OpenVpnEngine::write_auth_file(const Credentials& credentials) const {
    std::string path = auth_path();
    {
        std::ofstream touch(path, std::ios::trunc);
        if (!touch.is_open()) {
            return OpResult::fail(FailureKind::EngineError, "Cannot create " + path);
        }
    }

    // Restrict permissions before any secret is written
    std::error_code ec;
    fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, ec);
    if (ec) {
        remove_runtime_file(path);
        return OpResult::fail(FailureKind::EngineError,
                              "Cannot restrict permissions on " + path + ": " + ec.message());
    }

    std::ofstream out(path, std::ios::trunc);
    out << credentials.username << "\n" << credentials.password << "\n";
    out.close();
    if (out.fail()) {
        remove_runtime_file(path);
        return OpResult::fail(FailureKind::EngineError, "Failed writing " + path);
    }
    return OpResult::ok();
}

std::future<OpResult> OpenVpnEngine::establish(const std::string& config_file,
                                               const Credentials& credentials) {
    auto fail_now = [](std::string error) {
        std::promise<OpResult> p;
        p.set_value(OpResult::fail(FailureKind::EngineError, std::move(error)));
        return p.get_future();
    };

    std::lock_guard<std::mutex> lock(mutex_);

    if (process_ && process_->is_running()) {
        return fail_now("openvpn is already running (pid " + std::to_string(process_->child_pid()) + ")");
    }
    if (access(settings_.binary_path.c_str(), X_OK) != 0) {
        return fail_now("openvpn binary not found or not executable: " + settings_.binary_path);
    }

    std::error_code ec;
    fs::create_directories(settings_.runtime_dir, ec);
    if (ec) {
        return fail_now("Cannot create runtime directory " + settings_.runtime_dir + ": " + ec.message());
    }
    fs::permissions(settings_.runtime_dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) {
        log_->warn("Cannot restrict permissions on {}: {}", settings_.runtime_dir, ec.message());
    }

    // Leftovers from an earlier run would confuse the log watcher
    remove_runtime_file(log_path());
    remove_runtime_file(pid_path());

    std::vector<std::string> args = {
        "--config", config_file,
        "--log", log_path(),
        "--writepid", pid_path(),
        "--verb", "3",
    };

    if (!credentials.empty()) {
        auto written = write_auth_file(credentials);
        if (!written.success) return fail_now(written.error);
        args.push_back("--auth-user-pass");
        args.push_back(auth_path());
        args.push_back("--auth-nocache");
    }

    abort_.store(false);
    process_ = std::make_unique<ProcessManager>();
    auto log = log_;
    process_->on_exit = [log](int code) {
        log->debug("openvpn exited with code {}", code);
    };
    if (!process_->start(settings_.binary_path, args)) {
        process_.reset();
        remove_runtime_file(auth_path());
        return fail_now("Failed to start " + settings_.binary_path);
    }

    log_->info("openvpn started (pid {}), log: {}", process_->child_pid(), log_path());
    return std::async(std::launch::async, [this] { return watch_establishment(); });
}

OpResult OpenVpnEngine::watch_establishment() {
    std::string path = log_path();
    std::streamoff offset = 0;
    std::string pending;

    // Returns 1 for established, -1 for rejected credentials, 0 otherwise
    auto scan_new_lines = [&]() -> int {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open()) return 0;
        in.seekg(offset);
        std::string chunk((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        offset += static_cast<std::streamoff>(chunk.size());
        pending += chunk;

        size_t nl;
        while ((nl = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, nl);
            pending.erase(0, nl + 1);
            log_->trace("openvpn: {}", line);
            if (line.find(kEstablishedMarker) != std::string::npos) return 1;
            if (line.find(kAuthFailedMarker) != std::string::npos) return -1;
        }
        return 0;
    };

    auto cleanup_auth = [this]() {
        std::error_code ec;
        if (fs::exists(auth_path(), ec)) remove_runtime_file(auth_path());
    };

    while (true) {
        if (abort_.load()) {
            cleanup_auth();
            return OpResult::fail(FailureKind::EngineError, "Tunnel establishment aborted");
        }

        int outcome = scan_new_lines();
        if (outcome > 0) {
            cleanup_auth();
            std::lock_guard<std::mutex> lock(mutex_);
            if (process_) process_->release();
            return OpResult::ok();
        }
        if (outcome < 0) {
            cleanup_auth();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (process_) process_->stop(settings_.teardown_timeout_ms);
            }
            remove_runtime_file(pid_path());
            return OpResult::fail(FailureKind::EngineError,
                                  "Server rejected the credentials (AUTH_FAILED)");
        }

        bool exited = false;
        int code = -1;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!process_ || process_->has_exited()) {
                exited = true;
                code = process_ ? process_->exit_code() : -1;
            }
        }
        if (exited) {
            // Pick up anything written just before the exit
            if (scan_new_lines() > 0) {
                cleanup_auth();
                return OpResult::fail(FailureKind::EngineError,
                                      "openvpn exited right after the tunnel came up; see " + path);
            }
            cleanup_auth();
            if (abort_.load()) {
                return OpResult::fail(FailureKind::EngineError, "Tunnel establishment aborted");
            }
            return OpResult::fail(FailureKind::EngineError,
                                  "openvpn exited with code " + std::to_string(code) +
                                  " before the tunnel came up; see " + path);
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}

OpResult OpenVpnEngine::teardown() {
    abort_.store(true);

    pid_t pid = -1;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (process_ && !process_->released()) {
            bool was_running = process_->is_running();
            process_->stop(settings_.teardown_timeout_ms);
            if (was_running) {
                remove_runtime_file(pid_path());
                log_->info("openvpn stopped");
                return OpResult::ok();
            }
        } else if (process_) {
            pid = process_->child_pid();
        }
    }

    if (pid <= 0 || !ProcessManager::pid_alive(pid)) {
        pid = recorded_pid();
        if (pid > 0 && !owns_process(pid)) {
            log_->warn("Ignoring stale pid file {} (pid {} is not our openvpn)", pid_path(), pid);
            pid = -1;
        }
    }
    if (pid <= 0) {
        remove_runtime_file(pid_path());
        return OpResult::fail(FailureKind::EngineError, "No openvpn process is running");
    }

    if (!ProcessManager::terminate(pid, settings_.teardown_timeout_ms)) {
        return OpResult::fail(FailureKind::EngineError,
                              "Failed to stop openvpn (pid " + std::to_string(pid) + ")");
    }
    remove_runtime_file(pid_path());
    log_->info("openvpn (pid {}) stopped", pid);
    return OpResult::ok();
}

bool OpenVpnEngine::tunnel_running() const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (process_ && process_->is_running()) return true;
    }
    pid_t pid = recorded_pid();
    return pid > 0 && owns_process(pid);
}
