#pragma once

#include "core/errors.hpp"
#include "core/profile_store.hpp"
#include "session/connection_orchestrator.hpp"

#include <spdlog/logger.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <ostream>
#include <string>

struct FacadeOptions {
    std::chrono::milliseconds progress_interval{1000};
    std::chrono::seconds connect_timeout{0};   // 0 = wait for the engine's verdict
};

/// One method per CLI command. Validates input, delegates to the store or
/// the orchestrator, and logs a single line for every failure.
class CommandFacade {
public:
    CommandFacade(ProfileStore& store, ConnectionOrchestrator& orchestrator,
                  std::shared_ptr<spdlog::logger> log, FacadeOptions options = {});

    OpResult list_profiles(std::ostream& out);
    OpResult add_profile(const std::string& name, const std::string& config_file);
    OpResult remove_profile(const std::string& name);

    /// Blocks until the connection is established, fails or is cancelled
    OpResult connect(const std::string& name);
    OpResult disconnect();
    OpResult status(std::ostream& out);

    /// Ask a running connect() to cancel. Async-signal-safe.
    void request_cancel() { cancel_requested_.store(true); }

private:
    ProfileStore& store_;
    ConnectionOrchestrator& orchestrator_;
    std::shared_ptr<spdlog::logger> log_;
    FacadeOptions options_;
    std::atomic<bool> cancel_requested_{false};

    OpResult report(OpResult result);
};
