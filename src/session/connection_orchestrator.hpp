#pragma once

#include "auth/authenticator.hpp"
#include "core/errors.hpp"
#include "core/profile_store.hpp"
#include "engine/vpn_engine.hpp"

#include <spdlog/logger.h>

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

enum class SessionState {
    Idle,
    Authenticating,
    Connecting,
    Established,
    Failed,
};

const char* to_string(SessionState state);

/// Owns the single connection attempt: authenticate, then hand the
/// credentials to the engine, then wait for the tunnel. The work runs on a
/// worker thread; callers observe it through the returned futures.
///
/// A second connect() while a session is in flight or established is
/// rejected with AlreadyConnected.
class ConnectionOrchestrator {
public:
    ConnectionOrchestrator(Authenticator& auth, VpnEngine& engine,
                           std::vector<int> callback_ports,
                           std::shared_ptr<spdlog::logger> log);
    ~ConnectionOrchestrator();

    ConnectionOrchestrator(const ConnectionOrchestrator&) = delete;
    ConnectionOrchestrator& operator=(const ConnectionOrchestrator&) = delete;

    /// Resolves to success once the tunnel is established, or to
    /// ConfigNotFound, AuthFailed, EngineError, AlreadyConnected or Cancelled.
    std::future<OpResult> connect(const Profile& profile);

    /// Tear down the established tunnel (or one left by an earlier run).
    /// While a connect is in flight this cancels it. NoActiveConnection when
    /// there is nothing to tear down.
    std::future<OpResult> disconnect();

    /// Cancel an in-flight connect. Safe to call from any thread. Returns
    /// false, doing nothing, when no attempt is in flight.
    bool cancel();

    SessionState state() const;

    /// Profile of the current session, if any
    std::optional<Profile> active_profile() const;

    /// True if established here or the engine reports a running tunnel
    bool tunnel_active() const;

    /// Invoked on every state transition, outside the internal lock
    std::function<void(SessionState)> on_state_change;

private:
    Authenticator& auth_;
    VpnEngine& engine_;
    std::vector<int> callback_ports_;
    std::shared_ptr<spdlog::logger> log_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    SessionState state_ = SessionState::Idle;
    std::optional<Profile> profile_;
    std::atomic<bool> cancel_requested_{false};
    std::thread worker_;

    void run_session(Profile profile, std::promise<OpResult> done);
    void set_state(SessionState state);
    void announce(SessionState previous, SessionState state);
    bool try_establish();
    void finish(std::promise<OpResult>& done, OpResult result);
    void wait_until_idle();

    static std::future<OpResult> ready(OpResult result);
};
