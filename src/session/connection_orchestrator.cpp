#include "session/connection_orchestrator.hpp"
#include "core/validation.hpp"

#include <exception>

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle:           return "Idle";
        case SessionState::Authenticating: return "Authenticating";
        case SessionState::Connecting:     return "Connecting";
        case SessionState::Established:    return "Established";
        case SessionState::Failed:         return "Failed";
    }
    return "Unknown";
}

ConnectionOrchestrator::ConnectionOrchestrator(Authenticator& auth, VpnEngine& engine,
                                               std::vector<int> callback_ports,
                                               std::shared_ptr<spdlog::logger> log)
    : auth_(auth), engine_(engine),
      callback_ports_(std::move(callback_ports)), log_(std::move(log)) {}

ConnectionOrchestrator::~ConnectionOrchestrator() {
    // An established tunnel is left running; only an in-flight attempt is
    // unwound.
    cancel();
    if (worker_.joinable()) {
        worker_.join();
    }
}

std::future<OpResult> ConnectionOrchestrator::ready(OpResult result) {
    std::promise<OpResult> p;
    p.set_value(std::move(result));
    return p.get_future();
}

SessionState ConnectionOrchestrator::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<Profile> ConnectionOrchestrator::active_profile() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return profile_;
}

bool ConnectionOrchestrator::tunnel_active() const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::Established) return true;
    }
    return engine_.tunnel_running();
}

void ConnectionOrchestrator::set_state(SessionState state) {
    SessionState previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = state_;
        state_ = state;
        if (state == SessionState::Idle) {
            profile_.reset();
        }
    }
    announce(previous, state);
}

void ConnectionOrchestrator::announce(SessionState previous, SessionState state) {
    if (state == SessionState::Idle) {
        idle_cv_.notify_all();
    }
    log_->debug("Session state: {} -> {}", to_string(previous), to_string(state));
    if (on_state_change) {
        on_state_change(state);
    }
}

bool ConnectionOrchestrator::try_establish() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // cancel() sets the flag under this lock, so it either sees
        // Established or the flag is already set here
        if (cancel_requested_.load()) return false;
        state_ = SessionState::Established;
    }
    announce(SessionState::Connecting, SessionState::Established);
    return true;
}

void ConnectionOrchestrator::wait_until_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return state_ == SessionState::Idle; });
}

std::future<OpResult> ConnectionOrchestrator::connect(const Profile& profile) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Idle) {
            std::string current = profile_ ? profile_->name : std::string("unknown");
            return ready(OpResult::fail(FailureKind::AlreadyConnected,
                                        "A connection is already active: " + current));
        }
    }

    if (engine_.tunnel_running()) {
        return ready(OpResult::fail(FailureKind::AlreadyConnected,
                                    "A tunnel is already running; disconnect first"));
    }

    if (!config_file_exists(profile.config_file)) {
        return ready(OpResult::fail(FailureKind::ConfigNotFound,
                                    "OVPN config file not found: " + profile.config_file));
    }

    // Claim the session; from here on no other connect() gets past the check
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Idle) {
            return ready(OpResult::fail(FailureKind::AlreadyConnected,
                                        "A connection is already active"));
        }
        state_ = SessionState::Authenticating;
        profile_ = profile;
        cancel_requested_.store(false);
    }
    announce(SessionState::Idle, SessionState::Authenticating);

    // Only the claiming thread touches worker_. The previous worker has
    // already moved the state back to Idle.
    if (worker_.joinable()) {
        worker_.join();
    }

    std::promise<OpResult> done;
    auto result = done.get_future();
    worker_ = std::thread(&ConnectionOrchestrator::run_session, this, profile, std::move(done));
    return result;
}

void ConnectionOrchestrator::finish(std::promise<OpResult>& done, OpResult result) {
    if (result.success) {
        // try_establish() has already moved the state
    } else if (result.kind == FailureKind::Cancelled) {
        log_->info("Connection attempt cancelled");
        set_state(SessionState::Idle);
    } else {
        set_state(SessionState::Failed);
        set_state(SessionState::Idle);
    }
    done.set_value(std::move(result));
}

void ConnectionOrchestrator::run_session(Profile profile, std::promise<OpResult> done) {
    // 1. Authenticate
    AuthResult auth;
    try {
        auto pending = auth_.authenticate(callback_ports_);
        // cancel() may have called abort() before there was anything to abort
        if (cancel_requested_.load()) {
            auth_.abort();
        }
        auth = pending.get();
    } catch (const std::exception& e) {
        auth.status = OpResult::fail(FailureKind::AuthFailed, e.what());
    }

    if (cancel_requested_.load()) {
        finish(done, OpResult::fail(FailureKind::Cancelled, "Connection attempt cancelled"));
        return;
    }
    if (!auth.status.success) {
        std::string msg = auth.status.error.empty() ? "Authentication failed"
                                                    : "Authentication failed: " + auth.status.error;
        finish(done, OpResult::fail(FailureKind::AuthFailed, msg));
        return;
    }

    // 2. Hand the credentials to the engine
    set_state(SessionState::Connecting);
    if (cancel_requested_.load()) {
        finish(done, OpResult::fail(FailureKind::Cancelled, "Connection attempt cancelled"));
        return;
    }

    log_->info("Starting tunnel for profile: {}", profile.name);
    OpResult tunnel;
    try {
        auto pending = engine_.establish(profile.config_file, auth.credentials);
        // cancel() may have run its teardown before the engine had a process
        if (cancel_requested_.load()) {
            auto torn = engine_.teardown();
            if (!torn.success) log_->debug("Teardown after cancel: {}", torn.error);
        }
        tunnel = pending.get();
    } catch (const std::exception& e) {
        tunnel = OpResult::fail(FailureKind::EngineError, e.what());
    }

    // 3. Tunnel outcome
    if (cancel_requested_.load()) {
        if (tunnel.success) {
            auto torn = engine_.teardown();
            if (!torn.success) log_->warn("Teardown after cancel failed: {}", torn.error);
        }
        finish(done, OpResult::fail(FailureKind::Cancelled, "Connection attempt cancelled"));
        return;
    }
    if (!tunnel.success) {
        finish(done, OpResult::fail(FailureKind::EngineError,
                                    tunnel.error.empty() ? "Tunnel establishment failed" : tunnel.error));
        return;
    }

    if (!try_establish()) {
        // Cancelled between the tunnel coming up and this point
        auto torn = engine_.teardown();
        if (!torn.success) log_->warn("Teardown after cancel failed: {}", torn.error);
        finish(done, OpResult::fail(FailureKind::Cancelled, "Connection attempt cancelled"));
        return;
    }
    finish(done, OpResult::ok());
}

bool ConnectionOrchestrator::cancel() {
    SessionState current;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current = state_;
        if (current != SessionState::Authenticating && current != SessionState::Connecting) {
            return false;
        }
        cancel_requested_.store(true);
    }

    if (current == SessionState::Authenticating) {
        auth_.abort();
    } else {
        auto torn = engine_.teardown();
        if (!torn.success) log_->debug("Teardown during cancel: {}", torn.error);
    }
    return true;
}

std::future<OpResult> ConnectionOrchestrator::disconnect() {
    // cancel() decides under the lock; if the attempt finished in the
    // meantime, handle whatever state it reached
    if (cancel()) {
        return std::async(std::launch::async, [this] {
            wait_until_idle();
            return OpResult::ok();
        });
    }

    if (state() == SessionState::Established || engine_.tunnel_running()) {
        return std::async(std::launch::async, [this] {
            OpResult torn = engine_.teardown();
            // Idle regardless of how the teardown went
            set_state(SessionState::Idle);
            if (!torn.success) {
                return OpResult::fail(FailureKind::EngineError, torn.error);
            }
            return OpResult::ok();
        });
    }

    return ready(OpResult::fail(FailureKind::NoActiveConnection, "No active connection"));
}
