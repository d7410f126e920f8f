#include "core/command_facade.hpp"
#include "core/validation.hpp"

#include <algorithm>
#include <optional>

CommandFacade::CommandFacade(ProfileStore& store, ConnectionOrchestrator& orchestrator,
                             std::shared_ptr<spdlog::logger> log, FacadeOptions options)
    : store_(store), orchestrator_(orchestrator), log_(std::move(log)), options_(options) {}

OpResult CommandFacade::report(OpResult result) {
    if (!result.success) {
        log_->error("{}", result.error);
    }
    return result;
}

// ── list ────────────────────────────────────────────────────

OpResult CommandFacade::list_profiles(std::ostream& out) {
    auto listed = store_.list_profiles();
    if (!listed.status.success) return report(listed.status);

    if (listed.profiles.empty()) {
        out << "No profiles configured.\n";
        return OpResult::ok();
    }

    out << "Profiles:\n";
    for (const auto& p : listed.profiles) {
        out << "\t" << p.name << "\n";
    }
    return OpResult::ok();
}

// ── add / remove ────────────────────────────────────────────

OpResult CommandFacade::add_profile(const std::string& name, const std::string& config_file) {
    if (is_blank(name)) {
        return report(OpResult::fail(FailureKind::InvalidInput, "Profile name is required"));
    }
    if (is_blank(config_file)) {
        return report(OpResult::fail(FailureKind::InvalidInput, "Config file is required"));
    }
    if (!config_file_exists(config_file)) {
        return report(OpResult::fail(FailureKind::InvalidInput, "Config file not found: " + config_file));
    }

    auto added = store_.add_profile(name, config_file);
    if (!added.success) return report(added);

    log_->info("Profile added: {}", name);
    return added;
}

OpResult CommandFacade::remove_profile(const std::string& name) {
    if (is_blank(name)) {
        return report(OpResult::fail(FailureKind::InvalidInput, "Profile name is required"));
    }

    auto removed = store_.remove_profile(name);
    if (!removed.success) return report(removed);

    log_->info("Profile removed: {}", name);
    return removed;
}

// ── connect / disconnect ────────────────────────────────────

OpResult CommandFacade::connect(const std::string& name) {
    cancel_requested_.store(false);

    auto listed = store_.list_profiles();
    if (!listed.status.success) return report(listed.status);

    auto it = std::find_if(listed.profiles.begin(), listed.profiles.end(),
        [&](const Profile& p) { return p.name == name; });
    if (it == listed.profiles.end()) {
        return report(OpResult::fail(FailureKind::NotFound, "Profile not found: " + name));
    }
    const Profile selected = *it;

    if (!config_file_exists(selected.config_file)) {
        return report(OpResult::fail(FailureKind::ConfigNotFound,
                                     "OVPN config file not found: " + selected.config_file));
    }

    log_->info("Connecting to profile: {}", selected.name);
    auto pending = orchestrator_.connect(selected);

    using clock = std::chrono::steady_clock;
    const auto slice = std::min<std::chrono::milliseconds>(options_.progress_interval,
                                                           std::chrono::milliseconds(100));
    const auto started = clock::now();
    auto last_progress = started;
    bool cancelling = false;
    bool timed_out = false;

    while (pending.wait_for(slice) != std::future_status::ready) {
        auto now = clock::now();
        if (!cancelling && cancel_requested_.load()) {
            log_->warn("Interrupted, cancelling connection attempt...");
            orchestrator_.cancel();
            cancelling = true;
        } else if (!cancelling && options_.connect_timeout.count() > 0 &&
                   now - started >= options_.connect_timeout) {
            orchestrator_.cancel();
            cancelling = true;
            timed_out = true;
        }
        if (now - last_progress >= options_.progress_interval) {
            log_->debug("Waiting for connection...");
            last_progress = now;
        }
    }

    OpResult result = pending.get();
    if (!result.success && timed_out && result.kind == FailureKind::Cancelled) {
        result.error = "Connection attempt timed out after " +
                       std::to_string(options_.connect_timeout.count()) + "s";
    }
    if (!result.success) return report(result);

    log_->info("Connected: {}", selected.name);
    return result;
}

OpResult CommandFacade::disconnect() {
    log_->info("Disconnecting...");
    auto result = orchestrator_.disconnect().get();
    if (!result.success) return report(result);

    log_->info("Disconnected");
    return result;
}

// ── status ──────────────────────────────────────────────────

OpResult CommandFacade::status(std::ostream& out) {
    bool running = orchestrator_.tunnel_active();
    out << "Tunnel:  " << (running ? "running" : "not running") << "\n";
    if (auto profile = orchestrator_.active_profile()) {
        out << "Profile: " << profile->name << "\n";
    }
    return OpResult::ok();
}
