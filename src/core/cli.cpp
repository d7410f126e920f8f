#include "core/cli.hpp"
#include "core/command_facade.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "core/profile_store.hpp"
#include "auth/authenticator.hpp"
#include "auth/saml_acs.hpp"
#include "engine/openvpn_engine.hpp"
#include "session/connection_orchestrator.hpp"

#include <atomic>
#include <cstring>
#include <iostream>
#include <memory>
#include <signal.h>

#ifndef AWSVPNCTL_VERSION
#define AWSVPNCTL_VERSION "unknown"
#endif

namespace {

std::atomic<CommandFacade*> g_facade{nullptr};

void on_interrupt(int /*sig*/) {
    CommandFacade* facade = g_facade.load();
    if (facade) {
        facade->request_cancel();
    }
}

// Routes SIGINT/SIGTERM to the facade while a connect is waiting
class InterruptScope {
public:
    explicit InterruptScope(CommandFacade& facade) {
        g_facade.store(&facade);
        struct sigaction sa;
        std::memset(&sa, 0, sizeof(sa));
        sa.sa_handler = on_interrupt;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = 0;
        sigaction(SIGINT, &sa, &old_int_);
        sigaction(SIGTERM, &sa, &old_term_);
    }

    ~InterruptScope() {
        sigaction(SIGINT, &old_int_, nullptr);
        sigaction(SIGTERM, &old_term_, nullptr);
        g_facade.store(nullptr);
    }

private:
    struct sigaction old_int_;
    struct sigaction old_term_;
};

std::unique_ptr<Authenticator> make_authenticator(const AppConfig& cfg,
                                                  const std::shared_ptr<spdlog::logger>& log) {
    if (cfg.auth_method == "none") {
        return std::make_unique<NoAuthAuthenticator>();
    }
    if (cfg.auth_method != "saml") {
        log->warn("Unknown auth method '{}', using saml", cfg.auth_method);
    }
    return std::make_unique<SamlAcsAuthenticator>(log);
}

} // namespace

// ── Subcommand dispatch ─────────────────────────────────────

int CLI::run(int argc, char* argv[]) {
    if (argc < 2) {
        cmd_help(std::cerr);
        return kUsageError;
    }

    const char* cmd = argv[1];

    if (std::strcmp(cmd, "help") == 0 || std::strcmp(cmd, "--help") == 0 || std::strcmp(cmd, "-h") == 0) {
        return cmd_help(std::cout);
    }
    if (std::strcmp(cmd, "version") == 0 || std::strcmp(cmd, "--version") == 0 || std::strcmp(cmd, "-v") == 0) {
        return cmd_version();
    }

    // Check arity before touching config, logger or store
    if (std::strcmp(cmd, "add-profile") == 0) {
        if (argc < 4) return usage("add-profile <profileName> <configFile>");
    } else if (std::strcmp(cmd, "remove-profile") == 0) {
        if (argc < 3) return usage("remove-profile <profileName>");
    } else if (std::strcmp(cmd, "connect") == 0) {
        if (argc < 3) return usage("connect <profileName>");
    } else if (std::strcmp(cmd, "list-profiles") != 0 &&
               std::strcmp(cmd, "disconnect") != 0 &&
               std::strcmp(cmd, "status") != 0) {
        std::cerr << "Unknown command: " << cmd << "\n";
        std::cerr << "Run 'awsvpnctl help' for usage.\n";
        return kUsageError;
    }

    Config config;
    OpResult loaded = config.load();
    const AppConfig& cfg = config.data();

    LogSettings log_settings;
    log_settings.level = cfg.log_level;
    log_settings.file = Config::expand_home(cfg.log_file);
    auto log = make_logger(log_settings);
    if (!loaded.success) {
        log->warn("{}; using defaults", loaded.error);
    }

    ProfileStore store(Config::config_dir());

    OpenVpnSettings engine_settings;
    engine_settings.binary_path = Config::expand_home(cfg.openvpn_binary_path);
    engine_settings.runtime_dir = config.runtime_dir();
    engine_settings.teardown_timeout_ms = cfg.teardown_timeout_ms;

    auto auth = make_authenticator(cfg, log);
    OpenVpnEngine engine(engine_settings, log);
    ConnectionOrchestrator orchestrator(*auth, engine, cfg.callback_ports, log);

    FacadeOptions options;
    options.progress_interval = std::chrono::milliseconds(cfg.progress_interval_ms);
    options.connect_timeout = std::chrono::seconds(cfg.connect_timeout_sec);
    CommandFacade facade(store, orchestrator, log, options);

    OpResult result;
    if (std::strcmp(cmd, "list-profiles") == 0) {
        result = facade.list_profiles(std::cout);
    } else if (std::strcmp(cmd, "add-profile") == 0) {
        result = facade.add_profile(argv[2], argv[3]);
    } else if (std::strcmp(cmd, "remove-profile") == 0) {
        result = facade.remove_profile(argv[2]);
    } else if (std::strcmp(cmd, "connect") == 0) {
        InterruptScope interrupts(facade);
        result = facade.connect(argv[2]);
    } else if (std::strcmp(cmd, "disconnect") == 0) {
        result = facade.disconnect();
    } else {
        result = facade.status(std::cout);
    }

    log->flush();
    return exit_code_for(result.kind);
}

int CLI::usage(const char* synopsis) {
    std::cerr << "Usage: awsvpnctl " << synopsis << "\n";
    return kUsageError;
}

// ── help ────────────────────────────────────────────────────

int CLI::cmd_help(std::ostream& out) {
    out <<
        "awsvpnctl: manage OpenVPN profiles and drive one VPN connection\n"
        "\n"
        "Usage:\n"
        "  awsvpnctl list-profiles                         List profile names\n"
        "  awsvpnctl add-profile <profileName> <configFile> Add a profile\n"
        "  awsvpnctl remove-profile <profileName>          Remove a profile\n"
        "  awsvpnctl connect <profileName>                 Authenticate and bring the tunnel up\n"
        "  awsvpnctl disconnect                            Tear the tunnel down\n"
        "  awsvpnctl status                                Show whether a tunnel is running\n"
        "  awsvpnctl version                               Show version\n"
        "  awsvpnctl help                                  Show this help\n"
        "\n"
        "Configuration: $XDG_CONFIG_HOME/awsvpnctl/config.yaml (or ~/.config/awsvpnctl)\n"
        "\n"
        "Exit codes:\n"
        "  0 success, 1 usage, 2 invalid input, 3 not found, 4 duplicate name,\n"
        "  5 storage error, 6 config file missing, 7 authentication failed,\n"
        "  8 engine error, 9 no active connection, 10 already connected, 130 cancelled\n";
    return 0;
}

// ── version ─────────────────────────────────────────────────

int CLI::cmd_version() {
    std::cout << "awsvpnctl " << AWSVPNCTL_VERSION << "\n";
    return 0;
}
