#pragma once

#include "core/errors.hpp"

#include <future>
#include <string>
#include <vector>

/// What the VPN engine needs to log in. Empty for certificate-only profiles.
struct Credentials {
    std::string username;
    std::string password;

    bool empty() const { return username.empty() && password.empty(); }
};

struct AuthResult {
    OpResult status;
    Credentials credentials;
};

/// Obtains credentials for the VPN engine, possibly through user interaction.
class Authenticator {
public:
    virtual ~Authenticator() = default;

    /// Start authenticating. `callback_ports` are the local ports the
    /// external flow may call back on. The future resolves once the flow
    /// succeeds, fails or is aborted.
    virtual std::future<AuthResult> authenticate(const std::vector<int>& callback_ports) = 0;

    /// Abort a pending authenticate(); its future resolves with a failure
    virtual void abort() = 0;
};

/// Authenticator for profiles that carry their own certificates
class NoAuthAuthenticator : public Authenticator {
public:
    std::future<AuthResult> authenticate(const std::vector<int>& /*callback_ports*/) override {
        std::promise<AuthResult> p;
        p.set_value(AuthResult{});
        return p.get_future();
    }

    void abort() override {}
};
