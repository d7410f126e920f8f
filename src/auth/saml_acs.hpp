#pragma once

#include "auth/authenticator.hpp"

#include <spdlog/logger.h>

#include <memory>
#include <string>
#include <vector>

/// Local SAML assertion consumer service. Listens on the first free callback
/// port and resolves once the identity provider posts a SAMLResponse form
/// field to it. The assertion becomes the password, with username "N/A".
class SamlAcsAuthenticator : public Authenticator {
public:
    explicit SamlAcsAuthenticator(std::shared_ptr<spdlog::logger> log,
                                  std::string bind_host = "127.0.0.1");
    ~SamlAcsAuthenticator() override;

    std::future<AuthResult> authenticate(const std::vector<int>& callback_ports) override;
    void abort() override;

    /// Port of the pending listener, 0 when not listening
    int bound_port() const;

    static constexpr const char* kUsername = "N/A";

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
