#pragma once

#include "auth/authenticator.hpp"
#include "core/errors.hpp"

#include <future>
#include <string>

/// Brings a tunnel up and down. At most one tunnel per engine.
class VpnEngine {
public:
    virtual ~VpnEngine() = default;

    /// Start establishing a tunnel. The future resolves to success once the
    /// tunnel is up, or to EngineError if it could not be brought up.
    /// teardown() while pending makes the future resolve with a failure.
    virtual std::future<OpResult> establish(const std::string& config_file,
                                            const Credentials& credentials) = 0;

    /// Tear the tunnel down, whether still establishing or established
    virtual OpResult teardown() = 0;

    /// True if a tunnel process is alive, including one left running by an
    /// earlier invocation
    virtual bool tunnel_running() const = 0;
};
