#include "auth/saml_acs.hpp"

#include <httplib.h>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace {

const char* kReceivedPage =
    "<html><body><p>Authentication details received, processing details. "
    "You may close this window at any time.</p></body></html>";

// One listener per authenticate() call; the waiting task keeps it alive
struct Attempt {
    httplib::Server server;
    std::thread listener;
    int port = 0;

    std::mutex mutex;
    std::condition_variable cv;
    std::string saml_response;
    bool received = false;
    bool aborted = false;
    std::atomic<bool> finished{false};
};

} // namespace

struct SamlAcsAuthenticator::Impl {
    std::shared_ptr<spdlog::logger> log;
    std::string host;

    mutable std::mutex mutex;
    std::shared_ptr<Attempt> current;
};

SamlAcsAuthenticator::SamlAcsAuthenticator(std::shared_ptr<spdlog::logger> log, std::string bind_host)
    : impl_(std::make_unique<Impl>()) {
    impl_->log = std::move(log);
    impl_->host = std::move(bind_host);
}

SamlAcsAuthenticator::~SamlAcsAuthenticator() {
    abort();
}

int SamlAcsAuthenticator::bound_port() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->current || impl_->current->finished.load()) return 0;
    return impl_->current->port;
}

std::future<AuthResult> SamlAcsAuthenticator::authenticate(const std::vector<int>& callback_ports) {
    auto fail_now = [](std::string error) {
        std::promise<AuthResult> p;
        AuthResult r;
        r.status = OpResult::fail(FailureKind::AuthFailed, std::move(error));
        p.set_value(std::move(r));
        return p.get_future();
    };

    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->current && !impl_->current->finished.load()) {
        return fail_now("Authentication already in progress");
    }
    if (callback_ports.empty()) {
        return fail_now("No callback ports configured");
    }

    auto attempt = std::make_shared<Attempt>();
    Attempt* raw = attempt.get();

    attempt->server.Post("/", [raw](const httplib::Request& req, httplib::Response& res) {
        std::string assertion = req.has_param("SAMLResponse") ? req.get_param_value("SAMLResponse") : "";
        if (assertion.empty()) {
            res.status = 400;
            res.set_content("Missing SAMLResponse", "text/plain");
            return;
        }
        {
            std::lock_guard<std::mutex> guard(raw->mutex);
            raw->saml_response = std::move(assertion);
            raw->received = true;
        }
        raw->cv.notify_all();
        res.set_content(kReceivedPage, "text/html");
    });

    for (int port : callback_ports) {
        if (attempt->server.bind_to_port(impl_->host, port)) {
            attempt->port = port;
            break;
        }
        impl_->log->debug("Callback port {} unavailable", port);
    }
    if (attempt->port == 0) {
        std::string ports;
        for (int port : callback_ports) {
            if (!ports.empty()) ports += ", ";
            ports += std::to_string(port);
        }
        return fail_now("None of the callback ports are available: " + ports);
    }

    attempt->listener = std::thread([raw]() { raw->server.listen_after_bind(); });
    impl_->current = attempt;

    impl_->log->info("Waiting for SAML response on http://{}:{}/", impl_->host, attempt->port);

    auto log = impl_->log;
    return std::async(std::launch::async, [attempt, log]() {
        AuthResult result;
        {
            std::unique_lock<std::mutex> guard(attempt->mutex);
            attempt->cv.wait(guard, [&] { return attempt->received || attempt->aborted; });
            if (attempt->received) {
                result.credentials.username = kUsername;
                result.credentials.password = attempt->saml_response;
            } else {
                result.status = OpResult::fail(FailureKind::AuthFailed, "Authentication aborted");
            }
        }

        // stop() is a no-op until the listen loop is up
        attempt->server.wait_until_ready();
        attempt->server.stop();
        if (attempt->listener.joinable()) {
            attempt->listener.join();
        }
        attempt->finished.store(true);

        if (result.status.success) {
            log->info("SAML response received");
        }
        return result;
    });
}

void SamlAcsAuthenticator::abort() {
    std::shared_ptr<Attempt> attempt;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        attempt = impl_->current;
    }
    if (!attempt) return;
    {
        std::lock_guard<std::mutex> guard(attempt->mutex);
        attempt->aborted = true;
    }
    attempt->cv.notify_all();
}
