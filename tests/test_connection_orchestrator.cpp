#include <gtest/gtest.h>
#include "session/connection_orchestrator.hpp"
#include "core/logging.hpp"
#include "fakes.hpp"
#include "temp_home.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

class ConnectionOrchestratorTest : public TempHomeTest {
protected:
    FakeAuthenticator auth_;
    FakeEngine engine_;
    std::unique_ptr<ConnectionOrchestrator> orch_;
    Profile profile_;

    std::mutex states_mutex_;
    std::vector<SessionState> states_;

    void SetUp() override {
        TempHomeTest::SetUp();
        profile_.name = "work";
        profile_.config_file = write_file("work.ovpn", "client\n");
        orch_ = std::make_unique<ConnectionOrchestrator>(auth_, engine_, std::vector<int>{35001},
                                                         null_logger());
        orch_->on_state_change = [this](SessionState s) {
            std::lock_guard<std::mutex> lock(states_mutex_);
            states_.push_back(s);
        };
    }

    void TearDown() override {
        orch_.reset();
        TempHomeTest::TearDown();
    }

    std::vector<SessionState> states() {
        std::lock_guard<std::mutex> lock(states_mutex_);
        return states_;
    }

    static OpResult await(std::future<OpResult>& f) {
        if (f.wait_for(5s) != std::future_status::ready) {
            return OpResult::fail(FailureKind::None, "timed out waiting for result");
        }
        return f.get();
    }
};

TEST_F(ConnectionOrchestratorTest, StartsIdle) {
    EXPECT_EQ(orch_->state(), SessionState::Idle);
    EXPECT_FALSE(orch_->active_profile().has_value());
    EXPECT_FALSE(orch_->tunnel_active());
}

TEST_F(ConnectionOrchestratorTest, ConnectGoesThroughAllStates) {
    auto f = orch_->connect(profile_);
    auto r = await(f);
    ASSERT_TRUE(r.success) << r.error;

    EXPECT_EQ(orch_->state(), SessionState::Established);
    EXPECT_EQ(states(), (std::vector<SessionState>{
        SessionState::Authenticating, SessionState::Connecting, SessionState::Established}));
    EXPECT_TRUE(orch_->tunnel_active());
    ASSERT_TRUE(orch_->active_profile().has_value());
    EXPECT_EQ(orch_->active_profile()->name, "work");
}

TEST_F(ConnectionOrchestratorTest, CredentialsAndConfigReachEngine) {
    auto f = orch_->connect(profile_);
    ASSERT_TRUE(await(f).success);

    EXPECT_EQ(auth_.last_ports(), (std::vector<int>{35001}));
    EXPECT_EQ(engine_.last_config(), profile_.config_file);
    EXPECT_EQ(engine_.last_credentials().username, "N/A");
    EXPECT_EQ(engine_.last_credentials().password, "assertion");
}

TEST_F(ConnectionOrchestratorTest, MissingConfigFailsWithoutCollaborators) {
    Profile gone{"gone", temp_dir_ + "/gone.ovpn"};
    auto f = orch_->connect(gone);
    auto r = await(f);

    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.kind, FailureKind::ConfigNotFound);
    EXPECT_EQ(auth_.authenticate_calls.load(), 0);
    EXPECT_EQ(engine_.establish_calls.load(), 0);
    EXPECT_EQ(orch_->state(), SessionState::Idle);
    EXPECT_TRUE(states().empty());
}

TEST_F(ConnectionOrchestratorTest, AuthFailureIsReportedAsAuthFailed) {
    auth_.auto_result.status = OpResult::fail(FailureKind::AuthFailed, "user closed the browser");

    auto f = orch_->connect(profile_);
    auto r = await(f);

    EXPECT_EQ(r.kind, FailureKind::AuthFailed);
    EXPECT_NE(r.error.find("user closed the browser"), std::string::npos);
    EXPECT_EQ(engine_.establish_calls.load(), 0);
    EXPECT_EQ(orch_->state(), SessionState::Idle);
    EXPECT_EQ(states(), (std::vector<SessionState>{
        SessionState::Authenticating, SessionState::Failed, SessionState::Idle}));
}

TEST_F(ConnectionOrchestratorTest, EngineFailureIsReportedAsEngineError) {
    engine_.auto_result = OpResult::fail(FailureKind::EngineError, "openvpn exited with code 1");

    auto f = orch_->connect(profile_);
    auto r = await(f);

    EXPECT_EQ(r.kind, FailureKind::EngineError);
    EXPECT_EQ(r.error, "openvpn exited with code 1");
    EXPECT_EQ(orch_->state(), SessionState::Idle);
    EXPECT_FALSE(orch_->active_profile().has_value());
    EXPECT_EQ(states(), (std::vector<SessionState>{
        SessionState::Authenticating, SessionState::Connecting,
        SessionState::Failed, SessionState::Idle}));
}

TEST_F(ConnectionOrchestratorTest, ProgressIsObservableWithoutBlocking) {
    auth_.auto_complete = false;

    auto f = orch_->connect(profile_);
    ASSERT_TRUE(wait_until([&] { return auth_.pending(); }));

    EXPECT_EQ(f.wait_for(0ms), std::future_status::timeout);
    EXPECT_EQ(orch_->state(), SessionState::Authenticating);
    EXPECT_EQ(engine_.establish_calls.load(), 0);

    auth_.complete(auth_.auto_result);
    EXPECT_TRUE(await(f).success);
}

TEST_F(ConnectionOrchestratorTest, SecondConnectWhileInFlightIsRejected) {
    auth_.auto_complete = false;
    auto first = orch_->connect(profile_);
    ASSERT_TRUE(wait_until([&] { return auth_.pending(); }));

    auto second = orch_->connect(profile_);
    auto r2 = await(second);
    EXPECT_EQ(r2.kind, FailureKind::AlreadyConnected);
    EXPECT_EQ(auth_.authenticate_calls.load(), 1);

    auth_.complete(auth_.auto_result);
    EXPECT_TRUE(await(first).success);
}

TEST_F(ConnectionOrchestratorTest, ConnectWhileEstablishedIsRejected) {
    auto first = orch_->connect(profile_);
    ASSERT_TRUE(await(first).success);

    auto second = orch_->connect(profile_);
    EXPECT_EQ(await(second).kind, FailureKind::AlreadyConnected);
    EXPECT_EQ(orch_->state(), SessionState::Established);
}

TEST_F(ConnectionOrchestratorTest, ConnectWithLeftoverTunnelIsRejected) {
    engine_.running = true;
    auto f = orch_->connect(profile_);
    EXPECT_EQ(await(f).kind, FailureKind::AlreadyConnected);
    EXPECT_EQ(auth_.authenticate_calls.load(), 0);
}

TEST_F(ConnectionOrchestratorTest, DisconnectWhenIdleIsNoActiveConnection) {
    auto f = orch_->disconnect();
    auto r = await(f);
    EXPECT_EQ(r.kind, FailureKind::NoActiveConnection);
    EXPECT_EQ(engine_.teardown_calls.load(), 0);
    EXPECT_EQ(orch_->state(), SessionState::Idle);
}

TEST_F(ConnectionOrchestratorTest, DisconnectAfterConnectTearsDown) {
    auto c = orch_->connect(profile_);
    ASSERT_TRUE(await(c).success);

    auto d = orch_->disconnect();
    auto r = await(d);
    EXPECT_TRUE(r.success) << r.error;
    EXPECT_EQ(engine_.teardown_calls.load(), 1);
    EXPECT_EQ(orch_->state(), SessionState::Idle);
    EXPECT_FALSE(orch_->tunnel_active());
}

TEST_F(ConnectionOrchestratorTest, TeardownErrorIsReportedButSessionEnds) {
    auto c = orch_->connect(profile_);
    ASSERT_TRUE(await(c).success);

    engine_.teardown_result = OpResult::fail(FailureKind::EngineError, "kill failed");
    auto d = orch_->disconnect();
    auto r = await(d);
    EXPECT_EQ(r.kind, FailureKind::EngineError);
    EXPECT_EQ(r.error, "kill failed");
    EXPECT_EQ(orch_->state(), SessionState::Idle);
}

TEST_F(ConnectionOrchestratorTest, DisconnectAdoptsTunnelFromEarlierRun) {
    engine_.running = true;
    auto d = orch_->disconnect();
    EXPECT_TRUE(await(d).success);
    EXPECT_EQ(engine_.teardown_calls.load(), 1);
}

TEST_F(ConnectionOrchestratorTest, CancelWhileAuthenticating) {
    auth_.auto_complete = false;
    auto f = orch_->connect(profile_);
    ASSERT_TRUE(wait_until([&] { return auth_.pending(); }));

    orch_->cancel();
    auto r = await(f);
    EXPECT_EQ(r.kind, FailureKind::Cancelled);
    EXPECT_GE(auth_.abort_calls.load(), 1);
    EXPECT_EQ(engine_.establish_calls.load(), 0);
    EXPECT_EQ(orch_->state(), SessionState::Idle);
}

TEST_F(ConnectionOrchestratorTest, CancelWhileConnecting) {
    engine_.auto_complete = false;
    auto f = orch_->connect(profile_);
    ASSERT_TRUE(wait_until([&] { return engine_.pending(); }));
    EXPECT_EQ(orch_->state(), SessionState::Connecting);

    orch_->cancel();
    auto r = await(f);
    EXPECT_EQ(r.kind, FailureKind::Cancelled);
    EXPECT_GE(engine_.teardown_calls.load(), 1);
    EXPECT_EQ(orch_->state(), SessionState::Idle);
    EXPECT_FALSE(engine_.running.load());
}

TEST_F(ConnectionOrchestratorTest, CancelWhenIdleIsNoOp) {
    orch_->cancel();
    EXPECT_EQ(auth_.abort_calls.load(), 0);
    EXPECT_EQ(engine_.teardown_calls.load(), 0);
    EXPECT_EQ(orch_->state(), SessionState::Idle);
}

TEST_F(ConnectionOrchestratorTest, DisconnectWhileConnectingCancelsAttempt) {
    engine_.auto_complete = false;
    auto c = orch_->connect(profile_);
    ASSERT_TRUE(wait_until([&] { return engine_.pending(); }));

    auto d = orch_->disconnect();
    EXPECT_TRUE(await(d).success);
    EXPECT_EQ(await(c).kind, FailureKind::Cancelled);
    EXPECT_EQ(orch_->state(), SessionState::Idle);
}

TEST_F(ConnectionOrchestratorTest, ReconnectAfterFailure) {
    auth_.auto_result.status = OpResult::fail(FailureKind::AuthFailed, "denied");
    auto first = orch_->connect(profile_);
    EXPECT_EQ(await(first).kind, FailureKind::AuthFailed);

    auth_.auto_result.status = OpResult::ok();
    auto second = orch_->connect(profile_);
    EXPECT_TRUE(await(second).success);
    EXPECT_EQ(auth_.authenticate_calls.load(), 2);
}

TEST_F(ConnectionOrchestratorTest, DestructionUnwindsInFlightAttempt) {
    auth_.auto_complete = false;
    auto f = orch_->connect(profile_);
    ASSERT_TRUE(wait_until([&] { return auth_.pending(); }));

    orch_.reset();
    EXPECT_GE(auth_.abort_calls.load(), 1);
    ASSERT_EQ(f.wait_for(0ms), std::future_status::ready);
    EXPECT_EQ(f.get().kind, FailureKind::Cancelled);
}

TEST_F(ConnectionOrchestratorTest, DestructionLeavesEstablishedTunnelRunning) {
    auto f = orch_->connect(profile_);
    ASSERT_TRUE(await(f).success);

    orch_.reset();
    EXPECT_EQ(engine_.teardown_calls.load(), 0);
    EXPECT_TRUE(engine_.running.load());
}

TEST_F(ConnectionOrchestratorTest, CancelReportsWhetherItActed) {
    EXPECT_FALSE(orch_->cancel());

    auth_.auto_complete = false;
    auto f = orch_->connect(profile_);
    ASSERT_TRUE(wait_until([&] { return auth_.pending(); }));
    EXPECT_TRUE(orch_->cancel());
    EXPECT_EQ(await(f).kind, FailureKind::Cancelled);

    auth_.auto_complete = true;
    auto g = orch_->connect(profile_);
    ASSERT_TRUE(await(g).success);
    EXPECT_FALSE(orch_->cancel());
    EXPECT_EQ(orch_->state(), SessionState::Established);
}

TEST_F(ConnectionOrchestratorTest, ConcurrentConnectsStartOneSession) {
    for (int round = 0; round < 50; ++round) {
        FakeAuthenticator auth;
        FakeEngine engine;
        auth.auto_complete = false;
        ConnectionOrchestrator orch(auth, engine, {35001}, null_logger());

        std::atomic<bool> go{false};
        std::future<OpResult> a, b;
        std::thread ta([&] { while (!go.load()) {} a = orch.connect(profile_); });
        std::thread tb([&] { while (!go.load()) {} b = orch.connect(profile_); });
        go.store(true);
        ta.join();
        tb.join();

        ASSERT_TRUE(wait_until([&] { return auth.pending(); }));
        EXPECT_EQ(auth.authenticate_calls.load(), 1);
        EXPECT_TRUE(orch.cancel());

        auto ra = await(a);
        auto rb = await(b);
        int rejected = (ra.kind == FailureKind::AlreadyConnected) +
                       (rb.kind == FailureKind::AlreadyConnected);
        int cancelled = (ra.kind == FailureKind::Cancelled) + (rb.kind == FailureKind::Cancelled);
        EXPECT_EQ(rejected, 1) << "round " << round;
        EXPECT_EQ(cancelled, 1) << "round " << round;
    }
}

TEST_F(ConnectionOrchestratorTest, DisconnectRacingEstablishmentCompletes) {
    for (int round = 0; round < 50; ++round) {
        FakeAuthenticator auth;
        FakeEngine engine;
        engine.auto_complete = false;
        ConnectionOrchestrator orch(auth, engine, {35001}, null_logger());

        auto c = orch.connect(profile_);
        ASSERT_TRUE(wait_until([&] { return engine.pending(); }));

        std::thread up([&] { engine.complete(OpResult::ok()); });
        auto d = orch.disconnect();
        up.join();

        ASSERT_EQ(d.wait_for(5s), std::future_status::ready) << "round " << round;
        EXPECT_TRUE(d.get().success) << "round " << round;

        auto rc = await(c);
        EXPECT_TRUE(rc.success || rc.kind == FailureKind::Cancelled) << rc.error;
        EXPECT_EQ(orch.state(), SessionState::Idle);
        EXPECT_FALSE(engine.running.load());
    }
}

TEST(SessionStateTest, Names) {
    EXPECT_STREQ(to_string(SessionState::Idle), "Idle");
    EXPECT_STREQ(to_string(SessionState::Authenticating), "Authenticating");
    EXPECT_STREQ(to_string(SessionState::Connecting), "Connecting");
    EXPECT_STREQ(to_string(SessionState::Established), "Established");
    EXPECT_STREQ(to_string(SessionState::Failed), "Failed");
}
