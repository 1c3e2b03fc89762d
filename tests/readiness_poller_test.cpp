#include <gtest/gtest.h>

#include "helpers/fake_sandbox.hpp"
#include "sandprobe/core/readiness_poller.hpp"

namespace sandprobe {
namespace {

using core::DaemonConfig;
using core::ReadinessPoller;
using core::ReadinessReport;
using fakes::FakeSandbox;
using fakes::FakeSandboxState;
using fakes::RecordingSleeper;
using fakes::Reply;

const char* kHealth = "/health";
const char* kLiveness = "pgrep -f";
const char* kLogTail = "tail -n";

class ReadinessPollerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.server_config = "server:\n  http:\n    addr: 127.0.0.1:18080\n";
        config.policy = "version: 1\nname: default\n";
        config.attempts = 10;
    }

    ReadinessPoller MakePoller() { return ReadinessPoller(config, sleeper); }

    std::shared_ptr<FakeSandboxState> state = std::make_shared<FakeSandboxState>();
    FakeSandbox sandbox{state};
    DaemonConfig config;
    RecordingSleeper sleeper;
};

TEST_F(ReadinessPollerTest, FirstSuccessShortCircuits) {
    state->OnSequence(kHealth, {Reply::Exit(7), Reply::Exit(7), Reply::Ok("{\"status\":\"ok\"}")});

    auto poller = MakePoller();
    auto report = poller.StartAndWaitReady(sandbox);

    EXPECT_TRUE(report.ready);
    EXPECT_EQ(report.attempts, 3);
    EXPECT_EQ(state->CountCalls(kHealth), 3);
    EXPECT_EQ(state->CountCalls(kLiveness), 0);
    EXPECT_EQ(report.health_output, "{\"status\":\"ok\"}");
}

TEST_F(ReadinessPollerTest, SleepsOneIntervalBeforeEveryProbe) {
    state->OnSequence(kHealth, {Reply::Exit(7), Reply::Ok("ok")});

    auto poller = MakePoller();
    poller.StartAndWaitReady(sandbox);

    ASSERT_EQ(sleeper.waits->size(), 2u);
    for (auto wait : *sleeper.waits) {
        EXPECT_EQ(wait, std::chrono::milliseconds(1000));
    }
}

TEST_F(ReadinessPollerTest, ExhaustionIsBoundedAndFetchesLogWhenDaemonIsDead) {
    state->On(kHealth, Reply::Exit(7));
    state->On(kLiveness, Reply::Ok("not running\n"));
    state->On(kLogTail, Reply::Ok("FATAL: bind: address already in use\n"));

    auto poller = MakePoller();
    auto report = poller.StartAndWaitReady(sandbox);

    EXPECT_FALSE(report.ready);
    EXPECT_EQ(report.attempts, 10);
    EXPECT_EQ(state->CountCalls(kHealth), 10);
    ASSERT_TRUE(report.daemon_alive.has_value());
    EXPECT_FALSE(*report.daemon_alive);
    EXPECT_EQ(report.log_tail, "FATAL: bind: address already in use");
    EXPECT_EQ(state->CountCalls(kLogTail), 1);
    // Never re-launched
    EXPECT_EQ(state->spawns.size(), 1u);
}

TEST_F(ReadinessPollerTest, AliveButUnhealthyDaemonSkipsLogTail) {
    state->On(kHealth, Reply::Exit(7));
    state->On(kLiveness, Reply::Ok("running\n"));

    config.attempts = 3;
    auto poller = MakePoller();
    auto report = poller.StartAndWaitReady(sandbox);

    EXPECT_FALSE(report.ready);
    EXPECT_EQ(report.attempts, 3);
    EXPECT_EQ(report.daemon_alive, std::optional<bool>(true));
    EXPECT_TRUE(report.log_tail.empty());
    EXPECT_EQ(state->CountCalls(kLogTail), 0);
}

TEST_F(ReadinessPollerTest, UnknownLivenessStillFetchesLog) {
    state->On(kHealth, Reply::Transport("command timed out after 5000 ms"));
    state->On(kLiveness, Reply::Transport("command timed out after 5000 ms"));
    state->On(kLogTail, Reply::Ok("starting\n"));

    config.attempts = 2;
    auto poller = MakePoller();
    auto report = poller.StartAndWaitReady(sandbox);

    EXPECT_FALSE(report.ready);
    EXPECT_FALSE(report.daemon_alive.has_value());
    EXPECT_EQ(report.log_tail, "starting");
}

TEST_F(ReadinessPollerTest, StrictModeNeedsBody) {
    state->OnSequence(kHealth, {Reply::Ok(""), Reply::Ok("  \n"), Reply::Ok("ok")});

    config.attempts = 20;
    config.require_body = true;
    auto poller = MakePoller();
    auto report = poller.StartAndWaitReady(sandbox);

    EXPECT_TRUE(report.ready);
    EXPECT_EQ(report.attempts, 3);
}

TEST_F(ReadinessPollerTest, LightModeAcceptsEmptyBody) {
    state->On(kHealth, Reply::Ok(""));

    auto poller = MakePoller();
    auto report = poller.StartAndWaitReady(sandbox);

    EXPECT_TRUE(report.ready);
    EXPECT_EQ(report.attempts, 1);
}

TEST_F(ReadinessPollerTest, LivenessEachAttemptStopsEarlyWhenDaemonDied) {
    state->On(kHealth, Reply::Exit(7));
    state->OnSequence(kLiveness, {Reply::Ok("running\n"), Reply::Ok("not running\n")});
    state->On(kLogTail, Reply::Ok("panic: invalid policy\n"));

    config.liveness_each_attempt = true;
    auto poller = MakePoller();
    auto report = poller.StartAndWaitReady(sandbox);

    EXPECT_FALSE(report.ready);
    EXPECT_EQ(report.attempts, 2);
    EXPECT_EQ(report.daemon_alive, std::optional<bool>(false));
    EXPECT_EQ(report.log_tail, "panic: invalid policy");
}

TEST_F(ReadinessPollerTest, WritesBothDocumentsBeforeLaunch) {
    auto poller = MakePoller();
    auto report = poller.StartAndWaitReady(sandbox);

    EXPECT_TRUE(report.config_written);
    EXPECT_TRUE(report.launched);
    EXPECT_EQ(state->CountCalls("cat > '/etc/agentsh/config.yaml'"), 1);
    EXPECT_EQ(state->CountCalls("cat > '/etc/agentsh/policies/default.yaml'"), 1);

    ASSERT_EQ(state->spawns.size(), 1u);
    const auto& launch = state->spawns[0].back();
    EXPECT_NE(launch.find("agentsh server --config /etc/agentsh/config.yaml"), std::string::npos);
    EXPECT_NE(launch.find("> '/var/log/agentsh/agentsh.log' 2>&1 &"), std::string::npos);
}

TEST_F(ReadinessPollerTest, FailedWriteIsReportedButPollingContinues) {
    state->On("cat > '/etc/agentsh/policies", Reply::Exit(1, "", "Permission denied"));

    auto poller = MakePoller();
    auto report = poller.StartAndWaitReady(sandbox);

    EXPECT_FALSE(report.config_written);
    EXPECT_TRUE(report.ready);
}

TEST_F(ReadinessPollerTest, ShimInstallerRunsOnlyWhenConfigured) {
    {
        auto poller = MakePoller();
        poller.StartAndWaitReady(sandbox);
        EXPECT_EQ(state->CountCalls("shim install"), 0);
    }

    config.shim_install_command = "agentsh shim install --bash";
    state->On("shim install", Reply::Exit(1, "", "seccomp user notify unavailable"));

    auto poller = MakePoller();
    EXPECT_FALSE(poller.InstallShim(sandbox));
    auto report = poller.StartAndWaitReady(sandbox);
    EXPECT_TRUE(report.ready);
    EXPECT_EQ(state->CountCalls("shim install"), 2);
}

TEST_F(ReadinessPollerTest, LivenessCommandCannotMatchItself) {
    auto command = ReadinessPoller::BuildLivenessCommand("agentsh server");
    EXPECT_NE(command.find("pgrep -f '[a]gentsh server'"), std::string::npos);
    EXPECT_NE(command.find("echo running"), std::string::npos);

    EXPECT_NE(ReadinessPoller::BuildLivenessCommand("/usr/bin/agentsh").find("'/[u]sr/bin/agentsh'"),
              std::string::npos);
}

TEST_F(ReadinessPollerTest, AttemptsBelowOneStillProbeOnce) {
    state->On(kHealth, Reply::Exit(7));
    state->On(kLiveness, Reply::Ok("running"));

    config.attempts = 0;
    auto poller = MakePoller();
    auto report = poller.StartAndWaitReady(sandbox);

    EXPECT_EQ(report.attempts, 1);
}

} // namespace
} // namespace sandprobe
