#include <gtest/gtest.h>

#include "helpers/fake_sandbox.hpp"
#include "sandprobe/core/test_runner.hpp"

namespace sandprobe {
namespace {

using core::CaseObserver;
using core::CaseOutcome;
using core::ExpectedOutcome;
using core::OutcomeClassifier;
using core::RunnerConfig;
using core::TestCase;
using core::TestCategory;
using core::TestRunner;
using core::Verdict;
using fakes::FakeSandbox;
using fakes::FakeSandboxState;
using fakes::Reply;

TestCase MakeCase(const std::string& name, const std::string& command, ExpectedOutcome expected) {
    TestCase test_case;
    test_case.name = name;
    test_case.command = command;
    test_case.expected = expected;
    return test_case;
}

class RecordingObserver : public CaseObserver {
public:
    void OnCategoryStart(const TestCategory& category) override {
        events.push_back("category:" + category.key);
    }
    void OnCaseStart(const TestCategory& /*category*/, const TestCase& test_case) override {
        events.push_back("start:" + test_case.name);
    }
    void OnCaseFinished(const TestCase& test_case, const CaseOutcome& outcome) override {
        events.push_back("done:" + test_case.name + ":" + core::ToString(outcome.verdict));
    }

    std::vector<std::string> events;
};

class TestRunnerTest : public ::testing::Test {
protected:
    TestRunner MakeRunner(const std::string& session_id = "") {
        return TestRunner(sandbox, OutcomeClassifier(), config, session_id);
    }

    std::shared_ptr<FakeSandboxState> state = std::make_shared<FakeSandboxState>();
    FakeSandbox sandbox{state};
    RunnerConfig config;
};

TEST_F(TestRunnerTest, CountsEveryCaseExactlyOnce) {
    state->On("echo hi", Reply::Ok("hi\n"));
    state->On("169.254.169.254", Reply::Exit(7));
    state->On("docker.sock", Reply::Ok("srw-rw---- 1 root docker 0 /var/run/docker.sock"));
    state->On("sleep 999", Reply::Transport("command timed out after 30000 ms"));

    TestCategory network{"net", "Network", "", {
        MakeCase("metadata", "curl http://169.254.169.254/", ExpectedOutcome::BLOCKED),
        MakeCase("echo", "echo hi", ExpectedOutcome::SUCCESS),
    }};
    TestCategory isolation{"iso", "Isolation", "", {
        MakeCase("socket", "ls -la /var/run/docker.sock", ExpectedOutcome::BLOCKED),
        MakeCase("hang", "sleep 999", ExpectedOutcome::SUCCESS),
        MakeCase("info", "uname -a", ExpectedOutcome::UNCONSTRAINED),
    }};

    auto runner = MakeRunner();
    auto counters = runner.Run({network, isolation});

    EXPECT_EQ(counters.passed, 3);
    EXPECT_EQ(counters.failed, 1);
    EXPECT_EQ(counters.errors, 1);
    EXPECT_EQ(counters.Total(), 5);
    ASSERT_EQ(runner.Outcomes().size(), 5u);
    EXPECT_EQ(runner.Outcomes()[2].verdict, Verdict::FAIL);
    EXPECT_EQ(runner.Outcomes()[2].reason, "expected block, command succeeded");
}

TEST_F(TestRunnerTest, TimeoutIsAnErrorAndTheRunContinues) {
    state->On("sleep", Reply::Transport("command timed out after 30000 ms"));

    TestCategory category{"c", "C", "", {
        MakeCase("slow", "sleep 60", ExpectedOutcome::SUCCESS),
        MakeCase("next", "true", ExpectedOutcome::SUCCESS),
    }};

    auto runner = MakeRunner();
    auto counters = runner.Run({category});

    EXPECT_EQ(counters.errors, 1);
    EXPECT_EQ(counters.passed, 1);
    const auto& slow = runner.Outcomes()[0];
    EXPECT_EQ(slow.verdict, Verdict::ERROR);
    EXPECT_FALSE(slow.exit_code.has_value());
    EXPECT_NE(slow.reason.find("timed out"), std::string::npos);
    EXPECT_EQ(state->CountCalls("true"), 1);
}

TEST_F(TestRunnerTest, ExecutesInDeclarationOrderAndNotifiesObserver) {
    TestCategory first{"first", "First", "", {
        MakeCase("one", "echo 1", ExpectedOutcome::SUCCESS),
        MakeCase("two", "echo 2", ExpectedOutcome::SUCCESS),
    }};
    TestCategory second{"second", "Second", "", {
        MakeCase("three", "echo 3", ExpectedOutcome::SUCCESS),
    }};

    RecordingObserver observer;
    auto runner = MakeRunner();
    runner.SetObserver(&observer);
    runner.Run({first, second});

    ASSERT_EQ(state->calls.size(), 3u);
    EXPECT_EQ(state->calls[0].Script(), "echo 1");
    EXPECT_EQ(state->calls[1].Script(), "echo 2");
    EXPECT_EQ(state->calls[2].Script(), "echo 3");

    std::vector<std::string> expected = {
        "category:first", "start:one", "done:one:PASS", "start:two", "done:two:PASS",
        "category:second", "start:three", "done:three:PASS",
    };
    EXPECT_EQ(observer.events, expected);
}

TEST_F(TestRunnerTest, SubstitutesSessionId) {
    TestCategory category{"s", "Session", "", {
        MakeCase("info", "agentsh session info {session_id} --json", ExpectedOutcome::SUCCESS),
    }};

    auto runner = MakeRunner("sess-9");
    runner.Run({category});

    ASSERT_EQ(state->calls.size(), 1u);
    EXPECT_EQ(state->calls[0].Script(), "agentsh session info 'sess-9' --json");
    EXPECT_EQ(runner.Outcomes()[0].command, "agentsh session info 'sess-9' --json");
}

TEST_F(TestRunnerTest, SessionIdIsShellQuoted) {
    TestCategory category{"s", "Session", "", {
        MakeCase("info", "agentsh session info {session_id}", ExpectedOutcome::SUCCESS),
    }};

    auto runner = MakeRunner("x; rm -rf /tmp/w");
    runner.Run({category});

    ASSERT_EQ(state->calls.size(), 1u);
    EXPECT_EQ(state->calls[0].Script(), "agentsh session info 'x; rm -rf /tmp/w'");
}

TEST_F(TestRunnerTest, SessionDependentCaseWithoutSessionFails) {
    auto needs_session = MakeCase("info", "agentsh session info {session_id}", ExpectedOutcome::SUCCESS);
    needs_session.requires_session = true;
    TestCategory category{"s", "Session", "", {needs_session}};

    auto runner = MakeRunner("");
    auto counters = runner.Run({category});

    EXPECT_EQ(counters.failed, 1);
    EXPECT_EQ(runner.Outcomes()[0].reason, "no session");
    EXPECT_TRUE(state->calls.empty());
}

TEST_F(TestRunnerTest, TimeoutAndDisplayLimitComeFromConfig) {
    state->On("yes", Reply::Ok(std::string(500, 'y')));
    config.case_timeout = std::chrono::seconds(10);
    config.display_limit = 200;

    TestCategory category{"c", "C", "", {MakeCase("long", "yes | head -c 500", ExpectedOutcome::SUCCESS)}};
    auto runner = MakeRunner();
    runner.Run({category});

    EXPECT_EQ(state->calls[0].timeout, std::chrono::milliseconds(10000));
    EXPECT_EQ(runner.Outcomes()[0].output, std::string(200, 'y') + "...");
}

TEST_F(TestRunnerTest, ClassificationUsesUntruncatedOutput) {
    // The blocked signal sits beyond the display limit
    state->On("verbose", Reply::Ok(std::string(300, '.') + " permission denied"));
    TestCategory category{"c", "C", "", {MakeCase("late", "verbose", ExpectedOutcome::BLOCKED)}};

    auto runner = MakeRunner();
    auto counters = runner.Run({category});

    EXPECT_EQ(counters.passed, 1);
    EXPECT_EQ(runner.Outcomes()[0].output.size(), 203u);
}

TEST_F(TestRunnerTest, ReasonsDescribeTheVerdict) {
    state->On("fail-cmd", Reply::Exit(2));
    state->On("empty-cmd", Reply::Ok(""));

    auto needs_output = MakeCase("api", "empty-cmd", ExpectedOutcome::SUCCESS);
    needs_output.require_output = true;
    TestCategory category{"c", "C", "", {
        MakeCase("ok", "true", ExpectedOutcome::SUCCESS),
        MakeCase("bad", "fail-cmd", ExpectedOutcome::SUCCESS),
        needs_output,
        MakeCase("refused", "fail-cmd", ExpectedOutcome::BLOCKED),
        MakeCase("info", "fail-cmd", ExpectedOutcome::UNCONSTRAINED),
    }};

    auto runner = MakeRunner();
    runner.Run({category});
    const auto& outcomes = runner.Outcomes();

    EXPECT_EQ(outcomes[0].reason, "exit code 0");
    EXPECT_EQ(outcomes[1].reason, "expected success, exit code 2");
    EXPECT_EQ(outcomes[2].reason, "expected output, got none");
    EXPECT_EQ(outcomes[2].verdict, Verdict::FAIL);
    EXPECT_EQ(outcomes[3].reason, "refused with exit code 2");
    EXPECT_EQ(outcomes[4].reason, "informational");
    EXPECT_EQ(outcomes[4].verdict, Verdict::PASS);
}

TEST_F(TestRunnerTest, SandboxExceptionBecomesError) {
    state->On("boom", Reply::Throw("exec channel closed"));
    TestCategory category{"c", "C", "", {
        MakeCase("boom", "boom", ExpectedOutcome::SUCCESS),
        MakeCase("after", "true", ExpectedOutcome::SUCCESS),
    }};

    auto runner = MakeRunner();
    auto counters = runner.Run({category});

    EXPECT_EQ(counters.errors, 1);
    EXPECT_EQ(counters.passed, 1);
}

} // namespace
} // namespace sandprobe
