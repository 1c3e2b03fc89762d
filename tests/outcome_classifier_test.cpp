#include <gtest/gtest.h>

#include "sandprobe/core/outcome_classifier.hpp"

#include <stdexcept>

namespace sandprobe {
namespace {

using core::ExecutionResult;
using core::ExpectedOutcome;
using core::OutcomeClassifier;
using core::Verdict;

class OutcomeClassifierTest : public ::testing::Test {
protected:
    OutcomeClassifier classifier;
};

TEST_F(OutcomeClassifierTest, SuccessNeedsExitZero) {
    EXPECT_EQ(classifier.Classify(ExpectedOutcome::SUCCESS, ExecutionResult::Success("root", "", 0)),
              Verdict::PASS);
    EXPECT_EQ(classifier.Classify(ExpectedOutcome::SUCCESS, ExecutionResult::Success("", "oops", 1)),
              Verdict::FAIL);
}

TEST_F(OutcomeClassifierTest, SuccessIgnoresBlockedWordsInOutput) {
    auto result = ExecutionResult::Success("permission granted", "", 0);
    EXPECT_EQ(classifier.Classify(ExpectedOutcome::SUCCESS, result), Verdict::PASS);
}

TEST_F(OutcomeClassifierTest, RequireOutputRejectsEmptySuccess) {
    auto empty = ExecutionResult::Success("  \n", "", 0);
    EXPECT_EQ(classifier.Classify(ExpectedOutcome::SUCCESS, empty, true), Verdict::FAIL);
    EXPECT_EQ(classifier.Classify(ExpectedOutcome::SUCCESS, empty, false), Verdict::PASS);
    EXPECT_EQ(classifier.Classify(ExpectedOutcome::SUCCESS, ExecutionResult::Success("ok", "", 0), true),
              Verdict::PASS);
}

TEST_F(OutcomeClassifierTest, BlockedByNonZeroExit) {
    // curl against the metadata endpoint: connection refused
    auto result = ExecutionResult::Success("", "", 7);
    EXPECT_EQ(classifier.Classify(ExpectedOutcome::BLOCKED, result), Verdict::PASS);
}

TEST_F(OutcomeClassifierTest, BlockedBySignalDespiteExitZero) {
    auto result = ExecutionResult::Success("Access DENIED by policy", "", 0);
    EXPECT_EQ(classifier.Classify(ExpectedOutcome::BLOCKED, result), Verdict::PASS);

    auto http = ExecutionResult::Success("", "HTTP/1.1 400 Bad Request", 0);
    EXPECT_EQ(classifier.Classify(ExpectedOutcome::BLOCKED, http), Verdict::PASS);
}

TEST_F(OutcomeClassifierTest, BlockedFailsWhenCommandSucceededCleanly) {
    auto result = ExecutionResult::Success("uid=0(root)", "", 0);
    EXPECT_EQ(classifier.Classify(ExpectedOutcome::BLOCKED, result), Verdict::FAIL);
}

TEST_F(OutcomeClassifierTest, UnconstrainedAlwaysPasses) {
    EXPECT_EQ(classifier.Classify(ExpectedOutcome::UNCONSTRAINED, ExecutionResult::Success("", "", 0)),
              Verdict::PASS);
    EXPECT_EQ(classifier.Classify(ExpectedOutcome::UNCONSTRAINED, ExecutionResult::Success("", "", 137)),
              Verdict::PASS);
}

TEST_F(OutcomeClassifierTest, IncompleteResultIsRejected) {
    auto failed = ExecutionResult::TransportFailure("timed out");
    EXPECT_THROW(classifier.Classify(ExpectedOutcome::SUCCESS, failed), std::invalid_argument);
}

TEST_F(OutcomeClassifierTest, SignalsAreConfigurable) {
    OutcomeClassifier custom({"forbidden"});
    auto result = ExecutionResult::Success("403 Forbidden", "", 0);
    EXPECT_EQ(custom.Classify(ExpectedOutcome::BLOCKED, result), Verdict::PASS);

    auto denied = ExecutionResult::Success("denied", "", 0);
    EXPECT_EQ(custom.Classify(ExpectedOutcome::BLOCKED, denied), Verdict::FAIL);
}

TEST_F(OutcomeClassifierTest, MatchBlockedSignalReportsFirstHit) {
    EXPECT_EQ(classifier.MatchBlockedSignal("ls: /host: Not Found"), "not found");
    EXPECT_EQ(classifier.MatchBlockedSignal("everything fine"), "");
}

TEST_F(OutcomeClassifierTest, DefaultSignals) {
    auto signals = OutcomeClassifier::DefaultBlockedSignals();
    ASSERT_EQ(signals.size(), 5u);
    EXPECT_EQ(classifier.BlockedSignals(), signals);
}

} // namespace
} // namespace sandprobe
