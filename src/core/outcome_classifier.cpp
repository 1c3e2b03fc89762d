/**
 * @file outcome_classifier.cpp
 * @brief Implementation of expectation matching
 *
 * @date 2025
 */

#include "sandprobe/core/outcome_classifier.hpp"
#include "sandprobe/utils/string_utils.hpp"

#include <stdexcept>

namespace sandprobe {
namespace core {

using utils::StringUtils;

std::string ToString(Verdict verdict) {
    switch (verdict) {
        case Verdict::PASS:  return "PASS";
        case Verdict::FAIL:  return "FAIL";
        case Verdict::ERROR: return "ERROR";
    }
    return "ERROR";
}

std::vector<std::string> OutcomeClassifier::DefaultBlockedSignals() {
    return {"blocked", "denied", "permission", "400", "not found"};
}

OutcomeClassifier::OutcomeClassifier()
    : blocked_signals_(DefaultBlockedSignals()) {
}

OutcomeClassifier::OutcomeClassifier(std::vector<std::string> blocked_signals)
    : blocked_signals_(std::move(blocked_signals)) {
}

Verdict OutcomeClassifier::Classify(ExpectedOutcome expected,
                                    const ExecutionResult& result,
                                    bool require_output) const {
    if (!result.Completed()) {
        throw std::invalid_argument("cannot classify an incomplete execution: " +
                                    result.transport_error.value_or("no exit code"));
    }

    const int exit_code = *result.exit_code;

    switch (expected) {
        case ExpectedOutcome::SUCCESS: {
            bool passed = exit_code == 0;
            if (passed && require_output) {
                passed = !result.CombinedOutput().empty();
            }
            return passed ? Verdict::PASS : Verdict::FAIL;
        }
        case ExpectedOutcome::BLOCKED: {
            if (exit_code != 0) {
                return Verdict::PASS;
            }
            return MatchBlockedSignal(result.stdout_output + result.stderr_output).empty()
                ? Verdict::FAIL : Verdict::PASS;
        }
        case ExpectedOutcome::UNCONSTRAINED:
            return Verdict::PASS;
    }
    return Verdict::FAIL;
}

std::string OutcomeClassifier::MatchBlockedSignal(const std::string& text) const {
    for (const auto& signal : blocked_signals_) {
        if (!signal.empty() && StringUtils::ContainsIgnoreCase(text, signal)) {
            return signal;
        }
    }
    return "";
}

} // namespace core
} // namespace sandprobe
