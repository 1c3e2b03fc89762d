/**
 * @file outcome_classifier.hpp
 * @brief Pass/fail decision for a completed probe against its expectation
 *
 * **Rules**:
 * - SUCCESS: pass iff exit code is 0
 * - BLOCKED: pass iff exit code is non-zero OR the combined output contains
 *   any blocked signal (case-insensitive). This is a deliberate union: it
 *   covers network refusal, policy denial and missing files with one rule
 *   at the cost of occasional false positives.
 * - UNCONSTRAINED: always pass
 *
 * Classification always inspects the untruncated output.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

#include "remote_executor.hpp"
#include "test_suite.hpp"

namespace sandprobe {
namespace core {

/**
 * @enum Verdict
 * @brief Per-case result; ERROR is produced by the runner, never by the classifier
 */
enum class Verdict {
    PASS,   ///< Expectation held
    FAIL,   ///< Expectation did not hold (or prerequisite missing)
    ERROR   ///< Probe could not complete (timeout, transport)
};

std::string ToString(Verdict verdict);

/**
 * @class OutcomeClassifier
 * @brief Heuristic expectation matcher with configurable blocked signals
 *
 * **Usage Example**:
 * @code
 * OutcomeClassifier classifier;   // default blocked signals
 * auto verdict = classifier.Classify(ExpectedOutcome::BLOCKED, result);
 * @endcode
 */
class OutcomeClassifier {
public:
    /**
     * @brief Default signals: blocked, denied, permission, 400, not found
     */
    static std::vector<std::string> DefaultBlockedSignals();

    OutcomeClassifier();
    explicit OutcomeClassifier(std::vector<std::string> blocked_signals);

    /**
     * @brief Classify a completed result
     * @param expected Declared expectation
     * @param result Completed execution (exit code present)
     * @param require_output SUCCESS additionally needs non-empty output
     * @return PASS or FAIL
     * @throws std::invalid_argument if result did not complete
     */
    Verdict Classify(ExpectedOutcome expected,
                     const ExecutionResult& result,
                     bool require_output = false) const;

    /**
     * @brief First blocked signal found in text, empty if none
     */
    std::string MatchBlockedSignal(const std::string& text) const;

    const std::vector<std::string>& BlockedSignals() const { return blocked_signals_; }

private:
    std::vector<std::string> blocked_signals_;
};

} // namespace core
} // namespace sandprobe
