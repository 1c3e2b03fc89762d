/**
 * @file test_suite.hpp
 * @brief Declarative probe battery: categories of test cases
 *
 * Test content is data. A suite is an ordered list of categories, each an
 * ordered list of cases; declaration order is execution and report order.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace sandprobe {
namespace core {

/**
 * @enum ExpectedOutcome
 * @brief What the case author expects the probe to do
 */
enum class ExpectedOutcome {
    SUCCESS,        ///< Probe must exit 0
    BLOCKED,        ///< Probe must be refused (non-zero exit or blocked signal)
    UNCONSTRAINED   ///< Informational, always passes
};

/**
 * @brief "success" / "blocked" / anything else
 */
ExpectedOutcome ParseExpectedOutcome(const std::string& text);
std::string ToString(ExpectedOutcome expected);

/**
 * @struct TestCase
 * @brief One shell probe
 */
struct TestCase {
    std::string name;                                   ///< Display name
    std::string command;                                ///< Shell text; may use {session_id} (inserted shell-quoted)
    ExpectedOutcome expected{ExpectedOutcome::UNCONSTRAINED};  ///< Declared intent
    std::string description;                            ///< What the probe demonstrates
    bool requires_session{false};                       ///< Needs a daemon session
    bool require_output{false};                         ///< SUCCESS also needs non-empty output
};

/**
 * @struct TestCategory
 * @brief Named group of cases for one security domain
 */
struct TestCategory {
    std::string key;                ///< Stable identifier
    std::string title;              ///< Display title
    std::string description;        ///< Display description
    std::vector<TestCase> tests;    ///< Cases in execution order
};

/**
 * @struct TestSuite
 * @brief Ordered categories
 */
struct TestSuite {
    std::vector<TestCategory> categories;

    std::size_t CaseCount() const;
};

/**
 * @brief Build a suite from the "categories" array of a config document
 * @throws ConfigError on malformed entries
 */
TestSuite ParseTestSuite(const nlohmann::json& categories);

} // namespace core
} // namespace sandprobe
