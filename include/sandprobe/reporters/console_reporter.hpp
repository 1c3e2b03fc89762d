/**
 * @file console_reporter.hpp
 * @brief Human-readable progress and summary on a text stream
 *
 * ConsoleReporter renders while the run is in progress: a banner per
 * category, a block per case (description, command, output, exit code,
 * verdict) and the final counters.
 *
 * **Case block**:
 * @code
 * [TEST] AWS metadata blocked
 *        Cloud metadata access is refused
 *        Command: curl -s --connect-timeout 2 http://169.254.169.254/latest/meta-da...
 *        Output: (no output)
 *        Exit code: 7
 *        Result: [PASS]
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "sandprobe/core/test_runner.hpp"
#include "sandprobe/core/readiness_poller.hpp"
#include "sandprobe/core/harness.hpp"

namespace sandprobe {
namespace reporters {

/**
 * @class ConsoleReporter
 * @brief Streams run progress and the final summary
 */
class ConsoleReporter : public core::CaseObserver {
public:
    explicit ConsoleReporter(std::ostream& out);

    // core::CaseObserver
    void OnCategoryStart(const core::TestCategory& category) override;
    void OnCaseStart(const core::TestCategory& category, const core::TestCase& test_case) override;
    void OnCaseFinished(const core::TestCase& test_case, const core::CaseOutcome& outcome) override;

    /**
     * @brief Daemon bring-up result
     */
    void PrintReadiness(const core::ReadinessReport& report);

    /**
     * @brief Final counters; always printed once the runner has started
     */
    void PrintSummary(const core::RunCounters& counters);

    /**
     * @brief Loaded suite without running it
     */
    void PrintSuite(const core::TestSuite& suite);

    /**
     * @brief Discovery command outputs
     */
    void PrintDetect(const std::vector<core::DetectEntry>& entries);

    /**
     * @brief Command shortened for display (60 characters, then "...")
     */
    static std::string AbbreviateCommand(const std::string& command);

private:
    void PrintBanner(const std::string& title, const std::string& subtitle = "");

    std::ostream& out_;
};

} // namespace reporters
} // namespace sandprobe
