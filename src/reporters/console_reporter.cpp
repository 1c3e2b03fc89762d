/**
 * @file console_reporter.cpp
 * @brief Console rendering of run progress
 *
 * @date 2025
 */

#include "sandprobe/reporters/console_reporter.hpp"
#include "sandprobe/utils/string_utils.hpp"

namespace sandprobe {
namespace reporters {

namespace {

const char* kRule = "══════════════════════════════════════════════════════════════════════";
const std::string kIndent = "       ";
constexpr std::size_t kCommandWidth = 60;

} // anonymous namespace

ConsoleReporter::ConsoleReporter(std::ostream& out)
    : out_(out) {
}

std::string ConsoleReporter::AbbreviateCommand(const std::string& command) {
    return utils::StringUtils::Truncate(command, kCommandWidth);
}

void ConsoleReporter::PrintBanner(const std::string& title, const std::string& subtitle) {
    out_ << "\n" << kRule << "\n";
    out_ << "  " << title << "\n";
    if (!subtitle.empty()) {
        out_ << "  " << subtitle << "\n";
    }
    out_ << kRule << "\n";
}

void ConsoleReporter::OnCategoryStart(const core::TestCategory& category) {
    PrintBanner(category.title, category.description);
}

void ConsoleReporter::OnCaseStart(const core::TestCategory& /*category*/,
                                  const core::TestCase& test_case) {
    out_ << "\n[TEST] " << test_case.name << "\n";
    if (!test_case.description.empty()) {
        out_ << kIndent << test_case.description << "\n";
    }
    out_ << kIndent << "Command: " << AbbreviateCommand(test_case.command) << "\n";
    out_.flush();
}

void ConsoleReporter::OnCaseFinished(const core::TestCase& /*test_case*/,
                                     const core::CaseOutcome& outcome) {
    if (outcome.exit_code) {
        out_ << kIndent << "Output: "
             << (outcome.output.empty() ? "(no output)" : outcome.output) << "\n";
        out_ << kIndent << "Exit code: " << *outcome.exit_code << "\n";
    } else {
        out_ << kIndent << "Error: " << outcome.reason << "\n";
    }
    out_ << kIndent << "Result: [" << core::ToString(outcome.verdict) << "]";
    if (outcome.exit_code && !outcome.reason.empty()) {
        out_ << " (" << outcome.reason << ")";
    }
    out_ << "\n";
    out_.flush();
}

void ConsoleReporter::PrintReadiness(const core::ReadinessReport& report) {
    if (report.ready) {
        out_ << "    Daemon ready (" << report.attempts << " attempt"
             << (report.attempts == 1 ? "" : "s") << ")\n";
        return;
    }

    auto health = utils::StringUtils::Trim(report.health_output);
    out_ << "    Warning: daemon may not be fully ready (health check: "
         << (health.empty() ? "no response" : utils::StringUtils::Truncate(health, 80)) << ")\n";

    if (report.daemon_alive.has_value()) {
        out_ << "    Daemon process: " << (*report.daemon_alive ? "running" : "not running") << "\n";
    } else {
        out_ << "    Daemon process: unknown\n";
    }

    if (!report.log_tail.empty()) {
        out_ << "    Log:\n" << report.log_tail << "\n";
    }
}

void ConsoleReporter::PrintSummary(const core::RunCounters& counters) {
    PrintBanner("SUMMARY");
    out_ << "\n";
    out_ << "    Tests passed: " << counters.passed << "\n";
    out_ << "    Tests failed: " << counters.failed << "\n";
    out_ << "    Errors:       " << counters.errors << "\n";
    out_ << "    Total:        " << counters.Total() << "\n";
    out_.flush();
}

void ConsoleReporter::PrintSuite(const core::TestSuite& suite) {
    for (const auto& category : suite.categories) {
        PrintBanner(category.title + " [" + category.key + "]", category.description);
        for (const auto& test_case : category.tests) {
            out_ << "  - " << test_case.name
                 << " (expect " << core::ToString(test_case.expected);
            if (test_case.requires_session) {
                out_ << ", session";
            }
            if (test_case.require_output) {
                out_ << ", output";
            }
            out_ << ")\n";
            out_ << "      " << AbbreviateCommand(test_case.command) << "\n";
        }
    }
    out_ << "\n" << suite.categories.size() << " categories, "
         << suite.CaseCount() << " cases\n";
}

void ConsoleReporter::PrintDetect(const std::vector<core::DetectEntry>& entries) {
    for (const auto& entry : entries) {
        out_ << "\n=== " << entry.command << " ===\n";
        if (!entry.result.Completed()) {
            out_ << "error: " << *entry.result.transport_error << "\n";
            continue;
        }
        out_ << entry.result.stdout_output;
        if (!entry.result.stdout_output.empty() && entry.result.stdout_output.back() != '\n') {
            out_ << "\n";
        }
        if (!entry.result.stderr_output.empty()) {
            out_ << "stderr: " << entry.result.stderr_output;
            if (entry.result.stderr_output.back() != '\n') {
                out_ << "\n";
            }
        }
        if (*entry.result.exit_code != 0) {
            out_ << "(exit code " << *entry.result.exit_code << ")\n";
        }
    }
}

} // namespace reporters
} // namespace sandprobe
