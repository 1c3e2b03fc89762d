/**
 * @file json_reporter.hpp
 * @brief Machine-readable run summary
 *
 * Renders a finished run as one JSON document on a stream. Nothing is
 * written to disk.
 *
 * **Document**:
 * @code
 * {
 *   "sandbox_id": "3f2a...",
 *   "session_id": "sess-...",
 *   "daemon": { "ready": true, "attempts": 2, "alive": null, "log_tail": "" },
 *   "summary": { "passed": 14, "failed": 1, "errors": 0, "total": 15 },
 *   "cases": [ { "category": "basic_ops", "name": "...", "expected": "success",
 *                "verdict": "PASS", "exit_code": 0, "reason": "exit code 0",
 *                "output": "...", "duration_ms": 41 } ]
 * }
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

#include "sandprobe/core/harness.hpp"

namespace sandprobe {
namespace reporters {

/**
 * @struct JsonReporterConfig
 * @brief Rendering options
 */
struct JsonReporterConfig {
    bool pretty_print{true};      ///< Indent the document
    int indent_size{2};           ///< Spaces per level when pretty printing
    bool include_cases{true};     ///< Emit the per-case array
    bool include_output{true};    ///< Emit truncated case output
};

/**
 * @class JsonReporter
 * @brief Builds and writes the JSON run summary
 */
class JsonReporter {
public:
    explicit JsonReporter(const JsonReporterConfig& config = JsonReporterConfig{});

    /**
     * @brief Run summary as a JSON value
     */
    nlohmann::json BuildDocument(const core::HarnessResult& result) const;

    /**
     * @brief Serialized document
     */
    std::string GenerateJsonString(const core::HarnessResult& result) const;

    /**
     * @brief Write the serialized document followed by a newline
     */
    void Write(const core::HarnessResult& result, std::ostream& out) const;

    static nlohmann::json CaseToJson(const core::CaseOutcome& outcome, bool include_output);

private:
    JsonReporterConfig config_;
};

} // namespace reporters
} // namespace sandprobe
