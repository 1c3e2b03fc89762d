/**
 * @file json_reporter.cpp
 * @brief JSON rendering of a finished run
 *
 * @date 2025
 */

#include "sandprobe/reporters/json_reporter.hpp"

using json = nlohmann::json;

namespace sandprobe {
namespace reporters {

JsonReporter::JsonReporter(const JsonReporterConfig& config)
    : config_(config) {
}

json JsonReporter::CaseToJson(const core::CaseOutcome& outcome, bool include_output) {
    json node = {
        {"category", outcome.category_key},
        {"name", outcome.name},
        {"command", outcome.command},
        {"expected", core::ToString(outcome.expected)},
        {"verdict", core::ToString(outcome.verdict)},
        {"reason", outcome.reason},
        {"duration_ms", outcome.duration.count()}
    };

    if (outcome.exit_code) {
        node["exit_code"] = *outcome.exit_code;
    } else {
        node["exit_code"] = nullptr;
    }

    if (include_output) {
        node["output"] = outcome.output;
    }
    return node;
}

json JsonReporter::BuildDocument(const core::HarnessResult& result) const {
    json doc;
    doc["sandbox_id"] = result.sandbox_id;
    doc["session_id"] = result.session_id.empty() ? json(nullptr) : json(result.session_id);
    doc["released"] = result.released;
    doc["duration_ms"] = result.duration.count();

    json daemon = {
        {"ready", result.readiness.ready},
        {"attempts", result.readiness.attempts},
        {"config_written", result.readiness.config_written},
        {"launched", result.readiness.launched},
        {"log_tail", result.readiness.log_tail}
    };
    if (result.readiness.daemon_alive.has_value()) {
        daemon["alive"] = *result.readiness.daemon_alive;
    } else {
        daemon["alive"] = nullptr;
    }
    doc["daemon"] = daemon;

    doc["summary"] = {
        {"passed", result.counters.passed},
        {"failed", result.counters.failed},
        {"errors", result.counters.errors},
        {"total", result.counters.Total()}
    };

    if (config_.include_cases) {
        json cases = json::array();
        for (const auto& outcome : result.outcomes) {
            cases.push_back(CaseToJson(outcome, config_.include_output));
        }
        doc["cases"] = cases;
    }

    return doc;
}

std::string JsonReporter::GenerateJsonString(const core::HarnessResult& result) const {
    auto doc = BuildDocument(result);
    // Invalid UTF-8 in captured output is replaced rather than thrown on
    return config_.pretty_print
        ? doc.dump(config_.indent_size, ' ', false, json::error_handler_t::replace)
        : doc.dump(-1, ' ', false, json::error_handler_t::replace);
}

void JsonReporter::Write(const core::HarnessResult& result, std::ostream& out) const {
    out << GenerateJsonString(result) << "\n";
    out.flush();
}

} // namespace reporters
} // namespace sandprobe
