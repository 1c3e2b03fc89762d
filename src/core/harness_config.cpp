/**
 * @file harness_config.cpp
 * @brief Harness configuration loading and validation
 *
 * @date 2025
 */

#include "sandprobe/core/harness_config.hpp"
#include "sandprobe/core/outcome_classifier.hpp"
#include "sandprobe/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace sandprobe {
namespace core {

namespace {

const json& Section(const json& document, const char* name) {
    static const json empty = json::object();
    if (!document.contains(name) || document[name].is_null()) {
        return empty;
    }
    if (!document[name].is_object()) {
        throw ConfigError(std::string("\"") + name + "\" must be an object");
    }
    return document[name];
}

std::vector<std::string> StringList(const json& section, const char* key,
                                    std::vector<std::string> fallback) {
    if (!section.contains(key)) {
        return fallback;
    }
    const auto& node = section[key];
    if (!node.is_array()) {
        throw ConfigError(std::string("\"") + key + "\" must be an array of strings");
    }
    std::vector<std::string> values;
    for (const auto& item : node) {
        if (!item.is_string()) {
            throw ConfigError(std::string("\"") + key + "\" must be an array of strings");
        }
        values.push_back(item.get<std::string>());
    }
    return values;
}

std::filesystem::path ResolvePath(const std::filesystem::path& base_dir,
                                  const std::string& value) {
    std::filesystem::path path(value);
    if (path.is_relative() && !base_dir.empty()) {
        return base_dir / path;
    }
    return path;
}

} // anonymous namespace

utils::NetworkMode ParseNetworkMode(const std::string& text) {
    auto lower = utils::StringUtils::ToLower(text);
    if (lower == "none") {
        return utils::NetworkMode::NONE;
    }
    if (lower == "host") {
        return utils::NetworkMode::HOST;
    }
    if (lower.empty() || lower == "bridge") {
        return utils::NetworkMode::BRIDGE;
    }
    return utils::NetworkMode::CUSTOM;
}

utils::ContainerRuntime ParseRuntime(const std::string& text) {
    auto lower = utils::StringUtils::ToLower(text);
    if (lower == "docker") {
        return utils::ContainerRuntime::DOCKER;
    }
    if (lower == "podman") {
        return utils::ContainerRuntime::PODMAN;
    }
    throw ConfigError("Unsupported runtime: " + text);
}

std::string ReadTextFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw ConfigError("Cannot read " + path.string());
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void HarnessConfig::ApplyStrictMode() {
    daemon.attempts = 20;
    daemon.require_body = true;
}

void HarnessConfig::LoadDocuments() {
    if (!server_config_file.empty()) {
        daemon.server_config = ReadTextFile(server_config_file);
        spdlog::debug("Server config loaded from {} ({} bytes)",
                      server_config_file.string(), daemon.server_config.size());
    }
    if (!policy_file.empty()) {
        daemon.policy = ReadTextFile(policy_file);
        spdlog::debug("Policy loaded from {} ({} bytes)",
                      policy_file.string(), daemon.policy.size());
    }
}

void HarnessConfig::Validate() const {
    if (sandbox.image.empty()) {
        throw ConfigError("sandbox.image is required");
    }
    if (sandbox.network_mode == utils::NetworkMode::CUSTOM && sandbox.network_name.empty()) {
        throw ConfigError("sandbox.network names no network");
    }
    if (sandbox.timeout.count() <= 0) {
        throw ConfigError("sandbox.timeout_seconds must be positive");
    }
    if (sandbox.create_timeout.count() <= 0) {
        throw ConfigError("sandbox.create_timeout_seconds must be positive");
    }
    if (daemon.attempts < 1) {
        throw ConfigError("daemon.attempts must be at least 1");
    }
    if (daemon.interval.count() < 0) {
        throw ConfigError("daemon.interval_ms must not be negative");
    }
    // A zero deadline would let a hung command block forever
    if (daemon.probe_timeout.count() <= 0) {
        throw ConfigError("daemon.probe_timeout_seconds must be positive");
    }
    if (daemon.shim_timeout.count() <= 0) {
        throw ConfigError("daemon.shim_timeout_seconds must be positive");
    }
    if (session.timeout.count() <= 0) {
        throw ConfigError("session.timeout_seconds must be positive");
    }
    if (daemon.server_config.empty()) {
        throw ConfigError("daemon server config is empty (set daemon.server_config_file)");
    }
    if (daemon.policy.empty()) {
        throw ConfigError("daemon policy is empty (set daemon.policy_file)");
    }
    if (execution.case_timeout.count() <= 0) {
        throw ConfigError("execution.case_timeout_seconds must be positive");
    }
    for (const auto& signal : blocked_signals) {
        if (utils::StringUtils::Trim(signal).empty()) {
            throw ConfigError("classifier.blocked_signals contains an empty signal");
        }
    }
}

HarnessConfig ParseHarnessConfig(const json& document, const std::filesystem::path& base_dir) {
    if (!document.is_object()) {
        throw ConfigError("Configuration root must be an object");
    }

    HarnessConfig config;

    try {
        // ═══════════════════════════════════════════════════════════
        // Sandbox
        // ═══════════════════════════════════════════════════════════
        const auto& sandbox = Section(document, "sandbox");
        config.sandbox.image = sandbox.value("image", config.sandbox.image);
        config.sandbox.name_prefix = sandbox.value("name_prefix", config.sandbox.name_prefix);
        config.runtime = ParseRuntime(sandbox.value("runtime", std::string("docker")));

        std::string network = sandbox.value("network", std::string("bridge"));
        config.sandbox.network_mode = ParseNetworkMode(network);
        if (config.sandbox.network_mode == utils::NetworkMode::CUSTOM) {
            config.sandbox.network_name = network;
        }

        config.sandbox.timeout = std::chrono::seconds(
            sandbox.value("timeout_seconds", static_cast<int>(config.sandbox.timeout.count())));
        config.sandbox.create_timeout = std::chrono::seconds(
            sandbox.value("create_timeout_seconds",
                          static_cast<int>(config.sandbox.create_timeout.count())));

        if (sandbox.contains("environment")) {
            config.sandbox.environment =
                sandbox["environment"].get<std::map<std::string, std::string>>();
        }

        // ═══════════════════════════════════════════════════════════
        // Daemon under test
        // ═══════════════════════════════════════════════════════════
        const auto& daemon = Section(document, "daemon");
        auto& d = config.daemon;

        if (daemon.contains("server_config_file")) {
            config.server_config_file =
                ResolvePath(base_dir, daemon["server_config_file"].get<std::string>());
        }
        if (daemon.contains("policy_file")) {
            config.policy_file = ResolvePath(base_dir, daemon["policy_file"].get<std::string>());
        }
        d.server_config = daemon.value("server_config", d.server_config);
        d.policy = daemon.value("policy", d.policy);

        d.server_config_path = daemon.value("server_config_path", d.server_config_path);
        d.policy_path = daemon.value("policy_path", d.policy_path);
        d.shim_install_command = daemon.value("shim_install_command", d.shim_install_command);
        d.shim_timeout = std::chrono::seconds(
            daemon.value("shim_timeout_seconds", static_cast<int>(d.shim_timeout.count())));
        d.launch_command = daemon.value("launch_command", d.launch_command);
        d.log_path = daemon.value("log_path", d.log_path);
        d.health_command = daemon.value("health_command", d.health_command);
        d.process_pattern = daemon.value("process_pattern", d.process_pattern);
        d.attempts = daemon.value("attempts", d.attempts);
        d.interval = std::chrono::milliseconds(
            daemon.value("interval_ms", static_cast<int>(d.interval.count())));
        d.probe_timeout = std::chrono::seconds(
            daemon.value("probe_timeout_seconds", static_cast<int>(d.probe_timeout.count())));
        d.require_body = daemon.value("require_body", d.require_body);
        d.liveness_each_attempt = daemon.value("liveness_each_attempt", d.liveness_each_attempt);
        d.log_tail_lines = daemon.value("log_tail_lines", d.log_tail_lines);

        // ═══════════════════════════════════════════════════════════
        // Session
        // ═══════════════════════════════════════════════════════════
        const auto& session = Section(document, "session");
        auto& s = config.session;
        s.enabled = session.value("enabled", s.enabled);
        s.workspace = session.value("workspace", s.workspace);
        s.create_command = session.value("create_command", s.create_command);
        s.info_command = session.value("info_command", s.info_command);
        s.timeout = std::chrono::seconds(
            session.value("timeout_seconds", static_cast<int>(s.timeout.count())));

        // ═══════════════════════════════════════════════════════════
        // Execution, classification, discovery
        // ═══════════════════════════════════════════════════════════
        const auto& execution = Section(document, "execution");
        config.execution.case_timeout = std::chrono::seconds(
            execution.value("case_timeout_seconds",
                            static_cast<int>(config.execution.case_timeout.count())));
        auto display_limit = execution.value(
            "display_limit", static_cast<long long>(config.execution.display_limit));
        if (display_limit < 0) {
            throw ConfigError("execution.display_limit must not be negative");
        }
        config.execution.display_limit = static_cast<std::size_t>(display_limit);

        const auto& classifier = Section(document, "classifier");
        config.blocked_signals = StringList(classifier, "blocked_signals",
                                            OutcomeClassifier::DefaultBlockedSignals());

        const auto& detect = Section(document, "detect");
        config.detect_commands = StringList(detect, "commands", config.detect_commands);

        config.suite = ParseTestSuite(document.contains("categories")
                                          ? document["categories"] : json());

    } catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid configuration: ") + e.what());
    }

    return config;
}

HarnessConfig LoadHarnessConfig(const std::filesystem::path& path) {
    spdlog::debug("Loading configuration from {}", path.string());

    auto text = ReadTextFile(path);

    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigError(path.string() + ": " + e.what());
    }

    auto config = ParseHarnessConfig(document, path.parent_path());

    spdlog::debug("Configuration: image={}, {} categories, {} cases",
                  config.sandbox.image, config.suite.categories.size(),
                  config.suite.CaseCount());
    return config;
}

} // namespace core
} // namespace sandprobe
