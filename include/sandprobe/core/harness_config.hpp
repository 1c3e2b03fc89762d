/**
 * @file harness_config.hpp
 * @brief Harness configuration model and JSON loader
 *
 * One JSON document describes a run: the sandbox to provision, how to bring
 * up the daemon under test, session commands, execution limits, classifier
 * signals, discovery commands and the probe battery itself. Every key is
 * optional; defaults reproduce the reference agentsh setup.
 *
 * **Document layout**:
 * @code
 * {
 *   "sandbox":    { "image": "...", "runtime": "docker", "network": "bridge",
 *                   "timeout_seconds": 1800, "environment": { "K": "V" } },
 *   "daemon":     { "server_config_file": "config.yaml", "policy_file": "default.yaml",
 *                   "attempts": 10, "interval_ms": 1000, "require_body": false, ... },
 *   "session":    { "enabled": true, "workspace": "/root", ... },
 *   "execution":  { "case_timeout_seconds": 30, "display_limit": 200 },
 *   "classifier": { "blocked_signals": ["blocked", "denied", ...] },
 *   "detect":     { "commands": ["agentsh --version", ...] },
 *   "categories": [ { "key": "...", "title": "...", "tests": [ ... ] } ]
 * }
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "sandbox.hpp"
#include "readiness_poller.hpp"
#include "session_client.hpp"
#include "outcome_classifier.hpp"
#include "test_runner.hpp"
#include "test_suite.hpp"
#include "sandprobe/utils/container_utils.hpp"

namespace sandprobe {
namespace core {

/**
 * @class ConfigError
 * @brief Configuration could not be loaded or is inconsistent
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @struct HarnessConfig
 * @brief Everything a run needs
 */
struct HarnessConfig {
    // Sandbox
    SandboxSpec sandbox;                                              ///< What to provision
    utils::ContainerRuntime runtime{utils::ContainerRuntime::DOCKER}; ///< Provider backend

    // Daemon under test
    DaemonConfig daemon;                          ///< Setup and readiness parameters
    std::filesystem::path server_config_file;     ///< Local source of daemon.server_config
    std::filesystem::path policy_file;            ///< Local source of daemon.policy

    // Session, execution, classification
    SessionConfig session;                        ///< Session commands
    RunnerConfig execution;                       ///< Per-case limits
    std::vector<std::string> blocked_signals{OutcomeClassifier::DefaultBlockedSignals()};  ///< Classifier signals

    // Capability discovery
    std::vector<std::string> detect_commands{
        "agentsh --version",
        "agentsh detect",
        "agentsh detect config",
    };

    // Probe battery
    TestSuite suite;

    /**
     * @brief Stricter readiness: 20 attempts and a non-empty health body
     */
    void ApplyStrictMode();

    /**
     * @brief Read server_config_file and policy_file into daemon documents
     * @throws ConfigError if a configured file cannot be read
     */
    void LoadDocuments();

    /**
     * @brief Reject values the harness cannot run with
     * @throws ConfigError describing the first problem
     */
    void Validate() const;
};

/**
 * @brief Build a configuration from a parsed document
 * @param document Parsed JSON
 * @param base_dir Directory that relative file paths are resolved against
 * @throws ConfigError on type errors or invalid values
 */
HarnessConfig ParseHarnessConfig(const nlohmann::json& document,
                                 const std::filesystem::path& base_dir);

/**
 * @brief Load a configuration file
 * @throws ConfigError if the file is missing or malformed
 */
HarnessConfig LoadHarnessConfig(const std::filesystem::path& path);

/**
 * @brief Whole file as text
 * @throws ConfigError if the file cannot be read
 */
std::string ReadTextFile(const std::filesystem::path& path);

utils::NetworkMode ParseNetworkMode(const std::string& text);
utils::ContainerRuntime ParseRuntime(const std::string& text);

} // namespace core
} // namespace sandprobe
