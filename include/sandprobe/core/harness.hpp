/**
 * @file harness.hpp
 * @brief Run orchestration: provision, bring up the daemon, probe, release
 *
 * Harness wires the components of a run in their fixed order:
 *
 * 1. SandboxLifecycle provisions the sandbox (fatal on failure)
 * 2. ReadinessPoller writes configuration, launches and polls the daemon
 * 3. SessionClient opens a session (optional, degrades to no session)
 * 4. TestRunner executes the probe battery through the observer
 * 5. SandboxLifecycle releases the sandbox
 *
 * Only provisioning throws. A daemon that never becomes ready, a missing
 * session or individual probe errors degrade the run but never abort it.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

#include "harness_config.hpp"
#include "readiness_poller.hpp"
#include "remote_executor.hpp"
#include "sandbox.hpp"
#include "test_runner.hpp"

namespace sandprobe {
namespace core {

/**
 * @struct HarnessResult
 * @brief Everything a finished run produced
 */
struct HarnessResult {
    std::string sandbox_id;                  ///< Provisioned sandbox
    ReadinessReport readiness;               ///< Daemon bring-up report
    std::string session_id;                  ///< Empty when no session was opened
    RunCounters counters;                    ///< Final verdict counters
    std::vector<CaseOutcome> outcomes;       ///< Per-case outcomes in run order
    bool released{false};                    ///< Provider confirmed termination
    std::chrono::milliseconds duration{0};   ///< Whole run
};

/**
 * @struct DetectEntry
 * @brief One discovery command and what it printed
 */
struct DetectEntry {
    std::string command;
    ExecutionResult result;
};

/**
 * @class Harness
 * @brief Drives one run against one sandbox
 */
class Harness {
public:
    /**
     * @param config Loaded configuration (documents already read)
     * @param provider Sandbox provider
     * @param sleeper Wait primitive for the readiness poller
     */
    Harness(HarnessConfig config,
            SandboxProvider& provider,
            ReadinessPoller::Sleeper sleeper = ReadinessPoller::Sleeper());

    /**
     * @brief Progress callbacks for categories and cases
     */
    void SetObserver(CaseObserver* observer) { observer_ = observer; }

    /**
     * @brief Execute the full run
     * @throws ProvisioningError if the sandbox cannot be created
     */
    HarnessResult Run();

    /**
     * @brief Provision a sandbox and run the discovery commands
     * @throws ProvisioningError if the sandbox cannot be created
     */
    std::vector<DetectEntry> Detect();

    const HarnessConfig& Config() const { return config_; }

private:
    std::string OpenSession(Sandbox& sandbox);

    HarnessConfig config_;
    SandboxProvider& provider_;
    ReadinessPoller::Sleeper sleeper_;
    CaseObserver* observer_{nullptr};
};

} // namespace core
} // namespace sandprobe
