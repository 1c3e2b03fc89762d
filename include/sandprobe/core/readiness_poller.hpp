/**
 * @file readiness_poller.hpp
 * @brief Daemon configuration, launch and bounded readiness polling
 *
 * Brings the daemon under test up inside the sandbox:
 * 1. Write the server config and policy documents to their sandbox paths
 * 2. Optionally run the shell-shim installer
 * 3. Launch the daemon detached, output redirected to its log file
 * 4. Probe the health endpoint every interval, at most `attempts` times
 * 5. On exhaustion, check the daemon process and fetch its log tail
 *
 * The poller never re-launches the daemon and never fails the run: a daemon
 * that does not come up is reported, and the daemon-dependent probes fail
 * on their own downstream.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <optional>
#include <chrono>
#include <functional>

#include "sandbox.hpp"
#include "remote_executor.hpp"

namespace sandprobe {
namespace core {

/**
 * @struct DaemonConfig
 * @brief Where and how the daemon under test is set up
 *
 * Document contents are opaque text passed through verbatim. The launch
 * command may reference the config path as {config_path}.
 */
struct DaemonConfig {
    // Configuration documents
    std::string server_config;                                    ///< Server config content
    std::string policy;                                           ///< Policy document content
    std::string server_config_path{"/etc/agentsh/config.yaml"};   ///< Sandbox path of server config
    std::string policy_path{"/etc/agentsh/policies/default.yaml"};  ///< Sandbox path of policy

    // Optional shell shim installation
    std::string shim_install_command;                             ///< Empty to skip
    std::chrono::seconds shim_timeout{60};                        ///< Installer deadline

    // Launch
    std::string launch_command{"agentsh server --config {config_path}"};  ///< Daemon command line
    std::string log_path{"/var/log/agentsh/agentsh.log"};         ///< Combined output of the daemon

    // Readiness
    std::string health_command{"curl -s http://127.0.0.1:18080/health 2>&1"};  ///< Health probe
    std::string process_pattern{"agentsh server"};                ///< pgrep -f pattern
    int attempts{10};                                             ///< Probe budget (10 light, 20 strict)
    std::chrono::milliseconds interval{1000};                     ///< Sleep before every probe
    std::chrono::seconds probe_timeout{5};                        ///< Deadline of one probe
    bool require_body{false};                                     ///< Strict: health output must be non-empty
    bool liveness_each_attempt{false};                            ///< Stop early once the daemon died
    int log_tail_lines{20};                                       ///< Log lines fetched for diagnosis
};

/**
 * @struct ReadinessReport
 * @brief Outcome of StartAndWaitReady
 */
struct ReadinessReport {
    bool ready{false};                       ///< Health probe succeeded
    int attempts{0};                         ///< Probes issued
    bool config_written{false};              ///< Both documents written
    bool launched{false};                    ///< Launch request accepted
    std::optional<bool> daemon_alive;        ///< Process lookup result (checked only when not ready)
    std::string health_output;               ///< Output of the last probe
    std::string log_tail;                    ///< Daemon log tail (when found dead)
    std::chrono::milliseconds elapsed{0};    ///< Time spent polling
};

/**
 * @class ReadinessPoller
 * @brief Sets up the daemon and waits for it with bounded retry
 *
 * **Usage Example**:
 * @code
 * ReadinessPoller poller(daemon_config);
 * auto report = poller.StartAndWaitReady(sandbox);
 * if (!report.ready) {
 *     spdlog::warn("daemon not ready:\n{}", report.log_tail);
 * }
 * @endcode
 */
class ReadinessPoller {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    /**
     * @param config Daemon setup
     * @param sleeper Wait primitive between probes (std::this_thread::sleep_for by default)
     */
    explicit ReadinessPoller(DaemonConfig config, Sleeper sleeper = Sleeper());

    /**
     * @brief Configure, launch, then poll until ready or out of attempts
     */
    ReadinessReport StartAndWaitReady(Sandbox& sandbox);

    /**
     * @brief Write server config and policy documents
     * @return true if both writes completed
     */
    bool WriteConfiguration(Sandbox& sandbox);

    /**
     * @brief Run the shell-shim installer if one is configured
     * @return true if skipped or it exited 0
     */
    bool InstallShim(Sandbox& sandbox);

    /**
     * @brief Launch the daemon in the background (fire-and-forget)
     */
    bool LaunchDaemon(Sandbox& sandbox);

    /**
     * @brief Polling phase only; fills ready/attempts/health/liveness/log fields
     */
    void WaitReady(Sandbox& sandbox, ReadinessReport& report);

    /**
     * @brief Process lookup for the daemon
     * @return true/false, empty if the lookup itself could not complete
     */
    std::optional<bool> IsDaemonAlive(Sandbox& sandbox);

    /**
     * @brief Last log_tail_lines lines of the daemon log
     */
    std::string FetchLogTail(Sandbox& sandbox);

    /**
     * @brief Whether one health probe counts as ready
     */
    bool IsHealthy(const ExecutionResult& probe) const;

    /**
     * @brief pgrep command that cannot match its own shell
     *
     * The first alphanumeric character of the pattern is bracketed
     * ("agentsh" -> "[a]gentsh"), so the regex still matches the daemon
     * while the probing shell's own command line does not.
     */
    static std::string BuildLivenessCommand(const std::string& pattern);

    /**
     * @brief Detached launch script for the daemon
     */
    std::string BuildLaunchCommand() const;

    const DaemonConfig& Config() const { return config_; }

private:
    DaemonConfig config_;
    Sleeper sleeper_;
    RemoteExecutor executor_;
};

} // namespace core
} // namespace sandprobe
