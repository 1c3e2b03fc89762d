/**
 * @file container_utils.hpp
 * @brief Container runtime CLI wrapper used as the sandbox provider backend
 *
 * Wraps the docker (or podman) command-line client: container creation,
 * command execution with deadlines, liveness inspection and forced removal.
 * All calls go through utils::ProcessUtils so every runtime invocation is
 * bounded in time.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <chrono>

namespace sandprobe {
namespace utils {

/**
 * @enum ContainerRuntime
 * @brief Supported container runtime engines (CLI compatible)
 */
enum class ContainerRuntime {
    DOCKER,          ///< Docker Engine
    PODMAN           ///< Podman (daemonless, docker-compatible CLI)
};

/**
 * @enum NetworkMode
 * @brief Container network modes
 */
enum class NetworkMode {
    NONE,        ///< No network access
    BRIDGE,      ///< Default bridge network
    HOST,        ///< Host network
    CUSTOM       ///< Named network (network_name)
};

/**
 * @struct ContainerConfig
 * @brief Container creation parameters
 */
struct ContainerConfig {
    std::string name;                                     ///< Container name
    std::string image;                                    ///< Image reference
    NetworkMode network_mode{NetworkMode::BRIDGE};        ///< Network mode
    std::string network_name;                             ///< Network name for CUSTOM
    std::map<std::string, std::string> environment_vars;  ///< Environment variables
    std::vector<std::string> command;                     ///< Entrypoint arguments
    bool auto_remove{true};                               ///< --rm
};

/**
 * @struct ContainerExecResult
 * @brief Result of a runtime CLI invocation
 */
struct ContainerExecResult {
    int exit_code{0};                        ///< Exit code of the runtime client
    std::string stdout_output;               ///< Standard output
    std::string stderr_output;               ///< Standard error
    std::chrono::milliseconds duration{0};   ///< Execution duration
    bool timed_out{false};                   ///< Deadline reached, client was killed
    std::optional<std::string> runtime_error;  ///< Client could not run or runtime rejected the call
    bool success{false};                     ///< exit_code == 0 and no runtime error
};

/**
 * @class ContainerUtils
 * @brief docker/podman lifecycle and exec wrapper
 *
 * **Usage Example**:
 * @code
 * ContainerUtils utils(ContainerRuntime::DOCKER);
 *
 * ContainerConfig config;
 * config.name = "sandprobe-1234";
 * config.image = "debian:bookworm-slim";
 * config.command = {"sleep", "1800"};
 *
 * std::string container_id = utils.CreateContainer(config);
 * auto result = utils.ExecuteCommand(container_id, {"bash", "-c", "id"},
 *                                    std::chrono::seconds(30));
 * utils.RemoveContainer(container_id, true);
 * @endcode
 */
class ContainerUtils {
public:
    /**
     * @brief Construct container utilities for specific runtime
     * @param runtime Container runtime to use
     */
    explicit ContainerUtils(ContainerRuntime runtime = ContainerRuntime::DOCKER);

    ~ContainerUtils();

    /**
     * @brief Check if container runtime CLI is available and answers
     * @param runtime Runtime to check
     * @return true if `<runtime> --version` succeeds
     */
    static bool IsRuntimeAvailable(ContainerRuntime runtime = ContainerRuntime::DOCKER);

    /**
     * @brief Get runtime version string
     * @param runtime Runtime to query
     * @return Version string (x.y.z) or "unknown"
     */
    static std::string GetRuntimeVersion(ContainerRuntime runtime = ContainerRuntime::DOCKER);

    /**
     * @brief Runtime CLI binary name
     */
    static std::string RuntimeBinary(ContainerRuntime runtime);

    /**
     * @brief Create and start a detached container
     * @param config Container configuration
     * @param timeout Deadline for the create call (image pull included)
     * @return Container ID, empty on failure (see LastError())
     */
    std::string CreateContainer(const ContainerConfig& config,
                                std::chrono::seconds timeout = std::chrono::seconds(300));

    /**
     * @brief Remove container
     * @param container_id Container ID or name
     * @param force Kill a running container before removal
     * @return true if removed successfully (or already gone)
     */
    bool RemoveContainer(const std::string& container_id, bool force = true);

    /**
     * @brief Whether inspect reports the container as running
     * @param container_id Container ID
     * @return false when stopped, gone, or the runtime does not answer
     */
    bool IsContainerRunning(const std::string& container_id);

    /**
     * @brief Execute command in container
     * @param container_id Container ID
     * @param command Command argv
     * @param timeout Deadline, zero for none
     * @param detached Run with `exec -d` (returns as soon as the process started)
     * @return Execution result; runtime_error is set only for client spawn
     *         failures, timeouts, and runtime errors confirmed by inspect
     */
    ContainerExecResult ExecuteCommand(const std::string& container_id,
                                       const std::vector<std::string>& command,
                                       std::chrono::milliseconds timeout,
                                       bool detached = false);

    /**
     * @brief Build the `run` argument list for a configuration
     */
    static std::vector<std::string> BuildRunCommand(const ContainerConfig& config);

    /**
     * @brief Whether an exec result looks like a runtime-side failure
     *
     * `docker exec` forwards the exit code of the executed command, so this
     * is only a suspicion; ExecuteCommand confirms it with inspect.
     */
    static bool IsRuntimeFailure(int exit_code, const std::string& stderr_output);

    /**
     * @brief Last error message recorded by a failed call
     */
    const std::string& LastError() const { return last_error_; }

    ContainerRuntime Runtime() const { return runtime_; }

private:
    ContainerExecResult ExecuteRuntimeCommand(const std::vector<std::string>& args,
                                              std::chrono::milliseconds timeout) const;

    ContainerRuntime runtime_;
    std::string last_error_;
};

} // namespace utils
} // namespace sandprobe
