/**
 * @file container_utils.cpp
 * @brief Implementation of the container runtime CLI wrapper
 *
 * **Container Lifecycle**:
 * ```
 * run -d (create + start) -> exec ... exec -> rm --force
 * ```
 *
 * The container entrypoint is a bounded `sleep`, so a container whose owner
 * died without removing it still stops on its own and `--rm` reclaims it.
 *
 * **Runtime failure detection**:
 * `exec` forwards the exit status of the process run inside the container.
 * Runtime errors show up as exit code 125 or as a client diagnostic on
 * stderr, but a command inside the sandbox can produce the same code or text
 * (a nested `docker ps`, a plain `exit 125`). Such a result only counts as a
 * runtime failure once inspect confirms the container is no longer running.
 *
 * @date 2025
 */

#include "sandprobe/utils/container_utils.hpp"
#include "sandprobe/utils/process_utils.hpp"
#include "sandprobe/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <regex>

namespace sandprobe {
namespace utils {

namespace {

// Messages the docker/podman clients print when the runtime rejects a call
const std::vector<std::string> kRuntimeErrorPrefixes = {
    "Error response from daemon",
    "Error: No such container",
    "Error: no container with name or ID",
    "Cannot connect to the Docker daemon",
    "Error: can only create exec sessions on running containers",
};

constexpr int kRuntimeReservedExitCode = 125;

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

ContainerUtils::ContainerUtils(ContainerRuntime runtime)
    : runtime_(runtime) {
    spdlog::debug("Container Utils initialized with runtime: {}", RuntimeBinary(runtime));
}

ContainerUtils::~ContainerUtils() {
    spdlog::debug("Container Utils destroyed");
}

// ============================================================================
// RUNTIME DETECTION
// ============================================================================

std::string ContainerUtils::RuntimeBinary(ContainerRuntime runtime) {
    switch (runtime) {
        case ContainerRuntime::DOCKER:
            return "docker";
        case ContainerRuntime::PODMAN:
            return "podman";
    }
    return "docker";
}

bool ContainerUtils::IsRuntimeAvailable(ContainerRuntime runtime) {
    auto binary = RuntimeBinary(runtime);
    if (!ProcessUtils::IsOnPath(binary)) {
        return false;
    }

    // Version command success indicates runtime client is usable
    auto result = ProcessUtils::Run({binary, "--version"}, std::chrono::seconds(10));
    return !result.spawn_error && !result.timed_out && result.exit_code == 0;
}

std::string ContainerUtils::GetRuntimeVersion(ContainerRuntime runtime) {
    auto result = ProcessUtils::Run({RuntimeBinary(runtime), "--version"},
                                    std::chrono::seconds(10));
    if (!result.spawn_error && result.exit_code == 0) {
        // Extract version number using regex (matches x.y.z format)
        std::regex version_regex(R"((\d+\.\d+\.\d+))");
        std::smatch match;
        if (std::regex_search(result.stdout_output, match, version_regex)) {
            return match[1].str();
        }
        return StringUtils::Trim(result.stdout_output);
    }

    return "unknown";
}

// ============================================================================
// CONTAINER CREATION
// ============================================================================

std::string ContainerUtils::CreateContainer(const ContainerConfig& config,
                                            std::chrono::seconds timeout) {
    spdlog::info("Creating container: {} (image: {})", config.name, config.image);

    if (config.image.empty()) {
        last_error_ = "container image is required";
        spdlog::error("Invalid container configuration: {}", last_error_);
        return "";
    }

    auto result = ExecuteRuntimeCommand(BuildRunCommand(config), timeout);

    if (result.success) {
        // Container ID is the only stdout line of `run -d`
        std::string container_id = StringUtils::Trim(result.stdout_output);
        auto newline = container_id.find_last_of('\n');
        if (newline != std::string::npos) {
            container_id = container_id.substr(newline + 1);
        }

        if (!container_id.empty()) {
            spdlog::info("Container created: {}", container_id.substr(0, 12));
            last_error_.clear();
            return container_id;
        }
        last_error_ = "runtime returned no container id";
    } else if (result.runtime_error) {
        last_error_ = *result.runtime_error;
    } else {
        last_error_ = StringUtils::Trim(result.stderr_output);
        if (last_error_.empty()) {
            last_error_ = "run exited with code " + std::to_string(result.exit_code);
        }
    }

    spdlog::error("Failed to create container: {}", last_error_);
    return "";
}

// ============================================================================
// CONTAINER REMOVAL
// ============================================================================

bool ContainerUtils::RemoveContainer(const std::string& container_id, bool force) {
    spdlog::info("Removing container: {} (force: {})", container_id.substr(0, 12), force);

    std::vector<std::string> args = {"rm"};
    if (force) {
        args.push_back("--force");
    }
    args.push_back(container_id);

    auto result = ExecuteRuntimeCommand(args, std::chrono::seconds(60));

    if (result.success) {
        spdlog::info("Container removed successfully");
        return true;
    }

    // Already reclaimed by --rm
    if (StringUtils::ContainsIgnoreCase(result.stderr_output, "no such container")) {
        spdlog::info("Container already removed");
        return true;
    }

    last_error_ = result.runtime_error.value_or(StringUtils::Trim(result.stderr_output));
    spdlog::error("Failed to remove container: {}", last_error_);
    return false;
}

// ============================================================================
// CONTAINER INFORMATION RETRIEVAL
// ============================================================================

bool ContainerUtils::IsContainerRunning(const std::string& container_id) {
    auto result = ExecuteRuntimeCommand({
        "inspect",
        "--format", "{{.State.Running}}",
        container_id
    }, std::chrono::seconds(15));

    return result.success && StringUtils::Trim(result.stdout_output) == "true";
}

// ============================================================================
// CONTAINER COMMAND EXECUTION
// ============================================================================

ContainerExecResult ContainerUtils::ExecuteCommand(
    const std::string& container_id,
    const std::vector<std::string>& command,
    std::chrono::milliseconds timeout,
    bool detached) {

    std::vector<std::string> args = {"exec"};

    if (detached) {
        args.push_back("-d");  // Detached mode
    } else {
        args.push_back("-i");  // Interactive mode
    }

    args.push_back(container_id);
    args.insert(args.end(), command.begin(), command.end());

    auto result = ExecuteRuntimeCommand(args, timeout);

    if (!result.runtime_error && IsRuntimeFailure(result.exit_code, result.stderr_output)) {
        if (IsContainerRunning(container_id)) {
            spdlog::debug("Exit code {} came from the command inside {}", result.exit_code,
                          container_id.substr(0, 12));
        } else {
            result.runtime_error = StringUtils::Trim(result.stderr_output);
            if (result.runtime_error->empty()) {
                result.runtime_error = "runtime exited with code " +
                    std::to_string(result.exit_code);
            }
            result.success = false;
        }
    }

    return result;
}

bool ContainerUtils::IsRuntimeFailure(int exit_code, const std::string& stderr_output) {
    if (exit_code == 0) {
        return false;
    }
    if (exit_code == kRuntimeReservedExitCode) {
        return true;
    }
    std::string trimmed = StringUtils::Trim(stderr_output);
    for (const auto& prefix : kRuntimeErrorPrefixes) {
        if (StringUtils::StartsWith(trimmed, prefix)) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// PRIVATE HELPERS
// ============================================================================

ContainerExecResult ContainerUtils::ExecuteRuntimeCommand(
    const std::vector<std::string>& args,
    std::chrono::milliseconds timeout) const {

    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(RuntimeBinary(runtime_));
    argv.insert(argv.end(), args.begin(), args.end());

    spdlog::debug("Executing: {}", ProcessUtils::FormatCommand(argv));

    auto process = ProcessUtils::Run(argv, timeout);

    ContainerExecResult exec_result;
    exec_result.exit_code = process.exit_code;
    exec_result.stdout_output = std::move(process.stdout_output);
    exec_result.stderr_output = std::move(process.stderr_output);
    exec_result.duration = process.duration;
    exec_result.timed_out = process.timed_out;

    if (process.spawn_error) {
        exec_result.runtime_error = *process.spawn_error;
    } else if (process.timed_out) {
        exec_result.runtime_error = "command timed out after " +
            std::to_string(timeout.count()) + " ms";
    }

    exec_result.success = !exec_result.runtime_error && exec_result.exit_code == 0;

    return exec_result;
}

std::vector<std::string> ContainerUtils::BuildRunCommand(const ContainerConfig& config) {
    std::vector<std::string> args;

    args.push_back("run");
    args.push_back("-d");  // Detached mode

    if (config.auto_remove) {
        args.push_back("--rm");
    }

    // Container name
    if (!config.name.empty()) {
        args.push_back("--name");
        args.push_back(config.name);
    }

    // Network mode
    switch (config.network_mode) {
        case NetworkMode::NONE:
            args.push_back("--network");
            args.push_back("none");
            break;
        case NetworkMode::BRIDGE:
            args.push_back("--network");
            args.push_back("bridge");
            break;
        case NetworkMode::HOST:
            args.push_back("--network");
            args.push_back("host");
            break;
        case NetworkMode::CUSTOM:
            if (!config.network_name.empty()) {
                args.push_back("--network");
                args.push_back(config.network_name);
            }
            break;
    }

    // Environment variables
    for (const auto& [key, value] : config.environment_vars) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }

    args.push_back(config.image);
    args.insert(args.end(), config.command.begin(), config.command.end());

    return args;
}

} // namespace utils
} // namespace sandprobe
