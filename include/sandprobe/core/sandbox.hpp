/**
 * @file sandbox.hpp
 * @brief Sandbox provider capability: create, exec, spawn, terminate
 *
 * The harness treats the isolated execution environment as an opaque
 * capability. A SandboxProvider creates one Sandbox per run; the Sandbox runs
 * argv vectors inside the environment and can be terminated. Concrete
 * providers (see docker_sandbox.hpp) map this onto a container runtime.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <chrono>
#include <stdexcept>

#include "sandprobe/utils/container_utils.hpp"

namespace sandprobe {
namespace core {

/**
 * @class ProvisioningError
 * @brief Sandbox could not be created; the only error that aborts a run
 */
class ProvisioningError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @struct SandboxSpec
 * @brief What to provision
 */
struct SandboxSpec {
    std::string image;                                   ///< Execution image reference
    std::string name_prefix{"sandprobe"};                ///< Prefix of the generated sandbox name
    utils::NetworkMode network_mode{utils::NetworkMode::BRIDGE};  ///< Network mode
    std::string network_name;                            ///< Named network (CUSTOM mode)
    std::map<std::string, std::string> environment;      ///< Environment for every process
    std::chrono::seconds timeout{1800};                  ///< Sandbox lifetime (30 min)
    std::chrono::seconds create_timeout{300};            ///< Deadline of the create call itself
};

/**
 * @struct SandboxExecOutput
 * @brief Raw outcome of one process run inside the sandbox
 */
struct SandboxExecOutput {
    int exit_code{-1};                       ///< Exit code of the process
    std::string stdout_output;               ///< Standard output
    std::string stderr_output;               ///< Standard error
    std::optional<std::string> error;        ///< Transport failure or timeout, exit_code meaningless
    std::chrono::milliseconds duration{0};   ///< Wall-clock time
};

/**
 * @class Sandbox
 * @brief One live isolated execution environment
 */
class Sandbox {
public:
    virtual ~Sandbox() = default;

    /**
     * @brief Opaque identifier of the environment
     */
    virtual const std::string& Id() const = 0;

    /**
     * @brief Run argv inside the sandbox and wait for it
     * @param argv Program and arguments
     * @param timeout Deadline for this call
     * @return Captured output; error is set on timeout or transport failure
     */
    virtual SandboxExecOutput Exec(const std::vector<std::string>& argv,
                                   std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Start argv inside the sandbox without waiting for it
     * @return true if the start request was accepted
     */
    virtual bool Spawn(const std::vector<std::string>& argv) = 0;

    /**
     * @brief Destroy the environment
     * @return true if the provider confirmed termination
     */
    virtual bool Terminate() = 0;
};

/**
 * @class SandboxProvider
 * @brief Factory for sandboxes
 */
class SandboxProvider {
public:
    virtual ~SandboxProvider() = default;

    /**
     * @brief Provision a sandbox
     *
     * Implementations remove any partially created resource before throwing.
     *
     * @throws ProvisioningError if the sandbox cannot be created
     */
    virtual std::unique_ptr<Sandbox> Create(const SandboxSpec& spec) = 0;

    /**
     * @brief Provider name for logs
     */
    virtual std::string Name() const = 0;
};

} // namespace core
} // namespace sandprobe
