/**
 * @file sandbox_lifecycle.hpp
 * @brief Single-owner sandbox lifecycle with guaranteed release
 *
 * SandboxLifecycle owns the one sandbox of a run. Create() provisions it,
 * Terminate() releases it, and the destructor releases it on every exit path
 * that skipped an explicit Terminate() (failed runs, exceptions). No other
 * component can terminate the sandbox: they only receive Sandbox&.
 *
 * ```
 * UNINITIALIZED -> PROVISIONING -> READY -> TERMINATING -> TERMINATED
 *                       |
 *                       +-> FAILED (ProvisioningError rethrown)
 * ```
 *
 * @date 2025
 */

#pragma once

#include <memory>
#include <string>

#include "sandbox.hpp"

namespace sandprobe {
namespace core {

/**
 * @enum SandboxState
 * @brief Lifecycle state of the run's sandbox
 */
enum class SandboxState {
    UNINITIALIZED,  ///< Nothing provisioned yet
    PROVISIONING,   ///< Provider call in flight
    READY,          ///< Sandbox live, work may proceed
    TERMINATING,    ///< Release in flight
    TERMINATED,     ///< Released
    FAILED          ///< Provisioning failed, nothing to release
};

std::string ToString(SandboxState state);

/**
 * @class SandboxLifecycle
 * @brief RAII owner of the run's sandbox
 *
 * **Usage Example**:
 * @code
 * SandboxLifecycle lifecycle(provider);
 * Sandbox& sandbox = lifecycle.Create(spec);   // throws ProvisioningError
 * ... use sandbox ...
 * lifecycle.Terminate();                       // or let the destructor do it
 * @endcode
 */
class SandboxLifecycle {
public:
    explicit SandboxLifecycle(SandboxProvider& provider);
    ~SandboxLifecycle();

    SandboxLifecycle(const SandboxLifecycle&) = delete;
    SandboxLifecycle& operator=(const SandboxLifecycle&) = delete;

    /**
     * @brief Provision the sandbox (UNINITIALIZED -> READY)
     * @return Reference valid until Terminate()
     * @throws ProvisioningError if the provider fails
     * @throws std::logic_error if called twice
     */
    Sandbox& Create(const SandboxSpec& spec);

    /**
     * @brief Release the sandbox (READY -> TERMINATED); no-op in other states
     * @return false if the provider reported a failed termination
     */
    bool Terminate();

    SandboxState State() const { return state_; }

    /**
     * @brief Live sandbox, nullptr outside READY
     */
    Sandbox* Get() const;

    /**
     * @brief Identifier of the provisioned sandbox (kept after termination)
     */
    const std::string& SandboxId() const { return sandbox_id_; }

private:
    SandboxProvider& provider_;
    std::unique_ptr<Sandbox> sandbox_;
    SandboxState state_{SandboxState::UNINITIALIZED};
    std::string sandbox_id_;
};

} // namespace core
} // namespace sandprobe
