/**
 * @file docker_sandbox.hpp
 * @brief Container-backed sandbox provider
 *
 * Provisions the sandbox as a detached container whose entrypoint sleeps for
 * the sandbox lifetime. Commands are run with `exec`, the daemon under test is
 * launched with `exec -d`, and termination is a forced removal.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <chrono>

#include "sandbox.hpp"
#include "sandprobe/utils/container_utils.hpp"

namespace sandprobe {
namespace core {

/**
 * @class DockerSandbox
 * @brief Sandbox bound to one container
 */
class DockerSandbox : public Sandbox {
public:
    DockerSandbox(std::shared_ptr<utils::ContainerUtils> containers,
                  std::string container_id,
                  std::string name);
    ~DockerSandbox() override;

    const std::string& Id() const override { return container_id_; }
    const std::string& Name() const { return name_; }

    SandboxExecOutput Exec(const std::vector<std::string>& argv,
                           std::chrono::milliseconds timeout) override;

    bool Spawn(const std::vector<std::string>& argv) override;

    bool Terminate() override;

private:
    std::shared_ptr<utils::ContainerUtils> containers_;
    std::string container_id_;
    std::string name_;
    bool terminated_{false};
};

/**
 * @class DockerSandboxProvider
 * @brief Creates DockerSandbox instances through the runtime CLI
 *
 * **Usage Example**:
 * @code
 * DockerSandboxProvider provider(utils::ContainerRuntime::DOCKER);
 * SandboxSpec spec;
 * spec.image = "sandprobe/agentsh:latest";
 * auto sandbox = provider.Create(spec);   // throws ProvisioningError
 * auto out = sandbox->Exec({"bash", "-c", "id"}, std::chrono::seconds(30));
 * sandbox->Terminate();
 * @endcode
 */
class DockerSandboxProvider : public SandboxProvider {
public:
    explicit DockerSandboxProvider(utils::ContainerRuntime runtime = utils::ContainerRuntime::DOCKER);

    std::unique_ptr<Sandbox> Create(const SandboxSpec& spec) override;

    std::string Name() const override;

    /**
     * @brief Unique sandbox name: <prefix>-<YYYYmmdd-HHMMSS>-<4 digits>
     */
    static std::string GenerateSandboxName(const std::string& prefix);

private:
    utils::ContainerRuntime runtime_;
};

} // namespace core
} // namespace sandprobe
