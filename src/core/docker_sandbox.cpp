/**
 * @file docker_sandbox.cpp
 * @brief Implementation of the container-backed sandbox provider
 *
 * @date 2025
 */

#include "sandprobe/core/docker_sandbox.hpp"

#include <spdlog/spdlog.h>

#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace sandprobe {
namespace core {

// ============================================================================
// DockerSandbox
// ============================================================================

DockerSandbox::DockerSandbox(std::shared_ptr<utils::ContainerUtils> containers,
                             std::string container_id,
                             std::string name)
    : containers_(std::move(containers))
    , container_id_(std::move(container_id))
    , name_(std::move(name)) {
}

DockerSandbox::~DockerSandbox() {
    if (!terminated_) {
        spdlog::warn("Sandbox {} destroyed without termination, removing", name_);
        Terminate();
    }
}

SandboxExecOutput DockerSandbox::Exec(const std::vector<std::string>& argv,
                                      std::chrono::milliseconds timeout) {
    SandboxExecOutput output;

    if (terminated_) {
        output.error = "sandbox " + name_ + " is terminated";
        return output;
    }

    auto result = containers_->ExecuteCommand(container_id_, argv, timeout, false);

    output.exit_code = result.exit_code;
    output.stdout_output = std::move(result.stdout_output);
    output.stderr_output = std::move(result.stderr_output);
    output.duration = result.duration;
    output.error = std::move(result.runtime_error);

    return output;
}

bool DockerSandbox::Spawn(const std::vector<std::string>& argv) {
    if (terminated_) {
        return false;
    }

    auto result = containers_->ExecuteCommand(container_id_, argv,
                                              std::chrono::seconds(30), true);
    if (!result.success) {
        spdlog::warn("Detached exec in {} failed: {}", name_,
                     result.runtime_error.value_or(result.stderr_output));
        return false;
    }
    return true;
}

bool DockerSandbox::Terminate() {
    if (terminated_) {
        return true;
    }
    terminated_ = true;
    return containers_->RemoveContainer(container_id_, true);
}

// ============================================================================
// DockerSandboxProvider
// ============================================================================

DockerSandboxProvider::DockerSandboxProvider(utils::ContainerRuntime runtime)
    : runtime_(runtime) {
}

std::string DockerSandboxProvider::Name() const {
    return utils::ContainerUtils::RuntimeBinary(runtime_);
}

std::unique_ptr<Sandbox> DockerSandboxProvider::Create(const SandboxSpec& spec) {
    if (spec.image.empty()) {
        throw ProvisioningError("no sandbox image configured");
    }

    if (!utils::ContainerUtils::IsRuntimeAvailable(runtime_)) {
        throw ProvisioningError(Name() + " is not available on PATH or not responding");
    }
    spdlog::info("Runtime: {} {}", Name(), utils::ContainerUtils::GetRuntimeVersion(runtime_));

    auto containers = std::make_shared<utils::ContainerUtils>(runtime_);

    utils::ContainerConfig config;
    config.name = GenerateSandboxName(spec.name_prefix);
    config.image = spec.image;
    config.network_mode = spec.network_mode;
    config.network_name = spec.network_name;
    config.environment_vars = spec.environment;
    config.command = {"sleep", std::to_string(spec.timeout.count())};
    config.auto_remove = true;

    std::string container_id = containers->CreateContainer(config, spec.create_timeout);

    if (container_id.empty()) {
        std::string reason = containers->LastError();
        // The create call may have timed out after the container came up
        containers->RemoveContainer(config.name, true);
        throw ProvisioningError("failed to create sandbox " + config.name + ": " + reason);
    }

    if (!containers->IsContainerRunning(container_id)) {
        containers->RemoveContainer(container_id, true);
        throw ProvisioningError("sandbox " + config.name + " is not running after creation");
    }

    return std::make_unique<DockerSandbox>(containers, container_id, config.name);
}

// Generate unique sandbox name
std::string DockerSandboxProvider::GenerateSandboxName(const std::string& prefix) {
    auto timestamp = std::time(nullptr);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(1000, 9999);

    std::ostringstream oss;
    oss << (prefix.empty() ? "sandprobe" : prefix) << "-"
        << std::put_time(std::localtime(&timestamp), "%Y%m%d-%H%M%S")
        << "-" << dis(gen);

    return oss.str();
}

} // namespace core
} // namespace sandprobe
