/**
 * @file sandbox_lifecycle.cpp
 * @brief Implementation of the single-owner sandbox lifecycle
 *
 * @date 2025
 */

#include "sandprobe/core/sandbox_lifecycle.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace sandprobe {
namespace core {

std::string ToString(SandboxState state) {
    switch (state) {
        case SandboxState::UNINITIALIZED: return "uninitialized";
        case SandboxState::PROVISIONING:  return "provisioning";
        case SandboxState::READY:         return "ready";
        case SandboxState::TERMINATING:   return "terminating";
        case SandboxState::TERMINATED:    return "terminated";
        case SandboxState::FAILED:        return "failed";
    }
    return "unknown";
}

SandboxLifecycle::SandboxLifecycle(SandboxProvider& provider)
    : provider_(provider) {
}

SandboxLifecycle::~SandboxLifecycle() {
    if (state_ == SandboxState::READY) {
        spdlog::warn("[CLEANUP] Releasing sandbox {} on abnormal exit", sandbox_id_);
        Terminate();
    }
}

Sandbox& SandboxLifecycle::Create(const SandboxSpec& spec) {
    if (state_ != SandboxState::UNINITIALIZED) {
        throw std::logic_error("sandbox already created (state: " + ToString(state_) + ")");
    }

    state_ = SandboxState::PROVISIONING;
    spdlog::info("Provisioning sandbox via {} (image: {}, lifetime: {}s)",
                 provider_.Name(), spec.image, spec.timeout.count());

    try {
        sandbox_ = provider_.Create(spec);
    } catch (const ProvisioningError& e) {
        state_ = SandboxState::FAILED;
        spdlog::error("Provisioning failed: {}", e.what());
        throw;
    }

    if (!sandbox_) {
        state_ = SandboxState::FAILED;
        throw ProvisioningError("provider " + provider_.Name() + " returned no sandbox");
    }

    sandbox_id_ = sandbox_->Id();
    state_ = SandboxState::READY;
    spdlog::info("Sandbox ID: {}", sandbox_id_);

    return *sandbox_;
}

bool SandboxLifecycle::Terminate() {
    if (state_ != SandboxState::READY) {
        return true;
    }

    state_ = SandboxState::TERMINATING;
    spdlog::info("[CLEANUP] Terminating sandbox {}...", sandbox_id_);

    bool released = false;
    try {
        released = sandbox_->Terminate();
    } catch (const std::exception& e) {
        spdlog::error("Sandbox termination raised: {}", e.what());
    }

    sandbox_.reset();
    state_ = SandboxState::TERMINATED;

    if (released) {
        spdlog::info("Sandbox {} terminated.", sandbox_id_);
    } else {
        spdlog::error("Sandbox {} may still be running, remove it manually", sandbox_id_);
    }
    return released;
}

Sandbox* SandboxLifecycle::Get() const {
    return state_ == SandboxState::READY ? sandbox_.get() : nullptr;
}

} // namespace core
} // namespace sandprobe
