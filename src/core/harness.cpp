/**
 * @file harness.cpp
 * @brief Run orchestration
 *
 * @date 2025
 */

#include "sandprobe/core/harness.hpp"
#include "sandprobe/core/sandbox_lifecycle.hpp"
#include "sandprobe/core/session_client.hpp"
#include "sandprobe/core/outcome_classifier.hpp"
#include "sandprobe/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

namespace sandprobe {
namespace core {

Harness::Harness(HarnessConfig config,
                 SandboxProvider& provider,
                 ReadinessPoller::Sleeper sleeper)
    : config_(std::move(config))
    , provider_(provider)
    , sleeper_(std::move(sleeper)) {
}

HarnessResult Harness::Run() {
    auto start = std::chrono::steady_clock::now();
    HarnessResult result;

    // ═══════════════════════════════════════════════════════════
    // PHASE 1: Provision
    // ═══════════════════════════════════════════════════════════
    SandboxLifecycle lifecycle(provider_);
    Sandbox& sandbox = lifecycle.Create(config_.sandbox);
    result.sandbox_id = lifecycle.SandboxId();

    // ═══════════════════════════════════════════════════════════
    // PHASE 2: Daemon bring-up
    // ═══════════════════════════════════════════════════════════
    ReadinessPoller poller(config_.daemon, sleeper_);
    result.readiness = poller.StartAndWaitReady(sandbox);

    if (result.readiness.ready) {
        spdlog::info("[DAEMON] Ready after {} attempt(s)", result.readiness.attempts);
    } else {
        spdlog::warn("[DAEMON] Not ready after {} attempt(s), continuing degraded",
                     result.readiness.attempts);
        if (!result.readiness.log_tail.empty()) {
            spdlog::warn("[DAEMON] Log tail:\n{}", result.readiness.log_tail);
        }
    }

    // ═══════════════════════════════════════════════════════════
    // PHASE 3: Session
    // ═══════════════════════════════════════════════════════════
    result.session_id = OpenSession(sandbox);

    // ═══════════════════════════════════════════════════════════
    // PHASE 4: Probe battery
    // ═══════════════════════════════════════════════════════════
    spdlog::info("[RUN] {} categories, {} cases",
                 config_.suite.categories.size(), config_.suite.CaseCount());

    TestRunner runner(sandbox,
                      OutcomeClassifier(config_.blocked_signals),
                      config_.execution,
                      result.session_id);
    runner.SetObserver(observer_);
    result.counters = runner.Run(config_.suite.categories);
    result.outcomes = runner.Outcomes();

    // ═══════════════════════════════════════════════════════════
    // PHASE 5: Release
    // ═══════════════════════════════════════════════════════════
    result.released = lifecycle.Terminate();
    if (!result.released) {
        spdlog::warn("[SANDBOX] Termination of {} was not confirmed", result.sandbox_id);
    }

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    return result;
}

std::string Harness::OpenSession(Sandbox& sandbox) {
    if (!config_.session.enabled) {
        spdlog::info("[SESSION] Disabled");
        return "";
    }

    SessionClient client(config_.session);
    auto session_id = client.CreateSession(sandbox);
    if (session_id.empty()) {
        spdlog::warn("[SESSION] No session, session-dependent cases will fail");
        return session_id;
    }

    spdlog::info("[SESSION] {}", session_id);

    auto info = client.GetSessionInfo(sandbox, session_id);
    if (info.Completed()) {
        spdlog::debug("[SESSION] Info: {}", info.CombinedOutput());
    } else {
        spdlog::debug("[SESSION] Info unavailable: {}", *info.transport_error);
    }
    return session_id;
}

std::vector<DetectEntry> Harness::Detect() {
    spdlog::info("[DETECT] {} discovery command(s)", config_.detect_commands.size());

    SandboxLifecycle lifecycle(provider_);
    Sandbox& sandbox = lifecycle.Create(config_.sandbox);

    RemoteExecutor executor;
    std::vector<DetectEntry> entries;
    for (const auto& command : config_.detect_commands) {
        spdlog::debug("[DETECT] {}", command);
        entries.push_back({command,
                           executor.Execute(sandbox, command, config_.execution.case_timeout)});
    }

    if (!lifecycle.Terminate()) {
        spdlog::warn("[SANDBOX] Termination of {} was not confirmed", lifecycle.SandboxId());
    }
    return entries;
}

} // namespace core
} // namespace sandprobe
