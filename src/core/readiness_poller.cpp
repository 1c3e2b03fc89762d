/**
 * @file readiness_poller.cpp
 * @brief Implementation of daemon setup and readiness polling
 *
 * @date 2025
 */

#include "sandprobe/core/readiness_poller.hpp"
#include "sandprobe/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <thread>

namespace sandprobe {
namespace core {

using utils::StringUtils;

ReadinessPoller::ReadinessPoller(DaemonConfig config, Sleeper sleeper)
    : config_(std::move(config))
    , sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds duration) {
            std::this_thread::sleep_for(duration);
        };
    }
}

ReadinessReport ReadinessPoller::StartAndWaitReady(Sandbox& sandbox) {
    ReadinessReport report;

    spdlog::info("    Writing configuration files...");
    report.config_written = WriteConfiguration(sandbox);
    if (!report.config_written) {
        spdlog::warn("    Configuration incomplete, daemon may fail to start");
    }

    if (!config_.shim_install_command.empty()) {
        spdlog::info("    Installing shell shim...");
        InstallShim(sandbox);
    } else {
        spdlog::info("    Skipping shell shim (not configured)");
    }

    spdlog::info("    Starting daemon...");
    report.launched = LaunchDaemon(sandbox);
    if (!report.launched) {
        spdlog::warn("    Daemon launch request was rejected");
    }

    WaitReady(sandbox, report);
    return report;
}

bool ReadinessPoller::WriteConfiguration(Sandbox& sandbox) {
    bool ok = true;

    const std::pair<const std::string*, const std::string*> documents[] = {
        {&config_.server_config_path, &config_.server_config},
        {&config_.policy_path, &config_.policy},
    };

    for (const auto& [path, content] : documents) {
        if (path->empty()) {
            continue;
        }

        auto parent = std::filesystem::path(*path).parent_path().string();
        if (!parent.empty()) {
            auto mkdir = executor_.Execute(sandbox, "mkdir -p " + StringUtils::ShellQuote(parent),
                                           std::chrono::seconds(10));
            if (!mkdir.Completed() || *mkdir.exit_code != 0) {
                spdlog::debug("mkdir -p {} did not succeed", parent);
            }
        }

        if (executor_.WriteFile(sandbox, *path, *content)) {
            spdlog::debug("    wrote {}", *path);
        } else {
            ok = false;
        }
    }

    return ok;
}

bool ReadinessPoller::InstallShim(Sandbox& sandbox) {
    if (config_.shim_install_command.empty()) {
        return true;
    }

    auto result = executor_.Execute(sandbox, config_.shim_install_command, config_.shim_timeout);
    if (!result.Completed()) {
        spdlog::warn("    Warning: shell shim installation failed: {}", *result.transport_error);
        return false;
    }
    if (*result.exit_code != 0) {
        spdlog::warn("    Warning: shell shim installation returned exit code {}", *result.exit_code);
        spdlog::warn("    stdout: {}", StringUtils::Trim(result.stdout_output));
        spdlog::warn("    stderr: {}", StringUtils::Trim(result.stderr_output));
        return false;
    }
    return true;
}

std::string ReadinessPoller::BuildLaunchCommand() const {
    std::string launch = StringUtils::Substitute(config_.launch_command,
                                                 {{"config_path", config_.server_config_path}});
    std::string log = StringUtils::ShellQuote(config_.log_path);

    std::string script;
    auto log_dir = std::filesystem::path(config_.log_path).parent_path().string();
    if (!log_dir.empty()) {
        script += "mkdir -p " + StringUtils::ShellQuote(log_dir) + "; ";
    }
    script += "nohup " + launch + " > " + log + " 2>&1 &";
    return script;
}

bool ReadinessPoller::LaunchDaemon(Sandbox& sandbox) {
    return executor_.Launch(sandbox, BuildLaunchCommand());
}

bool ReadinessPoller::IsHealthy(const ExecutionResult& probe) const {
    if (!probe.Completed() || *probe.exit_code != 0) {
        return false;
    }
    if (config_.require_body && probe.CombinedOutput().empty()) {
        return false;
    }
    return true;
}

void ReadinessPoller::WaitReady(Sandbox& sandbox, ReadinessReport& report) {
    const int max_attempts = std::max(1, config_.attempts);
    auto start_time = std::chrono::steady_clock::now();

    report.ready = false;
    report.attempts = 0;

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        sleeper_(config_.interval);

        auto probe = executor_.Execute(sandbox, config_.health_command, config_.probe_timeout);
        report.attempts = attempt;
        report.health_output = probe.Completed() ? probe.CombinedOutput()
                                                 : probe.transport_error.value_or("");

        if (IsHealthy(probe)) {
            report.ready = true;
            break;
        }

        spdlog::debug("    health probe {}/{} not ready", attempt, max_attempts);

        if (config_.liveness_each_attempt) {
            report.daemon_alive = IsDaemonAlive(sandbox);
            if (report.daemon_alive.has_value() && !*report.daemon_alive) {
                spdlog::warn("    Daemon process exited during startup");
                break;
            }
        }
    }

    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    if (report.ready) {
        spdlog::info("    Daemon health: {} (took {} attempt{})",
                     StringUtils::Truncate(report.health_output, 50),
                     report.attempts, report.attempts == 1 ? "" : "s");
        return;
    }

    // Diagnosis only, the daemon is never re-launched
    if (!report.daemon_alive.has_value() || *report.daemon_alive) {
        report.daemon_alive = IsDaemonAlive(sandbox);
    }

    if (!report.daemon_alive.value_or(false)) {
        report.log_tail = FetchLogTail(sandbox);
        spdlog::warn("    Daemon not running. Log:\n{}",
                     report.log_tail.empty() ? "(empty)" : StringUtils::Truncate(report.log_tail, 500));
    }

    spdlog::warn("    Warning: daemon may not be fully ready (health check: {})",
                 report.health_output.empty() ? "no response" : report.health_output);
}

std::string ReadinessPoller::BuildLivenessCommand(const std::string& pattern) {
    std::string guarded = pattern;
    auto it = std::find_if(guarded.begin(), guarded.end(),
                           [](unsigned char c) { return std::isalnum(c); });
    if (it != guarded.end()) {
        auto index = static_cast<std::size_t>(it - guarded.begin());
        guarded = guarded.substr(0, index) + "[" + guarded[index] + "]" + guarded.substr(index + 1);
    }
    return "pgrep -f " + StringUtils::ShellQuote(guarded) +
           " > /dev/null 2>&1 && echo running || echo 'not running'";
}

std::optional<bool> ReadinessPoller::IsDaemonAlive(Sandbox& sandbox) {
    auto result = executor_.Execute(sandbox, BuildLivenessCommand(config_.process_pattern),
                                    config_.probe_timeout);
    if (!result.Completed()) {
        spdlog::debug("    Liveness probe failed: {}", *result.transport_error);
        return std::nullopt;
    }

    auto output = StringUtils::Trim(result.stdout_output);
    if (output == "running") {
        return true;
    }
    if (output == "not running") {
        return false;
    }
    return std::nullopt;
}

std::string ReadinessPoller::FetchLogTail(Sandbox& sandbox) {
    auto result = executor_.Execute(
        sandbox,
        "tail -n " + std::to_string(std::max(1, config_.log_tail_lines)) + " " +
            StringUtils::ShellQuote(config_.log_path) + " 2>&1",
        config_.probe_timeout);

    if (!result.Completed()) {
        return "(log unavailable: " + *result.transport_error + ")";
    }
    return StringUtils::Trim(result.stdout_output + result.stderr_output);
}

} // namespace core
} // namespace sandprobe
