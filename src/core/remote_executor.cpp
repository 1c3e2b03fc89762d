/**
 * @file remote_executor.cpp
 * @brief Implementation of remote shell execution and file transfer
 *
 * @date 2025
 */

#include "sandprobe/core/remote_executor.hpp"
#include "sandprobe/utils/hash_utils.hpp"
#include "sandprobe/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

namespace sandprobe {
namespace core {

using utils::StringUtils;

namespace {

// Remote kill lands after the local deadline so a timeout is always reported
// as a transport error rather than as the wrapper's exit code.
constexpr long long kRemoteGraceSeconds = 2;

} // anonymous namespace

// ============================================================================
// ExecutionResult
// ============================================================================

std::string ExecutionResult::CombinedOutput() const {
    return StringUtils::Trim(stdout_output + stderr_output);
}

ExecutionResult ExecutionResult::Success(std::string out, std::string err, int code) {
    ExecutionResult result;
    result.stdout_output = std::move(out);
    result.stderr_output = std::move(err);
    result.exit_code = code;
    return result;
}

ExecutionResult ExecutionResult::TransportFailure(std::string cause,
                                                  std::string out,
                                                  std::string err) {
    ExecutionResult result;
    result.stdout_output = std::move(out);
    result.stderr_output = std::move(err);
    result.transport_error = cause.empty() ? std::string("unknown transport error") : std::move(cause);
    return result;
}

// ============================================================================
// RemoteExecutor
// ============================================================================

ExecutionResult RemoteExecutor::Execute(Sandbox& sandbox,
                                        const std::string& command,
                                        std::chrono::milliseconds timeout) const {
    spdlog::debug("[EXEC] {} (timeout {} ms)", command, timeout.count());

    try {
        auto output = sandbox.Exec(BuildCommandArgv(command, timeout), timeout);

        ExecutionResult result;
        if (output.error) {
            result = ExecutionResult::TransportFailure(*output.error,
                                                       std::move(output.stdout_output),
                                                       std::move(output.stderr_output));
        } else {
            result = ExecutionResult::Success(std::move(output.stdout_output),
                                              std::move(output.stderr_output),
                                              output.exit_code);
        }
        result.duration = output.duration;
        return result;
    }
    catch (const std::exception& e) {
        spdlog::debug("[EXEC] transport exception: {}", e.what());
        return ExecutionResult::TransportFailure(e.what());
    }
}

std::vector<std::string> RemoteExecutor::BuildCommandArgv(const std::string& command,
                                                          std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        return {"bash", "-c", command};
    }

    auto seconds = (timeout.count() + 999) / 1000 + kRemoteGraceSeconds;
    return {"timeout", "-s", "KILL", std::to_string(seconds), "bash", "-c", command};
}

bool RemoteExecutor::Launch(Sandbox& sandbox, const std::string& command) const {
    spdlog::debug("[LAUNCH] {}", command);

    try {
        return sandbox.Spawn({"sh", "-c", command});
    }
    catch (const std::exception& e) {
        spdlog::warn("[LAUNCH] failed: {}", e.what());
        return false;
    }
}

std::string RemoteExecutor::ChooseHeredocMarker(const std::string& content) {
    const std::string base = "SANDPROBE_EOF";

    auto occurs_as_line = [&content](const std::string& marker) {
        std::istringstream stream(content);
        std::string line;
        while (std::getline(stream, line)) {
            if (line == marker) {
                return true;
            }
        }
        return false;
    };

    std::string marker = base;
    for (int suffix = 1; occurs_as_line(marker); ++suffix) {
        marker = base + "_" + std::to_string(suffix);
    }
    return marker;
}

std::string RemoteExecutor::BuildWriteScript(const std::string& path,
                                             const std::string& content,
                                             const std::string& marker) {
    std::string body = content;
    if (body.empty() || body.back() != '\n') {
        body.push_back('\n');
    }

    std::ostringstream script;
    script << "cat > " << StringUtils::ShellQuote(path)
           << " << '" << marker << "'\n"
           << body
           << marker << "\n";
    return script.str();
}

bool RemoteExecutor::WriteFile(Sandbox& sandbox,
                               const std::string& path,
                               const std::string& content,
                               bool verify) const {
    auto marker = ChooseHeredocMarker(content);
    auto result = Execute(sandbox, BuildWriteScript(path, content, marker), kDefaultTimeout);

    if (!result.Completed()) {
        spdlog::error("Failed to write {}: {}", path, *result.transport_error);
        return false;
    }
    if (*result.exit_code != 0) {
        spdlog::error("Failed to write {} (exit code {}): {}", path, *result.exit_code,
                      StringUtils::Truncate(result.CombinedOutput(), 200));
        return false;
    }

    if (!verify) {
        return true;
    }

    std::string expected = content;
    if (expected.empty() || expected.back() != '\n') {
        expected.push_back('\n');
    }
    auto local_digest = utils::HashUtils::ComputeSHA256(expected);

    auto check = Execute(sandbox, "sha256sum " + StringUtils::ShellQuote(path),
                         std::chrono::seconds(10));
    if (!check.Completed() || *check.exit_code != 0) {
        spdlog::debug("Cannot verify {} (sha256sum unavailable), skipping check", path);
        return true;
    }

    auto remote_digest = utils::HashUtils::ParseSha256SumOutput(check.stdout_output);
    if (remote_digest.empty()) {
        spdlog::debug("Cannot verify {} (unrecognised sha256sum output), skipping check", path);
        return true;
    }
    if (remote_digest != local_digest) {
        spdlog::warn("Digest mismatch for {}: local {} remote {}", path,
                     local_digest.substr(0, 16), remote_digest.substr(0, 16));
        return false;
    }

    spdlog::debug("Wrote {} ({} bytes, sha256 {})", path, expected.size(), local_digest.substr(0, 16));
    return true;
}

} // namespace core
} // namespace sandprobe
