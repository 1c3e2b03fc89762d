/**
 * @file session_client.cpp
 * @brief Implementation of daemon session handling
 *
 * @date 2025
 */

#include "sandprobe/core/session_client.hpp"
#include "sandprobe/parsers/json_extractor.hpp"
#include "sandprobe/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

namespace sandprobe {
namespace core {

using utils::StringUtils;

SessionClient::SessionClient(SessionConfig config)
    : config_(std::move(config)) {
}

std::string SessionClient::CreateSession(Sandbox& sandbox) {
    return CreateSession(sandbox, config_.workspace);
}

std::string SessionClient::CreateSession(Sandbox& sandbox, const std::string& workspace) {
    spdlog::info("    Creating session (workspace: {})...", workspace);

    auto command = StringUtils::Substitute(config_.create_command,
                                           {{"workspace", StringUtils::ShellQuote(workspace)}});
    auto result = executor_.Execute(sandbox, command, config_.timeout);

    if (!result.Completed()) {
        spdlog::warn("    Session creation failed: {}", *result.transport_error);
        return "";
    }

    auto session_id = ParseSessionId(result.CombinedOutput());
    if (session_id.empty()) {
        spdlog::warn("    Failed to parse session response (exit code {}): {}",
                     *result.exit_code, StringUtils::Truncate(result.CombinedOutput(), 200));
        return "";
    }

    spdlog::info("    Session ID: {}", session_id);
    return session_id;
}

ExecutionResult SessionClient::GetSessionInfo(Sandbox& sandbox, const std::string& session_id) {
    if (session_id.empty()) {
        return ExecutionResult::TransportFailure("no session");
    }

    auto command = StringUtils::Substitute(config_.info_command,
                                           {{"session_id", StringUtils::ShellQuote(session_id)}});
    return executor_.Execute(sandbox, command, config_.timeout);
}

std::string SessionClient::ParseSessionId(const std::string& output) {
    return parsers::JsonExtractor::ExtractString(output, "id");
}

} // namespace core
} // namespace sandprobe
