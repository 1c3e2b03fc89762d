/**
 * @file session_client.hpp
 * @brief Session creation through the daemon's command-line surface
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <chrono>

#include "sandbox.hpp"
#include "remote_executor.hpp"

namespace sandprobe {
namespace core {

/**
 * @struct SessionConfig
 * @brief Session commands; {workspace} and {session_id} are substituted
 */
struct SessionConfig {
    bool enabled{true};                                                         ///< Open a session at all
    std::string workspace{"/root"};                                             ///< Session workspace path
    std::string create_command{"agentsh session create --workspace {workspace} --json 2>&1"};  ///< Create command
    std::string info_command{"agentsh session info {session_id} --json 2>&1 | head -c 200"};  ///< Info command
    std::chrono::seconds timeout{30};                                           ///< Deadline per command
};

/**
 * @class SessionClient
 * @brief Opens a daemon session and extracts its identifier
 *
 * CreateSession() never throws: any failure (transport, non-JSON output,
 * missing id) yields the empty id, which downstream code treats as "no
 * session".
 */
class SessionClient {
public:
    explicit SessionClient(SessionConfig config);

    /**
     * @brief Create a session for a workspace
     * @param sandbox Target sandbox
     * @param workspace Workspace path inside the sandbox
     * @return Session identifier, empty on failure
     */
    std::string CreateSession(Sandbox& sandbox, const std::string& workspace);

    /**
     * @brief Create a session for the configured workspace
     */
    std::string CreateSession(Sandbox& sandbox);

    /**
     * @brief Query session info by id
     */
    ExecutionResult GetSessionInfo(Sandbox& sandbox, const std::string& session_id);

    /**
     * @brief Session id from create-command output (tolerant parse)
     */
    static std::string ParseSessionId(const std::string& output);

    const SessionConfig& Config() const { return config_; }

private:
    SessionConfig config_;
    RemoteExecutor executor_;
};

} // namespace core
} // namespace sandprobe
