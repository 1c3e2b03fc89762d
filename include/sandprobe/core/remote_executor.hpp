/**
 * @file remote_executor.hpp
 * @brief Shell command execution inside the sandbox with structured results
 *
 * The executor knows nothing about what a command means. It runs the text
 * through `bash -c` inside the sandbox and folds every failure mode into an
 * ExecutionResult: a completed run carries an exit code, a timeout or
 * transport failure carries a transport error instead. Execute() never throws.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <optional>
#include <chrono>
#include <vector>

#include "sandbox.hpp"

namespace sandprobe {
namespace core {

/**
 * @struct ExecutionResult
 * @brief Captured outcome of one remote command
 *
 * Invariant: exit_code is empty exactly when transport_error is set.
 */
struct ExecutionResult {
    std::string stdout_output;                  ///< Standard output (untruncated)
    std::string stderr_output;                  ///< Standard error (untruncated)
    std::optional<int> exit_code;               ///< Exit code of the completed command
    std::optional<std::string> transport_error; ///< Timeout or transport failure cause
    std::chrono::milliseconds duration{0};      ///< Wall-clock duration

    bool Completed() const { return exit_code.has_value(); }

    /**
     * @brief stdout followed by stderr, trimmed
     */
    std::string CombinedOutput() const;

    static ExecutionResult Success(std::string out, std::string err, int code);
    static ExecutionResult TransportFailure(std::string cause,
                                            std::string out = "",
                                            std::string err = "");
};

/**
 * @class RemoteExecutor
 * @brief Stateless remote shell runner
 *
 * **Usage Example**:
 * @code
 * RemoteExecutor executor;
 * auto result = executor.Execute(sandbox, "curl -s http://127.0.0.1:18080/health");
 * if (!result.Completed()) {
 *     spdlog::warn("probe failed: {}", *result.transport_error);
 * }
 * @endcode
 */
class RemoteExecutor {
public:
    static constexpr std::chrono::seconds kDefaultTimeout{30};

    /**
     * @brief Run a shell command inside the sandbox
     * @param sandbox Target sandbox
     * @param command Text interpreted by bash inside the sandbox
     * @param timeout Deadline for this command
     * @return Execution result (total, never throws)
     */
    ExecutionResult Execute(Sandbox& sandbox,
                            const std::string& command,
                            std::chrono::milliseconds timeout = kDefaultTimeout) const;

    /**
     * @brief Write a text document to a path inside the sandbox
     *
     * Uses a quoted heredoc so the content is transferred verbatim; the call
     * returns only after the remote write finished. The written file always
     * ends with a newline. When verify is set, the remote SHA-256 is compared
     * with the locally computed digest of the expected bytes.
     *
     * @return true if the write completed with exit code 0 (and digest matched)
     */
    bool WriteFile(Sandbox& sandbox,
                   const std::string& path,
                   const std::string& content,
                   bool verify = true) const;

    /**
     * @brief Start a shell command in the background without waiting
     * @return true if the sandbox accepted the launch request
     */
    bool Launch(Sandbox& sandbox, const std::string& command) const;

    /**
     * @brief argv run inside the sandbox for a command
     *
     * With a deadline the command runs under coreutils `timeout -s KILL`,
     * so the remote process dies shortly after the local client gives up.
     */
    static std::vector<std::string> BuildCommandArgv(const std::string& command,
                                                     std::chrono::milliseconds timeout);

    /**
     * @brief Heredoc terminator that does not occur as a line in content
     */
    static std::string ChooseHeredocMarker(const std::string& content);

    /**
     * @brief Full `sh -c` script used by WriteFile
     */
    static std::string BuildWriteScript(const std::string& path,
                                        const std::string& content,
                                        const std::string& marker);
};

} // namespace core
} // namespace sandprobe
