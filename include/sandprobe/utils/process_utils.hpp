/**
 * @file process_utils.hpp
 * @brief Local subprocess execution with deadline and separate stream capture
 *
 * Every interaction with the container runtime goes through a local child
 * process (the runtime's CLI). This header exposes the single primitive used
 * for that: spawn an argv, capture stdout and stderr independently, and kill
 * the child when it exceeds its deadline.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <chrono>

namespace sandprobe {
namespace utils {

/**
 * @struct ProcessResult
 * @brief Outcome of a local child process
 */
struct ProcessResult {
    int exit_code{-1};                      ///< Exit status (128+N when killed by signal N)
    std::string stdout_output;              ///< Captured standard output
    std::string stderr_output;              ///< Captured standard error
    bool timed_out{false};                  ///< Deadline reached, child was killed
    std::optional<std::string> spawn_error; ///< pipe/fork/exec failure description
    std::chrono::milliseconds duration{0};  ///< Wall-clock time
};

/**
 * @class ProcessUtils
 * @brief fork/exec wrapper with poll-based output capture
 *
 * **Usage Example**:
 * @code
 * auto result = ProcessUtils::Run({"docker", "ps"}, std::chrono::seconds(10));
 * if (result.timed_out) { ... }
 * @endcode
 */
class ProcessUtils {
public:
    /**
     * @brief Run argv and wait for it to finish or time out
     *
     * A zero timeout means no deadline. The child inherits the environment
     * and has stdin connected to /dev/null.
     *
     * @param argv Program and arguments (argv[0] is resolved through PATH)
     * @param timeout Deadline for the whole process
     * @return Captured result, never throws for child failures
     */
    static ProcessResult Run(const std::vector<std::string>& argv,
                             std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    /**
     * @brief Check whether a program can be found on PATH
     * @param program Program name
     * @return true if an executable with that name exists
     */
    static bool IsOnPath(const std::string& program);

    /**
     * @brief Render argv as a shell-like string for logging
     */
    static std::string FormatCommand(const std::vector<std::string>& argv);
};

} // namespace utils
} // namespace sandprobe
