/**
 * @file process_utils.cpp
 * @brief Implementation of deadline-bounded local subprocess execution
 *
 * The child is placed in its own process group so a timeout can kill the
 * runtime client together with anything it spawned. stdout and stderr are
 * read through two pipes multiplexed with poll(2); a third close-on-exec pipe
 * reports exec failures back to the parent.
 *
 * @date 2025
 */

#include "sandprobe/utils/process_utils.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sandprobe {
namespace utils {

namespace {

void CloseFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Returns false on EOF or unrecoverable error
bool DrainInto(int fd, std::string& sink) {
    std::array<char, 4096> buffer;
    ssize_t bytes_read = read(fd, buffer.data(), buffer.size());
    if (bytes_read < 0) {
        return errno == EINTR || errno == EAGAIN;
    }
    if (bytes_read == 0) {
        return false;
    }
    sink.append(buffer.data(), static_cast<std::size_t>(bytes_read));
    return true;
}

int DecodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // anonymous namespace

ProcessResult ProcessUtils::Run(const std::vector<std::string>& argv,
                                std::chrono::milliseconds timeout) {
    ProcessResult result;

    if (argv.empty()) {
        result.spawn_error = "empty command";
        return result;
    }

    auto start_time = std::chrono::steady_clock::now();

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};

    if (pipe(out_pipe) < 0 || pipe(err_pipe) < 0 || pipe(exec_pipe) < 0) {
        result.spawn_error = std::string("pipe failed: ") + std::strerror(errno);
        for (int* fds : {out_pipe, err_pipe, exec_pipe}) {
            CloseFd(fds[0]);
            CloseFd(fds[1]);
        }
        return result;
    }
    fcntl(exec_pipe[1], F_SETFD, FD_CLOEXEC);

    pid_t pid = fork();

    if (pid < 0) {
        result.spawn_error = std::string("fork failed: ") + std::strerror(errno);
        for (int* fds : {out_pipe, err_pipe, exec_pipe}) {
            CloseFd(fds[0]);
            CloseFd(fds[1]);
        }
        return result;
    }

    if (pid == 0) {
        // Child process
        setpgid(0, 0);

        int null_fd = open("/dev/null", O_RDONLY);
        if (null_fd >= 0) {
            dup2(null_fd, STDIN_FILENO);
            close(null_fd);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        close(exec_pipe[0]);

        std::vector<char*> child_argv;
        child_argv.reserve(argv.size() + 1);
        for (const auto& arg : argv) {
            child_argv.push_back(const_cast<char*>(arg.c_str()));
        }
        child_argv.push_back(nullptr);

        execvp(child_argv[0], child_argv.data());

        // exec failed, report errno to the parent
        int exec_errno = errno;
        ssize_t ignored = write(exec_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    CloseFd(out_pipe[1]);
    CloseFd(err_pipe[1]);
    CloseFd(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t exec_bytes;
    do {
        exec_bytes = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (exec_bytes < 0 && errno == EINTR);
    CloseFd(exec_pipe[0]);

    if (exec_bytes == static_cast<ssize_t>(sizeof(exec_errno))) {
        CloseFd(out_pipe[0]);
        CloseFd(err_pipe[0]);
        waitpid(pid, nullptr, 0);
        result.spawn_error = "exec " + argv[0] + " failed: " + std::strerror(exec_errno);
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        return result;
    }

    const bool has_deadline = timeout.count() > 0;
    const auto deadline = start_time + timeout;

    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];

    while (out_fd >= 0 || err_fd >= 0) {
        int wait_ms = -1;
        if (has_deadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                result.timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(remaining.count());
        }

        std::array<pollfd, 2> fds{};
        nfds_t count = 0;
        if (out_fd >= 0) {
            fds[count++] = pollfd{out_fd, POLLIN, 0};
        }
        if (err_fd >= 0) {
            fds[count++] = pollfd{err_fd, POLLIN, 0};
        }

        int ready = poll(fds.data(), count, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::warn("poll failed while reading child output: {}", std::strerror(errno));
            break;
        }
        if (ready == 0) {
            continue;  // Deadline is re-checked at the top of the loop
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) {
                continue;
            }
            if (fds[i].fd == out_fd) {
                if (!DrainInto(out_fd, result.stdout_output)) {
                    CloseFd(out_fd);
                }
            } else if (fds[i].fd == err_fd) {
                if (!DrainInto(err_fd, result.stderr_output)) {
                    CloseFd(err_fd);
                }
            }
        }
    }

    int status = 0;
    pid_t waited = 0;

    // Both pipes may close while the child keeps running
    if (!result.timed_out && has_deadline) {
        while (true) {
            waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid || (waited < 0 && errno != EINTR)) {
                break;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                result.timed_out = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    if (result.timed_out) {
        spdlog::debug("Deadline of {} ms reached, killing process group {}", timeout.count(), pid);
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
    }

    CloseFd(out_fd);
    CloseFd(err_fd);

    while (waited != pid) {
        waited = waitpid(pid, &status, 0);
        if (waited < 0 && errno != EINTR) {
            break;
        }
    }

    result.exit_code = (waited == pid) ? DecodeWaitStatus(status) : -1;
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    return result;
}

bool ProcessUtils::IsOnPath(const std::string& program) {
    if (program.find('/') != std::string::npos) {
        return access(program.c_str(), X_OK) == 0;
    }

    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return false;
    }

    std::istringstream stream(path_env);
    std::string dir;
    while (std::getline(stream, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        auto candidate = std::filesystem::path(dir) / program;
        if (access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

std::string ProcessUtils::FormatCommand(const std::vector<std::string>& argv) {
    std::ostringstream cmd;
    bool first = true;
    for (const auto& arg : argv) {
        if (!first) {
            cmd << " ";
        }
        first = false;
        if (arg.find_first_of(" \t\n'\"") != std::string::npos) {
            cmd << "\"" << arg << "\"";
        } else {
            cmd << arg;
        }
    }
    return cmd.str();
}

} // namespace utils
} // namespace sandprobe
