/**
 * @file fake_sandbox.hpp
 * @brief Scripted in-memory sandbox for unit tests
 *
 * Commands are answered by the first rule whose needle occurs in the shell
 * text (the last argv element). A rule with several replies hands them out
 * in order and keeps repeating the last one. Unmatched commands exit 0 with
 * no output.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "sandprobe/core/sandbox.hpp"

namespace sandprobe {
namespace fakes {

struct Reply {
    int exit_code{0};
    std::string stdout_output;
    std::string stderr_output;
    std::optional<std::string> error;   ///< Transport failure instead of a result
    bool throws{false};                 ///< Throw std::runtime_error(error) from Exec

    static Reply Ok(std::string out = "", std::string err = "") {
        Reply r;
        r.stdout_output = std::move(out);
        r.stderr_output = std::move(err);
        return r;
    }
    static Reply Exit(int code, std::string out = "", std::string err = "") {
        Reply r;
        r.exit_code = code;
        r.stdout_output = std::move(out);
        r.stderr_output = std::move(err);
        return r;
    }
    static Reply Transport(std::string message) {
        Reply r;
        r.exit_code = -1;
        r.error = std::move(message);
        return r;
    }
    static Reply Throw(std::string message) {
        Reply r = Transport(std::move(message));
        r.throws = true;
        return r;
    }
};

struct Call {
    std::vector<std::string> argv;
    std::chrono::milliseconds timeout{0};

    const std::string& Script() const { return argv.back(); }
};

/**
 * @brief State shared between a fake sandbox and the test that scripts it
 */
struct FakeSandboxState {
    struct Rule {
        std::string needle;
        std::deque<Reply> replies;
    };

    std::vector<Rule> rules;
    std::vector<Call> calls;
    std::vector<std::vector<std::string>> spawns;
    bool spawn_accepted{true};
    bool terminate_confirmed{true};
    bool terminate_throws{false};
    int terminate_calls{0};

    void On(const std::string& needle, Reply reply) {
        rules.push_back({needle, {std::move(reply)}});
    }

    void OnSequence(const std::string& needle, std::vector<Reply> replies) {
        rules.push_back({needle, std::deque<Reply>(replies.begin(), replies.end())});
    }

    Reply Answer(const std::string& script) {
        for (auto& rule : rules) {
            if (script.find(rule.needle) == std::string::npos || rule.replies.empty()) {
                continue;
            }
            Reply reply = rule.replies.front();
            if (rule.replies.size() > 1) {
                rule.replies.pop_front();
            }
            return reply;
        }
        return Reply::Ok();
    }

    int CountCalls(const std::string& needle) const {
        int count = 0;
        for (const auto& call : calls) {
            if (call.Script().find(needle) != std::string::npos) {
                ++count;
            }
        }
        return count;
    }
};

class FakeSandbox : public core::Sandbox {
public:
    explicit FakeSandbox(std::shared_ptr<FakeSandboxState> state,
                         std::string id = "fake-sandbox-1")
        : state_(std::move(state))
        , id_(std::move(id)) {
    }

    const std::string& Id() const override { return id_; }

    core::SandboxExecOutput Exec(const std::vector<std::string>& argv,
                                 std::chrono::milliseconds timeout) override {
        state_->calls.push_back({argv, timeout});
        Reply reply = state_->Answer(argv.empty() ? std::string() : argv.back());

        if (reply.throws) {
            throw std::runtime_error(reply.error.value_or("exec failed"));
        }

        core::SandboxExecOutput output;
        output.exit_code = reply.exit_code;
        output.stdout_output = reply.stdout_output;
        output.stderr_output = reply.stderr_output;
        output.error = reply.error;
        output.duration = std::chrono::milliseconds(1);
        return output;
    }

    bool Spawn(const std::vector<std::string>& argv) override {
        state_->spawns.push_back(argv);
        return state_->spawn_accepted;
    }

    bool Terminate() override {
        ++state_->terminate_calls;
        if (state_->terminate_throws) {
            throw std::runtime_error("provider unreachable");
        }
        return state_->terminate_confirmed;
    }

private:
    std::shared_ptr<FakeSandboxState> state_;
    std::string id_;
};

class FakeProvider : public core::SandboxProvider {
public:
    explicit FakeProvider(std::shared_ptr<FakeSandboxState> state)
        : state_(std::move(state)) {
    }

    std::unique_ptr<core::Sandbox> Create(const core::SandboxSpec& spec) override {
        ++create_calls;
        last_spec = spec;
        if (fail_with) {
            throw core::ProvisioningError(*fail_with);
        }
        return std::make_unique<FakeSandbox>(state_);
    }

    std::string Name() const override { return "fake"; }

    std::optional<std::string> fail_with;
    int create_calls{0};
    core::SandboxSpec last_spec;

private:
    std::shared_ptr<FakeSandboxState> state_;
};

/**
 * @brief Sleeper that records requested waits instead of sleeping
 */
struct RecordingSleeper {
    std::shared_ptr<std::vector<std::chrono::milliseconds>> waits =
        std::make_shared<std::vector<std::chrono::milliseconds>>();

    void operator()(std::chrono::milliseconds duration) const {
        waits->push_back(duration);
    }
};

} // namespace fakes
} // namespace sandprobe
