/**
 * @file main.cpp
 * @brief sandprobe - Command-line interface
 *
 * Entry point for the sandbox security-validation harness. Provisions a
 * disposable container, brings up the command-interception daemon inside it,
 * runs the configured probe battery and reports which expectations held.
 *
 * **Subcommands**:
 * - `run <config>`: full run (default flow)
 * - `detect <config>`: capability discovery commands only
 * - `list <config>`: print the loaded suite without provisioning anything
 *
 * **Exit codes**: 0 every case passed, 1 any case failed or errored,
 * 2 configuration error or provisioning failure.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "sandprobe/core/harness.hpp"
#include "sandprobe/core/harness_config.hpp"
#include "sandprobe/core/docker_sandbox.hpp"
#include "sandprobe/reporters/console_reporter.hpp"
#include "sandprobe/reporters/json_reporter.hpp"
#include "sandprobe/utils/container_utils.hpp"

#include <iostream>
#include <string>

using namespace sandprobe;

namespace {

constexpr int kExitPassed = 0;
constexpr int kExitFailures = 1;
constexpr int kExitSetupError = 2;

/**
 * @brief Values collected from the command line
 */
struct CliOptions {
    std::string config_path;
    std::string image;
    std::string server_config;
    std::string policy;
    int case_timeout{0};
    bool strict{false};
    bool no_session{false};
    bool json{false};
    bool verbose{false};
};

} // anonymous namespace

/*******************************************************************************
 * UI and Display Functions
 ******************************************************************************/

void PrintBanner(std::ostream& out) {
    out << R"(
╔═══════════════════════════════════════════════════════════════╗
║                                                               ║
║   sandprobe - sandbox security validation harness             ║
║                            v1.0.0                             ║
║                                                               ║
╚═══════════════════════════════════════════════════════════════╝
)" << std::endl;
}

/*******************************************************************************
 * Configuration
 ******************************************************************************/

core::HarnessConfig BuildConfig(const CliOptions& options) {
    auto config = core::LoadHarnessConfig(options.config_path);

    if (!options.image.empty()) {
        config.sandbox.image = options.image;
    }
    if (!options.server_config.empty()) {
        config.server_config_file = options.server_config;
    }
    if (!options.policy.empty()) {
        config.policy_file = options.policy;
    }
    if (options.strict) {
        config.ApplyStrictMode();
    }
    if (options.case_timeout > 0) {
        config.execution.case_timeout = std::chrono::seconds(options.case_timeout);
    }
    if (options.no_session) {
        config.session.enabled = false;
    }

    return config;
}

void AddConfigOptions(CLI::App* command, CliOptions& options) {
    command->add_option("config", options.config_path, "Harness configuration (JSON)")
        ->required()
        ->check(CLI::ExistingFile);
    command->add_option("--image", options.image, "Override sandbox.image");
}

/*******************************************************************************
 * Subcommands
 ******************************************************************************/

int RunHarness(const CliOptions& options) {
    auto config = BuildConfig(options);
    config.LoadDocuments();
    config.Validate();

    // Text goes to stderr when stdout carries the JSON document
    std::ostream& text_out = options.json ? std::cerr : std::cout;
    reporters::ConsoleReporter console(text_out);

    core::DockerSandboxProvider provider(config.runtime);
    core::Harness harness(config, provider);
    harness.SetObserver(&console);

    spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
    spdlog::info("[START] {} categories, {} cases against {}",
                 config.suite.categories.size(), config.suite.CaseCount(),
                 config.sandbox.image);

    auto result = harness.Run();

    console.PrintReadiness(result.readiness);
    console.PrintSummary(result.counters);

    if (options.json) {
        reporters::JsonReporter json_reporter;
        json_reporter.Write(result, std::cout);
    }

    spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
    spdlog::info("[DONE] Sandbox {} {}", result.sandbox_id,
                 result.released ? "terminated" : "termination unconfirmed");

    return result.counters.failed + result.counters.errors == 0 ? kExitPassed : kExitFailures;
}

int RunDetect(const CliOptions& options) {
    auto config = BuildConfig(options);
    if (config.sandbox.image.empty()) {
        throw core::ConfigError("sandbox.image is required");
    }

    core::DockerSandboxProvider provider(config.runtime);
    core::Harness harness(config, provider);

    auto entries = harness.Detect();

    reporters::ConsoleReporter console(std::cout);
    console.PrintDetect(entries);
    return kExitPassed;
}

int RunList(const CliOptions& options) {
    auto config = BuildConfig(options);
    reporters::ConsoleReporter console(std::cout);
    console.PrintSuite(config.suite);
    return kExitPassed;
}

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"sandprobe - sandbox security validation harness"};
    app.require_subcommand(1);

    CliOptions options;
    app.add_flag("-v,--verbose", options.verbose, "Enable verbose logging");

    auto* run = app.add_subcommand("run", "Provision a sandbox and run the probe battery");
    AddConfigOptions(run, options);
    run->add_option("--server-config", options.server_config, "Override daemon.server_config_file")
        ->check(CLI::ExistingFile);
    run->add_option("--policy", options.policy, "Override daemon.policy_file")
        ->check(CLI::ExistingFile);
    run->add_option("--case-timeout", options.case_timeout, "Per-case timeout in seconds")
        ->check(CLI::PositiveNumber);
    run->add_flag("--strict", options.strict, "20 readiness attempts and a non-empty health body");
    run->add_flag("--no-session", options.no_session, "Do not open a daemon session");
    run->add_flag("--json", options.json, "Write the run summary as JSON to stdout");

    auto* detect = app.add_subcommand("detect", "Run capability discovery inside a sandbox");
    AddConfigOptions(detect, options);

    auto* list = app.add_subcommand("list", "Print the configured probe battery");
    AddConfigOptions(list, options);

    CLI11_PARSE(app, argc, argv);

    // Configure logging level and format
    if (options.json) {
        spdlog::set_default_logger(spdlog::stderr_color_mt("sandprobe"));
    }
    if (options.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        if (*run) {
            PrintBanner(options.json ? std::cerr : std::cout);
            return RunHarness(options);
        }
        if (*detect) {
            PrintBanner(std::cout);
            return RunDetect(options);
        }
        return RunList(options);

    } catch (const core::ConfigError& e) {
        spdlog::error("[CONFIG] {}", e.what());
        return kExitSetupError;
    } catch (const core::ProvisioningError& e) {
        spdlog::error("[SANDBOX] Provisioning failed: {}", e.what());
        return kExitSetupError;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return kExitFailures;
    }
}
