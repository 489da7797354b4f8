/**
 * @file main.cpp
 * @brief Sandcell - Command-line interface
 *
 * `sandcell serve` answers tool calls (line-delimited JSON) on stdin/stdout
 * until EOF or SIGINT/SIGTERM, then stops the sandbox. `sandcell run <file>`
 * initializes a sandbox, executes one file and prints the JSON result.
 * Logs go to stderr; stdout carries only protocol output.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>

#include "sandcell/config/service_config.hpp"
#include "sandcell/core/sandbox_controller.hpp"
#include "sandcell/runtime/docker_cli_runtime.hpp"
#include "sandcell/tools/tool_service.hpp"

#include <atomic>
#include <signal.h>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>

using json = nlohmann::json;

namespace {

std::atomic<bool> g_stop_requested{false};

void HandleSignal(int /*signal*/) {
    g_stop_requested.store(true);
}

// No SA_RESTART: a blocked read on stdin returns so the loop can exit
void InstallSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

/*******************************************************************************
 * Commands
 ******************************************************************************/

int RunServe(sandcell::core::SandboxController& controller) {
    InstallSignalHandlers();

    sandcell::tools::ToolService service(controller);
    service.Serve(std::cin, std::cout, &g_stop_requested);

    try {
        controller.Stop();
    }
    catch (const sandcell::core::CleanupError& e) {
        spdlog::error("[ERROR] {}", e.what());
        return 1;
    }
    return 0;
}

int RunOnce(sandcell::core::SandboxController& controller,
            const std::string& source_path,
            const std::string& language) {
    std::ifstream file(source_path, std::ios::binary);
    if (!file) {
        spdlog::error("[ERROR] Cannot read {}", source_path);
        return 1;
    }
    std::ostringstream source;
    source << file.rdbuf();

    sandcell::tools::ToolService service(controller);

    json response = service.Dispatch({{"tool", "initialize_sandbox"}});
    if (response["status"] == "success") {
        response = service.Dispatch({
            {"tool", "execute_code"},
            {"arguments", {{"code", source.str()}, {"language", language}}}
        });
    }

    json stop = service.Dispatch({{"tool", "stop_sandbox"}});
    if (stop["status"] != "success") {
        spdlog::warn("[WARN] {}", stop["message"].get<std::string>());
    }

    std::cout << response.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
    return response["status"] == "success" ? 0 : 1;
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"Sandcell - isolated code execution sandbox controller"};
    app.require_subcommand(1);
    app.fallthrough();

    std::string config_path;
    std::string image;
    std::string docker_host;
    std::string network;
    int timeout_seconds = 0;
    std::size_t memory_mb = 0;
    double cpus = 0.0;
    int pids = 0;
    bool verbose = false;

    app.add_option("-c,--config", config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);
    app.add_option("--image", image, "Base image for the sandbox");
    app.add_option("--timeout", timeout_seconds, "Execution timeout in seconds")
        ->check(CLI::PositiveNumber);
    app.add_option("--docker-host", docker_host, "Container engine endpoint (e.g. unix:///var/run/docker.sock)");
    app.add_option("--network", network, "Network policy: disabled or enabled")
        ->check(CLI::IsMember({"disabled", "enabled", "none", "bridge"}));
    app.add_option("--memory", memory_mb, "Memory limit in MiB")
        ->check(CLI::PositiveNumber);
    app.add_option("--cpus", cpus, "CPU limit in cores")
        ->check(CLI::PositiveNumber);
    app.add_option("--pids", pids, "Process limit")
        ->check(CLI::PositiveNumber);
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    auto* serve = app.add_subcommand("serve", "Serve sandbox tools as line-delimited JSON on stdin/stdout");

    std::string source_path;
    std::string language = "python";
    auto* run = app.add_subcommand("run", "Run one source file in a fresh sandbox and print the result");
    run->add_option("file", source_path, "Source file to execute")
        ->required()
        ->check(CLI::ExistingFile);
    run->add_option("-l,--language", language, "Language of the source file")
        ->default_val("python");

    CLI11_PARSE(app, argc, argv);

    // stdout is reserved for protocol output
    auto logger = spdlog::stderr_color_mt("sandcell");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        sandcell::config::ServiceConfig service_config;
        if (!config_path.empty()) {
            service_config = sandcell::config::LoadConfig(config_path);
        }

        // Command-line flags override the file
        auto& controller_config = service_config.controller;
        if (!image.empty()) {
            controller_config.default_image = image;
        }
        if (timeout_seconds > 0) {
            controller_config.execution_timeout = std::chrono::seconds(timeout_seconds);
        }
        if (!docker_host.empty()) {
            service_config.docker.host = docker_host;
        }
        if (!network.empty()) {
            controller_config.network_policy = sandcell::config::ParseNetworkPolicy(network);
        }
        if (memory_mb > 0) {
            controller_config.default_limits.memory_mb = memory_mb;
        }
        if (cpus > 0.0) {
            controller_config.default_limits.cpus = cpus;
        }
        if (pids > 0) {
            controller_config.default_limits.max_processes = pids;
        }

        if (verbose) {
            spdlog::set_level(spdlog::level::debug);
            spdlog::debug("[DEBUG] Verbose logging enabled");
        } else {
            spdlog::set_level(sandcell::config::ParseLogLevel(service_config.logging.level));
        }

        auto docker = std::make_shared<sandcell::runtime::DockerCliRuntime>(service_config.docker);
        sandcell::core::SandboxController controller(docker, controller_config);

        if (*serve) {
            return RunServe(controller);
        }
        if (*run) {
            return RunOnce(controller, source_path, language);
        }
        return 1;

    } catch (const sandcell::config::ConfigError& e) {
        spdlog::error("[ERROR] Configuration error: {}", e.what());
        return 2;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return 1;
    }
}
