/**
 * @file main.cpp
 * @brief codebox - Command-line interface
 *
 * Entry point for the codebox sandboxed code execution service. `serve`
 * (the default) speaks the tool protocol on stdin/stdout; `run` executes one
 * snippet and exits with its status; `languages` prints the registry.
 *
 * stdout belongs to the protocol (serve) or to the program's output (run),
 * so every log line goes to stderr or the optional log file.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>

#include "codebox/core/errors.hpp"
#include "codebox/core/execution_engine.hpp"
#include "codebox/core/sandbox_manager.hpp"
#include "codebox/runtime/docker_runtime.hpp"
#include "codebox/server/service_config.hpp"
#include "codebox/server/tool_server.hpp"

#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>

namespace {

constexpr int kExitTimeout = 124;
constexpr std::size_t kLogFileSize = 5 * 1024 * 1024;
constexpr std::size_t kLogFileCount = 3;

/*******************************************************************************
 * Logging
 ******************************************************************************/

void ConfigureLogging(const std::string& log_file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file, kLogFileSize, kLogFileCount));
    }

    auto logger = std::make_shared<spdlog::logger>("codebox", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
}

void ApplyLogLevel(bool verbose, const std::string& configured) {
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        spdlog::debug("[DEBUG] Verbose logging enabled");
        return;
    }

    auto level = spdlog::level::from_str(configured);
    if (level == spdlog::level::off && configured != "off") {
        spdlog::warn("[WARN] Unknown log level '{}', using info", configured);
        level = spdlog::level::info;
    }
    spdlog::set_level(level);
}

/*******************************************************************************
 * Subcommands
 ******************************************************************************/

void PrintLanguages(const codebox::core::LanguageRegistry& registry) {
    for (const auto& id : registry.Identifiers()) {
        const auto& profile = registry.Resolve(id);
        std::cout << id << "\t" << profile.image << "\t"
                  << (profile.install_command ? "install" : "-") << "\n";
    }
}

std::string ReadSource(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot read source file: " + path);
    }
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

int RunOnce(codebox::core::ExecutionEngine& engine,
            codebox::core::ExecutionRequest request,
            bool json_output) {
    using codebox::core::ExecutionOutcome;
    using codebox::server::ToolServer;

    try {
        auto result = engine.ExecuteEphemeral(request);

        if (json_output) {
            std::cout << ToolServer::ExecutionResultToJson(result).dump(2) << std::endl;
        } else {
            std::cout << result.stdout_output << std::flush;
            std::cerr << result.stderr_output << std::flush;
        }

        spdlog::info("[DONE] {} in {} ms", codebox::core::ExecutionOutcomeToString(result.outcome),
                     result.execution_time.count());

        if (result.outcome == ExecutionOutcome::TIMED_OUT) {
            return kExitTimeout;
        }
        return result.exit_code.value_or(1);
    }
    catch (const codebox::core::SandboxError& e) {
        spdlog::error("[ERROR] {}: {}", codebox::core::ErrorKindToString(e.kind()), e.what());
        if (json_output) {
            std::cout << ToolServer::ErrorToJson(e.kind(), e.what()).dump(2) << std::endl;
        }
        return 1;
    }
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"codebox - sandboxed code execution service"};
    app.require_subcommand(0, 1);

    std::string config_path;
    std::string log_file;
    std::string runtime_name;
    std::string runtime_binary;
    bool verbose = false;

    app.add_option("-c,--config", config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_option("--log-file", log_file, "Also write logs to this rotating file");
    app.add_option("--runtime", runtime_name, "Container engine")
        ->check(CLI::IsMember({"docker", "podman"}));
    app.add_option("--runtime-binary", runtime_binary, "Path of the container engine binary");

    app.add_subcommand("serve", "Serve tool calls on stdin/stdout (default)");

    auto* run_cmd = app.add_subcommand("run", "Execute one snippet and exit with its status");
    std::string language;
    std::string code;
    std::string source_file;
    double timeout_s = 0;
    std::vector<std::string> dependencies;
    bool json_output = false;

    run_cmd->add_option("-l,--language", language, "Language identifier")->required();
    auto* code_opt = run_cmd->add_option("--code", code, "Source code");
    auto* file_opt = run_cmd->add_option("-f,--file", source_file, "Read source code from file")
        ->check(CLI::ExistingFile);
    code_opt->excludes(file_opt);
    run_cmd->add_option("-t,--timeout", timeout_s, "Timeout in seconds (default from config)");
    run_cmd->add_option("-d,--dep", dependencies, "Package to install before running (repeatable)");
    run_cmd->add_flag("--json", json_output, "Print the result as JSON");

    auto* languages_cmd = app.add_subcommand("languages", "List supported languages");

    CLI11_PARSE(app, argc, argv);

    // A client closing the pipe must not kill the process mid-cleanup
    std::signal(SIGPIPE, SIG_IGN);

    try {
        ConfigureLogging(log_file);
        ApplyLogLevel(verbose, "info");

        codebox::server::ServiceConfig config;
        if (!config_path.empty()) {
            config = codebox::server::LoadConfigFile(config_path);
            ApplyLogLevel(verbose, config.log_level);
        }

        if (!runtime_name.empty()) {
            config.runtime.runtime = *codebox::runtime::ParseContainerRuntime(runtime_name);
        }
        if (!runtime_binary.empty()) {
            config.runtime.binary = runtime_binary;
        }

        auto registry = codebox::server::BuildRegistry(config);

        if (*languages_cmd) {
            PrintLanguages(registry);
            return 0;
        }

        codebox::runtime::DockerRuntime docker(config.runtime);
        codebox::core::ExecutionEngine engine(registry, docker, config.execution);

        if (*run_cmd) {
            if (run_cmd->count("--code") == 0 && run_cmd->count("--file") == 0) {
                spdlog::error("[ERROR] One of --code or --file is required");
                return 1;
            }

            codebox::core::ExecutionRequest request;
            request.language = language;
            request.code = source_file.empty() ? code : ReadSource(source_file);
            request.dependencies = dependencies;
            if (run_cmd->count("--timeout") > 0) {
                request.timeout = engine.TimeoutFromSeconds(timeout_s);
            }
            return RunOnce(engine, std::move(request), json_output);
        }

        spdlog::info("[INIT] codebox {} starting", codebox::server::ToolServer::kServerVersion);
        if (docker.IsAvailable()) {
            spdlog::info("[INIT] Container engine: {} (server {})", docker.Binary(), docker.GetRuntimeVersion());
        } else {
            spdlog::warn("[WARN] Container engine '{}' is not reachable; tool calls will fail until it is",
                         docker.Binary());
        }

        codebox::core::SandboxManager manager(registry, docker, config.sandbox);
        codebox::server::ToolServer server(engine, manager, registry, config.max_concurrent_requests);

        server.Serve(std::cin, std::cout);

        manager.Shutdown();
        spdlog::info("[DONE] codebox stopped");
        return 0;

    } catch (const codebox::core::SandboxError& e) {
        spdlog::error("[ERROR] {}: {}", codebox::core::ErrorKindToString(e.kind()), e.what());
        return 1;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("[ERROR] Filesystem error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return 1;
    }
}
