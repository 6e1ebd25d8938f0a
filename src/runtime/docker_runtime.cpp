/**
 * @file docker_runtime.cpp
 * @brief Implementation of the Docker/Podman CLI adapter
 *
 * **Hardening Applied To Every Container**:
 * 1. Memory cap with swap pinned to the same value (--memory / --memory-swap)
 * 2. CPU cap (--cpus) and process cap (--pids-limit)
 * 3. No privilege escalation (--security-opt no-new-privileges)
 * 4. Unprivileged runs: numeric uid:gid and --cap-drop ALL
 * 5. Network: --network none, or a dedicated bridge network
 *
 * **Container Lifecycle**:
 * ```
 * one-shot:   run --rm --cidfile ... image cmd   (force-removed on deadline)
 * long-lived: run -d ... image keepalive -> exec ... -> stop -> rm --force
 * ```
 *
 * @date 2025
 */

#include "codebox/runtime/docker_runtime.hpp"
#include "codebox/utils/id_utils.hpp"
#include "codebox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <sstream>
#include <system_error>

namespace codebox {
namespace runtime {

using core::ErrorKind;
using core::SandboxError;
using utils::StringUtils;

namespace {

std::string FormatCpus(double cpus) {
    std::ostringstream oss;
    oss << cpus;
    return oss.str();
}

std::string FirstLine(const std::string& text) {
    auto trimmed = StringUtils::Trim(text);
    auto pos = trimmed.find('\n');
    return pos == std::string::npos ? trimmed : trimmed.substr(0, pos);
}

bool IsMissingObject(const std::string& stderr_output) {
    auto lower = StringUtils::ToLower(stderr_output);
    return StringUtils::Contains(lower, "no such container") ||
           StringUtils::Contains(lower, "no such object") ||
           StringUtils::Contains(lower, "no container with name or id");
}

} // anonymous namespace

// ============================================================================
// RUNTIME FLAVOR
// ============================================================================

std::optional<ContainerRuntime> ParseContainerRuntime(const std::string& name) {
    auto lower = StringUtils::ToLower(name);
    if (lower == "docker") return ContainerRuntime::DOCKER;
    if (lower == "podman") return ContainerRuntime::PODMAN;
    return std::nullopt;
}

std::string ContainerRuntimeToString(ContainerRuntime runtime) {
    switch (runtime) {
        case ContainerRuntime::DOCKER: return "docker";
        case ContainerRuntime::PODMAN: return "podman";
    }
    return "docker";
}

std::string EnvironmentStateToString(EnvironmentState state) {
    switch (state) {
        case EnvironmentState::CREATED: return "created";
        case EnvironmentState::RUNNING: return "running";
        case EnvironmentState::PAUSED: return "paused";
        case EnvironmentState::EXITED: return "exited";
        case EnvironmentState::DEAD: return "dead";
        default: return "unknown";
    }
}

// ============================================================================
// CONSTRUCTOR
// ============================================================================

DockerRuntime::DockerRuntime(const Config& config)
    : config_(config)
    , binary_(config.binary.empty() ? ContainerRuntimeToString(config.runtime) : config.binary) {
    spdlog::debug("Container runtime adapter using binary: {}", binary_);
}

// ============================================================================
// ONE-SHOT EXECUTION
// ============================================================================

RunOutcome DockerRuntime::Run(const IsolationSpec& spec, std::chrono::milliseconds timeout) {
    spdlog::debug("Running container {} from {} (timeout: {} ms)",
                  spec.name, spec.image, timeout.count());

    // The engine writes the container id here once the container exists.
    // Without it a failed run never reached the workload, so stderr is the
    // engine's own diagnostic.
    auto cidfile = std::filesystem::temp_directory_path() /
                   ("codebox-" + utils::GenerateUUID() + ".cid");

    auto args = BuildRunArguments(spec, false);
    args.insert(args.begin() + 2, "--cidfile=" + cidfile.string());

    // The CLI client dies with SIGKILL but the container keeps running
    // unless it is removed by name
    std::string name = spec.name;
    auto result = ExecuteDockerCommand(args, timeout, [this, name]() {
        if (!name.empty()) {
            spdlog::warn("Container {} exceeded its deadline, removing", name);
            ForceRemove(name);
        }
    });

    std::error_code ec;
    bool created = std::filesystem::exists(cidfile, ec);
    std::filesystem::remove(cidfile, ec);

    if (!created && !result.timed_out && result.exit_code && *result.exit_code != 0) {
        auto message = FirstLine(result.stderr_output);
        spdlog::error("Container engine rejected run of {}: {}", spec.image, message);
        throw SandboxError(ClassifyFailure(result.stderr_output).value_or(ErrorKind::RUNTIME_UNAVAILABLE),
                           "Failed to run " + spec.image + ": " + message);
    }

    RunOutcome outcome;
    outcome.exit_code = result.exit_code;
    outcome.timed_out = result.timed_out;
    outcome.stdout_output = std::move(result.stdout_output);
    outcome.stderr_output = std::move(result.stderr_output);
    outcome.elapsed = result.duration;
    return outcome;
}

// ============================================================================
// LONG-LIVED CONTAINERS
// ============================================================================

void DockerRuntime::StartDetached(const IsolationSpec& spec) {
    spdlog::info("Starting container: {} ({})", spec.name, spec.image);

    auto result = ExecuteControlCommand(BuildRunArguments(spec, true));

    if (result.exit_code && *result.exit_code == 0) {
        std::string container_id = StringUtils::Trim(result.stdout_output);
        spdlog::info("Container started: {}", container_id.substr(0, 12));
        return;
    }

    auto message = FirstLine(result.stderr_output);
    spdlog::error("Failed to start container {}: {}", spec.name, message);

    auto kind = ClassifyFailure(result.stderr_output);
    throw SandboxError(kind.value_or(ErrorKind::RUNTIME_UNAVAILABLE),
                       "Failed to start container " + spec.name + ": " + message);
}

RunOutcome DockerRuntime::Exec(const std::string& name,
                               const std::vector<std::string>& command,
                               std::chrono::milliseconds timeout) {
    spdlog::debug("Executing in container {}: {}", name, StringUtils::Join(command, " "));

    std::vector<std::string> args = {"exec", name};
    args.insert(args.end(), command.begin(), command.end());

    auto result = ExecuteDockerCommand(args, timeout);

    if (!result.timed_out && result.exit_code && *result.exit_code != 0) {
        auto kind = ClassifyFailure(result.stderr_output);
        bool engine_diagnostic = (kind && *kind == ErrorKind::RUNTIME_UNAVAILABLE) ||
                                 IsMissingObject(result.stderr_output);

        // The command's own output may quote engine messages; only a missing
        // container or unreachable engine makes them authoritative.
        // Inspect() raises RUNTIME_UNAVAILABLE itself when the engine is down.
        if (engine_diagnostic && !Inspect(name)) {
            throw SandboxError(ErrorKind::SANDBOX_NOT_FOUND, "Container not found: " + name);
        }
    }

    RunOutcome outcome;
    outcome.exit_code = result.exit_code;
    outcome.timed_out = result.timed_out;
    outcome.stdout_output = std::move(result.stdout_output);
    outcome.stderr_output = std::move(result.stderr_output);
    outcome.elapsed = result.duration;
    return outcome;
}

void DockerRuntime::Remove(const std::string& name) {
    spdlog::info("Removing container: {}", name);

    auto stop = ExecuteControlCommand({
        "stop",
        "--time", std::to_string(config_.stop_timeout.count()),
        name
    });
    if (stop.exit_code != 0 && !IsMissingObject(stop.stderr_output)) {
        auto kind = ClassifyFailure(stop.stderr_output);
        if (kind && *kind == ErrorKind::RUNTIME_UNAVAILABLE) {
            throw SandboxError(*kind, "Failed to stop container " + name + ": " +
                               FirstLine(stop.stderr_output));
        }
        spdlog::warn("Stopping {} failed, forcing removal: {}", name, FirstLine(stop.stderr_output));
    }

    auto rm = ExecuteControlCommand({"rm", "--force", name});
    if (rm.exit_code == 0 || IsMissingObject(rm.stderr_output)) {
        spdlog::info("Container removed: {}", name);
        return;
    }

    auto message = FirstLine(rm.stderr_output);
    spdlog::error("Failed to remove container {}: {}", name, message);
    throw SandboxError(ErrorKind::RUNTIME_UNAVAILABLE,
                       "Failed to remove container " + name + ": " + message);
}

std::optional<EnvironmentState> DockerRuntime::Inspect(const std::string& name) {
    auto result = ExecuteControlCommand({
        "inspect",
        "--format", "{{.State.Status}}",
        name
    });

    if (result.exit_code == 0) {
        return ParseState(StringUtils::Trim(result.stdout_output));
    }
    if (IsMissingObject(result.stderr_output)) {
        return std::nullopt;
    }

    throw SandboxError(ErrorKind::RUNTIME_UNAVAILABLE,
                       "Failed to inspect container " + name + ": " +
                       FirstLine(result.stderr_output));
}

void DockerRuntime::EnsureNetwork(const std::string& name) {
    auto inspect = ExecuteControlCommand({"network", "inspect", name});
    if (inspect.exit_code == 0) {
        spdlog::debug("Network {} already exists", name);
        return;
    }

    spdlog::info("Creating network: {}", name);
    auto create = ExecuteControlCommand({"network", "create", "--driver", "bridge", name});
    if (create.exit_code == 0 ||
        StringUtils::Contains(StringUtils::ToLower(create.stderr_output), "already exists")) {
        return;
    }

    throw SandboxError(ErrorKind::RUNTIME_UNAVAILABLE,
                       "Failed to create network " + name + ": " +
                       FirstLine(create.stderr_output));
}

// ============================================================================
// RUNTIME DETECTION
// ============================================================================

bool DockerRuntime::IsAvailable() {
    try {
        auto result = ExecuteControlCommand({"version", "--format", "{{.Server.Version}}"});
        return result.exit_code == 0;
    }
    catch (const SandboxError& e) {
        spdlog::debug("Runtime availability check failed: {}", e.what());
        return false;
    }
}

std::string DockerRuntime::GetRuntimeVersion() {
    try {
        auto result = ExecuteControlCommand({"version", "--format", "{{.Server.Version}}"});
        if (result.exit_code == 0) {
            return StringUtils::Trim(result.stdout_output);
        }
    }
    catch (const SandboxError& e) {
        spdlog::debug("Runtime version query failed: {}", e.what());
    }
    return "unknown";
}

// ============================================================================
// COMMAND CONSTRUCTION
// ============================================================================

std::vector<std::string> DockerRuntime::BuildRunArguments(const IsolationSpec& spec, bool detached) {
    std::vector<std::string> args;

    args.push_back("run");
    args.push_back(detached ? "--detach" : "--rm");

    if (!spec.name.empty()) {
        args.push_back("--name");
        args.push_back(spec.name);
    }

    // Resource limits
    if (spec.memory_limit_mb > 0) {
        args.push_back("--memory=" + std::to_string(spec.memory_limit_mb) + "m");
        args.push_back("--memory-swap=" + std::to_string(spec.memory_limit_mb) + "m");
    }
    if (spec.cpu_limit > 0) {
        args.push_back("--cpus=" + FormatCpus(spec.cpu_limit));
    }
    if (spec.pids_limit > 0) {
        args.push_back("--pids-limit=" + std::to_string(spec.pids_limit));
    }

    // Network
    switch (spec.network_mode) {
        case NetworkMode::NONE:
            args.push_back("--network=none");
            break;
        case NetworkMode::ISOLATED:
            args.push_back("--network=" + (spec.network_name.empty() ? std::string("bridge")
                                                                     : spec.network_name));
            break;
    }

    // Privileges
    args.push_back("--security-opt=no-new-privileges");
    if (spec.unprivileged_user) {
        args.push_back("--user=" + spec.user);
        args.push_back("--cap-drop=ALL");
    }

    // Filesystem
    if (spec.workspace) {
        args.push_back("--volume=" + std::filesystem::absolute(*spec.workspace).string() +
                       ":" + spec.mount_point.string());
    }
    if (!spec.working_dir.empty()) {
        args.push_back("--workdir=" + spec.working_dir.string());
    }

    for (const auto& [key, value] : spec.environment) {
        args.push_back("--env=" + key + "=" + value);
    }

    args.push_back(spec.image);
    args.insert(args.end(), spec.command.begin(), spec.command.end());

    return args;
}

std::optional<ErrorKind> DockerRuntime::ClassifyFailure(const std::string& stderr_output) {
    auto lower = StringUtils::ToLower(stderr_output);

    static const std::vector<std::string> daemon_patterns = {
        "cannot connect to the docker daemon",
        "is the docker daemon running",
        "error during connect",
        "permission denied while trying to connect",
        "cannot connect to podman"
    };
    static const std::vector<std::string> image_patterns = {
        "pull access denied",
        "manifest unknown",
        "repository does not exist",
        "no such image",
        "failed to resolve reference",
        "error pulling image",
        "initializing source"
    };

    for (const auto& pattern : daemon_patterns) {
        if (StringUtils::Contains(lower, pattern)) return ErrorKind::RUNTIME_UNAVAILABLE;
    }
    for (const auto& pattern : image_patterns) {
        if (StringUtils::Contains(lower, pattern)) return ErrorKind::IMAGE_UNAVAILABLE;
    }
    if (StringUtils::Contains(lower, "is already in use")) {
        return ErrorKind::SANDBOX_NAME_CONFLICT;
    }

    return std::nullopt;
}

EnvironmentState DockerRuntime::ParseState(const std::string& state_str) {
    if (state_str == "created") return EnvironmentState::CREATED;
    if (state_str == "running") return EnvironmentState::RUNNING;
    if (state_str == "restarting") return EnvironmentState::RUNNING;
    if (state_str == "paused") return EnvironmentState::PAUSED;
    if (state_str == "exited") return EnvironmentState::EXITED;
    if (state_str == "removing") return EnvironmentState::EXITED;
    if (state_str == "stopped") return EnvironmentState::EXITED;
    if (state_str == "dead") return EnvironmentState::DEAD;
    return EnvironmentState::UNKNOWN;
}

// ============================================================================
// CLI INVOCATION
// ============================================================================

utils::ProcessResult DockerRuntime::ExecuteDockerCommand(const std::vector<std::string>& args,
                                                         std::chrono::milliseconds timeout,
                                                         std::function<void()> on_timeout) const {
    utils::ProcessOptions options;
    options.argv.reserve(args.size() + 1);
    options.argv.push_back(binary_);
    options.argv.insert(options.argv.end(), args.begin(), args.end());
    options.timeout = timeout;
    options.on_timeout = std::move(on_timeout);
    options.max_output_bytes = config_.max_output_bytes;

    spdlog::debug("Executing: {} {}", binary_, StringUtils::Truncate(StringUtils::Join(args, " "), 512));

    try {
        return utils::RunProcess(options);
    }
    catch (const std::system_error& e) {
        spdlog::error("Container engine '{}' cannot be started: {}", binary_, e.what());
        throw SandboxError(ErrorKind::RUNTIME_UNAVAILABLE,
                           "Container engine '" + binary_ + "' is not available: " + e.what());
    }
}

utils::ProcessResult DockerRuntime::ExecuteControlCommand(const std::vector<std::string>& args) const {
    auto result = ExecuteDockerCommand(args, config_.control_timeout);
    if (result.timed_out) {
        throw SandboxError(ErrorKind::RUNTIME_UNAVAILABLE,
                           "Container engine did not answer '" + args.front() + "' within " +
                           std::to_string(config_.control_timeout.count()) + "s");
    }
    return result;
}

void DockerRuntime::ForceRemove(const std::string& name) const {
    auto result = ExecuteControlCommand({"rm", "--force", name});
    if (result.exit_code != 0 && !IsMissingObject(result.stderr_output)) {
        spdlog::warn("Forced removal of {} failed: {}", name, FirstLine(result.stderr_output));
    }
}

} // namespace runtime
} // namespace codebox
