/**
 * @file execution_engine.cpp
 * @brief Implementation of ExecutionEngine
 *
 * @date 2025
 */

#include "codebox/core/execution_engine.hpp"
#include "codebox/core/errors.hpp"
#include "codebox/core/workspace.hpp"
#include "codebox/utils/id_utils.hpp"
#include "codebox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <cmath>

namespace codebox {
namespace core {

using utils::StringUtils;

namespace {

std::string TimeoutTooLongMessage(std::chrono::milliseconds max_timeout) {
    return "Timeout exceeds maximum of " + std::to_string(max_timeout.count() / 1000) + "s";
}

} // anonymous namespace

std::string ExecutionOutcomeToString(ExecutionOutcome outcome) {
    switch (outcome) {
        case ExecutionOutcome::COMPLETED: return "completed";
        case ExecutionOutcome::TIMED_OUT: return "timed-out";
        case ExecutionOutcome::RUNTIME_ERROR: return "runtime-error";
    }
    return "runtime-error";
}

ExecutionEngine::ExecutionEngine(const LanguageRegistry& registry,
                                 runtime::IsolationRuntime& runtime,
                                 Config config)
    : registry_(registry)
    , runtime_(runtime)
    , config_(std::move(config)) {
}

// ============================================================================
// EPHEMERAL EXECUTION
// ============================================================================

ExecutionResult ExecutionEngine::ExecuteEphemeral(const ExecutionRequest& request) {
    auto timeout = ValidateRequest(request);
    const LanguageProfile& profile = registry_.Resolve(request.language);

    std::string execution_id = utils::GenerateUUID();
    spdlog::info("Execution {} started: {} ({} bytes, timeout {} ms, {} dependencies)",
                 execution_id, profile.Id(), request.code.size(),
                 timeout.count(), request.dependencies.size());

    // Removed on scope exit if anything below throws
    auto workspace = Workspace::Create(config_.workspace_root, config_.workspace_prefix);
    std::string source_file = profile.SourceFileName();
    workspace.WriteFile(source_file, request.code);

    bool installs = !request.dependencies.empty() && profile.install_command.has_value();
    if (!request.dependencies.empty() && !installs) {
        spdlog::warn("Language {} has no package installer, ignoring {} dependencies",
                     profile.Id(), request.dependencies.size());
    }

    runtime::IsolationSpec spec;
    spec.name = config_.container_prefix + execution_id;
    spec.image = profile.image;
    spec.workspace = workspace.Path();
    spec.mount_point = "/workspace";
    spec.working_dir = "/workspace";
    spec.command = ComposeCommand(profile, request.dependencies);
    spec.memory_limit_mb = config_.memory_limit_mb;
    spec.cpu_limit = config_.cpu_limit;
    spec.pids_limit = config_.pids_limit;
    spec.unprivileged_user = true;
    spec.user = config_.user;
    spec.environment["HOME"] = "/tmp";

    if (installs && config_.allow_network_for_dependencies) {
        spec.network_mode = runtime::NetworkMode::ISOLATED;
        spec.network_name = "bridge";
    } else {
        spec.network_mode = runtime::NetworkMode::NONE;
    }

    auto outcome = runtime_.Run(spec, timeout);

    if (!workspace.Remove()) {
        throw SandboxError(ErrorKind::INTERNAL,
                           "Failed to remove workspace for execution " + execution_id);
    }

    ExecutionResult result;
    result.execution_id = execution_id;
    result.language = profile.Id();
    result.exit_code = outcome.timed_out ? std::nullopt : outcome.exit_code;
    result.stdout_output = std::move(outcome.stdout_output);
    result.stderr_output = std::move(outcome.stderr_output);
    result.execution_time = outcome.elapsed;

    if (outcome.timed_out) {
        result.outcome = ExecutionOutcome::TIMED_OUT;
    } else if (outcome.exit_code && *outcome.exit_code == 0) {
        result.outcome = ExecutionOutcome::COMPLETED;
    } else {
        result.outcome = ExecutionOutcome::RUNTIME_ERROR;
    }

    spdlog::info("Execution {} finished: {} (exit: {}, {} ms)",
                 execution_id, ExecutionOutcomeToString(result.outcome),
                 result.exit_code ? std::to_string(*result.exit_code) : std::string("none"),
                 result.execution_time.count());

    return result;
}

// ============================================================================
// HELPERS
// ============================================================================

std::vector<std::string> ExecutionEngine::ComposeCommand(const LanguageProfile& profile,
                                                         const std::vector<std::string>& dependencies) {
    auto run = profile.BuildRunCommand(profile.SourceFileName());
    auto install = profile.BuildInstallCommand(dependencies);
    if (!install) {
        return run;
    }

    return {"sh", "-c", *install + " && " + StringUtils::ShellJoin(run)};
}

std::chrono::milliseconds ExecutionEngine::TimeoutFromSeconds(double seconds) const {
    // Range-checked as a double; only bounded values reach the integer cast
    if (!std::isfinite(seconds) || seconds <= 0) {
        throw SandboxError(ErrorKind::INVALID_REQUEST, "Timeout must be positive");
    }

    std::chrono::duration<double> requested(seconds);
    if (requested > config_.max_timeout) {
        throw SandboxError(ErrorKind::INVALID_REQUEST, TimeoutTooLongMessage(config_.max_timeout));
    }

    return std::chrono::ceil<std::chrono::milliseconds>(requested);
}

std::chrono::milliseconds ExecutionEngine::ValidateRequest(const ExecutionRequest& request) const {
    auto timeout = request.timeout.value_or(config_.default_timeout);

    if (timeout.count() <= 0) {
        throw SandboxError(ErrorKind::INVALID_REQUEST, "Timeout must be positive");
    }
    if (timeout > config_.max_timeout) {
        throw SandboxError(ErrorKind::INVALID_REQUEST, TimeoutTooLongMessage(config_.max_timeout));
    }
    for (const auto& dependency : request.dependencies) {
        if (StringUtils::Trim(dependency).empty()) {
            throw SandboxError(ErrorKind::INVALID_REQUEST, "Dependency names must not be empty");
        }
    }

    return timeout;
}

} // namespace core
} // namespace codebox
