/**
 * @file execution_engine.hpp
 * @brief One-shot ("ephemeral") code execution
 *
 * Each call materializes the caller's code in a fresh workspace, runs it in
 * a throwaway container under a deadline and returns whatever the container
 * produced. Nothing survives the call: the container is started with --rm
 * and the workspace is deleted on every exit path.
 *
 * **Execution Pipeline**:
 * ```
 * validate -> resolve profile -> create workspace -> write main<ext>
 *          -> compose command (install && run) -> runtime.Run(spec, timeout)
 *          -> remove workspace -> ExecutionResult
 * ```
 *
 * @date 2025
 */

#pragma once

#include "codebox/core/language_registry.hpp"
#include "codebox/runtime/isolation_runtime.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace codebox {
namespace core {

/**
 * @enum ExecutionOutcome
 * @brief Terminal state of one ephemeral execution
 */
enum class ExecutionOutcome {
    COMPLETED,      ///< Exited with status 0
    TIMED_OUT,      ///< Killed by the deadline
    RUNTIME_ERROR   ///< Exited with non-zero status
};

/**
 * @brief Wire tag of an outcome ("completed", "timed-out", "runtime-error")
 */
std::string ExecutionOutcomeToString(ExecutionOutcome outcome);

/**
 * @struct ExecutionRequest
 * @brief Caller input for one ephemeral execution
 */
struct ExecutionRequest {
    std::string language;                              ///< Language identifier
    std::string code;                                  ///< Source text
    std::optional<std::chrono::milliseconds> timeout;  ///< Engine default when empty
    std::vector<std::string> dependencies;             ///< Packages to install first
};

/**
 * @struct ExecutionResult
 * @brief Everything observed about one execution
 */
struct ExecutionResult {
    std::string execution_id;                    ///< UUID of this execution
    std::string language;                        ///< Language identifier
    std::optional<int> exit_code;                ///< Empty when timed out
    std::string stdout_output;                   ///< Captured standard output
    std::string stderr_output;                   ///< Captured standard error
    std::chrono::milliseconds execution_time{0}; ///< Wall-clock time of the container run
    ExecutionOutcome outcome{ExecutionOutcome::COMPLETED};
};

/**
 * @class ExecutionEngine
 * @brief Runs caller code in throwaway containers
 *
 * **Thread Safety**: ExecuteEphemeral() may be called concurrently; each
 * call owns its workspace and container name.
 *
 * **Usage Example**:
 * @code
 * ExecutionEngine engine(registry, docker, ExecutionEngine::Config{});
 *
 * ExecutionRequest request;
 * request.language = "python";
 * request.code = "print(1+1)";
 * auto result = engine.ExecuteEphemeral(request);
 * // result.stdout_output == "2\n", result.outcome == COMPLETED
 * @endcode
 */
class ExecutionEngine {
public:
    /**
     * @struct Config
     * @brief Ephemeral container defaults
     */
    struct Config {
        std::filesystem::path workspace_root{std::filesystem::temp_directory_path()};
        std::string workspace_prefix{"codebox-"};
        std::string container_prefix{"codebox-run-"};

        // Resource Limits
        std::size_t memory_limit_mb{512};
        double cpu_limit{1.0};
        int pids_limit{256};
        std::string user{"1000:1000"};

        // Deadlines
        std::chrono::milliseconds default_timeout{std::chrono::seconds(30)};
        std::chrono::milliseconds max_timeout{std::chrono::seconds(600)};

        /// Attach to the default bridge network when an install runs
        bool allow_network_for_dependencies{false};
    };

    ExecutionEngine(const LanguageRegistry& registry,
                    runtime::IsolationRuntime& runtime,
                    Config config);

    /**
     * @brief Run one request to completion or deadline
     *
     * A timeout is a result, not an error.
     *
     * @throws SandboxError INVALID_REQUEST, UNSUPPORTED_LANGUAGE (before the
     *         runtime is touched), or whatever the runtime raises
     */
    ExecutionResult ExecuteEphemeral(const ExecutionRequest& request);

    /**
     * @brief Container command for @p profile with optional install step
     *
     * With an installer and dependencies: `sh -c "<install> && <run>"`.
     */
    static std::vector<std::string> ComposeCommand(const LanguageProfile& profile,
                                                   const std::vector<std::string>& dependencies);

    /**
     * @brief Convert a caller timeout given in seconds
     *
     * Sub-millisecond values round up to 1 ms.
     *
     * @throws SandboxError INVALID_REQUEST if @p seconds is not a positive
     *         finite number or exceeds Config::max_timeout
     */
    std::chrono::milliseconds TimeoutFromSeconds(double seconds) const;

    const Config& GetConfig() const { return config_; }

private:
    std::chrono::milliseconds ValidateRequest(const ExecutionRequest& request) const;

    const LanguageRegistry& registry_;
    runtime::IsolationRuntime& runtime_;
    Config config_;
};

} // namespace core
} // namespace codebox
