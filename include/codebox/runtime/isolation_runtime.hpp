/**
 * @file isolation_runtime.hpp
 * @brief Abstract boundary to the external isolation engine
 *
 * The execution engine and sandbox manager talk to containers only through
 * this interface. DockerRuntime drives the Docker or Podman CLI; tests
 * substitute a mock. The engine process itself is an unowned collaborator:
 * nothing here caches its state.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace codebox {
namespace runtime {

/**
 * @enum NetworkMode
 * @brief Network attachment of a container
 */
enum class NetworkMode {
    NONE,     ///< No network interface besides loopback
    ISOLATED  ///< Attached to a dedicated named bridge network
};

/**
 * @enum EnvironmentState
 * @brief Coarse lifecycle state of a container as reported by the engine
 */
enum class EnvironmentState {
    CREATED,
    RUNNING,
    PAUSED,
    EXITED,
    DEAD,
    UNKNOWN
};

/**
 * @struct IsolationSpec
 * @brief Resource and isolation settings for one container
 */
struct IsolationSpec {
    std::string name;                                   ///< Container name (unique per engine)
    std::string image;                                  ///< Image reference
    std::optional<std::filesystem::path> workspace;     ///< Host directory to bind-mount
    std::filesystem::path mount_point{"/workspace"};    ///< Where the workspace appears inside
    std::filesystem::path working_dir{"/workspace"};    ///< Initial working directory
    std::vector<std::string> command;                   ///< Command tokens

    // Resource Limits
    std::size_t memory_limit_mb{512};                   ///< Memory cap
    double cpu_limit{1.0};                              ///< CPU cap in cores
    int pids_limit{256};                                ///< Process count cap (0 = unlimited)

    // Isolation
    NetworkMode network_mode{NetworkMode::NONE};        ///< Network attachment
    std::string network_name;                           ///< Bridge network for ISOLATED
    bool unprivileged_user{true};                       ///< Run as @ref user instead of image default
    std::string user{"1000:1000"};                      ///< uid:gid for unprivileged runs
    std::map<std::string, std::string> environment;     ///< Extra environment variables
};

/**
 * @struct RunOutcome
 * @brief What the engine reported for one run or exec
 */
struct RunOutcome {
    std::optional<int> exit_code;            ///< Empty when the deadline killed the run
    bool timed_out{false};                   ///< Deadline fired first
    std::string stdout_output;               ///< Output captured up to exit or kill
    std::string stderr_output;               ///< Error output captured up to exit or kill
    std::chrono::milliseconds elapsed{0};    ///< Wall-clock time
};

/**
 * @class IsolationRuntime
 * @brief Narrow interface over a container engine
 *
 * Failures reaching the engine raise core::SandboxError with
 * RUNTIME_UNAVAILABLE or IMAGE_UNAVAILABLE. A non-zero exit of the workload
 * itself is not a failure; it is reported in RunOutcome.
 *
 * **Thread Safety**: Implementations must allow concurrent calls.
 */
class IsolationRuntime {
public:
    virtual ~IsolationRuntime() = default;

    /**
     * @brief Run a one-shot container to completion or deadline
     * @param spec Container settings; the container is removed afterwards
     * @param timeout Deadline measured from spawn
     */
    virtual RunOutcome Run(const IsolationSpec& spec, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Start a long-lived detached container running spec.command
     */
    virtual void StartDetached(const IsolationSpec& spec) = 0;

    /**
     * @brief Execute a command inside a running container
     */
    virtual RunOutcome Exec(const std::string& name,
                            const std::vector<std::string>& command,
                            std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Stop and remove a container; a missing container is not an error
     */
    virtual void Remove(const std::string& name) = 0;

    /**
     * @brief Current state of a container, empty if it does not exist
     */
    virtual std::optional<EnvironmentState> Inspect(const std::string& name) = 0;

    /**
     * @brief Create the named bridge network unless it already exists
     */
    virtual void EnsureNetwork(const std::string& name) = 0;

    /**
     * @brief Whether the engine answers at all
     */
    virtual bool IsAvailable() = 0;
};

/**
 * @brief Lowercase name of an environment state
 */
std::string EnvironmentStateToString(EnvironmentState state);

} // namespace runtime
} // namespace codebox
