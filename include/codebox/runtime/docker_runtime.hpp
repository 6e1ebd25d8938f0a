/**
 * @file docker_runtime.hpp
 * @brief IsolationRuntime backed by the Docker or Podman command line
 *
 * Every operation is one invocation of the engine CLI through RunProcess.
 * Podman accepts the same arguments, so both engines share this class and
 * differ only in the binary that is spawned.
 *
 * @date 2025
 */

#pragma once

#include "codebox/core/errors.hpp"
#include "codebox/runtime/isolation_runtime.hpp"
#include "codebox/utils/process_utils.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace codebox {
namespace runtime {

/**
 * @enum ContainerRuntime
 * @brief Supported container engines
 */
enum class ContainerRuntime {
    DOCKER,  ///< Docker Engine
    PODMAN   ///< Podman (daemonless)
};

/**
 * @brief Parse "docker" / "podman"
 */
std::optional<ContainerRuntime> ParseContainerRuntime(const std::string& name);

std::string ContainerRuntimeToString(ContainerRuntime runtime);

/**
 * @class DockerRuntime
 * @brief Container engine adapter over the Docker/Podman CLI
 *
 * **Timeouts**: Killing the CLI client does not stop the container it
 * started, so when a one-shot run hits its deadline the container is also
 * force-removed by name.
 *
 * **Error Mapping**:
 * - binary missing / not executable: RUNTIME_UNAVAILABLE
 * - daemon unreachable: RUNTIME_UNAVAILABLE
 * - image pull failure (exit 125): IMAGE_UNAVAILABLE
 * - container name already taken: SANDBOX_NAME_CONFLICT
 *
 * **Usage Example**:
 * @code
 * DockerRuntime::Config config;
 * config.runtime = ContainerRuntime::DOCKER;
 * DockerRuntime docker(config);
 *
 * IsolationSpec spec;
 * spec.name = "codebox-run-1";
 * spec.image = "alpine:latest";
 * spec.command = {"echo", "hello"};
 * auto outcome = docker.Run(spec, std::chrono::seconds(5));
 * @endcode
 */
class DockerRuntime : public IsolationRuntime {
public:
    /**
     * @struct Config
     * @brief Engine binary and control-plane limits
     */
    struct Config {
        ContainerRuntime runtime{ContainerRuntime::DOCKER};  ///< Engine flavor
        std::string binary;                                  ///< Override binary (empty = flavor default)
        std::chrono::seconds control_timeout{120};           ///< Deadline for start/stop/inspect calls
        std::chrono::seconds stop_timeout{2};                ///< Grace period passed to `stop --time`
        std::size_t max_output_bytes{1024 * 1024};           ///< Per-stream capture cap
    };

    explicit DockerRuntime(const Config& config);
    ~DockerRuntime() override = default;

    RunOutcome Run(const IsolationSpec& spec, std::chrono::milliseconds timeout) override;
    void StartDetached(const IsolationSpec& spec) override;
    RunOutcome Exec(const std::string& name,
                    const std::vector<std::string>& command,
                    std::chrono::milliseconds timeout) override;
    void Remove(const std::string& name) override;
    std::optional<EnvironmentState> Inspect(const std::string& name) override;
    void EnsureNetwork(const std::string& name) override;
    bool IsAvailable() override;

    /**
     * @brief Engine server version, "unknown" if it cannot be queried
     */
    std::string GetRuntimeVersion();

    const std::string& Binary() const { return binary_; }

    /**
     * @brief Arguments (without the binary) for `run` of @p spec
     * @param spec Container settings
     * @param detached Long-lived `run -d` instead of `run --rm`
     */
    static std::vector<std::string> BuildRunArguments(const IsolationSpec& spec, bool detached);

    /**
     * @brief Map engine diagnostics to an error kind
     * @return Kind, or empty when the text is not an engine-level failure
     */
    static std::optional<core::ErrorKind> ClassifyFailure(const std::string& stderr_output);

    static EnvironmentState ParseState(const std::string& state_str);

private:
    utils::ProcessResult ExecuteDockerCommand(const std::vector<std::string>& args,
                                              std::chrono::milliseconds timeout,
                                              std::function<void()> on_timeout = nullptr) const;
    utils::ProcessResult ExecuteControlCommand(const std::vector<std::string>& args) const;
    void ForceRemove(const std::string& name) const;

    Config config_;
    std::string binary_;
};

} // namespace runtime
} // namespace codebox
