/**
 * @file sandbox_manager.hpp
 * @brief Named long-lived ("persistent") sandboxes
 *
 * A sandbox is a detached container kept alive by an idle process, attached
 * to a dedicated bridge network, optionally with packages installed right
 * after start. The manager owns the only record of which sandboxes exist;
 * the container is looked up by name and never owned independently.
 *
 * **Lifecycle**:
 * ```
 * CreateSandbox: reserve id (CREATED) -> run -d (RUNNING) -> exec install
 *                                     \-> failure: remove container, drop record
 * DeleteSandbox: stop + rm -> DELETED (record dropped, id free again)
 * ```
 *
 * **Locking**:
 * - Create and delete on the same id are serialized by a per-id mutex
 * - The record map has its own mutex, never held across engine calls
 * - Operations on different ids never wait for each other
 *
 * @date 2025
 */

#pragma once

#include "codebox/core/language_registry.hpp"
#include "codebox/runtime/isolation_runtime.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace codebox {
namespace core {

/**
 * @enum SandboxStatus
 * @brief Lifecycle state of a sandbox
 */
enum class SandboxStatus {
    CREATED,   ///< Id reserved, container starting
    RUNNING,   ///< Container up
    STOPPED,   ///< Container exited on its own
    DELETED    ///< Removed through DeleteSandbox (terminal)
};

std::string SandboxStatusToString(SandboxStatus status);

/**
 * @struct Sandbox
 * @brief Manager record of one persistent sandbox
 */
struct Sandbox {
    std::string id;                                    ///< Caller name or generated UUID
    std::string language;                              ///< Language identifier
    SandboxStatus status{SandboxStatus::CREATED};      ///< Current state
    std::chrono::system_clock::time_point created_at;  ///< Reservation time
    std::vector<std::string> dependencies;             ///< Packages requested at creation
    std::string environment_name;                      ///< Backing container name
    std::uint64_t sequence{0};                         ///< Creation order
};

/**
 * @struct SandboxSummary
 * @brief One row of ListSandboxes()
 */
struct SandboxSummary {
    std::string id;
    std::string language;
    SandboxStatus status{SandboxStatus::RUNNING};
    std::chrono::system_clock::time_point created_at;
    std::chrono::seconds age{0};
};

/**
 * @class SandboxManager
 * @brief Creates, lists and deletes persistent sandboxes
 *
 * **Thread Safety**: All public methods may be called concurrently.
 *
 * **Usage Example**:
 * @code
 * SandboxManager manager(registry, docker, SandboxManager::Config{});
 * auto sandbox = manager.CreateSandbox("python", std::string("s2"), {"requests"});
 * for (const auto& row : manager.ListSandboxes()) {
 *     spdlog::info("{} {}", row.id, SandboxStatusToString(row.status));
 * }
 * manager.DeleteSandbox("s2");
 * @endcode
 */
class SandboxManager {
public:
    /**
     * @struct Config
     * @brief Persistent container defaults
     */
    struct Config {
        std::string name_prefix{"sandbox-"};            ///< Container name = prefix + id
        std::size_t memory_limit_mb{1024};
        double cpu_limit{2.0};
        int pids_limit{512};
        std::string network_name{"codebox-net"};        ///< Bridge network created on first use
        std::chrono::milliseconds install_timeout{std::chrono::seconds(300)};
        bool cleanup_on_shutdown{true};                 ///< Shutdown() removes remaining containers
        std::vector<std::string> keepalive_command{"tail", "-f", "/dev/null"};
    };

    SandboxManager(const LanguageRegistry& registry,
                   runtime::IsolationRuntime& runtime,
                   Config config);
    ~SandboxManager();

    SandboxManager(const SandboxManager&) = delete;
    SandboxManager& operator=(const SandboxManager&) = delete;

    /**
     * @brief Start a new sandbox and install @p dependencies in it
     * @param language Language identifier
     * @param name Sandbox id; a UUID is generated when absent or empty
     * @param dependencies Packages for the language's installer
     * @return Record as of the end of creation
     * @throws SandboxError UNSUPPORTED_LANGUAGE, INVALID_REQUEST,
     *         SANDBOX_NAME_CONFLICT, DEPENDENCY_INSTALL_FAILURE or a runtime kind
     */
    Sandbox CreateSandbox(const std::string& language,
                          const std::optional<std::string>& name,
                          const std::vector<std::string>& dependencies);

    /**
     * @brief Non-deleted sandboxes, oldest first
     *
     * Running sandboxes whose container has exited are reported STOPPED.
     */
    std::vector<SandboxSummary> ListSandboxes();

    /**
     * @brief Stop and remove a sandbox
     * @return Final record with status DELETED
     * @throws SandboxError SANDBOX_NOT_FOUND if no live sandbox has @p id
     */
    Sandbox DeleteSandbox(const std::string& id);

    /**
     * @brief Remove every remaining sandbox if cleanup_on_shutdown is set
     */
    void Shutdown();

    /**
     * @brief Whether @p name is usable as a sandbox id
     *
     * Same charset as container names: `[A-Za-z0-9][A-Za-z0-9_.-]*`, at
     * most 128 characters.
     */
    static bool IsValidName(const std::string& name);

private:
    struct IdLock {
        std::mutex mutex;
        std::size_t users{0};
    };
    class IdLockGuard;

    void EnsureNetwork();
    void SetStatus(const std::string& id, std::uint64_t sequence, SandboxStatus status);
    void DropRecord(const std::string& id, std::uint64_t sequence);
    void Rollback(const Sandbox& record);

    const LanguageRegistry& registry_;
    runtime::IsolationRuntime& runtime_;
    Config config_;

    std::mutex state_mutex_;
    std::map<std::string, Sandbox> sandboxes_;
    std::map<std::string, std::shared_ptr<IdLock>> id_locks_;
    std::uint64_t next_sequence_{0};

    std::once_flag network_once_;
};

} // namespace core
} // namespace codebox
