/**
 * @file service_config.hpp
 * @brief Aggregated service settings and their JSON file form
 *
 * Defaults live in the member initializers of the component Config
 * structs. A JSON file overrides any subset of them; command-line flags are
 * applied on top by main().
 *
 * **File Format**:
 * @code{.json}
 * {
 *   "runtime": "docker",
 *   "runtime_binary": "/usr/bin/docker",
 *   "workspace_root": "/var/tmp/codebox",
 *   "default_timeout_s": 30,
 *   "max_timeout_s": 600,
 *   "max_output_bytes": 1048576,
 *   "max_concurrent_requests": 16,
 *   "ephemeral": { "memory_mb": 512, "cpus": 1.0, "user": "1000:1000" },
 *   "persistent": { "memory_mb": 1024, "cpus": 2.0, "network": "codebox-net",
 *                   "install_timeout_s": 300, "cleanup_on_shutdown": true },
 *   "images": { "python": "python:3.12-alpine" },
 *   "log_level": "info"
 * }
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include "codebox/core/execution_engine.hpp"
#include "codebox/core/language_registry.hpp"
#include "codebox/core/sandbox_manager.hpp"
#include "codebox/runtime/docker_runtime.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <string>

namespace codebox {
namespace server {

/**
 * @struct ServiceConfig
 * @brief Everything needed to wire up a codebox service
 */
struct ServiceConfig {
    runtime::DockerRuntime::Config runtime;        ///< Engine binary and control limits
    core::ExecutionEngine::Config execution;       ///< Ephemeral defaults
    core::SandboxManager::Config sandbox;          ///< Persistent defaults
    std::map<std::string, std::string> images;     ///< Per-language image overrides
    std::size_t max_concurrent_requests{16};       ///< Tool calls handled at once
    std::string log_level{"info"};                 ///< spdlog level name
};

/**
 * @brief Overlay the keys present in @p document onto @p config
 * @throws std::runtime_error on wrong value types or invalid values
 */
void ApplyConfigJson(ServiceConfig& config, const nlohmann::json& document);

/**
 * @brief Read a JSON configuration file over the defaults
 * @throws std::runtime_error if the file cannot be read or parsed
 */
ServiceConfig LoadConfigFile(const std::filesystem::path& path);

/**
 * @brief Built-in language registry with the configured image overrides
 * @throws std::invalid_argument for overrides naming unknown languages
 */
core::LanguageRegistry BuildRegistry(const ServiceConfig& config);

} // namespace server
} // namespace codebox
