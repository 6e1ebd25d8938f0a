/**
 * @file service_config.cpp
 * @brief JSON configuration loading
 *
 * @date 2025
 */

#include "codebox/server/service_config.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <set>
#include <stdexcept>

namespace codebox {
namespace server {

using json = nlohmann::json;

namespace {

const std::set<std::string> kTopLevelKeys = {
    "runtime", "runtime_binary", "workspace_root", "default_timeout_s", "max_timeout_s",
    "max_output_bytes", "max_concurrent_requests", "ephemeral", "persistent", "images", "log_level"
};

void WarnUnknownKeys(const json& object, const std::set<std::string>& known, const std::string& scope) {
    for (const auto& [key, value] : object.items()) {
        if (!known.count(key)) {
            spdlog::warn("Ignoring unknown configuration key: {}{}", scope, key);
        }
    }
}

std::chrono::milliseconds SecondsToMillis(double seconds, const std::string& key) {
    if (seconds <= 0) {
        throw std::runtime_error("Configuration value '" + key + "' must be positive");
    }
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

void ApplyEphemeral(ServiceConfig& config, const json& section) {
    WarnUnknownKeys(section, {"memory_mb", "cpus", "user"}, "ephemeral.");

    if (section.contains("memory_mb")) {
        config.execution.memory_limit_mb = section.at("memory_mb").get<std::size_t>();
    }
    if (section.contains("cpus")) {
        config.execution.cpu_limit = section.at("cpus").get<double>();
    }
    if (section.contains("user")) {
        config.execution.user = section.at("user").get<std::string>();
    }
}

void ApplyPersistent(ServiceConfig& config, const json& section) {
    WarnUnknownKeys(section,
                    {"memory_mb", "cpus", "network", "install_timeout_s", "cleanup_on_shutdown"},
                    "persistent.");

    if (section.contains("memory_mb")) {
        config.sandbox.memory_limit_mb = section.at("memory_mb").get<std::size_t>();
    }
    if (section.contains("cpus")) {
        config.sandbox.cpu_limit = section.at("cpus").get<double>();
    }
    if (section.contains("network")) {
        config.sandbox.network_name = section.at("network").get<std::string>();
    }
    if (section.contains("install_timeout_s")) {
        config.sandbox.install_timeout = SecondsToMillis(
            section.at("install_timeout_s").get<double>(), "persistent.install_timeout_s");
    }
    if (section.contains("cleanup_on_shutdown")) {
        config.sandbox.cleanup_on_shutdown = section.at("cleanup_on_shutdown").get<bool>();
    }
}

} // anonymous namespace

// ============================================================================
// JSON OVERLAY
// ============================================================================

void ApplyConfigJson(ServiceConfig& config, const json& document) {
    if (!document.is_object()) {
        throw std::runtime_error("Configuration must be a JSON object");
    }

    try {
        WarnUnknownKeys(document, kTopLevelKeys, "");

        if (document.contains("runtime")) {
            auto name = document.at("runtime").get<std::string>();
            auto runtime = runtime::ParseContainerRuntime(name);
            if (!runtime) {
                throw std::runtime_error("Unknown container runtime: " + name);
            }
            config.runtime.runtime = *runtime;
        }
        if (document.contains("runtime_binary")) {
            config.runtime.binary = document.at("runtime_binary").get<std::string>();
        }
        if (document.contains("workspace_root")) {
            config.execution.workspace_root = document.at("workspace_root").get<std::string>();
        }
        if (document.contains("default_timeout_s")) {
            config.execution.default_timeout = SecondsToMillis(
                document.at("default_timeout_s").get<double>(), "default_timeout_s");
        }
        if (document.contains("max_timeout_s")) {
            config.execution.max_timeout = SecondsToMillis(
                document.at("max_timeout_s").get<double>(), "max_timeout_s");
        }
        if (document.contains("max_output_bytes")) {
            config.runtime.max_output_bytes = document.at("max_output_bytes").get<std::size_t>();
        }
        if (document.contains("max_concurrent_requests")) {
            config.max_concurrent_requests = document.at("max_concurrent_requests").get<std::size_t>();
            if (config.max_concurrent_requests == 0) {
                throw std::runtime_error("Configuration value 'max_concurrent_requests' must be positive");
            }
        }
        if (document.contains("ephemeral")) {
            ApplyEphemeral(config, document.at("ephemeral"));
        }
        if (document.contains("persistent")) {
            ApplyPersistent(config, document.at("persistent"));
        }
        if (document.contains("images")) {
            for (const auto& [language, image] : document.at("images").items()) {
                config.images[language] = image.get<std::string>();
            }
        }
        if (document.contains("log_level")) {
            config.log_level = document.at("log_level").get<std::string>();
        }
    }
    catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid configuration: ") + e.what());
    }

    if (config.execution.default_timeout > config.execution.max_timeout) {
        throw std::runtime_error("default_timeout_s exceeds max_timeout_s");
    }
}

// ============================================================================
// FILE LOADING
// ============================================================================

ServiceConfig LoadConfigFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open configuration file: " + path.string());
    }

    json document;
    try {
        document = json::parse(file);
    }
    catch (const json::parse_error& e) {
        throw std::runtime_error("Cannot parse " + path.string() + ": " + e.what());
    }

    ServiceConfig config;
    ApplyConfigJson(config, document);

    spdlog::info("Configuration loaded: {}", path.string());
    return config;
}

core::LanguageRegistry BuildRegistry(const ServiceConfig& config) {
    auto registry = core::LanguageRegistry::Builtin();
    if (config.images.empty()) {
        return registry;
    }
    return registry.WithImages(config.images);
}

} // namespace server
} // namespace codebox
