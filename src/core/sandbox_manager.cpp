/**
 * @file sandbox_manager.cpp
 * @brief Implementation of SandboxManager
 *
 * @date 2025
 */

#include "codebox/core/sandbox_manager.hpp"
#include "codebox/core/errors.hpp"
#include "codebox/utils/id_utils.hpp"
#include "codebox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace codebox {
namespace core {

using utils::StringUtils;

namespace {

constexpr std::size_t kMaxNameLength = 128;
constexpr std::size_t kMaxReportedOutput = 2000;

} // anonymous namespace

std::string SandboxStatusToString(SandboxStatus status) {
    switch (status) {
        case SandboxStatus::CREATED: return "created";
        case SandboxStatus::RUNNING: return "running";
        case SandboxStatus::STOPPED: return "stopped";
        case SandboxStatus::DELETED: return "deleted";
    }
    return "unknown";
}

// ============================================================================
// PER-ID SERIALIZATION
// ============================================================================

/**
 * @brief Holds the mutex of one sandbox id for a scope
 *
 * The lock entry is reference counted under state_mutex_ and dropped once
 * no operation on that id is in flight.
 */
class SandboxManager::IdLockGuard {
public:
    IdLockGuard(SandboxManager& manager, std::string id)
        : manager_(manager), id_(std::move(id)) {
        {
            std::lock_guard<std::mutex> lock(manager_.state_mutex_);
            auto& entry = manager_.id_locks_[id_];
            if (!entry) {
                entry = std::make_shared<IdLock>();
            }
            ++entry->users;
            lock_ = entry;
        }
        lock_->mutex.lock();
    }

    ~IdLockGuard() {
        lock_->mutex.unlock();

        std::lock_guard<std::mutex> lock(manager_.state_mutex_);
        if (--lock_->users == 0) {
            manager_.id_locks_.erase(id_);
        }
    }

    IdLockGuard(const IdLockGuard&) = delete;
    IdLockGuard& operator=(const IdLockGuard&) = delete;

private:
    SandboxManager& manager_;
    std::string id_;
    std::shared_ptr<IdLock> lock_;
};

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

SandboxManager::SandboxManager(const LanguageRegistry& registry,
                               runtime::IsolationRuntime& runtime,
                               Config config)
    : registry_(registry)
    , runtime_(runtime)
    , config_(std::move(config)) {
}

SandboxManager::~SandboxManager() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!sandboxes_.empty()) {
        spdlog::debug("Sandbox manager released with {} sandboxes still recorded", sandboxes_.size());
    }
}

// ============================================================================
// CREATE
// ============================================================================

Sandbox SandboxManager::CreateSandbox(const std::string& language,
                                      const std::optional<std::string>& name,
                                      const std::vector<std::string>& dependencies) {
    const LanguageProfile& profile = registry_.Resolve(language);

    for (const auto& dependency : dependencies) {
        if (StringUtils::Trim(dependency).empty()) {
            throw SandboxError(ErrorKind::INVALID_REQUEST, "Dependency names must not be empty");
        }
    }

    std::string id;
    if (name && !name->empty()) {
        if (!IsValidName(*name)) {
            throw SandboxError(ErrorKind::INVALID_REQUEST,
                               "Invalid sandbox name '" + *name +
                               "': use letters, digits, '_', '.', '-' and start with a letter or digit");
        }
        id = *name;
    } else {
        id = utils::GenerateUUID();
    }

    IdLockGuard id_guard(*this, id);

    Sandbox record;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (sandboxes_.count(id)) {
            throw SandboxError(ErrorKind::SANDBOX_NAME_CONFLICT, "Sandbox already exists: " + id);
        }

        record.id = id;
        record.language = profile.Id();
        record.status = SandboxStatus::CREATED;
        record.created_at = std::chrono::system_clock::now();
        record.dependencies = dependencies;
        record.environment_name = config_.name_prefix + id;
        record.sequence = next_sequence_++;
        sandboxes_.emplace(id, record);
    }

    spdlog::info("Creating sandbox {} ({})", id, profile.Id());

    try {
        EnsureNetwork();

        runtime::IsolationSpec spec;
        spec.name = record.environment_name;
        spec.image = profile.image;
        spec.working_dir = "/workspace";
        spec.command = config_.keepalive_command;
        spec.memory_limit_mb = config_.memory_limit_mb;
        spec.cpu_limit = config_.cpu_limit;
        spec.pids_limit = config_.pids_limit;
        spec.network_mode = runtime::NetworkMode::ISOLATED;
        spec.network_name = config_.network_name;
        spec.unprivileged_user = false;

        runtime_.StartDetached(spec);
    }
    catch (const std::exception& e) {
        spdlog::error("Sandbox {} failed to start: {}", id, e.what());
        DropRecord(id, record.sequence);
        throw;
    }

    record.status = SandboxStatus::RUNNING;
    SetStatus(id, record.sequence, SandboxStatus::RUNNING);

    auto install = profile.BuildInstallCommand(dependencies);
    if (!dependencies.empty() && !install) {
        spdlog::warn("Language {} has no package installer, ignoring {} dependencies",
                     profile.Id(), dependencies.size());
    }

    if (install) {
        spdlog::info("Installing {} dependencies in sandbox {}", dependencies.size(), id);

        runtime::RunOutcome outcome;
        try {
            outcome = runtime_.Exec(record.environment_name, {"sh", "-c", *install},
                                    config_.install_timeout);
        }
        catch (const std::exception& e) {
            spdlog::error("Dependency install in sandbox {} failed: {}", id, e.what());
            Rollback(record);
            throw;
        }

        if (outcome.timed_out || !outcome.exit_code || *outcome.exit_code != 0) {
            std::string reason = outcome.timed_out
                ? "timed out after " + std::to_string(config_.install_timeout.count() / 1000) + "s"
                : "exited with " + (outcome.exit_code ? std::to_string(*outcome.exit_code)
                                                      : std::string("no status"));
            std::string detail = StringUtils::Trim(outcome.stderr_output);
            if (detail.empty()) {
                detail = StringUtils::Trim(outcome.stdout_output);
            }

            spdlog::error("Dependency install in sandbox {} {}", id, reason);
            Rollback(record);

            std::string message = "Dependency installation " + reason;
            if (!detail.empty()) {
                message += ": " + StringUtils::Truncate(detail, kMaxReportedOutput);
            }
            throw SandboxError(ErrorKind::DEPENDENCY_INSTALL_FAILURE, message);
        }
    }

    spdlog::info("Sandbox {} running as {}", id, record.environment_name);
    return record;
}

// ============================================================================
// LIST
// ============================================================================

std::vector<SandboxSummary> SandboxManager::ListSandboxes() {
    std::vector<Sandbox> snapshot;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        snapshot.reserve(sandboxes_.size());
        for (const auto& [id, sandbox] : sandboxes_) {
            if (sandbox.status != SandboxStatus::DELETED) {
                snapshot.push_back(sandbox);
            }
        }
    }

    std::sort(snapshot.begin(), snapshot.end(),
              [](const Sandbox& a, const Sandbox& b) { return a.sequence < b.sequence; });

    auto now = std::chrono::system_clock::now();
    std::vector<SandboxSummary> rows;
    rows.reserve(snapshot.size());

    for (auto& sandbox : snapshot) {
        if (sandbox.status == SandboxStatus::RUNNING || sandbox.status == SandboxStatus::STOPPED) {
            try {
                auto state = runtime_.Inspect(sandbox.environment_name);
                bool alive = state && (*state == runtime::EnvironmentState::RUNNING ||
                                       *state == runtime::EnvironmentState::PAUSED);
                SandboxStatus observed = alive ? SandboxStatus::RUNNING : SandboxStatus::STOPPED;
                if (observed != sandbox.status) {
                    spdlog::info("Sandbox {} is now {}", sandbox.id, SandboxStatusToString(observed));
                    sandbox.status = observed;
                    SetStatus(sandbox.id, sandbox.sequence, observed);
                }
            }
            catch (const SandboxError& e) {
                spdlog::warn("Cannot refresh status of sandbox {}: {}", sandbox.id, e.what());
            }
        }

        SandboxSummary row;
        row.id = sandbox.id;
        row.language = sandbox.language;
        row.status = sandbox.status;
        row.created_at = sandbox.created_at;
        row.age = std::chrono::duration_cast<std::chrono::seconds>(now - sandbox.created_at);
        rows.push_back(std::move(row));
    }

    return rows;
}

// ============================================================================
// DELETE
// ============================================================================

Sandbox SandboxManager::DeleteSandbox(const std::string& id) {
    IdLockGuard id_guard(*this, id);

    Sandbox record;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto it = sandboxes_.find(id);
        if (it == sandboxes_.end() || it->second.status == SandboxStatus::DELETED) {
            throw SandboxError(ErrorKind::SANDBOX_NOT_FOUND, "Sandbox not found: " + id);
        }
        record = it->second;
    }

    spdlog::info("Deleting sandbox {}", id);
    runtime_.Remove(record.environment_name);

    DropRecord(id, record.sequence);
    record.status = SandboxStatus::DELETED;

    spdlog::info("Sandbox {} deleted", id);
    return record;
}

// ============================================================================
// SHUTDOWN
// ============================================================================

void SandboxManager::Shutdown() {
    if (!config_.cleanup_on_shutdown) {
        return;
    }

    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        for (const auto& [id, sandbox] : sandboxes_) {
            ids.push_back(id);
        }
    }

    if (ids.empty()) {
        return;
    }

    spdlog::info("Removing {} sandboxes on shutdown", ids.size());
    for (const auto& id : ids) {
        try {
            DeleteSandbox(id);
        }
        catch (const SandboxError& e) {
            spdlog::warn("Failed to remove sandbox {} on shutdown: {}", id, e.what());
        }
    }
}

// ============================================================================
// HELPERS
// ============================================================================

bool SandboxManager::IsValidName(const std::string& name) {
    if (name.empty() || name.size() > kMaxNameLength) {
        return false;
    }
    if (!std::isalnum(static_cast<unsigned char>(name.front()))) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '-';
    });
}

void SandboxManager::EnsureNetwork() {
    std::call_once(network_once_, [this]() {
        runtime_.EnsureNetwork(config_.network_name);
    });
}

void SandboxManager::SetStatus(const std::string& id, std::uint64_t sequence, SandboxStatus status) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = sandboxes_.find(id);
    if (it != sandboxes_.end() && it->second.sequence == sequence) {
        it->second.status = status;
    }
}

void SandboxManager::DropRecord(const std::string& id, std::uint64_t sequence) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = sandboxes_.find(id);
    if (it != sandboxes_.end() && it->second.sequence == sequence) {
        sandboxes_.erase(it);
    }
}

void SandboxManager::Rollback(const Sandbox& record) {
    try {
        runtime_.Remove(record.environment_name);
    }
    catch (const SandboxError& e) {
        spdlog::error("Failed to remove container {} after failed creation: {}",
                      record.environment_name, e.what());
    }
    DropRecord(record.id, record.sequence);
}

} // namespace core
} // namespace codebox
