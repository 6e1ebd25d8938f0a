/**
 * @file workspace.hpp
 * @brief Transient per-execution directory
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <string>

namespace codebox {
namespace core {

/**
 * @class Workspace
 * @brief Uniquely named temporary directory removed when the owner goes away
 *
 * Directory names come from mkdtemp(3), so two workspaces created
 * concurrently under the same root never collide. The directory is made
 * world-writable so an unprivileged container user can create files beside
 * the source.
 *
 * **Usage Example**:
 * @code
 * auto workspace = Workspace::Create("/tmp", "codebox-");
 * workspace.WriteFile("main.py", "print(1)");
 * // ... mount workspace.Path() ...
 * workspace.Remove();
 * @endcode
 */
class Workspace {
public:
    /**
     * @brief Create a fresh directory under @p root
     * @param root Parent directory (created if missing)
     * @param prefix Leading part of the directory name
     * @throws SandboxError (INTERNAL) if the directory cannot be created
     */
    static Workspace Create(const std::filesystem::path& root, const std::string& prefix);

    ~Workspace();

    Workspace(Workspace&& other) noexcept;
    Workspace& operator=(Workspace&& other) noexcept;
    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    /**
     * @brief Write @p content to @p name inside the workspace
     * @return Full path of the written file
     * @throws SandboxError (INTERNAL) on I/O failure
     */
    std::filesystem::path WriteFile(const std::string& name, const std::string& content) const;

    const std::filesystem::path& Path() const { return path_; }

    /**
     * @brief Delete the directory tree now
     * @return false if removal failed (logged)
     */
    bool Remove() noexcept;

private:
    explicit Workspace(std::filesystem::path path) : path_(std::move(path)) {}

    std::filesystem::path path_;
};

} // namespace core
} // namespace codebox
