/**
 * @file workspace.cpp
 * @brief Implementation of Workspace
 *
 * @date 2025
 */

#include "codebox/core/workspace.hpp"
#include "codebox/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <vector>

#include <stdlib.h>

namespace codebox {
namespace core {

namespace fs = std::filesystem;

Workspace Workspace::Create(const fs::path& root, const std::string& prefix) {
    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        throw SandboxError(ErrorKind::INTERNAL,
                           "Cannot create workspace root " + root.string() + ": " + ec.message());
    }

    std::string templ = (root / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(templ.begin(), templ.end());
    buffer.push_back('\0');

    if (mkdtemp(buffer.data()) == nullptr) {
        throw SandboxError(ErrorKind::INTERNAL,
                           "Cannot create workspace under " + root.string() + ": " +
                           std::strerror(errno));
    }

    fs::path path(buffer.data());

    // Container user is not the host user
    fs::permissions(path, fs::perms::all, fs::perm_options::replace, ec);
    if (ec) {
        spdlog::warn("Cannot relax permissions on {}: {}", path.string(), ec.message());
    }

    spdlog::debug("Workspace created: {}", path.string());
    return Workspace(std::move(path));
}

Workspace::~Workspace() {
    Remove();
}

Workspace::Workspace(Workspace&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

Workspace& Workspace::operator=(Workspace&& other) noexcept {
    if (this != &other) {
        Remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

fs::path Workspace::WriteFile(const std::string& name, const std::string& content) const {
    fs::path file = path_ / name;

    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw SandboxError(ErrorKind::INTERNAL, "Cannot open " + file.string() + " for writing");
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
        throw SandboxError(ErrorKind::INTERNAL, "Failed to write " + file.string());
    }

    std::error_code ec;
    fs::permissions(file,
                    fs::perms::owner_read | fs::perms::owner_write |
                    fs::perms::group_read | fs::perms::others_read,
                    fs::perm_options::replace, ec);
    if (ec) {
        spdlog::warn("Cannot set permissions on {}: {}", file.string(), ec.message());
    }

    return file;
}

bool Workspace::Remove() noexcept {
    if (path_.empty()) {
        return true;
    }

    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        spdlog::error("Failed to remove workspace {}: {}", path_.string(), ec.message());
        return false;
    }

    spdlog::debug("Workspace removed: {}", path_.string());
    path_.clear();
    return true;
}

} // namespace core
} // namespace codebox
