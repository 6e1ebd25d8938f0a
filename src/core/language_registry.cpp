/**
 * @file language_registry.cpp
 * @brief Built-in language profiles and registry validation
 *
 * **Built-in Profiles**:
 * | id         | image              | run                           | install                       |
 * |------------|--------------------|-------------------------------|-------------------------------|
 * | javascript | node:18-alpine     | node                          | npm install                   |
 * | typescript | node:18-alpine     | npx ts-node                   | npm install                   |
 * | python     | python:3.11-alpine | python                        | pip install --user            |
 * | bash       | alpine:latest      | sh                            | -                             |
 * | go         | golang:1.21-alpine | go run                        | go mod init + go get          |
 * | rust       | rust:1.70-alpine   | rustc then run binary (sh -c) | -                             |
 *
 * @date 2025
 */

#include "codebox/core/language_registry.hpp"
#include "codebox/core/errors.hpp"
#include "codebox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace codebox {
namespace core {

namespace {

const char* kSourcePlaceholder = "{source}";
const char* kPackagesPlaceholder = "{packages}";

} // anonymous namespace

// ============================================================================
// LANGUAGE ENUMERATION
// ============================================================================

const std::vector<Language>& AllLanguages() {
    static const std::vector<Language> languages = {
        Language::JAVASCRIPT,
        Language::TYPESCRIPT,
        Language::PYTHON,
        Language::BASH,
        Language::GO,
        Language::RUST
    };
    return languages;
}

std::string LanguageToString(Language language) {
    switch (language) {
        case Language::JAVASCRIPT: return "javascript";
        case Language::TYPESCRIPT: return "typescript";
        case Language::PYTHON: return "python";
        case Language::BASH: return "bash";
        case Language::GO: return "go";
        case Language::RUST: return "rust";
    }
    return "unknown";
}

std::optional<Language> ParseLanguage(const std::string& id) {
    for (Language language : AllLanguages()) {
        if (LanguageToString(language) == id) {
            return language;
        }
    }
    return std::nullopt;
}

// ============================================================================
// LANGUAGE PROFILE
// ============================================================================

std::string LanguageProfile::SourceFileName() const {
    return "main" + extension;
}

std::vector<std::string> LanguageProfile::BuildRunCommand(const std::string& source_file) const {
    std::vector<std::string> command;
    command.reserve(run_command.size() + 1);
    bool substituted = false;

    for (const auto& token : run_command) {
        if (utils::StringUtils::Contains(token, kSourcePlaceholder)) {
            command.push_back(utils::StringUtils::ReplaceAll(token, kSourcePlaceholder, source_file));
            substituted = true;
        } else {
            command.push_back(token);
        }
    }

    if (!substituted) {
        command.push_back(source_file);
    }

    return command;
}

std::optional<std::string> LanguageProfile::BuildInstallCommand(
    const std::vector<std::string>& dependencies) const {

    if (!install_command || dependencies.empty()) {
        return std::nullopt;
    }

    return utils::StringUtils::ReplaceAll(*install_command, kPackagesPlaceholder,
                                          utils::StringUtils::ShellJoin(dependencies));
}

// ============================================================================
// REGISTRY CONSTRUCTION
// ============================================================================
// Exhaustive: every enumerator exactly once, every profile runnable

LanguageRegistry::LanguageRegistry(std::vector<LanguageProfile> profiles) {
    for (auto& profile : profiles) {
        std::string id = profile.Id();

        if (profiles_.count(profile.language)) {
            throw std::invalid_argument("Duplicate language profile: " + id);
        }
        if (profile.image.empty()) {
            throw std::invalid_argument("Language profile has no image: " + id);
        }
        if (profile.extension.empty()) {
            throw std::invalid_argument("Language profile has no extension: " + id);
        }
        if (profile.run_command.empty() || profile.run_command.front().empty()) {
            throw std::invalid_argument("Language profile has no run command: " + id);
        }

        profiles_.emplace(profile.language, std::move(profile));
    }

    for (Language language : AllLanguages()) {
        if (!profiles_.count(language)) {
            throw std::invalid_argument("Missing language profile: " + LanguageToString(language));
        }
    }

    spdlog::debug("Language registry loaded with {} profiles", profiles_.size());
}

std::vector<LanguageProfile> LanguageRegistry::BuiltinProfiles() {
    return {
        {Language::JAVASCRIPT, "node:18-alpine", ".js",
         {"node"}, std::string("npm install --no-audit --no-fund {packages}")},
        {Language::TYPESCRIPT, "node:18-alpine", ".ts",
         {"npx", "ts-node"}, std::string("npm install --no-audit --no-fund {packages}")},
        {Language::PYTHON, "python:3.11-alpine", ".py",
         {"python"}, std::string("pip install --user --no-cache-dir {packages}")},
        {Language::BASH, "alpine:latest", ".sh",
         {"sh"}, std::nullopt},
        {Language::GO, "golang:1.21-alpine", ".go",
         {"go", "run"}, std::string("go mod init sandbox && go get {packages}")},
        {Language::RUST, "rust:1.70-alpine", ".rs",
         {"sh", "-c", "rustc --edition 2021 -o /tmp/binary {source} && /tmp/binary"},
         std::nullopt},
    };
}

LanguageRegistry LanguageRegistry::Builtin() {
    return LanguageRegistry(BuiltinProfiles());
}

LanguageRegistry LanguageRegistry::WithImages(const std::map<std::string, std::string>& images) const {
    std::vector<LanguageProfile> profiles;
    profiles.reserve(profiles_.size());
    for (const auto& [language, profile] : profiles_) {
        profiles.push_back(profile);
    }

    for (const auto& [id, image] : images) {
        auto language = ParseLanguage(id);
        if (!language) {
            throw std::invalid_argument("Image override for unknown language: " + id);
        }
        if (image.empty()) {
            throw std::invalid_argument("Empty image override for language: " + id);
        }

        auto it = std::find_if(profiles.begin(), profiles.end(),
                               [&](const LanguageProfile& p) { return p.language == *language; });
        it->image = image;
        spdlog::info("Image for {} overridden: {}", id, image);
    }

    return LanguageRegistry(std::move(profiles));
}

// ============================================================================
// LOOKUP
// ============================================================================

const LanguageProfile& LanguageRegistry::Resolve(const std::string& id) const {
    auto language = ParseLanguage(id);
    if (!language) {
        throw SandboxError(ErrorKind::UNSUPPORTED_LANGUAGE, "Unsupported language: " + id);
    }
    return Resolve(*language);
}

const LanguageProfile& LanguageRegistry::Resolve(Language language) const {
    return profiles_.at(language);
}

std::vector<std::string> LanguageRegistry::Identifiers() const {
    std::vector<std::string> ids;
    ids.reserve(profiles_.size());
    for (const auto& [language, profile] : profiles_) {
        ids.push_back(profile.Id());
    }
    return ids;
}

} // namespace core
} // namespace codebox
