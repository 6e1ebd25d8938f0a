/**
 * @file language_registry.hpp
 * @brief Supported languages and their container execution profiles
 *
 * Languages are a closed enumeration. Each enumerator owns exactly one
 * LanguageProfile describing which image runs it, how the source file is
 * named and which commands run and install packages. The registry checks
 * this table exhaustively when it is built, so a missing or malformed entry
 * fails at startup instead of on the first request.
 *
 * **Adding a language**: add an enumerator, its wire name in
 * LanguageToString() and a profile in BuiltinProfiles(). Nothing in the
 * execution engine or sandbox manager changes.
 *
 * @date 2025
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace codebox {
namespace core {

/**
 * @enum Language
 * @brief Every language codebox can execute
 */
enum class Language {
    JAVASCRIPT,
    TYPESCRIPT,
    PYTHON,
    BASH,
    GO,
    RUST
};

/**
 * @brief All enumerators, in declaration order
 */
const std::vector<Language>& AllLanguages();

/**
 * @brief Wire identifier of a language ("python", "javascript", ...)
 */
std::string LanguageToString(Language language);

/**
 * @brief Parse a wire identifier
 * @return Language, or empty for unknown identifiers
 */
std::optional<Language> ParseLanguage(const std::string& id);

/**
 * @struct LanguageProfile
 * @brief How one language is executed inside a container
 *
 * Command tokens may contain `{source}`, replaced by the source file name.
 * The install template may contain `{packages}`, replaced by the quoted
 * dependency list.
 */
struct LanguageProfile {
    Language language{Language::PYTHON};         ///< Enumerator this profile belongs to
    std::string image;                           ///< Container image reference
    std::string extension;                       ///< Source file extension including dot
    std::vector<std::string> run_command;        ///< Ordered run tokens
    std::optional<std::string> install_command;  ///< Shell template, if the language has an installer

    std::string Id() const { return LanguageToString(language); }

    /**
     * @brief Source file name used in workspaces ("main" + extension)
     */
    std::string SourceFileName() const;

    /**
     * @brief Run tokens with `{source}` substituted
     *
     * When no token references `{source}` the file name is appended.
     */
    std::vector<std::string> BuildRunCommand(const std::string& source_file) const;

    /**
     * @brief Install shell command for @p dependencies
     * @return Command, or empty if the language has no installer or the list is empty
     */
    std::optional<std::string> BuildInstallCommand(const std::vector<std::string>& dependencies) const;
};

/**
 * @class LanguageRegistry
 * @brief Immutable lookup from language identifier to profile
 *
 * **Thread Safety**: Read-only after construction; share freely by const reference.
 *
 * **Usage Example**:
 * @code
 * auto registry = LanguageRegistry::Builtin();
 * const auto& profile = registry.Resolve("python");
 * auto argv = profile.BuildRunCommand(profile.SourceFileName());
 * // {"python", "main.py"}
 * @endcode
 */
class LanguageRegistry {
public:
    /**
     * @brief Build a registry from an explicit profile table
     * @param profiles One profile per Language enumerator
     * @throws std::invalid_argument if an enumerator is missing or duplicated,
     *         or a profile has an empty image, extension or run command
     */
    explicit LanguageRegistry(std::vector<LanguageProfile> profiles);

    /**
     * @brief Registry holding the built-in profiles
     */
    static LanguageRegistry Builtin();

    /**
     * @brief The built-in profile table
     */
    static std::vector<LanguageProfile> BuiltinProfiles();

    /**
     * @brief Registry with image references replaced
     * @param images Map of language identifier to image
     * @throws std::invalid_argument for unknown identifiers or empty images
     */
    LanguageRegistry WithImages(const std::map<std::string, std::string>& images) const;

    /**
     * @brief Look up a profile by wire identifier
     * @throws SandboxError (UNSUPPORTED_LANGUAGE) if the identifier is unknown
     */
    const LanguageProfile& Resolve(const std::string& id) const;

    const LanguageProfile& Resolve(Language language) const;

    /**
     * @brief Wire identifiers of every registered language
     */
    std::vector<std::string> Identifiers() const;

private:
    std::map<Language, LanguageProfile> profiles_;
};

} // namespace core
} // namespace codebox
