/**
 * @file errors.hpp
 * @brief Error kinds and the exception type raised across codebox
 *
 * Every failure that a caller can observe carries one of the kinds below.
 * Timeouts are not errors: they are reported through ExecutionResult.
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>

namespace codebox {
namespace core {

/**
 * @enum ErrorKind
 * @brief Caller-visible failure categories
 */
enum class ErrorKind {
    UNSUPPORTED_LANGUAGE,        ///< Language identifier not in the registry
    RUNTIME_UNAVAILABLE,         ///< Container engine binary or daemon unreachable
    IMAGE_UNAVAILABLE,           ///< Image could not be pulled
    EXECUTION_TIMEOUT,           ///< Only used as a tag, never thrown
    DEPENDENCY_INSTALL_FAILURE,  ///< Package installer failed inside a sandbox
    SANDBOX_NOT_FOUND,           ///< No live sandbox with that id
    SANDBOX_NAME_CONFLICT,       ///< Name already used by a live sandbox
    INVALID_REQUEST,             ///< Malformed arguments
    INTERNAL                     ///< Anything else
};

/**
 * @brief Stable wire name of an error kind ("UnsupportedLanguage", ...)
 */
std::string ErrorKindToString(ErrorKind kind);

/**
 * @class SandboxError
 * @brief Exception carrying an ErrorKind
 */
class SandboxError : public std::runtime_error {
public:
    SandboxError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace core
} // namespace codebox
