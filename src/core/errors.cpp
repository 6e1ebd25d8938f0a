/**
 * @file errors.cpp
 * @brief Wire names for error kinds
 *
 * @date 2025
 */

#include "codebox/core/errors.hpp"

namespace codebox {
namespace core {

std::string ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UNSUPPORTED_LANGUAGE: return "UnsupportedLanguage";
        case ErrorKind::RUNTIME_UNAVAILABLE: return "RuntimeUnavailable";
        case ErrorKind::IMAGE_UNAVAILABLE: return "ImageUnavailable";
        case ErrorKind::EXECUTION_TIMEOUT: return "ExecutionTimeout";
        case ErrorKind::DEPENDENCY_INSTALL_FAILURE: return "DependencyInstallFailure";
        case ErrorKind::SANDBOX_NOT_FOUND: return "SandboxNotFound";
        case ErrorKind::SANDBOX_NAME_CONFLICT: return "SandboxNameConflict";
        case ErrorKind::INVALID_REQUEST: return "InvalidRequest";
        case ErrorKind::INTERNAL: return "Internal";
    }
    return "Internal";
}

} // namespace core
} // namespace codebox
