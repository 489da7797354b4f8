/**
 * @file sandbox_errors.cpp
 * @brief Error kind names and classification
 *
 * @date 2025
 */

#include "sandcell/core/sandbox_errors.hpp"

namespace sandcell {
namespace core {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INITIALIZATION: return "InitializationError";
        case ErrorKind::UNSUPPORTED_LANGUAGE: return "UnsupportedLanguageError";
        case ErrorKind::CONCURRENT_EXECUTION: return "ConcurrentExecutionError";
        case ErrorKind::EXECUTION_TIMEOUT: return "ExecutionTimeoutError";
        case ErrorKind::RUNTIME: return "RuntimeError";
        case ErrorKind::CLEANUP: return "CleanupError";
        case ErrorKind::INVALID_STATE: return "InvalidStateError";
    }
    return "UnknownError";
}

bool IsCallerFixable(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UNSUPPORTED_LANGUAGE:
        case ErrorKind::CONCURRENT_EXECUTION:
        case ErrorKind::EXECUTION_TIMEOUT:
        case ErrorKind::INVALID_STATE:
            return true;
        default:
            return false;
    }
}

} // namespace core
} // namespace sandcell
