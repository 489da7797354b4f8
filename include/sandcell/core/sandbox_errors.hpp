/**
 * @file sandbox_errors.hpp
 * @brief Error taxonomy surfaced by the sandbox controller
 *
 * Every controller failure is a SandboxError carrying an ErrorKind, so a
 * caller can tell caller-fixable problems (bad language, misuse, timeouts)
 * from infrastructure problems (engine unreachable, container lost).
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>

namespace sandcell {
namespace core {

/**
 * @enum ErrorKind
 * @brief Categories of controller failures
 */
enum class ErrorKind {
    INITIALIZATION,        ///< Image/engine problem or sandbox already live
    UNSUPPORTED_LANGUAGE,  ///< Unknown language or runtime not present in the sandbox
    CONCURRENT_EXECUTION,  ///< Execute while another execute is in flight
    EXECUTION_TIMEOUT,     ///< Code exceeded the execution timeout (sandbox still usable)
    RUNTIME,               ///< Engine failure during execute (sandbox unusable)
    CLEANUP,               ///< Stop/remove failed (state still became Stopped)
    INVALID_STATE          ///< Operation not allowed in the current state
};

/**
 * @brief Stable name of an error kind ("InitializationError", ...)
 */
const char* ErrorKindName(ErrorKind kind);

/**
 * @brief Whether the caller can fix the problem by changing its request
 */
bool IsCallerFixable(ErrorKind kind);

/**
 * @class SandboxError
 * @brief Base class of all controller errors
 */
class SandboxError : public std::runtime_error {
public:
    SandboxError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class InitializationError : public SandboxError {
public:
    explicit InitializationError(const std::string& message)
        : SandboxError(ErrorKind::INITIALIZATION, message) {}
};

class UnsupportedLanguageError : public SandboxError {
public:
    explicit UnsupportedLanguageError(const std::string& message)
        : SandboxError(ErrorKind::UNSUPPORTED_LANGUAGE, message) {}
};

class ConcurrentExecutionError : public SandboxError {
public:
    explicit ConcurrentExecutionError(const std::string& message)
        : SandboxError(ErrorKind::CONCURRENT_EXECUTION, message) {}
};

class ExecutionTimeoutError : public SandboxError {
public:
    explicit ExecutionTimeoutError(const std::string& message)
        : SandboxError(ErrorKind::EXECUTION_TIMEOUT, message) {}
};

/// Engine-level failure during execute; not to be confused with std::runtime_error
class RuntimeError : public SandboxError {
public:
    explicit RuntimeError(const std::string& message)
        : SandboxError(ErrorKind::RUNTIME, message) {}
};

class CleanupError : public SandboxError {
public:
    explicit CleanupError(const std::string& message)
        : SandboxError(ErrorKind::CLEANUP, message) {}
};

class InvalidStateError : public SandboxError {
public:
    explicit InvalidStateError(const std::string& message)
        : SandboxError(ErrorKind::INVALID_STATE, message) {}
};

} // namespace core
} // namespace sandcell
