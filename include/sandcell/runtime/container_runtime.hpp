/**
 * @file container_runtime.hpp
 * @brief Container engine primitives used by the sandbox controller
 *
 * Declares the engine-neutral adapter interface (create, start, exec, inspect,
 * stop, remove) together with the description of a hardened container and
 * the normalized error kinds every adapter reports. The adapter carries no
 * sandbox semantics; lifecycle policy lives in core::SandboxController.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace sandcell {
namespace runtime {

/**
 * @enum AdapterErrorKind
 * @brief Normalized engine failure categories
 */
enum class AdapterErrorKind {
    ENGINE_UNAVAILABLE,       ///< Engine endpoint unreachable or CLI missing
    IMAGE_NOT_FOUND,          ///< Image cannot be found locally or pulled
    CONTAINER_CREATE_FAILED,  ///< Create, start or network setup rejected
    EXEC_FAILED,              ///< Engine could not run a command in the container
    REMOVE_FAILED             ///< Stop or remove rejected
};

/**
 * @brief Stable name of an adapter error kind ("EngineUnavailable", ...)
 */
const char* AdapterErrorKindName(AdapterErrorKind kind);

/**
 * @class ContainerRuntimeError
 * @brief Exception thrown by every ContainerRuntime implementation
 */
class ContainerRuntimeError : public std::runtime_error {
public:
    ContainerRuntimeError(AdapterErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    AdapterErrorKind kind() const { return kind_; }

private:
    AdapterErrorKind kind_;
};

/**
 * @struct ContainerSpec
 * @brief Everything fixed at container creation time
 *
 * Resource limits and security options cannot be changed once the container
 * exists, so the adapter receives them in one piece.
 */
struct ContainerSpec {
    std::string name;                    ///< Container name (unique per engine)
    std::string image;                   ///< Image reference
    std::vector<std::string> command{"tail", "-f", "/dev/null"};  ///< Keep-alive command

    // Resource Limits
    double cpus{0.5};                    ///< CPU share cap in cores
    std::size_t memory_mb{512};          ///< Memory cap (swap pinned to the same value)
    int pids_limit{100};                 ///< Process count cap

    // Security Settings
    std::vector<std::string> capabilities_drop{"ALL"};  ///< Dropped capabilities
    std::vector<std::string> capabilities_add;          ///< Re-added capabilities
    bool read_only_rootfs{true};         ///< Read-only root filesystem
    bool no_new_privileges{true};        ///< Block setuid escalation
    bool init_process{true};             ///< Run an init that reaps zombies

    // Filesystem
    std::map<std::string, std::string> tmpfs;  ///< Mount point -> tmpfs options

    // Network
    std::string network{"none"};         ///< Network mode ("none", "bridge", ...)

    std::map<std::string, std::string> labels;  ///< Engine labels for ownership tracking
};

/**
 * @struct ExecRequest
 * @brief A single command to run inside a running container
 */
struct ExecRequest {
    std::vector<std::string> command;       ///< Program and arguments
    std::string stdin_data;                 ///< Payload piped to the command's stdin
    std::string user;                       ///< User to run as (empty = image default)
    std::string working_dir;                ///< Working directory (empty = image default)
    std::map<std::string, std::string> env; ///< Extra environment
    std::optional<std::chrono::milliseconds> timeout;  ///< Caller deadline
    std::size_t max_output_bytes{0};        ///< Per-stream capture cap (0 = unlimited)
};

/**
 * @struct ExecOutcome
 * @brief Raw result of an exec; exit codes are not interpreted here
 */
struct ExecOutcome {
    int exit_code{0};                       ///< Exit code of the command
    std::string stdout_output;              ///< Captured stdout
    std::string stderr_output;              ///< Captured stderr
    bool timed_out{false};                  ///< Deadline hit; client side was killed
    bool stdout_truncated{false};           ///< stdout hit the capture cap
    bool stderr_truncated{false};           ///< stderr hit the capture cap
    std::chrono::milliseconds duration{0};  ///< Wall-clock duration
};

/**
 * @struct ContainerStatus
 * @brief Subset of engine state the controller cares about
 */
struct ContainerStatus {
    bool exists{false};     ///< Engine knows the container
    bool running{false};    ///< Container is running
    bool oom_killed{false}; ///< Engine reports an out-of-memory kill
    int exit_code{0};       ///< Exit code of the main process if it exited
    std::string status;     ///< Engine status string ("running", "exited", ...)
};

/**
 * @class ContainerRuntime
 * @brief Engine-neutral container primitives
 *
 * Implementations normalize engine failures into ContainerRuntimeError.
 * Calls are safe to issue sequentially from one thread at a time; the
 * controller never issues two execs against the same container at once.
 */
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    /**
     * @brief Verify the engine endpoint answers
     * @return Engine version string
     * @throws ContainerRuntimeError (ENGINE_UNAVAILABLE)
     */
    virtual std::string Ping() = 0;

    /**
     * @brief Check whether an image is present locally
     */
    virtual bool ImageExists(const std::string& image) = 0;

    /**
     * @brief Pull an image from its registry
     * @throws ContainerRuntimeError (IMAGE_NOT_FOUND, ENGINE_UNAVAILABLE)
     */
    virtual void PullImage(const std::string& image) = 0;

    /**
     * @brief Create (but do not start) a container
     * @return Engine-assigned container ID
     * @throws ContainerRuntimeError (CONTAINER_CREATE_FAILED, IMAGE_NOT_FOUND, ENGINE_UNAVAILABLE)
     */
    virtual std::string CreateContainer(const ContainerSpec& spec) = 0;

    /**
     * @brief Start a created container
     * @throws ContainerRuntimeError (CONTAINER_CREATE_FAILED, ENGINE_UNAVAILABLE)
     */
    virtual void StartContainer(const std::string& container_id) = 0;

    /**
     * @brief Run a command inside a running container
     *
     * On deadline the engine client is killed and the outcome is returned
     * with `timed_out` set; processes inside the container are left for the
     * caller to terminate.
     *
     * @throws ContainerRuntimeError (EXEC_FAILED, ENGINE_UNAVAILABLE)
     */
    virtual ExecOutcome Exec(const std::string& container_id, const ExecRequest& request) = 0;

    /**
     * @brief Inspect container state
     * @return Status; `exists` is false when the engine does not know the ID
     * @throws ContainerRuntimeError (ENGINE_UNAVAILABLE)
     */
    virtual ContainerStatus Inspect(const std::string& container_id) = 0;

    /**
     * @brief Detach a container from a network
     * @throws ContainerRuntimeError (CONTAINER_CREATE_FAILED, ENGINE_UNAVAILABLE)
     */
    virtual void DisconnectNetwork(const std::string& container_id, const std::string& network) = 0;

    /**
     * @brief Stop a running container
     * @param grace Time allowed before the engine kills it
     * @throws ContainerRuntimeError (REMOVE_FAILED, ENGINE_UNAVAILABLE)
     */
    virtual void StopContainer(const std::string& container_id, std::chrono::seconds grace) = 0;

    /**
     * @brief Remove a container; removing an unknown ID succeeds
     * @throws ContainerRuntimeError (REMOVE_FAILED, ENGINE_UNAVAILABLE)
     */
    virtual void RemoveContainer(const std::string& container_id, bool force) = 0;
};

} // namespace runtime
} // namespace sandcell
