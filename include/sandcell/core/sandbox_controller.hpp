/**
 * @file sandbox_controller.hpp
 * @brief Single-tenant sandbox lifecycle controller
 *
 * Owns one isolated container at a time: provisions it with resource and
 * privilege limits, runs submitted code in it one request at a time, and
 * guarantees the container is released on stop or on unrecoverable failure.
 * Engine access goes through runtime::ContainerRuntime.
 *
 * @date 2025
 */

#pragma once

#include "sandcell/core/language_recipe.hpp"
#include "sandcell/core/sandbox_errors.hpp"
#include "sandcell/runtime/container_runtime.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sandcell {
namespace core {

/**
 * @enum SandboxState
 * @brief Lifecycle state of the controller's sandbox
 *
 * ```
 * UNINITIALIZED --initialize(ok)--> READY
 * UNINITIALIZED --initialize(fail)--> FAILED
 * READY --execute(ok | timeout)--> READY
 * READY --execute(fatal)--> FAILED
 * READY | FAILED | EXECUTING --stop--> STOPPED
 * STOPPED | FAILED --initialize--> (new lifecycle)
 * ```
 */
enum class SandboxState {
    UNINITIALIZED,  ///< No sandbox yet
    INITIALIZING,   ///< Container being provisioned
    READY,          ///< Accepting execute calls
    EXECUTING,      ///< One execute in flight
    STOPPING,       ///< Container being released
    STOPPED,        ///< Released by stop
    FAILED          ///< Released after an unrecoverable failure
};

/**
 * @brief Lowercase name of a state ("ready", ...)
 */
const char* SandboxStateName(SandboxState state);

/**
 * @enum NetworkPolicy
 * @brief Whether submitted code may reach the network
 */
enum class NetworkPolicy {
    DISABLED,  ///< No network interface besides loopback (default)
    ENABLED    ///< Default bridge network
};

/**
 * @struct ResourceLimits
 * @brief Hard limits fixed at sandbox creation
 */
struct ResourceLimits {
    double cpus{0.5};               ///< CPU share cap in cores
    std::size_t memory_mb{512};     ///< Memory cap
    int max_processes{100};         ///< Process count cap
    std::size_t scratch_mb{64};     ///< Size of the writable tmpfs working directory
};

/**
 * @struct SandboxHandle
 * @brief Identity and fixed properties of a live sandbox
 */
struct SandboxHandle {
    std::string container_id;                      ///< Engine-assigned ID
    std::string container_name;                    ///< Generated container name
    std::string image;                             ///< Base image
    ResourceLimits limits;                         ///< Limits applied at creation
    NetworkPolicy network{NetworkPolicy::DISABLED};  ///< Network policy
    std::map<Language, std::string> interpreters;  ///< Available languages -> interpreter path
    std::chrono::system_clock::time_point created_at;  ///< Ready timestamp
};

/**
 * @struct ExecutionResult
 * @brief Buffered outcome of one execute call
 */
struct ExecutionResult {
    Language language{Language::PYTHON};   ///< Language the code ran as
    std::string stdout_output;             ///< Captured standard output
    std::string stderr_output;             ///< Captured standard error
    int exit_code{0};                      ///< Exit code of the submitted program
    std::chrono::milliseconds duration{0}; ///< Wall-clock execution time
    bool stdout_truncated{false};          ///< stdout hit the capture cap
    bool stderr_truncated{false};          ///< stderr hit the capture cap
};

/**
 * @struct ControllerConfig
 * @brief Policy applied to every sandbox the controller creates
 */
struct ControllerConfig {
    // Sandbox Defaults
    std::string default_image{"alpine:latest"};          ///< Image used when none is given
    ResourceLimits default_limits;                       ///< Limits used when none are given
    NetworkPolicy network_policy{NetworkPolicy::DISABLED};  ///< Default network policy

    // Timeouts
    std::chrono::milliseconds execution_timeout{10000};  ///< Per-execute deadline
    std::chrono::seconds bootstrap_timeout{300};         ///< Interpreter install deadline
    std::chrono::seconds probe_timeout{30};              ///< Probe / smoke / kill deadline
    std::chrono::seconds stop_grace{5};                  ///< Grace period on stop

    // Bootstrap
    // The install decision is made before probing. While bootstrap is enabled
    // with languages, every container is created install-capable (writable
    // root, bridge network until disconnected, bootstrap_capabilities added)
    // even when the image already ships the interpreters. Disable bootstrap
    // for a read-only, network-less container from the start.
    bool bootstrap_enabled{true};                        ///< Install missing interpreters
    std::vector<Language> bootstrap_languages{Language::PYTHON};  ///< Languages to install if missing
    std::vector<std::string> bootstrap_capabilities{
        "CHOWN", "DAC_OVERRIDE", "FOWNER", "SETGID", "SETUID"};   ///< Caps kept when installing

    // Execution Environment
    std::string execution_user{"nobody"};                ///< Unprivileged user for code
    std::string working_dir{"/tmp"};                     ///< Writable tmpfs working directory
    std::size_t max_output_bytes{1 << 20};               ///< Per-stream capture cap

    // Hardening
    bool read_only_rootfs{true};                         ///< Read-only rootfs; ignored while bootstrap is enabled
    bool health_check_before_execute{true};              ///< Inspect the container before each execute
    std::string container_name_prefix{"sandcell"};       ///< Container name prefix
};

/**
 * @class SandboxController
 * @brief Lifecycle controller for one sandbox at a time
 *
 * - **Single tenancy**: at most one live sandbox; a second initialize fails
 * - **Serialized execution**: a concurrent execute is rejected, never queued
 * - **Recoverable timeouts**: the timed-out process is killed, the sandbox stays READY
 * - **Guaranteed cleanup**: partial creations are rolled back, stop always ends in STOPPED
 *
 * **Thread Safety**: all public methods may be called from any thread.
 * Initialize and Stop are serialized against each other; Execute never
 * blocks behind another Execute.
 *
 * **Usage Example**:
 * @code
 * auto docker = std::make_shared<runtime::DockerCliRuntime>();
 * SandboxController controller(docker);
 *
 * controller.Initialize("alpine:latest");
 * auto result = controller.Execute("print('hi')", "python");
 * // result.stdout_output == "hi\n", result.exit_code == 0
 *
 * controller.Stop();
 * @endcode
 */
class SandboxController {
public:
    /**
     * @brief Construct controller; does not contact the engine
     * @param runtime Container engine adapter
     * @param config Sandbox policy
     */
    explicit SandboxController(std::shared_ptr<runtime::ContainerRuntime> runtime,
                               const ControllerConfig& config = ControllerConfig{});

    /**
     * @brief Stops the sandbox if one is live; cleanup failures are logged
     */
    ~SandboxController();

    SandboxController(const SandboxController&) = delete;
    SandboxController& operator=(const SandboxController&) = delete;

    /**
     * @brief Provision a sandbox from an image
     *
     * Pulls the image if needed, creates and starts a hardened container,
     * discovers interpreters, installs the configured ones that are missing,
     * isolates the network, and verifies unprivileged execution.
     *
     * @param image Base image reference
     * @param limits Resource limits for the sandbox's lifetime
     * @param network Network policy for the sandbox's lifetime
     * @return Handle of the new sandbox
     *
     * @throws InitializationError if a sandbox is live, the limits are invalid,
     *         the engine or image is unavailable, or bootstrap fails; any
     *         partially created container is removed first
     */
    SandboxHandle Initialize(const std::string& image,
                             const ResourceLimits& limits,
                             NetworkPolicy network);

    /// Initialize with the configured network policy
    SandboxHandle Initialize(const std::string& image, const ResourceLimits& limits);

    /// Initialize with the configured limits and network policy
    SandboxHandle Initialize(const std::string& image);

    /**
     * @brief Run code in the sandbox and buffer its result
     *
     * @param code Source text, delivered to the container through stdin
     * @param language Language name or alias
     * @return ExecutionResult; a non-zero exit code is a normal result
     *
     * @throws UnsupportedLanguageError unknown language or interpreter not
     *         available (no container call is made)
     * @throws ConcurrentExecutionError another execute is in flight
     * @throws InvalidStateError sandbox not READY
     * @throws ExecutionTimeoutError deadline hit; process killed, sandbox still READY
     * @throws RuntimeError engine failure; sandbox released and FAILED
     */
    ExecutionResult Execute(const std::string& code, const std::string& language = "python");

    /**
     * @brief Release the sandbox; idempotent and legal in every state
     *
     * The state becomes STOPPED even when the engine rejects stop/remove.
     *
     * @throws CleanupError after the transition, if the engine reported errors
     */
    void Stop();

    SandboxState GetState() const;
    std::optional<SandboxHandle> GetHandle() const;
    const ControllerConfig& GetConfig() const { return config_; }

private:
    std::shared_ptr<runtime::ContainerRuntime> runtime_;
    ControllerConfig config_;

    std::mutex lifecycle_mutex_;      ///< Serializes Initialize and Stop
    mutable std::mutex state_mutex_;  ///< Guards the fields below
    SandboxState state_{SandboxState::UNINITIALIZED};
    std::optional<SandboxHandle> handle_;
    std::uint64_t generation_{0};     ///< Bumped whenever the live sandbox changes
    std::uint64_t run_counter_{0};
    std::vector<std::string> orphaned_containers_;  ///< Containers whose removal failed

    SandboxHandle Provision(const std::string& image, const ResourceLimits& limits,
                            NetworkPolicy network);
    runtime::ContainerSpec BuildContainerSpec(const std::string& image,
                                              const ResourceLimits& limits,
                                              NetworkPolicy network,
                                              bool allow_install) const;
    std::map<Language, std::string> ProbeInterpreters(const std::string& container_id);
    std::optional<std::string> ProbeInterpreter(const std::string& container_id,
                                                const LanguageRecipe& recipe);
    void Bootstrap(const std::string& container_id, std::map<Language, std::string>& interpreters);
    void SmokeCheck(const std::string& container_id);
    void TerminateRun(const std::string& container_id, const std::string& run_dir);

    bool FinishExecution(std::uint64_t generation);
    bool FailExecution(std::uint64_t generation, const std::string& container_id);

    runtime::ExecRequest MakeRequest(std::vector<std::string> command,
                                     std::chrono::milliseconds timeout) const;
    std::string GenerateContainerName() const;
    void ValidateLimits(const ResourceLimits& limits) const;
};

/**
 * @class ControllerConfigBuilder
 * @brief Fluent API for constructing controller configurations
 *
 * **Usage Example**:
 * @code
 * auto config = ControllerConfigBuilder()
 *     .WithImage("python:3.12-alpine")
 *     .WithExecutionTimeout(std::chrono::seconds(30))
 *     .WithMemoryLimit(256)
 *     .WithNetwork(NetworkPolicy::DISABLED)
 *     .Build();
 * @endcode
 */
class ControllerConfigBuilder {
public:
    ControllerConfigBuilder& WithImage(const std::string& image) {
        config_.default_image = image;
        return *this;
    }

    ControllerConfigBuilder& WithExecutionTimeout(std::chrono::milliseconds timeout) {
        config_.execution_timeout = timeout;
        return *this;
    }

    ControllerConfigBuilder& WithMemoryLimit(std::size_t mb) {
        config_.default_limits.memory_mb = mb;
        return *this;
    }

    ControllerConfigBuilder& WithCPULimit(double cpus) {
        config_.default_limits.cpus = cpus;
        return *this;
    }

    ControllerConfigBuilder& WithProcessLimit(int processes) {
        config_.default_limits.max_processes = processes;
        return *this;
    }

    ControllerConfigBuilder& WithNetwork(NetworkPolicy policy) {
        config_.network_policy = policy;
        return *this;
    }

    ControllerConfigBuilder& WithBootstrap(bool enabled, std::vector<Language> languages) {
        config_.bootstrap_enabled = enabled;
        config_.bootstrap_languages = std::move(languages);
        return *this;
    }

    ControllerConfigBuilder& WithHealthCheck(bool enabled) {
        config_.health_check_before_execute = enabled;
        return *this;
    }

    ControllerConfig Build() const {
        return config_;
    }

private:
    ControllerConfig config_;
};

} // namespace core
} // namespace sandcell
