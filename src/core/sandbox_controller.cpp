/**
 * @file sandbox_controller.cpp
 * @brief Implementation of the sandbox lifecycle controller
 *
 * **Provisioning Workflow**:
 * 1. **Validation**: Reject non-positive limits
 * 2. **Engine Check**: Ping the engine, pull the image if it is missing
 * 3. **Creation**: Create and start a hardened keep-alive container
 * 4. **Discovery**: Probe each language's interpreter candidates
 * 5. **Bootstrap**: Install configured interpreters that are missing (as root)
 * 6. **Isolation**: Detach the install network when the policy disables it
 * 7. **Smoke Check**: Run `echo ready` as the unprivileged user
 *
 * Each acquisition pushes its release onto a CleanupStack; any failure
 * rolls the stack back before InitializationError reaches the caller.
 *
 * **Container Hardening**:
 * - **Capabilities**: ALL dropped; a small install set re-added only while bootstrapping
 * - **Privileges**: no-new-privileges, code runs as `nobody`
 * - **Filesystem**: read-only rootfs unless installing, noexec tmpfs working dir
 * - **Resources**: CPU, memory (swap pinned), process count
 * - **Init**: zombie-reaping init as PID 1
 *
 * **Timeout Handling**: the engine client is killed at the deadline, then a
 * second exec kills the recorded process group so the sandbox stays usable.
 *
 * @date 2025
 */

#include "sandcell/core/sandbox_controller.hpp"
#include "sandcell/core/cleanup_stack.hpp"
#include "sandcell/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace sandcell {
namespace core {

using runtime::ContainerRuntimeError;
using utils::StringUtils;

namespace {

constexpr const char* kInstallNetwork = "bridge";
constexpr std::size_t kMaxReportedOutput = 2000;

std::string SupportedLanguages() {
    std::vector<std::string> names;
    for (const auto& recipe : LanguageTable()) {
        names.push_back(recipe.name);
    }
    return StringUtils::Join(names, ", ");
}

std::string ShortId(const std::string& container_id) {
    return container_id.substr(0, 12);
}

// Prefer stderr for diagnostics; installers write progress to stdout
std::string DiagnosticOutput(const runtime::ExecOutcome& outcome) {
    std::string text = StringUtils::Trim(outcome.stderr_output);
    if (text.empty()) {
        text = StringUtils::Trim(outcome.stdout_output);
    }
    return StringUtils::Truncate(text, kMaxReportedOutput);
}

} // anonymous namespace

const char* SandboxStateName(SandboxState state) {
    switch (state) {
        case SandboxState::UNINITIALIZED: return "uninitialized";
        case SandboxState::INITIALIZING: return "initializing";
        case SandboxState::READY: return "ready";
        case SandboxState::EXECUTING: return "executing";
        case SandboxState::STOPPING: return "stopping";
        case SandboxState::STOPPED: return "stopped";
        case SandboxState::FAILED: return "failed";
    }
    return "unknown";
}

// Constructor
SandboxController::SandboxController(std::shared_ptr<runtime::ContainerRuntime> runtime,
                                     const ControllerConfig& config)
    : runtime_(std::move(runtime))
    , config_(config) {

    if (!runtime_) {
        throw std::invalid_argument("SandboxController requires a container runtime");
    }

    spdlog::debug("Sandbox controller created");
    spdlog::debug("Default image: {}", config_.default_image);
    spdlog::debug("Execution timeout: {}ms", config_.execution_timeout.count());
}

// Destructor
SandboxController::~SandboxController() {
    try {
        Stop();
    }
    catch (const std::exception& e) {
        spdlog::warn("Sandbox cleanup on shutdown failed: {}", e.what());
    }
}

// ============================================================================
// INITIALIZE
// ============================================================================

SandboxHandle SandboxController::Initialize(const std::string& image) {
    return Initialize(image, config_.default_limits, config_.network_policy);
}

SandboxHandle SandboxController::Initialize(const std::string& image, const ResourceLimits& limits) {
    return Initialize(image, limits, config_.network_policy);
}

SandboxHandle SandboxController::Initialize(const std::string& image,
                                            const ResourceLimits& limits,
                                            NetworkPolicy network) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (handle_) {
            throw InitializationError(fmt::format(
                "Sandbox already initialized (state: {}, container: {}); stop it first",
                SandboxStateName(state_), ShortId(handle_->container_id)));
        }
        state_ = SandboxState::INITIALIZING;
    }

    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("INITIALIZING SANDBOX ({})", image);
    spdlog::info("═══════════════════════════════════════════════════════════════");

    try {
        ValidateLimits(limits);
        if (image.empty()) {
            throw InitializationError("Image reference must not be empty");
        }

        SandboxHandle handle = Provision(image, limits, network);

        std::lock_guard<std::mutex> lock(state_mutex_);
        handle_ = handle;
        state_ = SandboxState::READY;
        ++generation_;

        spdlog::info("✓ Sandbox ready: {} ({})", handle.container_name, ShortId(handle.container_id));
        return handle;
    }
    catch (const std::exception& e) {
        spdlog::error("Sandbox initialization failed: {}", e.what());
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = SandboxState::FAILED;
        throw;
    }
}

SandboxHandle SandboxController::Provision(const std::string& image,
                                           const ResourceLimits& limits,
                                           NetworkPolicy network) {
    CleanupStack cleanup;
    std::string container_id;

    auto roll_back = [&]() {
        auto failures = cleanup.Unwind();
        if (!failures.empty() && !container_id.empty()) {
            spdlog::error("Container {} could not be removed; will retry on stop", ShortId(container_id));
            std::lock_guard<std::mutex> lock(state_mutex_);
            orphaned_containers_.push_back(container_id);
        }
    };

    try {
        spdlog::info("Checking container engine...");
        std::string version = runtime_->Ping();
        spdlog::info("✓ Container engine available (version {})", version);

        if (!runtime_->ImageExists(image)) {
            spdlog::info("Pulling image {}...", image);
            runtime_->PullImage(image);
            spdlog::info("✓ Image pulled");
        }

        const bool allow_install = config_.bootstrap_enabled && !config_.bootstrap_languages.empty();
        runtime::ContainerSpec spec = BuildContainerSpec(image, limits, network, allow_install);

        container_id = runtime_->CreateContainer(spec);
        cleanup.Push("remove container " + ShortId(container_id), [this, container_id]() {
            runtime_->RemoveContainer(container_id, true);
        });
        spdlog::info("✓ Container created: {} ({})", spec.name, ShortId(container_id));

        runtime_->StartContainer(container_id);
        spdlog::debug("Container started");

        std::map<Language, std::string> interpreters = ProbeInterpreters(container_id);

        if (allow_install) {
            Bootstrap(container_id, interpreters);
            if (network == NetworkPolicy::DISABLED) {
                runtime_->DisconnectNetwork(container_id, kInstallNetwork);
                spdlog::info("✓ Network access removed");
            }
        }

        SmokeCheck(container_id);

        SandboxHandle handle;
        handle.container_id = container_id;
        handle.container_name = spec.name;
        handle.image = image;
        handle.limits = limits;
        handle.network = network;
        handle.interpreters = std::move(interpreters);
        handle.created_at = std::chrono::system_clock::now();

        cleanup.Commit();
        return handle;
    }
    catch (const ContainerRuntimeError& e) {
        roll_back();
        throw InitializationError(fmt::format("Failed to initialize sandbox: {} [{}]",
                                              e.what(), runtime::AdapterErrorKindName(e.kind())));
    }
    catch (const InitializationError&) {
        roll_back();
        throw;
    }
    catch (const std::exception& e) {
        roll_back();
        throw InitializationError(fmt::format("Failed to initialize sandbox: {}", e.what()));
    }
}

runtime::ContainerSpec SandboxController::BuildContainerSpec(const std::string& image,
                                                             const ResourceLimits& limits,
                                                             NetworkPolicy network,
                                                             bool allow_install) const {
    runtime::ContainerSpec spec;
    spec.name = GenerateContainerName();
    spec.image = image;

    spec.cpus = limits.cpus;
    spec.memory_mb = limits.memory_mb;
    spec.pids_limit = limits.max_processes;

    spec.capabilities_drop = {"ALL"};
    spec.no_new_privileges = true;
    spec.init_process = true;
    spec.read_only_rootfs = config_.read_only_rootfs && !allow_install;
    if (allow_install) {
        // Package managers need these as root; code runs as an unprivileged user
        spec.capabilities_add = config_.bootstrap_capabilities;
    }

    spec.tmpfs[config_.working_dir] =
        fmt::format("rw,size={}m,mode=1777,noexec,nodev,nosuid", limits.scratch_mb);

    spec.network = (network == NetworkPolicy::ENABLED || allow_install) ? kInstallNetwork : "none";
    spec.labels["sandcell.managed"] = "true";

    return spec;
}

std::map<Language, std::string> SandboxController::ProbeInterpreters(const std::string& container_id) {
    std::map<Language, std::string> interpreters;

    for (const auto& recipe : LanguageTable()) {
        auto path = ProbeInterpreter(container_id, recipe);
        if (path) {
            spdlog::debug("Found {} interpreter: {}", recipe.name, *path);
            interpreters[recipe.language] = *path;
        }
        else {
            spdlog::debug("No {} interpreter in image", recipe.name);
        }
    }

    return interpreters;
}

std::optional<std::string> SandboxController::ProbeInterpreter(const std::string& container_id,
                                                               const LanguageRecipe& recipe) {
    auto outcome = runtime_->Exec(container_id, MakeRequest(BuildProbeCommand(recipe), config_.probe_timeout));

    if (outcome.timed_out) {
        throw InitializationError("Timed out probing for the " + recipe.name + " interpreter");
    }
    if (outcome.exit_code != 0) {
        return std::nullopt;
    }

    std::string path = StringUtils::Trim(StringUtils::FirstLine(outcome.stdout_output));
    if (path.empty()) {
        return std::nullopt;
    }
    return path;
}

void SandboxController::Bootstrap(const std::string& container_id,
                                  std::map<Language, std::string>& interpreters) {
    for (Language language : config_.bootstrap_languages) {
        if (interpreters.count(language) > 0) {
            continue;
        }

        const LanguageRecipe& recipe = GetRecipe(language);
        if (!CanBootstrap(recipe)) {
            throw InitializationError(recipe.name + " cannot be installed automatically");
        }

        spdlog::info("Installing {} runtime...", recipe.name);

        auto install = MakeRequest(BuildBootstrapCommand(recipe), config_.bootstrap_timeout);
        install.user = "0";
        install.working_dir = "/";

        auto outcome = runtime_->Exec(container_id, install);
        if (outcome.timed_out) {
            throw InitializationError(fmt::format("Timed out installing {} after {}s",
                                                  recipe.name, config_.bootstrap_timeout.count()));
        }
        if (outcome.exit_code != 0) {
            throw InitializationError(fmt::format("Failed to install {} (exit {}): {}",
                                                  recipe.name, outcome.exit_code,
                                                  DiagnosticOutput(outcome)));
        }

        auto path = ProbeInterpreter(container_id, recipe);
        if (!path) {
            throw InitializationError(recipe.name + " executable not found after installation");
        }

        auto version_command = BuildVersionCommand(recipe, *path);
        if (!version_command.empty()) {
            auto version = runtime_->Exec(container_id, MakeRequest(version_command, config_.probe_timeout));
            if (version.timed_out || version.exit_code != 0) {
                throw InitializationError(fmt::format("Failed to execute {} after installation: {}",
                                                      recipe.name, DiagnosticOutput(version)));
            }
            // python 2 prints its version on stderr
            std::string text = version.stdout_output.empty() ? version.stderr_output : version.stdout_output;
            spdlog::info("✓ {} installed: {}", recipe.name, StringUtils::Trim(StringUtils::FirstLine(text)));
        }
        else {
            spdlog::info("✓ {} installed", recipe.name);
        }

        interpreters[language] = *path;
    }
}

void SandboxController::SmokeCheck(const std::string& container_id) {
    auto outcome = runtime_->Exec(container_id,
                                  MakeRequest({"/bin/sh", "-c", "echo ready"}, config_.probe_timeout));

    if (outcome.timed_out || outcome.exit_code != 0 ||
        StringUtils::Trim(outcome.stdout_output) != "ready") {
        throw InitializationError(fmt::format("Sandbox smoke check failed as user '{}': {}",
                                              config_.execution_user, DiagnosticOutput(outcome)));
    }
    spdlog::debug("Smoke check passed");
}

// ============================================================================
// EXECUTE
// ============================================================================

ExecutionResult SandboxController::Execute(const std::string& code, const std::string& language_name) {
    auto language = ParseLanguage(language_name);
    if (!language) {
        throw UnsupportedLanguageError(fmt::format("Unsupported language: '{}' (supported: {})",
                                                   language_name, SupportedLanguages()));
    }
    const LanguageRecipe& recipe = GetRecipe(*language);

    std::string container_id;
    std::string interpreter;
    std::uint64_t generation = 0;
    std::uint64_t run_number = 0;

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == SandboxState::EXECUTING) {
            throw ConcurrentExecutionError("Another execution is already in progress");
        }
        if (state_ != SandboxState::READY || !handle_) {
            throw InvalidStateError(fmt::format("Sandbox is not ready (state: {}); initialize it first",
                                                SandboxStateName(state_)));
        }

        auto it = handle_->interpreters.find(*language);
        if (it == handle_->interpreters.end()) {
            throw UnsupportedLanguageError(fmt::format("{} runtime is not available in image {}",
                                                       recipe.name, handle_->image));
        }

        container_id = handle_->container_id;
        interpreter = it->second;
        generation = generation_;
        run_number = ++run_counter_;
        state_ = SandboxState::EXECUTING;
    }

    const std::string run_dir = fmt::format("{}/.sandcell-run-{}", config_.working_dir, run_number);
    spdlog::info("Executing {} code ({} bytes)", recipe.name, code.size());

    try {
        if (config_.health_check_before_execute) {
            auto status = runtime_->Inspect(container_id);
            if (!status.running) {
                std::string reason = fmt::format("Sandbox container is no longer running (status: {}{})",
                                                 status.exists ? status.status : "removed",
                                                 status.oom_killed ? ", out of memory" : "");
                spdlog::error("{}", reason);
                if (!FailExecution(generation, container_id)) {
                    throw InvalidStateError("Sandbox was stopped during execution");
                }
                throw RuntimeError(reason);
            }
        }

        auto request = MakeRequest(BuildRunCommand(recipe, interpreter, run_dir), config_.execution_timeout);
        request.stdin_data = code;

        auto start = std::chrono::steady_clock::now();
        auto outcome = runtime_->Exec(container_id, request);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        if (outcome.timed_out) {
            spdlog::warn("Execution exceeded {}ms, terminating", config_.execution_timeout.count());
            TerminateRun(container_id, run_dir);
            if (!FinishExecution(generation)) {
                throw InvalidStateError("Sandbox was stopped during execution");
            }
            throw ExecutionTimeoutError(fmt::format("Execution timed out after {}ms",
                                                    config_.execution_timeout.count()));
        }

        ExecutionResult result;
        result.language = *language;
        result.stdout_output = std::move(outcome.stdout_output);
        result.stderr_output = std::move(outcome.stderr_output);
        result.exit_code = outcome.exit_code;
        result.duration = elapsed;
        result.stdout_truncated = outcome.stdout_truncated;
        result.stderr_truncated = outcome.stderr_truncated;

        if (!FinishExecution(generation)) {
            throw InvalidStateError("Sandbox was stopped during execution");
        }

        if (result.exit_code == kStagingFailedExitCode && result.stdout_output.empty()) {
            spdlog::warn("Exit code {} may mean the source could not be staged in {}",
                         kStagingFailedExitCode, config_.working_dir);
        }
        spdlog::info("✓ Execution finished: exit code {}, {}ms", result.exit_code, result.duration.count());
        return result;
    }
    catch (const SandboxError&) {
        throw;
    }
    catch (const ContainerRuntimeError& e) {
        spdlog::error("Execution failed: {}", e.what());
        if (!FailExecution(generation, container_id)) {
            throw InvalidStateError("Sandbox was stopped during execution");
        }
        throw RuntimeError(fmt::format("Execution failed: {} [{}]",
                                       e.what(), runtime::AdapterErrorKindName(e.kind())));
    }
    catch (const std::exception& e) {
        spdlog::error("Execution failed: {}", e.what());
        if (!FailExecution(generation, container_id)) {
            throw InvalidStateError("Sandbox was stopped during execution");
        }
        throw RuntimeError(std::string("Execution failed: ") + e.what());
    }
}

void SandboxController::TerminateRun(const std::string& container_id, const std::string& run_dir) {
    auto outcome = runtime_->Exec(container_id, MakeRequest(BuildKillCommand(run_dir), config_.probe_timeout));

    if (outcome.timed_out || outcome.exit_code != 0) {
        throw ContainerRuntimeError(runtime::AdapterErrorKind::EXEC_FAILED,
                                    "Could not terminate timed-out process: " + DiagnosticOutput(outcome));
    }
    spdlog::debug("Timed-out process terminated");
}

bool SandboxController::FinishExecution(std::uint64_t generation) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (generation_ != generation || state_ != SandboxState::EXECUTING) {
        return false;
    }
    state_ = SandboxState::READY;
    return true;
}

bool SandboxController::FailExecution(std::uint64_t generation, const std::string& container_id) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (generation_ != generation) {
            return false;
        }
        state_ = SandboxState::FAILED;
        handle_.reset();
        ++generation_;
    }

    try {
        runtime_->RemoveContainer(container_id, true);
        spdlog::info("Failed sandbox container removed");
    }
    catch (const ContainerRuntimeError& e) {
        spdlog::error("Could not remove failed container {}: {}", ShortId(container_id), e.what());
        std::lock_guard<std::mutex> lock(state_mutex_);
        orphaned_containers_.push_back(container_id);
    }
    return true;
}

// ============================================================================
// STOP
// ============================================================================

void SandboxController::Stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    std::optional<SandboxHandle> handle;
    std::vector<std::string> orphans;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!handle_ && orphaned_containers_.empty()) {
            if (state_ != SandboxState::STOPPED) {
                spdlog::debug("No active container to clean up");
                state_ = SandboxState::STOPPED;
            }
            return;
        }
        handle.swap(handle_);
        orphans.swap(orphaned_containers_);
        state_ = SandboxState::STOPPING;
        ++generation_;
    }

    std::vector<std::string> failures;

    if (handle) {
        spdlog::info("Stopping sandbox {}...", handle->container_name);
        try {
            runtime_->StopContainer(handle->container_id, config_.stop_grace);
        }
        catch (const ContainerRuntimeError& e) {
            spdlog::warn("Stop failed, forcing removal: {}", e.what());
            failures.push_back(e.what());
        }
        orphans.insert(orphans.begin(), handle->container_id);
    }

    for (const auto& container_id : orphans) {
        try {
            runtime_->RemoveContainer(container_id, true);
            spdlog::debug("Removed container {}", ShortId(container_id));
        }
        catch (const ContainerRuntimeError& e) {
            spdlog::error("Failed to remove container {}: {}", ShortId(container_id), e.what());
            failures.push_back(e.what());
        }
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = SandboxState::STOPPED;
    }

    if (!failures.empty()) {
        throw CleanupError("Sandbox stopped with cleanup errors: " + StringUtils::Join(failures, "; "));
    }
    spdlog::info("✓ Sandbox stopped");
}

// ============================================================================
// ACCESSORS & HELPERS
// ============================================================================

SandboxState SandboxController::GetState() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::optional<SandboxHandle> SandboxController::GetHandle() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return handle_;
}

runtime::ExecRequest SandboxController::MakeRequest(std::vector<std::string> command,
                                                    std::chrono::milliseconds timeout) const {
    runtime::ExecRequest request;
    request.command = std::move(command);
    request.user = config_.execution_user;
    request.working_dir = config_.working_dir;
    request.env["HOME"] = config_.working_dir;
    request.timeout = timeout;
    request.max_output_bytes = config_.max_output_bytes;
    return request;
}

std::string SandboxController::GenerateContainerName() const {
    auto timestamp = std::time(nullptr);
    std::tm local{};
    localtime_r(&timestamp, &local);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(1000, 9999);

    std::ostringstream oss;
    oss << config_.container_name_prefix << "_"
        << std::put_time(&local, "%Y%m%d_%H%M%S")
        << "_" << dis(gen);

    return oss.str();
}

void SandboxController::ValidateLimits(const ResourceLimits& limits) const {
    if (limits.cpus <= 0.0) {
        throw InitializationError("CPU limit must be positive");
    }
    // Docker refuses memory limits below 6 MB
    if (limits.memory_mb < 6) {
        throw InitializationError("Memory limit must be at least 6 MB");
    }
    if (limits.max_processes <= 0) {
        throw InitializationError("Process limit must be positive");
    }
    if (limits.scratch_mb == 0) {
        throw InitializationError("Scratch space must be positive");
    }
}

} // namespace core
} // namespace sandcell
