/**
 * @file docker_cli_runtime.cpp
 * @brief Implementation of the Docker CLI container adapter
 *
 * Every primitive is a single `docker` invocation run through
 * utils::RunProcess, never through a shell, so container names, image
 * references and submitted payloads cannot be reinterpreted as shell syntax.
 *
 * **Security Hardening at Creation**:
 * - **Capability Dropping**: --cap-drop ALL (selected caps re-added only on request)
 * - **No New Privileges**: --security-opt no-new-privileges
 * - **Read-only Rootfs**: --read-only with tmpfs scratch mounts
 * - **Resource Limits**: --cpus, --memory (swap pinned), --pids-limit
 * - **Network Isolation**: --network none unless the caller asks otherwise
 * - **Zombie Reaping**: --init as PID 1
 *
 * **Error Normalization**:
 * ```
 * spawn failure / daemon unreachable  -> ENGINE_UNAVAILABLE
 * unknown image / pull denied         -> IMAGE_NOT_FOUND
 * create / start / network rejected   -> CONTAINER_CREATE_FAILED
 * exec rejected by engine             -> EXEC_FAILED
 * stop / rm rejected                  -> REMOVE_FAILED
 * ```
 *
 * @date 2025
 */

#include "sandcell/runtime/docker_cli_runtime.hpp"
#include "sandcell/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <nlohmann/json.hpp>

#include <system_error>

using json = nlohmann::json;

namespace sandcell {
namespace runtime {

using utils::StringUtils;

namespace {

const std::vector<std::string> kEngineUnavailableMarkers = {
    "cannot connect to the docker daemon",
    "is the docker daemon running",
    "error during connect",
    "permission denied while trying to connect",
    "connection refused",
};

const std::vector<std::string> kImageNotFoundMarkers = {
    "no such image",
    "unable to find image",
    "pull access denied",
    "manifest unknown",
    "repository does not exist",
    "invalid reference format",
};

const std::vector<std::string> kEngineDiagnosticPrefixes = {
    "Error response from daemon",
    "Error: No such container",
    "OCI runtime exec failed",
    "Cannot connect to the Docker daemon",
    "error during connect",
};

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR
// ============================================================================

DockerCliRuntime::DockerCliRuntime(const DockerCliOptions& options)
    : options_(options) {
    spdlog::debug("Docker CLI runtime: binary={} host={}", options_.binary,
                  options_.host.empty() ? "<default>" : options_.host);
}

// ============================================================================
// ENGINE AND IMAGES
// ============================================================================

std::string DockerCliRuntime::Ping() {
    auto result = RunManagement({"version", "--format", "{{.Server.Version}}"},
                                options_.command_timeout);
    if (result.exit_code != 0 || result.timed_out) {
        Fail(AdapterErrorKind::ENGINE_UNAVAILABLE, "version", result);
    }

    std::string version = StringUtils::Trim(result.stdout_output);
    spdlog::debug("Container engine version: {}", version);
    return version;
}

bool DockerCliRuntime::ImageExists(const std::string& image) {
    auto result = RunManagement({"image", "inspect", "--format", "{{.Id}}", image},
                                options_.command_timeout);
    if (result.exit_code == 0 && !result.timed_out) {
        return true;
    }

    auto kind = ClassifyCliError(result.stderr_output);
    if (result.timed_out || (kind && *kind == AdapterErrorKind::ENGINE_UNAVAILABLE)) {
        Fail(AdapterErrorKind::ENGINE_UNAVAILABLE, "image inspect", result);
    }
    return false;
}

void DockerCliRuntime::PullImage(const std::string& image) {
    spdlog::info("Pulling image: {}", image);

    auto result = RunManagement({"pull", "--quiet", image}, options_.pull_timeout);
    if (result.exit_code != 0 || result.timed_out) {
        Fail(AdapterErrorKind::IMAGE_NOT_FOUND, "pull " + image, result);
    }

    spdlog::info("Image pulled: {}", image);
}

// ============================================================================
// CONTAINER LIFECYCLE
// ============================================================================

std::string DockerCliRuntime::CreateContainer(const ContainerSpec& spec) {
    spdlog::info("Creating container {} from {}", spec.name, spec.image);

    auto result = RunManagement(BuildCreateArgs(spec), options_.command_timeout);
    if (result.exit_code != 0 || result.timed_out) {
        Fail(AdapterErrorKind::CONTAINER_CREATE_FAILED, "create", result);
    }

    // The ID is the last line; earlier lines may carry pull progress
    auto lines = StringUtils::Split(result.stdout_output, '\n');
    std::string container_id = lines.empty() ? "" : StringUtils::Trim(lines.back());
    if (container_id.empty()) {
        throw ContainerRuntimeError(AdapterErrorKind::CONTAINER_CREATE_FAILED,
                                    "docker create returned no container ID");
    }

    spdlog::info("Container created: {}", container_id.substr(0, 12));
    return container_id;
}

void DockerCliRuntime::StartContainer(const std::string& container_id) {
    auto result = RunManagement({"start", container_id}, options_.command_timeout);
    if (result.exit_code != 0 || result.timed_out) {
        Fail(AdapterErrorKind::CONTAINER_CREATE_FAILED, "start", result);
    }
    spdlog::debug("Container started: {}", container_id.substr(0, 12));
}

ExecOutcome DockerCliRuntime::Exec(const std::string& container_id, const ExecRequest& request) {
    utils::ProcessOptions process_options;
    process_options.stdin_data = request.stdin_data;
    process_options.timeout = request.timeout;
    process_options.max_output_bytes = request.max_output_bytes;

    auto result = RunDocker(BuildExecArgs(container_id, request), process_options);

    if (!result.timed_out && result.exit_code != 0 && IsEngineDiagnostic(result.stderr_output) &&
        !IsProgramOutput(container_id, result)) {
        Fail(AdapterErrorKind::EXEC_FAILED, "exec", result);
    }

    ExecOutcome outcome;
    outcome.exit_code = result.exit_code;
    outcome.stdout_output = std::move(result.stdout_output);
    outcome.stderr_output = std::move(result.stderr_output);
    outcome.timed_out = result.timed_out;
    outcome.stdout_truncated = result.stdout_truncated;
    outcome.stderr_truncated = result.stderr_truncated;
    outcome.duration = result.duration;
    return outcome;
}

ContainerStatus DockerCliRuntime::Inspect(const std::string& container_id) {
    auto result = RunManagement({"inspect", "--type", "container", "--format", "{{json .State}}",
                                 container_id},
                                options_.command_timeout);

    if (result.exit_code != 0 || result.timed_out) {
        if (!result.timed_out && IsMissingContainer(result.stderr_output)) {
            return ContainerStatus{};
        }
        Fail(AdapterErrorKind::ENGINE_UNAVAILABLE, "inspect", result);
    }

    try {
        return ParseInspectState(result.stdout_output);
    }
    catch (const json::exception& e) {
        throw ContainerRuntimeError(AdapterErrorKind::ENGINE_UNAVAILABLE,
                                    std::string("unparseable inspect output: ") + e.what());
    }
}

void DockerCliRuntime::DisconnectNetwork(const std::string& container_id,
                                         const std::string& network) {
    spdlog::debug("Disconnecting {} from network {}", container_id.substr(0, 12), network);

    auto result = RunManagement({"network", "disconnect", "--force", network, container_id},
                                options_.command_timeout);
    if (result.exit_code != 0 || result.timed_out) {
        Fail(AdapterErrorKind::CONTAINER_CREATE_FAILED, "network disconnect", result);
    }
}

void DockerCliRuntime::StopContainer(const std::string& container_id, std::chrono::seconds grace) {
    spdlog::debug("Stopping container {} (grace: {}s)", container_id.substr(0, 12), grace.count());

    auto result = RunManagement({"stop", "--time", std::to_string(grace.count()), container_id},
                                options_.command_timeout + grace);
    if (result.exit_code != 0 || result.timed_out) {
        if (!result.timed_out && IsMissingContainer(result.stderr_output)) {
            spdlog::debug("Container {} already gone", container_id.substr(0, 12));
            return;
        }
        Fail(AdapterErrorKind::REMOVE_FAILED, "stop", result);
    }
}

void DockerCliRuntime::RemoveContainer(const std::string& container_id, bool force) {
    std::vector<std::string> args = {"rm"};
    if (force) {
        args.push_back("--force");
    }
    args.push_back(container_id);

    auto result = RunManagement(args, options_.command_timeout);
    if (result.exit_code != 0 || result.timed_out) {
        if (!result.timed_out && IsMissingContainer(result.stderr_output)) {
            spdlog::info("Container {} already removed", container_id.substr(0, 12));
            return;
        }
        Fail(AdapterErrorKind::REMOVE_FAILED, "rm", result);
    }

    spdlog::info("Container removed: {}", container_id.substr(0, 12));
}

// ============================================================================
// COMMAND CONSTRUCTION
// ============================================================================

std::vector<std::string> DockerCliRuntime::BuildCreateArgs(const ContainerSpec& spec) {
    std::vector<std::string> args;

    args.push_back("create");

    if (!spec.name.empty()) {
        args.push_back("--name");
        args.push_back(spec.name);
    }

    for (const auto& [key, value] : spec.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }

    // Memory limit; equal swap limit disables swap
    if (spec.memory_mb > 0) {
        args.push_back("--memory");
        args.push_back(std::to_string(spec.memory_mb) + "m");
        args.push_back("--memory-swap");
        args.push_back(std::to_string(spec.memory_mb) + "m");
    }

    // CPU limit
    if (spec.cpus > 0) {
        args.push_back("--cpus");
        args.push_back(fmt::format("{}", spec.cpus));
    }

    // Process limit
    if (spec.pids_limit > 0) {
        args.push_back("--pids-limit");
        args.push_back(std::to_string(spec.pids_limit));
    }

    args.push_back("--network");
    args.push_back(spec.network.empty() ? "none" : spec.network);

    for (const auto& cap : spec.capabilities_drop) {
        args.push_back("--cap-drop");
        args.push_back(cap);
    }
    for (const auto& cap : spec.capabilities_add) {
        args.push_back("--cap-add");
        args.push_back(cap);
    }

    if (spec.no_new_privileges) {
        args.push_back("--security-opt");
        args.push_back("no-new-privileges");
    }

    if (spec.read_only_rootfs) {
        args.push_back("--read-only");
    }

    for (const auto& [mount_point, mount_options] : spec.tmpfs) {
        args.push_back("--tmpfs");
        args.push_back(mount_options.empty() ? mount_point : mount_point + ":" + mount_options);
    }

    if (spec.init_process) {
        args.push_back("--init");
    }

    // Image (must be last before command)
    args.push_back(spec.image);
    args.insert(args.end(), spec.command.begin(), spec.command.end());

    return args;
}

std::vector<std::string> DockerCliRuntime::BuildExecArgs(const std::string& container_id,
                                                         const ExecRequest& request) {
    std::vector<std::string> args = {"exec"};

    if (!request.stdin_data.empty()) {
        args.push_back("--interactive");
    }
    if (!request.user.empty()) {
        args.push_back("--user");
        args.push_back(request.user);
    }
    if (!request.working_dir.empty()) {
        args.push_back("--workdir");
        args.push_back(request.working_dir);
    }
    for (const auto& [key, value] : request.env) {
        args.push_back("--env");
        args.push_back(key + "=" + value);
    }

    args.push_back(container_id);
    args.insert(args.end(), request.command.begin(), request.command.end());

    return args;
}

// ============================================================================
// OUTPUT INTERPRETATION
// ============================================================================

std::optional<AdapterErrorKind> DockerCliRuntime::ClassifyCliError(const std::string& stderr_output) {
    std::string lower = StringUtils::ToLower(stderr_output);

    if (StringUtils::ContainsAny(lower, kEngineUnavailableMarkers)) {
        return AdapterErrorKind::ENGINE_UNAVAILABLE;
    }
    if (StringUtils::ContainsAny(lower, kImageNotFoundMarkers)) {
        return AdapterErrorKind::IMAGE_NOT_FOUND;
    }
    return std::nullopt;
}

bool DockerCliRuntime::IsEngineDiagnostic(const std::string& stderr_output) {
    std::string first = StringUtils::FirstLine(stderr_output);
    for (const auto& prefix : kEngineDiagnosticPrefixes) {
        if (StringUtils::StartsWith(first, prefix)) {
            return true;
        }
    }
    return false;
}

ContainerStatus DockerCliRuntime::ParseInspectState(const std::string& json_str) {
    json j = json::parse(json_str);

    ContainerStatus status;
    status.exists = true;
    status.status = j.value("Status", "");
    status.running = j.value("Running", false);
    status.oom_killed = j.value("OOMKilled", false);
    status.exit_code = j.value("ExitCode", 0);
    return status;
}

bool DockerCliRuntime::IsProgramOutput(const std::string& container_id,
                                       const utils::ProcessResult& result) {
    // The CLI reserves these for "could not run the command"
    if (result.exit_code >= 125 && result.exit_code <= 127) {
        return false;
    }

    // A program may print daemon-like text itself; the engine only refuses
    // execs when the container is gone or stopped
    try {
        ContainerStatus status = Inspect(container_id);
        if (status.running) {
            spdlog::debug("Exec stderr looks like an engine error but the container is running; "
                          "treating it as program output");
            return true;
        }
    }
    catch (const ContainerRuntimeError& e) {
        spdlog::debug("Inspect after failed exec also failed: {}", e.what());
    }
    return false;
}

bool DockerCliRuntime::IsMissingContainer(const std::string& stderr_output) {
    return StringUtils::ContainsAny(StringUtils::ToLower(stderr_output),
                                    {"no such container", "no such object"});
}

// ============================================================================
// PROCESS PLUMBING
// ============================================================================

utils::ProcessResult DockerCliRuntime::RunDocker(const std::vector<std::string>& args,
                                                 utils::ProcessOptions process_options) const {
    std::vector<std::string> argv = {options_.binary};
    if (!options_.host.empty()) {
        argv.push_back("--host");
        argv.push_back(options_.host);
    }
    argv.insert(argv.end(), args.begin(), args.end());

    spdlog::debug("Executing: {}", StringUtils::Truncate(StringUtils::Join(argv, " "), 512));

    try {
        return utils::RunProcess(argv, process_options);
    }
    catch (const std::system_error& e) {
        throw ContainerRuntimeError(AdapterErrorKind::ENGINE_UNAVAILABLE,
                                    "cannot run " + options_.binary + ": " + e.what());
    }
}

utils::ProcessResult DockerCliRuntime::RunManagement(const std::vector<std::string>& args,
                                                     std::chrono::seconds timeout) const {
    utils::ProcessOptions process_options;
    process_options.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(timeout);
    process_options.max_output_bytes = 1 << 20;
    return RunDocker(args, process_options);
}

void DockerCliRuntime::Fail(AdapterErrorKind fallback, const std::string& what,
                            const utils::ProcessResult& result) const {
    AdapterErrorKind kind = fallback;
    std::string detail;

    if (result.timed_out) {
        kind = AdapterErrorKind::ENGINE_UNAVAILABLE;
        detail = "timed out after " + std::to_string(result.duration.count()) + " ms";
    } else {
        if (auto classified = ClassifyCliError(result.stderr_output)) {
            kind = *classified;
        }
        detail = "exit " + std::to_string(result.exit_code);
        std::string first = StringUtils::FirstLine(result.stderr_output);
        if (!first.empty()) {
            detail += ": " + first;
        }
    }

    std::string message = "docker " + what + " failed (" + detail + ")";
    spdlog::error("[{}] {}", AdapterErrorKindName(kind), message);
    throw ContainerRuntimeError(kind, message);
}

} // namespace runtime
} // namespace sandcell
