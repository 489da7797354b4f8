/**
 * @file docker_cli_runtime.hpp
 * @brief ContainerRuntime implementation driving the Docker CLI
 *
 * Translates container primitives into `docker` command invocations, runs
 * them as child processes with separated stdout/stderr and deadlines, and
 * normalizes CLI failures into runtime::AdapterErrorKind. Works with any
 * endpoint the CLI can reach (local socket, `DOCKER_HOST`, or an explicit
 * `-H` address) and with CLI-compatible engines such as Podman.
 *
 * @date 2025
 */

#pragma once

#include "sandcell/runtime/container_runtime.hpp"
#include "sandcell/utils/process_runner.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace sandcell {
namespace runtime {

/**
 * @struct DockerCliOptions
 * @brief How to reach the engine through its CLI
 */
struct DockerCliOptions {
    std::string binary{"docker"};                     ///< CLI executable (PATH lookup if no slash)
    std::string host;                                 ///< Engine endpoint for `-H` (empty = CLI default / DOCKER_HOST)
    std::chrono::seconds command_timeout{120};        ///< Deadline for management commands
    std::chrono::seconds pull_timeout{600};           ///< Deadline for image pulls
};

/**
 * @class DockerCliRuntime
 * @brief Docker CLI backed container primitives
 *
 * Construction never contacts the engine; an unreachable engine surfaces as
 * ENGINE_UNAVAILABLE on the first call.
 *
 * **Usage Example**:
 * @code
 * DockerCliRuntime docker;
 * docker.Ping();
 *
 * ContainerSpec spec;
 * spec.name = "sandcell_1700000000_4242";
 * spec.image = "alpine:latest";
 * auto id = docker.CreateContainer(spec);
 * docker.StartContainer(id);
 *
 * ExecRequest request;
 * request.command = {"sh", "-c", "echo hi"};
 * auto outcome = docker.Exec(id, request);
 *
 * docker.StopContainer(id, std::chrono::seconds(5));
 * docker.RemoveContainer(id, true);
 * @endcode
 */
class DockerCliRuntime : public ContainerRuntime {
public:
    explicit DockerCliRuntime(const DockerCliOptions& options = DockerCliOptions{});

    std::string Ping() override;
    bool ImageExists(const std::string& image) override;
    void PullImage(const std::string& image) override;
    std::string CreateContainer(const ContainerSpec& spec) override;
    void StartContainer(const std::string& container_id) override;
    ExecOutcome Exec(const std::string& container_id, const ExecRequest& request) override;
    ContainerStatus Inspect(const std::string& container_id) override;
    void DisconnectNetwork(const std::string& container_id, const std::string& network) override;
    void StopContainer(const std::string& container_id, std::chrono::seconds grace) override;
    void RemoveContainer(const std::string& container_id, bool force) override;

    const DockerCliOptions& GetOptions() const { return options_; }

    /**
     * @brief Build `docker create` arguments (without the binary)
     *
     * Emits resource limits, capability changes, read-only rootfs, tmpfs
     * mounts, network mode and labels, then the image and keep-alive command.
     */
    static std::vector<std::string> BuildCreateArgs(const ContainerSpec& spec);

    /**
     * @brief Build `docker exec` arguments (without the binary)
     */
    static std::vector<std::string> BuildExecArgs(const std::string& container_id,
                                                  const ExecRequest& request);

    /**
     * @brief Map CLI error text to an adapter error kind
     * @param stderr_output Captured CLI stderr
     * @return Kind for engine-reachability or image problems, nullopt otherwise
     */
    static std::optional<AdapterErrorKind> ClassifyCliError(const std::string& stderr_output);

    /**
     * @brief Check whether stderr of `docker exec` came from the CLI/engine
     *
     * The CLI reports its own failures with fixed prefixes ("Error response
     * from daemon", "OCI runtime exec failed", ...) before the command runs.
     * A match alone is not conclusive: Exec also checks the exit code and
     * whether the container is still running.
     */
    static bool IsEngineDiagnostic(const std::string& stderr_output);

    /**
     * @brief Parse `docker inspect --format '{{json .State}}'` output
     * @throws nlohmann::json::exception on malformed JSON
     */
    static ContainerStatus ParseInspectState(const std::string& json_str);

private:
    DockerCliOptions options_;

    utils::ProcessResult RunDocker(const std::vector<std::string>& args,
                                   utils::ProcessOptions process_options) const;
    utils::ProcessResult RunManagement(const std::vector<std::string>& args,
                                       std::chrono::seconds timeout) const;
    [[noreturn]] void Fail(AdapterErrorKind fallback, const std::string& what,
                           const utils::ProcessResult& result) const;
    bool IsProgramOutput(const std::string& container_id, const utils::ProcessResult& result);
    static bool IsMissingContainer(const std::string& stderr_output);
};

} // namespace runtime
} // namespace sandcell
