/**
 * @file service_config.hpp
 * @brief Service configuration model and JSON loader
 *
 * **File Layout** (every key optional, absent keys keep their defaults):
 * ```json
 * {
 *   "controller": {
 *     "image": "alpine:latest",
 *     "limits": { "cpus": 0.5, "memory_mb": 512, "max_processes": 100, "scratch_mb": 64 },
 *     "network": "disabled",
 *     "execution_timeout_ms": 10000,
 *     "bootstrap": { "enabled": true, "languages": ["python"], "timeout_s": 300 },
 *     "execution_user": "nobody",
 *     "working_dir": "/tmp",
 *     "max_output_bytes": 1048576
 *   },
 *   "docker": { "binary": "docker", "host": "", "command_timeout_s": 120 },
 *   "logging": { "level": "info" }
 * }
 * ```
 *
 * @date 2025
 */

#pragma once

#include "sandcell/core/sandbox_controller.hpp"
#include "sandcell/runtime/docker_cli_runtime.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/common.h>

#include <filesystem>
#include <stdexcept>
#include <string>

namespace sandcell {
namespace config {

/**
 * @class ConfigError
 * @brief Invalid configuration file or value
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

struct LoggingConfig {
    std::string level{"info"};  ///< spdlog level name
};

/**
 * @struct ServiceConfig
 * @brief Everything the executable needs to build its controller
 */
struct ServiceConfig {
    core::ControllerConfig controller;
    runtime::DockerCliOptions docker;
    LoggingConfig logging;
};

/**
 * @brief Load configuration from a JSON file
 * @throws ConfigError if the file cannot be read, is not JSON, or holds invalid values
 */
ServiceConfig LoadConfig(const std::filesystem::path& path);

/**
 * @brief Build configuration from a parsed JSON document
 * @throws ConfigError on wrong types or invalid values
 */
ServiceConfig ParseConfig(const nlohmann::json& document);

/**
 * @brief Parse "disabled"/"none" or "enabled"/"bridge" (case-insensitive)
 * @throws ConfigError on any other value
 */
core::NetworkPolicy ParseNetworkPolicy(const std::string& value);

/**
 * @brief Canonical name of a network policy ("disabled" or "enabled")
 */
const char* NetworkPolicyName(core::NetworkPolicy policy);

/**
 * @brief Parse a spdlog level name ("trace" ... "off")
 * @throws ConfigError on unknown names
 */
spdlog::level::level_enum ParseLogLevel(const std::string& value);

} // namespace config
} // namespace sandcell
