/**
 * @file config_loader.cpp
 * @brief JSON configuration loading and validation
 *
 * @date 2025
 */

#include "sandcell/config/service_config.hpp"
#include "sandcell/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace sandcell {
namespace config {

using json = nlohmann::json;
using utils::StringUtils;

namespace {

// Typed readers; each leaves `out` untouched when the key is absent

const json* Find(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return nullptr;
    }
    return &(*it);
}

[[noreturn]] void WrongType(const std::string& path, const char* expected) {
    throw ConfigError("Configuration key '" + path + "' must be " + expected);
}

const json* Section(const json& object, const char* key, const std::string& path) {
    const json* value = Find(object, key);
    if (value && !value->is_object()) {
        WrongType(path, "an object");
    }
    return value;
}

void ReadString(const json& object, const char* key, const std::string& path, std::string& out) {
    if (const json* value = Find(object, key)) {
        if (!value->is_string()) {
            WrongType(path, "a string");
        }
        out = value->get<std::string>();
    }
}

void ReadBool(const json& object, const char* key, const std::string& path, bool& out) {
    if (const json* value = Find(object, key)) {
        if (!value->is_boolean()) {
            WrongType(path, "a boolean");
        }
        out = value->get<bool>();
    }
}

void ReadDouble(const json& object, const char* key, const std::string& path, double& out) {
    if (const json* value = Find(object, key)) {
        if (!value->is_number()) {
            WrongType(path, "a number");
        }
        out = value->get<double>();
    }
}

template <typename T>
void ReadUnsigned(const json& object, const char* key, const std::string& path, T& out) {
    if (const json* value = Find(object, key)) {
        if (!value->is_number_unsigned()) {
            WrongType(path, "a non-negative integer");
        }
        out = value->get<T>();
    }
}

template <typename Duration>
void ReadDuration(const json& object, const char* key, const std::string& path, Duration& out) {
    if (const json* value = Find(object, key)) {
        if (!value->is_number_unsigned() || value->get<std::uint64_t>() == 0) {
            WrongType(path, "a positive integer");
        }
        out = Duration(value->get<std::uint64_t>());
    }
}

void ReadStringList(const json& object, const char* key, const std::string& path,
                    std::vector<std::string>& out) {
    if (const json* value = Find(object, key)) {
        if (!value->is_array()) {
            WrongType(path, "an array of strings");
        }
        std::vector<std::string> items;
        for (const auto& item : *value) {
            if (!item.is_string()) {
                WrongType(path, "an array of strings");
            }
            items.push_back(item.get<std::string>());
        }
        out = std::move(items);
    }
}

void ParseLimits(const json& section, core::ResourceLimits& limits) {
    ReadDouble(section, "cpus", "controller.limits.cpus", limits.cpus);
    ReadUnsigned(section, "memory_mb", "controller.limits.memory_mb", limits.memory_mb);
    ReadUnsigned(section, "max_processes", "controller.limits.max_processes", limits.max_processes);
    ReadUnsigned(section, "scratch_mb", "controller.limits.scratch_mb", limits.scratch_mb);

    if (limits.cpus <= 0.0) {
        throw ConfigError("controller.limits.cpus must be positive");
    }
    if (limits.memory_mb == 0 || limits.max_processes == 0 || limits.scratch_mb == 0) {
        throw ConfigError("controller.limits values must be positive");
    }
}

void ParseBootstrap(const json& section, core::ControllerConfig& controller) {
    ReadBool(section, "enabled", "controller.bootstrap.enabled", controller.bootstrap_enabled);
    ReadDuration(section, "timeout_s", "controller.bootstrap.timeout_s", controller.bootstrap_timeout);
    ReadStringList(section, "capabilities", "controller.bootstrap.capabilities",
                   controller.bootstrap_capabilities);

    std::vector<std::string> names;
    ReadStringList(section, "languages", "controller.bootstrap.languages", names);
    if (section.contains("languages")) {
        std::vector<core::Language> languages;
        for (const auto& name : names) {
            auto language = core::ParseLanguage(name);
            if (!language) {
                throw ConfigError("Unknown language in controller.bootstrap.languages: " + name);
            }
            languages.push_back(*language);
        }
        controller.bootstrap_languages = std::move(languages);
    }
}

void ParseController(const json& section, core::ControllerConfig& controller) {
    ReadString(section, "image", "controller.image", controller.default_image);

    if (const json* limits = Section(section, "limits", "controller.limits")) {
        ParseLimits(*limits, controller.default_limits);
    }

    std::string network;
    ReadString(section, "network", "controller.network", network);
    if (!network.empty()) {
        controller.network_policy = ParseNetworkPolicy(network);
    }

    ReadDuration(section, "execution_timeout_ms", "controller.execution_timeout_ms",
                 controller.execution_timeout);
    ReadDuration(section, "probe_timeout_s", "controller.probe_timeout_s", controller.probe_timeout);
    ReadDuration(section, "stop_grace_s", "controller.stop_grace_s", controller.stop_grace);

    if (const json* bootstrap = Section(section, "bootstrap", "controller.bootstrap")) {
        ParseBootstrap(*bootstrap, controller);
    }

    ReadString(section, "execution_user", "controller.execution_user", controller.execution_user);
    ReadString(section, "working_dir", "controller.working_dir", controller.working_dir);
    ReadUnsigned(section, "max_output_bytes", "controller.max_output_bytes", controller.max_output_bytes);
    ReadBool(section, "health_check", "controller.health_check", controller.health_check_before_execute);
    ReadBool(section, "read_only_rootfs", "controller.read_only_rootfs", controller.read_only_rootfs);
    ReadString(section, "container_name_prefix", "controller.container_name_prefix",
               controller.container_name_prefix);

    if (controller.default_image.empty()) {
        throw ConfigError("controller.image must not be empty");
    }
    if (!StringUtils::StartsWith(controller.working_dir, "/")) {
        throw ConfigError("controller.working_dir must be an absolute path");
    }
    if (controller.execution_user.empty()) {
        throw ConfigError("controller.execution_user must not be empty");
    }
}

void ParseDocker(const json& section, runtime::DockerCliOptions& docker) {
    ReadString(section, "binary", "docker.binary", docker.binary);
    ReadString(section, "host", "docker.host", docker.host);
    ReadDuration(section, "command_timeout_s", "docker.command_timeout_s", docker.command_timeout);
    ReadDuration(section, "pull_timeout_s", "docker.pull_timeout_s", docker.pull_timeout);

    if (docker.binary.empty()) {
        throw ConfigError("docker.binary must not be empty");
    }
}

} // anonymous namespace

// ============================================================================
// LOADING
// ============================================================================

ServiceConfig LoadConfig(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Cannot open configuration file: " + path.string());
    }

    json document;
    try {
        document = json::parse(file);
    }
    catch (const json::parse_error& e) {
        throw ConfigError("Invalid JSON in " + path.string() + ": " + e.what());
    }

    spdlog::debug("Loaded configuration from {}", path.string());
    return ParseConfig(document);
}

ServiceConfig ParseConfig(const json& document) {
    if (!document.is_object()) {
        throw ConfigError("Configuration root must be a JSON object");
    }

    ServiceConfig config;

    if (const json* controller = Section(document, "controller", "controller")) {
        ParseController(*controller, config.controller);
    }
    if (const json* docker = Section(document, "docker", "docker")) {
        ParseDocker(*docker, config.docker);
    }
    if (const json* logging = Section(document, "logging", "logging")) {
        ReadString(*logging, "level", "logging.level", config.logging.level);
        ParseLogLevel(config.logging.level);
    }

    return config;
}

// ============================================================================
// VALUE PARSERS
// ============================================================================

core::NetworkPolicy ParseNetworkPolicy(const std::string& value) {
    std::string key = StringUtils::ToLower(StringUtils::Trim(value));
    if (key == "disabled" || key == "none") {
        return core::NetworkPolicy::DISABLED;
    }
    if (key == "enabled" || key == "bridge") {
        return core::NetworkPolicy::ENABLED;
    }
    throw ConfigError("Unknown network policy: " + value + " (expected disabled or enabled)");
}

const char* NetworkPolicyName(core::NetworkPolicy policy) {
    return policy == core::NetworkPolicy::ENABLED ? "enabled" : "disabled";
}

spdlog::level::level_enum ParseLogLevel(const std::string& value) {
    std::string key = StringUtils::ToLower(StringUtils::Trim(value));
    auto level = spdlog::level::from_str(key);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && key != "off") {
        throw ConfigError("Unknown log level: " + value);
    }
    return level;
}

} // namespace config
} // namespace sandcell
