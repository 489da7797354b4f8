/**
 * @file tool_service.cpp
 * @brief Tool-call dispatch and line-delimited JSON serving
 *
 * @date 2025
 */

#include "sandcell/tools/tool_service.hpp"
#include "sandcell/config/service_config.hpp"
#include "sandcell/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <istream>
#include <limits>
#include <optional>
#include <ostream>
#include <sstream>

namespace sandcell {
namespace tools {

using json = nlohmann::json;
using utils::StringUtils;

namespace {

constexpr std::size_t kLoggedCodeBytes = 200;

json ErrorResponse(const std::string& error_type, const std::string& message, bool caller_fixable) {
    json response;
    response["status"] = "error";
    response["error_type"] = error_type;
    response["message"] = message;
    response["caller_fixable"] = caller_fixable;
    return response;
}

// Submitted programs may print arbitrary bytes; never fail on bad UTF-8
std::string Serialize(const json& response) {
    return response.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::optional<std::string> OptionalString(const json& arguments, const char* key) {
    auto it = arguments.find(key);
    if (it == arguments.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw ProtocolError(std::string("Argument '") + key + "' must be a string");
    }
    return it->get<std::string>();
}

// Rejects fractions, non-positive values and anything T cannot hold
template <typename T>
std::optional<T> OptionalPositiveInteger(const json& arguments, const char* key) {
    auto it = arguments.find(key);
    if (it == arguments.end() || it->is_null()) {
        return std::nullopt;
    }
    const auto limit = static_cast<std::uint64_t>(std::numeric_limits<T>::max());
    bool valid = false;
    if (it->is_number_unsigned()) {
        const auto value = it->get<std::uint64_t>();
        valid = value > 0 && value <= limit;
    }
    else if (it->is_number_integer()) {
        const auto value = it->get<std::int64_t>();
        valid = value > 0 && static_cast<std::uint64_t>(value) <= limit;
    }
    if (!valid) {
        throw ProtocolError(fmt::format(
            "Argument '{}' must be a positive integer no greater than {}", key, limit));
    }
    return static_cast<T>(it->get<std::uint64_t>());
}

std::optional<double> OptionalPositiveNumber(const json& arguments, const char* key) {
    auto it = arguments.find(key);
    if (it == arguments.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_number() || !std::isfinite(it->get<double>()) || it->get<double>() <= 0) {
        throw ProtocolError(std::string("Argument '") + key + "' must be a positive number");
    }
    return it->get<double>();
}

std::string FormatUtc(std::chrono::system_clock::time_point when) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

json LanguageNames(const std::map<core::Language, std::string>& interpreters) {
    json names = json::array();
    for (const auto& entry : interpreters) {
        names.push_back(core::LanguageName(entry.first));
    }
    return names;
}

json LimitsToJson(const core::ResourceLimits& limits) {
    json j;
    j["cpus"] = limits.cpus;
    j["memory_mb"] = limits.memory_mb;
    j["max_processes"] = limits.max_processes;
    j["scratch_mb"] = limits.scratch_mb;
    return j;
}

json HandleToJson(const core::SandboxHandle& handle) {
    json j;
    j["container_id"] = handle.container_id;
    j["container_name"] = handle.container_name;
    j["image"] = handle.image;
    j["network"] = config::NetworkPolicyName(handle.network);
    j["languages"] = LanguageNames(handle.interpreters);
    j["limits"] = LimitsToJson(handle.limits);
    j["created_at"] = FormatUtc(handle.created_at);
    return j;
}

} // anonymous namespace

ToolService::ToolService(core::SandboxController& controller)
    : controller_(controller) {
}

// ============================================================================
// DISPATCH
// ============================================================================

json ToolService::Dispatch(const json& request) {
    json response;
    json id;
    if (request.is_object() && request.contains("id")) {
        id = request["id"];
    }

    try {
        if (!request.is_object()) {
            throw ProtocolError("Request must be a JSON object");
        }

        auto tool_it = request.find("tool");
        if (tool_it == request.end() || !tool_it->is_string()) {
            throw ProtocolError("Request is missing the 'tool' name");
        }

        json arguments = json::object();
        auto args_it = request.find("arguments");
        if (args_it != request.end() && !args_it->is_null()) {
            if (!args_it->is_object()) {
                throw ProtocolError("'arguments' must be an object");
            }
            arguments = *args_it;
        }

        const std::string tool = tool_it->get<std::string>();
        spdlog::debug("Tool call: {}", tool);

        if (tool == "initialize_sandbox") {
            response = InitializeSandbox(arguments);
        }
        else if (tool == "execute_code") {
            response = ExecuteCode(arguments);
        }
        else if (tool == "stop_sandbox") {
            response = StopSandbox();
        }
        else if (tool == "sandbox_status") {
            response = SandboxStatus();
        }
        else if (tool == "list_tools") {
            response["tools"] = ListTools();
        }
        else {
            throw ProtocolError("Unknown tool: " + tool);
        }

        response["status"] = "success";
    }
    catch (const core::SandboxError& e) {
        spdlog::warn("{}: {}", core::ErrorKindName(e.kind()), e.what());
        response = ErrorResponse(core::ErrorKindName(e.kind()), e.what(), core::IsCallerFixable(e.kind()));
    }
    catch (const ProtocolError& e) {
        spdlog::warn("Rejected request: {}", e.what());
        response = ErrorResponse("ProtocolError", e.what(), true);
    }

    if (!id.is_null()) {
        response["id"] = id;
    }
    return response;
}

json ToolService::HandleLine(const std::string& line) {
    json request;
    try {
        request = json::parse(line);
    }
    catch (const json::parse_error& e) {
        spdlog::warn("Rejected request: invalid JSON");
        return ErrorResponse("ProtocolError", std::string("Invalid JSON: ") + e.what(), true);
    }
    return Dispatch(request);
}

std::size_t ToolService::Serve(std::istream& in, std::ostream& out,
                               const std::atomic<bool>* stop_requested) {
    spdlog::info("Serving tool calls on stdin/stdout");

    std::size_t answered = 0;
    std::string line;

    while (!(stop_requested && stop_requested->load()) && std::getline(in, line)) {
        if (StringUtils::Trim(line).empty()) {
            continue;
        }
        out << Serialize(HandleLine(line)) << std::endl;
        ++answered;
    }

    if (stop_requested && stop_requested->load()) {
        spdlog::info("Stop requested, leaving tool loop");
    }
    else {
        spdlog::info("Input closed after {} request(s)", answered);
    }
    return answered;
}

// ============================================================================
// TOOLS
// ============================================================================

json ToolService::InitializeSandbox(const json& arguments) {
    const auto& defaults = controller_.GetConfig();

    std::string image = OptionalString(arguments, "image").value_or(defaults.default_image);

    core::ResourceLimits limits = defaults.default_limits;
    if (auto memory = OptionalPositiveInteger<std::size_t>(arguments, "memory_mb")) {
        limits.memory_mb = *memory;
    }
    if (auto cpus = OptionalPositiveNumber(arguments, "cpus")) {
        limits.cpus = *cpus;
    }
    if (auto pids = OptionalPositiveInteger<int>(arguments, "pids")) {
        limits.max_processes = *pids;
    }

    core::NetworkPolicy network = defaults.network_policy;
    if (auto value = OptionalString(arguments, "network")) {
        try {
            network = config::ParseNetworkPolicy(*value);
        }
        catch (const config::ConfigError& e) {
            throw ProtocolError(e.what());
        }
    }

    auto handle = controller_.Initialize(image, limits, network);

    json response = HandleToJson(handle);
    response["state"] = core::SandboxStateName(controller_.GetState());
    return response;
}

json ToolService::ExecuteCode(const json& arguments) {
    auto code = OptionalString(arguments, "code");
    if (!code) {
        throw ProtocolError("Argument 'code' is required");
    }
    std::string language = OptionalString(arguments, "language").value_or("python");

    spdlog::debug("Code: {}", StringUtils::Truncate(*code, kLoggedCodeBytes));

    auto result = controller_.Execute(*code, language);

    json response;
    response["language"] = core::LanguageName(result.language);
    response["stdout"] = result.stdout_output;
    response["stderr"] = result.stderr_output;
    response["exit_code"] = result.exit_code;
    response["duration_ms"] = result.duration.count();
    response["stdout_truncated"] = result.stdout_truncated;
    response["stderr_truncated"] = result.stderr_truncated;
    return response;
}

json ToolService::StopSandbox() {
    controller_.Stop();

    json response;
    response["state"] = core::SandboxStateName(controller_.GetState());
    return response;
}

json ToolService::SandboxStatus() const {
    json response;
    response["state"] = core::SandboxStateName(controller_.GetState());
    if (auto handle = controller_.GetHandle()) {
        response["sandbox"] = HandleToJson(*handle);
    }
    return response;
}

json ToolService::ListTools() {
    json tools = json::array();

    tools.push_back({
        {"name", "initialize_sandbox"},
        {"description", "Create the sandbox container and install missing interpreters"},
        {"arguments", {
            {"image", "Base image (default from configuration)"},
            {"memory_mb", "Memory limit in MiB"},
            {"cpus", "CPU limit in cores"},
            {"pids", "Process limit"},
            {"network", "disabled or enabled"}
        }}
    });
    tools.push_back({
        {"name", "execute_code"},
        {"description", "Run code in the sandbox and return stdout, stderr and exit code"},
        {"arguments", {
            {"code", "Source code (required)"},
            {"language", "python, javascript or shell (default python)"}
        }}
    });
    tools.push_back({
        {"name", "stop_sandbox"},
        {"description", "Stop and remove the sandbox container"},
        {"arguments", json::object()}
    });
    tools.push_back({
        {"name", "sandbox_status"},
        {"description", "Report the sandbox state and properties"},
        {"arguments", json::object()}
    });
    tools.push_back({
        {"name", "list_tools"},
        {"description", "Describe the available tools"},
        {"arguments", json::object()}
    });

    return tools;
}

} // namespace tools
} // namespace sandcell
