/**
 * @file tool_service.hpp
 * @brief Tool-call front-end for the sandbox controller
 *
 * Maps named tool calls onto SandboxController operations and renders every
 * outcome, including failures, as a JSON response.
 *
 * **Wire Format** (one JSON document per line in each direction):
 * ```
 * -> {"id": 1, "tool": "execute_code", "arguments": {"code": "print('hi')"}}
 * <- {"id": 1, "status": "success", "stdout": "hi\n", "stderr": "", "exit_code": 0, ...}
 * <- {"id": 2, "status": "error", "error_type": "UnsupportedLanguageError",
 *     "message": "...", "caller_fixable": true}
 * ```
 *
 * @date 2025
 */

#pragma once

#include "sandcell/core/sandbox_controller.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <iosfwd>
#include <stdexcept>
#include <string>

namespace sandcell {
namespace tools {

/**
 * @class ProtocolError
 * @brief Malformed request: bad JSON, unknown tool, or invalid arguments
 */
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @class ToolService
 * @brief Dispatches tool calls to one controller
 *
 * **Tools**:
 * - `initialize_sandbox` (image, memory_mb, cpus, pids, network)
 * - `execute_code` (code, language = "python")
 * - `stop_sandbox`
 * - `sandbox_status`
 * - `list_tools`
 *
 * **Usage Example**:
 * @code
 * ToolService service(controller);
 * auto response = service.Dispatch({{"tool", "initialize_sandbox"}});
 * @endcode
 */
class ToolService {
public:
    explicit ToolService(core::SandboxController& controller);

    /**
     * @brief Handle one request object
     * @return Response object; never throws for request or sandbox errors
     */
    nlohmann::json Dispatch(const nlohmann::json& request);

    /**
     * @brief Parse and handle one line of input
     */
    nlohmann::json HandleLine(const std::string& line);

    /**
     * @brief Answer requests line by line until EOF or a stop request
     * @param stop_requested Checked between requests; may be set from a signal handler
     * @return Number of requests answered
     */
    std::size_t Serve(std::istream& in, std::ostream& out,
                      const std::atomic<bool>* stop_requested = nullptr);

    /**
     * @brief Descriptions of every tool
     */
    static nlohmann::json ListTools();

private:
    core::SandboxController& controller_;

    nlohmann::json InitializeSandbox(const nlohmann::json& arguments);
    nlohmann::json ExecuteCode(const nlohmann::json& arguments);
    nlohmann::json StopSandbox();
    nlohmann::json SandboxStatus() const;
};

} // namespace tools
} // namespace sandcell
