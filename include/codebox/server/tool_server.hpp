/**
 * @file tool_server.hpp
 * @brief Tool-call protocol front end (JSON-RPC 2.0 over stdio)
 *
 * Exposes the four operations as tools of the Model Context Protocol:
 * `execute_code`, `create_sandbox`, `list_sandboxes` and `delete_sandbox`.
 * Messages are single-line JSON documents separated by '\n'.
 *
 * **Message Flow**:
 * ```
 * stdin line -> async task (at most max_in_flight) -> parse (-32700 on failure) -> HandleMessage
 *   initialize | ping | tools/list            -> result
 *   tools/call                                -> CallTool
 *   notifications/*                           -> no response
 * result -> one line on stdout (writes serialized)
 * ```
 *
 * Every failure inside a tool becomes a result with `isError: true` and a
 * `{"error": {"kind", "message"}}` payload; protocol errors use JSON-RPC
 * error objects.
 *
 * @date 2025
 */

#pragma once

#include "codebox/core/errors.hpp"
#include "codebox/core/execution_engine.hpp"
#include "codebox/core/language_registry.hpp"
#include "codebox/core/sandbox_manager.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>

namespace codebox {
namespace server {

/**
 * @brief JSON-RPC 2.0 error codes
 */
namespace rpc {
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
} // namespace rpc

/**
 * @class ToolServer
 * @brief Binds the execution engine and sandbox manager to the tool protocol
 *
 * **Thread Safety**: HandleMessage() and CallTool() may run concurrently;
 * Serve() relies on that to run tool calls in parallel.
 *
 * **Usage Example**:
 * @code
 * ToolServer server(engine, manager, registry);
 * server.Serve(std::cin, std::cout);   // returns at end of input
 * @endcode
 */
class ToolServer {
public:
    static constexpr const char* kServerName = "codebox";
    static constexpr const char* kServerVersion = "1.0.0";
    static constexpr const char* kProtocolVersion = "2024-11-05";
    static constexpr std::size_t kDefaultMaxInFlight = 16;

    /**
     * @param max_in_flight Requests handled at once by Serve(); at least 1
     */
    ToolServer(core::ExecutionEngine& engine,
               core::SandboxManager& manager,
               const core::LanguageRegistry& registry,
               std::size_t max_in_flight = kDefaultMaxInFlight);

    /**
     * @brief Read requests until end of input, answering each on @p out
     *
     * Every message is handled on its own asynchronous task. Once
     * max_in_flight tasks are running, reading pauses until the oldest one
     * answers. Returns once input is exhausted and all tasks have answered.
     */
    void Serve(std::istream& in, std::ostream& out);

    /**
     * @brief Handle one raw input line
     * @return Serialized response, empty for notifications
     */
    std::optional<std::string> HandleLine(const std::string& line);

    /**
     * @brief Handle one parsed JSON-RPC message
     * @return Response object, empty for notifications
     */
    std::optional<nlohmann::json> HandleMessage(const nlohmann::json& message);

    /**
     * @brief Invoke a tool by name
     * @return Tool result (`content` plus `isError` on failure); never throws
     *         for tool-level failures
     */
    nlohmann::json CallTool(const std::string& name, const nlohmann::json& arguments);

    /**
     * @brief Tool descriptors with JSON schemas for `tools/list`
     */
    nlohmann::json ListTools() const;

    // Payload conversion
    static nlohmann::json ExecutionResultToJson(const core::ExecutionResult& result);
    static nlohmann::json SandboxToJson(const core::Sandbox& sandbox);
    static nlohmann::json SandboxSummaryToJson(const core::SandboxSummary& summary);
    static nlohmann::json ErrorToJson(core::ErrorKind kind, const std::string& message);
    static std::string FormatTimestamp(std::chrono::system_clock::time_point time);

private:
    nlohmann::json DispatchTool(const std::string& name, const nlohmann::json& arguments);
    nlohmann::json ExecuteCode(const nlohmann::json& arguments);
    nlohmann::json CreateSandbox(const nlohmann::json& arguments);
    nlohmann::json ListSandboxes();
    nlohmann::json DeleteSandbox(const nlohmann::json& arguments);

    static nlohmann::json TextResult(const nlohmann::json& payload, bool is_error);
    static nlohmann::json RpcResult(const nlohmann::json& id, nlohmann::json result);
    static nlohmann::json RpcError(const nlohmann::json& id, int code, const std::string& message);

    core::ExecutionEngine& engine_;
    core::SandboxManager& manager_;
    const core::LanguageRegistry& registry_;
    std::size_t max_in_flight_;

    std::mutex output_mutex_;
};

} // namespace server
} // namespace codebox
