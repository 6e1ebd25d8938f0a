/**
 * @file tool_server.cpp
 * @brief Implementation of ToolServer
 *
 * **Tool Payloads**:
 * - execute_code:   {executionId, language, exitCode, stdout, stderr, executionTime, outcome}
 * - create_sandbox: {sandboxId, language, status: "created", dependencies}
 * - list_sandboxes: {sandboxes: [{id, language, status, createdAt, ageSeconds}]}
 * - delete_sandbox: {sandboxId, status: "deleted"}
 * - any failure:    {error: {kind, message}} with isError
 *
 * @date 2025
 */

#include "codebox/server/tool_server.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <ctime>
#include <future>
#include <iomanip>
#include <istream>
#include <list>
#include <ostream>
#include <sstream>

namespace codebox {
namespace server {

using json = nlohmann::json;
using core::ErrorKind;
using core::SandboxError;

namespace {

constexpr int kJsonIndent = 2;

std::string RequireString(const json& arguments, const std::string& key) {
    auto it = arguments.find(key);
    if (it == arguments.end() || it->is_null()) {
        throw SandboxError(ErrorKind::INVALID_REQUEST, "Missing required argument: " + key);
    }
    if (!it->is_string()) {
        throw SandboxError(ErrorKind::INVALID_REQUEST, "Argument '" + key + "' must be a string");
    }
    return it->get<std::string>();
}

std::optional<std::string> OptionalString(const json& arguments, const std::string& key) {
    auto it = arguments.find(key);
    if (it == arguments.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw SandboxError(ErrorKind::INVALID_REQUEST, "Argument '" + key + "' must be a string");
    }
    return it->get<std::string>();
}

std::vector<std::string> StringList(const json& arguments, const std::string& key) {
    std::vector<std::string> values;
    auto it = arguments.find(key);
    if (it == arguments.end() || it->is_null()) {
        return values;
    }
    if (!it->is_array()) {
        throw SandboxError(ErrorKind::INVALID_REQUEST, "Argument '" + key + "' must be an array");
    }
    for (const auto& item : *it) {
        if (!item.is_string()) {
            throw SandboxError(ErrorKind::INVALID_REQUEST,
                               "Argument '" + key + "' must contain only strings");
        }
        values.push_back(item.get<std::string>());
    }
    return values;
}

json LanguageProperty(const std::vector<std::string>& languages) {
    return {
        {"type", "string"},
        {"description", "Programming language"},
        {"enum", languages}
    };
}

} // anonymous namespace

ToolServer::ToolServer(core::ExecutionEngine& engine,
                       core::SandboxManager& manager,
                       const core::LanguageRegistry& registry,
                       std::size_t max_in_flight)
    : engine_(engine)
    , manager_(manager)
    , registry_(registry)
    , max_in_flight_(std::max<std::size_t>(1, max_in_flight)) {
}

// ============================================================================
// TRANSPORT
// ============================================================================

void ToolServer::Serve(std::istream& in, std::ostream& out) {
    spdlog::info("Tool server listening on stdio (max {} concurrent requests)", max_in_flight_);

    std::list<std::future<void>> pending;

    auto reap = [&pending](bool wait_all) {
        for (auto it = pending.begin(); it != pending.end();) {
            if (wait_all || it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                try {
                    it->get();
                }
                catch (const std::exception& e) {
                    spdlog::error("Request task failed: {}", e.what());
                }
                it = pending.erase(it);
            } else {
                ++it;
            }
        }
    };

    std::string line;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        reap(false);
        while (pending.size() >= max_in_flight_) {
            pending.front().wait();
            reap(false);
        }

        pending.push_back(std::async(std::launch::async, [this, line, &out]() {
            auto response = HandleLine(line);
            if (response) {
                std::lock_guard<std::mutex> lock(output_mutex_);
                out << *response << '\n';
                out.flush();
            }
        }));
    }

    spdlog::info("Input closed, waiting for {} in-flight requests", pending.size());
    reap(true);
}

std::optional<std::string> ToolServer::HandleLine(const std::string& line) {
    json message;
    try {
        message = json::parse(line);
    }
    catch (const json::parse_error& e) {
        spdlog::warn("Malformed request: {}", e.what());
        return RpcError(nullptr, rpc::kParseError, "Parse error").dump();
    }

    auto response = HandleMessage(message);
    if (!response) {
        return std::nullopt;
    }
    return response->dump(-1, ' ', false, json::error_handler_t::replace);
}

std::optional<json> ToolServer::HandleMessage(const json& message) {
    if (!message.is_object() || !message.contains("method") || !message.at("method").is_string()) {
        json id = message.is_object() && message.contains("id") ? message.at("id") : json(nullptr);
        return RpcError(id, rpc::kInvalidRequest, "Invalid Request");
    }

    const std::string method = message.at("method").get<std::string>();
    const bool is_notification = !message.contains("id");
    const json id = is_notification ? json(nullptr) : message.at("id");
    const json params = message.value("params", json::object());

    spdlog::debug("Request: {}", method);

    if (is_notification) {
        if (method == "notifications/initialized") {
            spdlog::info("Client initialized");
        } else {
            spdlog::debug("Ignoring notification: {}", method);
        }
        return std::nullopt;
    }

    if (method == "initialize") {
        std::string protocol = kProtocolVersion;
        if (params.is_object() && params.contains("protocolVersion") &&
            params.at("protocolVersion").is_string()) {
            protocol = params.at("protocolVersion").get<std::string>();
        }
        return RpcResult(id, {
            {"protocolVersion", protocol},
            {"capabilities", {{"tools", json::object()}}},
            {"serverInfo", {{"name", kServerName}, {"version", kServerVersion}}}
        });
    }

    if (method == "ping") {
        return RpcResult(id, json::object());
    }

    if (method == "tools/list") {
        return RpcResult(id, {{"tools", ListTools()}});
    }

    if (method == "tools/call") {
        if (!params.is_object() || !params.contains("name") || !params.at("name").is_string()) {
            return RpcError(id, rpc::kInvalidParams, "tools/call requires a string 'name'");
        }
        json arguments = params.value("arguments", json::object());
        if (arguments.is_null()) {
            arguments = json::object();
        }
        if (!arguments.is_object()) {
            return RpcError(id, rpc::kInvalidParams, "tools/call 'arguments' must be an object");
        }
        return RpcResult(id, CallTool(params.at("name").get<std::string>(), arguments));
    }

    return RpcError(id, rpc::kMethodNotFound, "Method not found: " + method);
}

// ============================================================================
// TOOL DISPATCH
// ============================================================================

json ToolServer::CallTool(const std::string& name, const json& arguments) {
    try {
        return TextResult(DispatchTool(name, arguments), false);
    }
    catch (const SandboxError& e) {
        spdlog::warn("Tool {} failed ({}): {}", name, core::ErrorKindToString(e.kind()), e.what());
        return TextResult(ErrorToJson(e.kind(), e.what()), true);
    }
    catch (const json::exception& e) {
        spdlog::warn("Tool {} received malformed arguments: {}", name, e.what());
        return TextResult(ErrorToJson(ErrorKind::INVALID_REQUEST, e.what()), true);
    }
    catch (const std::exception& e) {
        spdlog::error("Tool {} failed unexpectedly: {}", name, e.what());
        return TextResult(ErrorToJson(ErrorKind::INTERNAL, e.what()), true);
    }
}

json ToolServer::DispatchTool(const std::string& name, const json& arguments) {
    if (name == "execute_code") return ExecuteCode(arguments);
    if (name == "create_sandbox") return CreateSandbox(arguments);
    if (name == "list_sandboxes") return ListSandboxes();
    if (name == "delete_sandbox") return DeleteSandbox(arguments);

    throw SandboxError(ErrorKind::INVALID_REQUEST, "Unknown tool: " + name);
}

json ToolServer::ExecuteCode(const json& arguments) {
    core::ExecutionRequest request;
    request.language = RequireString(arguments, "language");
    request.code = RequireString(arguments, "code");
    request.dependencies = StringList(arguments, "dependencies");

    auto timeout = arguments.find("timeout");
    if (timeout != arguments.end() && !timeout->is_null()) {
        if (!timeout->is_number()) {
            throw SandboxError(ErrorKind::INVALID_REQUEST, "Argument 'timeout' must be a number");
        }
        request.timeout = engine_.TimeoutFromSeconds(timeout->get<double>());
    }

    return ExecutionResultToJson(engine_.ExecuteEphemeral(request));
}

json ToolServer::CreateSandbox(const json& arguments) {
    auto language = RequireString(arguments, "language");
    auto name = OptionalString(arguments, "name");
    auto dependencies = StringList(arguments, "dependencies");

    return SandboxToJson(manager_.CreateSandbox(language, name, dependencies));
}

json ToolServer::ListSandboxes() {
    json rows = json::array();
    for (const auto& summary : manager_.ListSandboxes()) {
        rows.push_back(SandboxSummaryToJson(summary));
    }
    return {{"sandboxes", rows}};
}

json ToolServer::DeleteSandbox(const json& arguments) {
    auto sandbox = manager_.DeleteSandbox(RequireString(arguments, "sandboxId"));
    return {
        {"sandboxId", sandbox.id},
        {"status", core::SandboxStatusToString(sandbox.status)}
    };
}

json ToolServer::ListTools() const {
    auto languages = registry_.Identifiers();

    json execute_code = {
        {"name", "execute_code"},
        {"description", "Execute code in a secure sandbox environment"},
        {"inputSchema", {
            {"type", "object"},
            {"properties", {
                {"language", LanguageProperty(languages)},
                {"code", {{"type", "string"}, {"description", "Code to execute"}}},
                {"timeout", {
                    {"type", "number"},
                    {"description", "Execution timeout in seconds (default: 30)"},
                    {"default", 30}
                }},
                {"dependencies", {
                    {"type", "array"},
                    {"description", "Additional dependencies to install"},
                    {"items", {{"type", "string"}}}
                }}
            }},
            {"required", json::array({"language", "code"})}
        }}
    };

    json create_sandbox = {
        {"name", "create_sandbox"},
        {"description", "Create a persistent sandbox environment"},
        {"inputSchema", {
            {"type", "object"},
            {"properties", {
                {"language", LanguageProperty(languages)},
                {"name", {{"type", "string"}, {"description", "Sandbox name (optional)"}}},
                {"dependencies", {
                    {"type", "array"},
                    {"description", "Dependencies to pre-install"},
                    {"items", {{"type", "string"}}}
                }}
            }},
            {"required", json::array({"language"})}
        }}
    };

    json list_sandboxes = {
        {"name", "list_sandboxes"},
        {"description", "List active sandbox environments"},
        {"inputSchema", {{"type", "object"}, {"properties", json::object()}}}
    };

    json delete_sandbox = {
        {"name", "delete_sandbox"},
        {"description", "Delete a sandbox environment"},
        {"inputSchema", {
            {"type", "object"},
            {"properties", {
                {"sandboxId", {{"type", "string"}, {"description", "Sandbox ID to delete"}}}
            }},
            {"required", json::array({"sandboxId"})}
        }}
    };

    return json::array({execute_code, create_sandbox, list_sandboxes, delete_sandbox});
}

// ============================================================================
// PAYLOAD CONVERSION
// ============================================================================

json ToolServer::ExecutionResultToJson(const core::ExecutionResult& result) {
    return {
        {"executionId", result.execution_id},
        {"language", result.language},
        {"exitCode", result.exit_code ? json(*result.exit_code) : json(nullptr)},
        {"stdout", result.stdout_output},
        {"stderr", result.stderr_output},
        {"executionTime", result.execution_time.count()},
        {"outcome", core::ExecutionOutcomeToString(result.outcome)}
    };
}

json ToolServer::SandboxToJson(const core::Sandbox& sandbox) {
    // Creation is reported as "created" whatever state the container reached
    return {
        {"sandboxId", sandbox.id},
        {"language", sandbox.language},
        {"status", core::SandboxStatusToString(core::SandboxStatus::CREATED)},
        {"dependencies", sandbox.dependencies}
    };
}

json ToolServer::SandboxSummaryToJson(const core::SandboxSummary& summary) {
    return {
        {"id", summary.id},
        {"language", summary.language},
        {"status", core::SandboxStatusToString(summary.status)},
        {"createdAt", FormatTimestamp(summary.created_at)},
        {"ageSeconds", summary.age.count()}
    };
}

json ToolServer::ErrorToJson(ErrorKind kind, const std::string& message) {
    return {
        {"error", {
            {"kind", core::ErrorKindToString(kind)},
            {"message", message}
        }}
    };
}

std::string ToolServer::FormatTimestamp(std::chrono::system_clock::time_point time) {
    auto t = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

json ToolServer::TextResult(const json& payload, bool is_error) {
    json result = {
        {"content", json::array({
            {{"type", "text"},
             {"text", payload.dump(kJsonIndent, ' ', false, json::error_handler_t::replace)}}
        })}
    };
    if (is_error) {
        result["isError"] = true;
    }
    return result;
}

json ToolServer::RpcResult(const json& id, json result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", std::move(result)}
    };
}

json ToolServer::RpcError(const json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}}
    };
}

} // namespace server
} // namespace codebox
