#include <toolsrv/mcp/mcp_server.hpp>

#include <toolsrv/core/log.hpp>
#include <toolsrv/core/version.hpp>
#include <toolsrv/core/worker_pool.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

namespace toolsrv {

namespace {

constexpr auto kPumpInterval = std::chrono::milliseconds(200);
constexpr auto kAwaitSlice = std::chrono::milliseconds(1000);

// JSON-RPC ids may be strings or numbers; the core wants a string.
std::string RequestIdOf(const nlohmann::json& id) {
    if (id.is_string()) {
        return id.get<std::string>();
    }
    return id.dump();
}

// Failures that belong to the execution phase are tool results with
// isError set; everything else is a protocol error.
bool IsExecutionPhase(const Error& error) {
    switch (error.category) {
        case ErrorCategory::ExecutionFailed:
        case ErrorCategory::ExecutionTimeout:
        case ErrorCategory::Cancelled:
        case ErrorCategory::Internal:
            return true;
        default:
            return false;
    }
}

nlohmann::json TextContent(const std::string& text) {
    return nlohmann::json::array({{{"type", "text"}, {"text", text}}});
}

} // anonymous namespace

McpServer::McpServer(MessageRouter& router, EventPublisher& events, McpOptions options,
                     std::istream& in, std::ostream& out)
    : router_(router), events_(events), options_(std::move(options)), in_(in), out_(out) {
    if (options_.version.empty()) {
        options_.version = kVersion;
    }
}

void McpServer::Run() {
    std::atomic<bool> done{false};
    auto subscription = events_.Subscribe(kStdioSession);
    std::thread pump([this, &done, &subscription] {
        for (;;) {
            const bool draining = done.load();
            auto event = subscription.Next(draining ? std::chrono::milliseconds(0)
                                                    : kPumpInterval);
            if (event) {
                WriteLine({{"jsonrpc", "2.0"},
                           {"method", "notifications/event"},
                           {"params", event->ToJson()}});
            } else if (draining || !subscription.Active()) {
                return;
            }
        }
    });

    WorkerPool dispatch(options_.dispatch_threads, "mcp");
    std::string line;
    while (std::getline(in_, line)) {
        if (line.empty()) continue;

        nlohmann::json message;
        try {
            message = nlohmann::json::parse(line);
        } catch (const nlohmann::json::exception&) {
            WriteLine(MakeError(nullptr, -32700, "Parse error"));
            continue;
        }

        // JSON-RPC notifications (cancellation included) never wait behind
        // requests occupying the dispatch workers.
        if (message.is_object() && message.contains("jsonrpc") && !message.contains("id")) {
            auto response = HandleMessage(kStdioSession, message);
            if (response) {
                WriteLine(*response);
            }
            continue;
        }

        dispatch.Post([this, message = std::move(message)] {
            auto response = HandleMessage(kStdioSession, message);
            if (response) {
                WriteLine(*response);
            }
        });
    }

    LogInfo("mcp", "input closed, waiting for pending requests");
    dispatch.Shutdown();
    done.store(true);
    pump.join();
}

std::optional<nlohmann::json> McpServer::HandleLine(const std::string& session_id,
                                                    const std::string& line) {
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(line);
    } catch (const nlohmann::json::exception&) {
        return MakeError(nullptr, -32700, "Parse error");
    }
    return HandleMessage(session_id, message);
}

std::optional<nlohmann::json> McpServer::HandleMessage(
    const std::string& session_id, const nlohmann::json& message) {
    if (!message.is_object()) {
        return MakeError(nullptr, -32600, "Invalid Request");
    }

    // Core protocol message.
    if (message.contains("kind") && !message.contains("jsonrpc")) {
        return router_.Handle(message).ToJson();
    }

    // Check for JSON-RPC 2.0.
    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        if (message.contains("id")) {
            return MakeError(message["id"], -32600, "Invalid JSON-RPC version");
        }
        return std::nullopt;
    }

    // Notifications have no "id".
    bool is_notification = !message.contains("id");
    auto method = message.value("method", "");
    auto params = message.value("params", nlohmann::json::object());

    if (is_notification) {
        if (method == "notifications/cancelled") {
            HandleCancelled(session_id, params);
        }
        // notifications/initialized and unknown notifications: no response.
        return std::nullopt;
    }

    auto id = message["id"];

    try {
        if (method == "initialize") {
            return HandleInitialize(params, id);
        } else if (method == "ping") {
            return MakeResult(id, nlohmann::json::object());
        } else if (method == "tools/list") {
            return HandleToolsList(session_id, id);
        } else if (method == "tools/call") {
            return HandleToolsCall(session_id, params, id);
        } else if (method == "context/get" || method == "context/set" ||
                   method == "context/delete") {
            return HandleContext(session_id, method, params, id);
        }
    } catch (const nlohmann::json::exception& e) {
        LogError("mcp", method + " failed: " + e.what());
        return MakeError(id, -32603, "Internal error");
    }
    return MakeError(id, -32601, "Method not found: " + method);
}

nlohmann::json McpServer::HandleInitialize(
    const nlohmann::json& params, const nlohmann::json& id) {
    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        LogInfo("mcp", "client " + params["clientInfo"].value("name", std::string("?")) +
                           " connected");
    }

    nlohmann::json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"] = {
        {"tools", {{"listChanged", false}}},
        {"experimental", {{"context", nlohmann::json::object()}}}
    };
    result["serverInfo"] = {
        {"name", options_.name},
        {"version", options_.version}
    };

    return MakeResult(id, result);
}

nlohmann::json McpServer::HandleToolsList(const std::string& session_id,
                                          const nlohmann::json& id) {
    auto response = router_.Handle({{"kind", "discovery"},
                                    {"request_id", RequestIdOf(id)},
                                    {"session_id", session_id}});
    if (!response.ok) {
        return MakeCoreError(id, *response.error);
    }

    nlohmann::json tools = nlohmann::json::array();
    for (const auto& tool : response.result["tools"]) {
        tools.push_back({
            {"name", tool["name"]},
            {"description", tool["description"]},
            {"inputSchema", tool["input_schema"]},
            {"version", tool["version"]}
        });
    }

    return MakeResult(id, {{"tools", tools}});
}

nlohmann::json McpServer::HandleToolsCall(const std::string& session_id,
                                          const nlohmann::json& params,
                                          const nlohmann::json& id) {
    if (!params.contains("name") || !params["name"].is_string()) {
        return MakeError(id, -32602, "Missing 'name' parameter");
    }
    auto arguments = params.value("arguments", nlohmann::json::object());
    if (!arguments.is_object()) {
        return MakeError(id, -32602, "'arguments' must be an object");
    }

    const auto request_id = RequestIdOf(id);
    nlohmann::json core = {
        {"kind", "execute"},
        {"request_id", request_id},
        {"session_id", session_id},
        {"tool", params["name"]},
        {"params", arguments}
    };
    if (params.contains("_meta") && params["_meta"].is_object() &&
        params["_meta"].contains("timeout_ms")) {
        core["timeout_ms"] = params["_meta"]["timeout_ms"];
    }

    auto response = router_.Handle(core);
    while (response.ok && response.pending) {
        response = router_.Await(session_id, request_id, kAwaitSlice);
    }

    if (!response.ok) {
        const auto& error = *response.error;
        if (!IsExecutionPhase(error)) {
            return MakeCoreError(id, error);
        }
        return MakeResult(id, {{"content", TextContent(error.ToJson().dump())},
                               {"isError", true}});
    }

    nlohmann::json result;
    result["content"] = TextContent(response.result.dump());
    if (response.result.is_object()) {
        result["structuredContent"] = response.result;
    }
    return MakeResult(id, result);
}

nlohmann::json McpServer::HandleContext(const std::string& session_id,
                                        const std::string& method,
                                        const nlohmann::json& params,
                                        const nlohmann::json& id) {
    nlohmann::json core = {
        {"request_id", RequestIdOf(id)},
        {"session_id", session_id},
        {"key", params.value("key", nlohmann::json())}
    };
    if (method == "context/get") {
        core["kind"] = "context_get";
    } else if (method == "context/set") {
        core["kind"] = "context_set";
        if (params.contains("value")) {
            core["value"] = params["value"];
        }
    } else {
        core["kind"] = "context_delete";
    }

    auto response = router_.Handle(core);
    if (!response.ok) {
        return MakeCoreError(id, *response.error);
    }
    return MakeResult(id, response.result);
}

void McpServer::HandleCancelled(const std::string& session_id,
                                const nlohmann::json& params) {
    if (!params.contains("requestId")) {
        LogWarn("mcp", "notifications/cancelled without requestId ignored");
        return;
    }
    const auto request_id = RequestIdOf(params["requestId"]);
    auto response = router_.Handle({{"kind", "cancel"},
                                    {"request_id", request_id},
                                    {"session_id", session_id}});
    if (!response.ok) {
        LogDebug("mcp", "cancel of " + request_id + " failed: " + response.error->message);
    }
}

nlohmann::json McpServer::MakeError(
    const nlohmann::json& id, int code, const std::string& message,
    const nlohmann::json& data) {
    nlohmann::json error = {
        {"code", code},
        {"message", message}
    };
    if (!data.is_null()) {
        error["data"] = data;
    }
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", error}
    };
}

nlohmann::json McpServer::MakeResult(
    const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

nlohmann::json McpServer::MakeCoreError(const nlohmann::json& id, const Error& error) {
    return MakeError(id, error.RpcCode(), error.ClientMessage(), {{"code", error.Code()}});
}

void McpServer::WriteLine(const nlohmann::json& message) {
    std::lock_guard<std::mutex> lock(out_mutex_);
    out_ << message.dump() << "\n";
    out_.flush();
}

} // namespace toolsrv
