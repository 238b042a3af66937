#pragma once

#include <toolsrv/core/result.hpp>
#include <toolsrv/events/event_publisher.hpp>
#include <toolsrv/router/message_router.hpp>

#include <cstddef>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace toolsrv {

struct McpOptions {
    std::string name = "toolsrv";
    std::string version;  // empty = build version
    std::size_t dispatch_threads = 4;
};

// ---------------------------------------------------------------------------
// McpServer: MCP 2024-11-05 adapter in front of the MessageRouter.
//
// Implements JSON-RPC 2.0 protocol with MCP methods:
//   - initialize
//   - ping
//   - tools/list
//   - tools/call
//   - context/get, context/set, context/delete
//   - notifications/cancelled (notification, no response)
//   - notifications/initialized (notification, no response)
//
// Messages with a `kind` member and no `jsonrpc` are core protocol messages
// and are answered with the core response shape.
// ---------------------------------------------------------------------------
class McpServer {
public:
    static constexpr const char* kStdioSession = "stdio";

    McpServer(MessageRouter& router, EventPublisher& events, McpOptions options,
              std::istream& in = std::cin, std::ostream& out = std::cout);

    // Run the stdio loop (blocks until EOF on the input stream). Requests are
    // handled on a dispatcher pool; events of the stdio session are written
    // as notifications/event messages.
    void Run();

    // Process a single message on behalf of `session_id` and return the
    // response (if any). Returns nullopt for notifications.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const std::string& session_id, const nlohmann::json& message);

    // Parse one line of input. Parse failures produce a -32700 error.
    [[nodiscard]] std::optional<nlohmann::json> HandleLine(
        const std::string& session_id, const std::string& line);

private:
    nlohmann::json HandleInitialize(const nlohmann::json& params,
                                    const nlohmann::json& id);
    nlohmann::json HandleToolsList(const std::string& session_id,
                                   const nlohmann::json& id);
    nlohmann::json HandleToolsCall(const std::string& session_id,
                                   const nlohmann::json& params,
                                   const nlohmann::json& id);
    nlohmann::json HandleContext(const std::string& session_id,
                                 const std::string& method,
                                 const nlohmann::json& params,
                                 const nlohmann::json& id);
    void HandleCancelled(const std::string& session_id, const nlohmann::json& params);

    nlohmann::json MakeError(const nlohmann::json& id, int code,
                             const std::string& message,
                             const nlohmann::json& data = nullptr);
    nlohmann::json MakeResult(const nlohmann::json& id,
                              const nlohmann::json& result);
    nlohmann::json MakeCoreError(const nlohmann::json& id, const Error& error);
    void WriteLine(const nlohmann::json& message);

    MessageRouter& router_;
    EventPublisher& events_;
    McpOptions options_;
    std::istream& in_;
    std::ostream& out_;
    std::mutex out_mutex_;
};

} // namespace toolsrv
