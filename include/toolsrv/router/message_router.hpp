#pragma once

#include <toolsrv/core/result.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace toolsrv {

struct AppConfig;
class ServerContext;

enum class MessageKind {
    Discovery,
    Execute,
    Cancel,
    ContextGet,
    ContextSet,
    ContextDelete,
};

const char* MessageKindName(MessageKind kind);
std::optional<MessageKind> ParseMessageKind(std::string_view text);

// ---------------------------------------------------------------------------
// InboundMessage: a validated core protocol message.
//
//   {kind, request_id, session_id, tool?, params?, key?, value?, timeout_ms?}
// ---------------------------------------------------------------------------
struct InboundMessage {
    MessageKind kind = MessageKind::Discovery;
    std::string request_id;
    std::string session_id;
    std::optional<std::string> tool;
    nlohmann::json params = nlohmann::json::object();
    std::optional<std::string> key;
    std::optional<nlohmann::json> value;
    std::optional<std::chrono::milliseconds> timeout;

    // ValidationError naming the offending member on any mismatch.
    static Result<InboundMessage, Error> Parse(const nlohmann::json& message);
};

// ---------------------------------------------------------------------------
// Response: synchronous answer to one inbound message.
//
//   {request_id, status: ok|error, result?, error?: {code, message}}
// ---------------------------------------------------------------------------
struct Response {
    std::string request_id;
    bool ok = true;
    // Execution acknowledged but not terminal yet; `result` carries
    // {request_id, state, accepted}.
    bool pending = false;
    nlohmann::json result;
    std::optional<Error> error;

    static Response Ok(std::string request_id, nlohmann::json result);
    static Response Fail(std::string request_id, Error error);

    [[nodiscard]] nlohmann::json ToJson() const;
};

struct RouterOptions {
    // How long an execute request waits for a terminal state before it is
    // acknowledged instead.
    std::chrono::milliseconds sync_wait{250};
    // Bound on time spent in gates and the rate-limiter queue.
    std::chrono::milliseconds admission_timeout{30000};
};

RouterOptions RouterOptionsFrom(const AppConfig& config);

// ---------------------------------------------------------------------------
// MessageRouter: validates inbound messages and dispatches them to the
// registry, the execution engine and the context store. Stateless apart
// from its options; safe to call from any number of threads.
// ---------------------------------------------------------------------------
class MessageRouter {
public:
    MessageRouter(ServerContext& context, RouterOptions options);

    // Parse and dispatch. Never throws; every failure becomes an error
    // response.
    [[nodiscard]] Response Handle(const nlohmann::json& message);
    [[nodiscard]] Response Dispatch(const InboundMessage& message);

    // Waits up to `timeout` for a submitted execution and answers like an
    // execute request would.
    [[nodiscard]] Response Await(const std::string& session_id,
                                 const std::string& request_id,
                                 std::chrono::milliseconds timeout);

private:
    Response HandleDiscovery(const InboundMessage& message);
    Response HandleExecute(const InboundMessage& message);
    Response HandleCancel(const InboundMessage& message);
    Response HandleContextGet(const InboundMessage& message);
    Response HandleContextSet(const InboundMessage& message);
    Response HandleContextDelete(const InboundMessage& message);

    ServerContext& context_;
    RouterOptions options_;
};

} // namespace toolsrv
