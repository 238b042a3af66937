#include <toolsrv/router/message_router.hpp>

#include <toolsrv/config/app_config.hpp>
#include <toolsrv/core/log.hpp>
#include <toolsrv/registry/schema.hpp>
#include <toolsrv/server/server_context.hpp>

#include <exception>

namespace toolsrv {

namespace {

Error ValidationFailure(const std::string& message) {
    return Error{"Route", message, ErrorCategory::Validation, std::nullopt};
}

Result<std::string, Error> RequireString(const nlohmann::json& message,
                                         const std::string& member) {
    if (!message.contains(member) || !message[member].is_string() ||
        message[member].get<std::string>().empty()) {
        return Result<std::string, Error>::Err(
            ValidationFailure("'" + member + "' must be a non-empty string"));
    }
    return Result<std::string, Error>::Ok(message[member].get<std::string>());
}

std::string RequestIdOf(const nlohmann::json& message) {
    if (message.is_object() && message.contains("request_id") &&
        message["request_id"].is_string()) {
        return message["request_id"].get<std::string>();
    }
    return "";
}

Response SnapshotResponse(const ExecutionSnapshot& snapshot) {
    switch (snapshot.state) {
        case ExecutionState::Completed:
            return Response::Ok(snapshot.request_id, snapshot.result.value_or(nullptr));
        case ExecutionState::Failed:
        case ExecutionState::TimedOut:
        case ExecutionState::Cancelled:
            return Response::Fail(
                snapshot.request_id,
                snapshot.error.value_or(Error{"Execute", "execution did not complete",
                                              ErrorCategory::Internal, std::nullopt}));
        case ExecutionState::Queued:
        case ExecutionState::Admitted:
        case ExecutionState::Running:
            break;
    }
    auto ack = Response::Ok(snapshot.request_id,
                            {{"request_id", snapshot.request_id},
                             {"state", ExecutionStateName(snapshot.state)},
                             {"accepted", true}});
    ack.pending = true;
    return ack;
}

} // anonymous namespace

const char* MessageKindName(MessageKind kind) {
    switch (kind) {
        case MessageKind::Discovery:     return "discovery";
        case MessageKind::Execute:       return "execute";
        case MessageKind::Cancel:        return "cancel";
        case MessageKind::ContextGet:    return "context_get";
        case MessageKind::ContextSet:    return "context_set";
        case MessageKind::ContextDelete: return "context_delete";
    }
    return "unknown";
}

std::optional<MessageKind> ParseMessageKind(std::string_view text) {
    if (text == "discovery") return MessageKind::Discovery;
    if (text == "execute") return MessageKind::Execute;
    if (text == "cancel") return MessageKind::Cancel;
    if (text == "context_get") return MessageKind::ContextGet;
    if (text == "context_set") return MessageKind::ContextSet;
    if (text == "context_delete") return MessageKind::ContextDelete;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// InboundMessage::Parse
// ---------------------------------------------------------------------------
Result<InboundMessage, Error> InboundMessage::Parse(const nlohmann::json& message) {
    using R = Result<InboundMessage, Error>;
    if (!message.is_object()) {
        return R::Err(ValidationFailure("message must be a JSON object"));
    }
    if (!message.contains("kind") || !message["kind"].is_string()) {
        return R::Err(ValidationFailure("'kind' must be a string"));
    }
    const auto kind_text = message["kind"].get<std::string>();
    auto kind = ParseMessageKind(kind_text);
    if (!kind) {
        return R::Err(ValidationFailure("unknown message kind '" + kind_text + "'"));
    }

    InboundMessage parsed;
    parsed.kind = *kind;

    auto request_id = RequireString(message, "request_id");
    if (request_id.IsErr()) {
        return R::Err(request_id.Error());
    }
    parsed.request_id = request_id.Value();

    auto session_id = RequireString(message, "session_id");
    if (session_id.IsErr()) {
        return R::Err(session_id.Error());
    }
    parsed.session_id = session_id.Value();

    switch (parsed.kind) {
        case MessageKind::Discovery:
            if (message.contains("tool")) {
                if (!message["tool"].is_string()) {
                    return R::Err(ValidationFailure("'tool' must be a string"));
                }
                parsed.tool = message["tool"].get<std::string>();
            }
            break;

        case MessageKind::Execute: {
            auto tool = RequireString(message, "tool");
            if (tool.IsErr()) {
                return R::Err(tool.Error());
            }
            parsed.tool = tool.Value();
            if (message.contains("params")) {
                if (!message["params"].is_object()) {
                    return R::Err(ValidationFailure("'params' must be an object"));
                }
                parsed.params = message["params"];
            }
            if (message.contains("timeout_ms")) {
                const auto& timeout = message["timeout_ms"];
                if (!timeout.is_number_integer() || timeout.get<long long>() <= 0) {
                    return R::Err(ValidationFailure("'timeout_ms' must be a positive integer"));
                }
                parsed.timeout = std::chrono::milliseconds(timeout.get<long long>());
            }
            break;
        }

        case MessageKind::Cancel:
            break;

        case MessageKind::ContextSet:
            if (!message.contains("value")) {
                return R::Err(ValidationFailure("'value' is required"));
            }
            parsed.value = message["value"];
            [[fallthrough]];
        case MessageKind::ContextGet:
        case MessageKind::ContextDelete: {
            auto key = RequireString(message, "key");
            if (key.IsErr()) {
                return R::Err(key.Error());
            }
            parsed.key = key.Value();
            break;
        }
    }

    return R::Ok(std::move(parsed));
}

// ---------------------------------------------------------------------------
// Response
// ---------------------------------------------------------------------------
Response Response::Ok(std::string request_id, nlohmann::json result) {
    Response response;
    response.request_id = std::move(request_id);
    response.ok = true;
    response.result = std::move(result);
    return response;
}

Response Response::Fail(std::string request_id, Error error) {
    Response response;
    response.request_id = std::move(request_id);
    response.ok = false;
    response.error = std::move(error);
    return response;
}

nlohmann::json Response::ToJson() const {
    nlohmann::json j = {{"request_id", request_id}, {"status", ok ? "ok" : "error"}};
    if (ok) {
        j["result"] = result;
    } else if (error) {
        j["error"] = error->ToJson();
    }
    return j;
}

RouterOptions RouterOptionsFrom(const AppConfig& config) {
    RouterOptions options;
    options.sync_wait = std::chrono::milliseconds(config.limits.sync_wait_ms);
    options.admission_timeout = std::chrono::milliseconds(config.limits.admission_timeout_ms);
    return options;
}

// ---------------------------------------------------------------------------
// MessageRouter
// ---------------------------------------------------------------------------
MessageRouter::MessageRouter(ServerContext& context, RouterOptions options)
    : context_(context), options_(options) {}

Response MessageRouter::Handle(const nlohmann::json& message) {
    auto parsed = InboundMessage::Parse(message);
    if (parsed.IsErr()) {
        LogDebug("router", "rejected message: " + parsed.Error().message);
        return Response::Fail(RequestIdOf(message), parsed.Error());
    }
    return Dispatch(parsed.Value());
}

Response MessageRouter::Dispatch(const InboundMessage& message) {
    try {
        switch (message.kind) {
            case MessageKind::Discovery:     return HandleDiscovery(message);
            case MessageKind::Execute:       return HandleExecute(message);
            case MessageKind::Cancel:        return HandleCancel(message);
            case MessageKind::ContextGet:    return HandleContextGet(message);
            case MessageKind::ContextSet:    return HandleContextSet(message);
            case MessageKind::ContextDelete: return HandleContextDelete(message);
        }
    } catch (const std::exception& e) {
        LogError("router", std::string(MessageKindName(message.kind)) + " request " +
                               message.request_id + " failed: " + e.what());
        return Response::Fail(message.request_id,
                              Error{"Route", "Internal error", ErrorCategory::Internal,
                                    std::string(e.what())});
    }
    return Response::Fail(message.request_id,
                          Error{"Route", "Internal error", ErrorCategory::Internal,
                                std::string("unhandled message kind")});
}

Response MessageRouter::HandleDiscovery(const InboundMessage& message) {
    auto& registry = context_.Registry();
    if (message.tool) {
        auto tool = registry.Lookup(*message.tool);
        if (tool.IsErr()) {
            return Response::Fail(message.request_id, tool.Error());
        }
        return Response::Ok(message.request_id, {{"tool", DescriptorToJson(*tool.Value())}});
    }
    auto tools = nlohmann::json::array();
    for (const auto& tool : registry.List()) {
        tools.push_back(DescriptorToJson(*tool));
    }
    return Response::Ok(message.request_id, {{"tools", std::move(tools)}});
}

Response MessageRouter::HandleExecute(const InboundMessage& message) {
    auto tool = context_.Registry().Lookup(*message.tool);
    if (tool.IsErr()) {
        return Response::Fail(message.request_id, tool.Error());
    }
    auto valid = ValidateParams(tool.Value()->input_schema, message.params);
    if (valid.IsErr()) {
        return Response::Fail(message.request_id, valid.Error());
    }

    const auto now = std::chrono::steady_clock::now();
    ExecutionRequest request;
    request.request_id = message.request_id;
    request.session_id = message.session_id;
    request.tool = *message.tool;
    request.params = message.params;
    request.submitted_at = now;
    request.admission_deadline = now + options_.admission_timeout;
    request.timeout = message.timeout;

    auto& engine = context_.Engine();
    auto handle = engine.Submit(std::move(request), tool.Value());
    if (handle.IsErr()) {
        return Response::Fail(message.request_id, handle.Error());
    }
    return SnapshotResponse(engine.Wait(handle.Value(), options_.sync_wait));
}

Response MessageRouter::Await(const std::string& session_id,
                              const std::string& request_id,
                              std::chrono::milliseconds timeout) {
    auto& engine = context_.Engine();
    auto handle = engine.Find(session_id, request_id);
    if (handle.IsErr()) {
        return Response::Fail(request_id, handle.Error());
    }
    return SnapshotResponse(engine.Wait(handle.Value(), timeout));
}

Response MessageRouter::HandleCancel(const InboundMessage& message) {
    auto snapshot = context_.Engine().Cancel(message.session_id, message.request_id);
    if (snapshot.IsErr()) {
        return Response::Fail(message.request_id, snapshot.Error());
    }
    const auto& state = snapshot.Value().state;
    return Response::Ok(message.request_id,
                        {{"request_id", message.request_id},
                         {"state", ExecutionStateName(state)},
                         {"cancelled", state == ExecutionState::Cancelled}});
}

Response MessageRouter::HandleContextGet(const InboundMessage& message) {
    auto value = context_.Contexts().Get(message.session_id, *message.key);
    if (value.IsErr()) {
        return Response::Fail(message.request_id, value.Error());
    }
    return Response::Ok(message.request_id, {{"key", *message.key}, {"value", value.Value()}});
}

Response MessageRouter::HandleContextSet(const InboundMessage& message) {
    auto stored = context_.Contexts().Set(message.session_id, *message.key, *message.value);
    if (stored.IsErr()) {
        return Response::Fail(message.request_id, stored.Error());
    }
    return Response::Ok(message.request_id, {{"key", *message.key}, {"stored", true}});
}

Response MessageRouter::HandleContextDelete(const InboundMessage& message) {
    auto deleted = context_.Contexts().Delete(message.session_id, *message.key);
    if (deleted.IsErr()) {
        return Response::Fail(message.request_id, deleted.Error());
    }
    return Response::Ok(message.request_id,
                        {{"key", *message.key}, {"deleted", deleted.Value()}});
}

} // namespace toolsrv
