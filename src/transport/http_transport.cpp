#include <toolsrv/transport/http_transport.hpp>

#include <toolsrv/core/log.hpp>

#include <httplib.h>

#include <atomic>
#include <iomanip>
#include <random>
#include <sstream>

namespace toolsrv {

namespace {

const char* kComponent = "http";

std::string SseFrame(const Event& event) {
    std::ostringstream oss;
    oss << "id: " << event.sequence << '\n'
        << "event: " << EventKindName(event.kind) << '\n'
        << "data: " << event.ToJson().dump() << "\n\n";
    return oss.str();
}

bool WriteFrame(httplib::DataSink& sink, const std::string& frame) {
    return sink.write(frame.data(), frame.size());
}

// JSON-RPC parse errors are answered with 400; every other reply is 200.
bool IsParseError(const nlohmann::json& reply) {
    return reply.is_object() && reply.contains("error") &&
           reply["error"].is_object() &&
           reply["error"].value("code", 0) == -32700;
}

} // anonymous namespace

std::string GenerateSessionId() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < 2; ++i) {
        oss << std::setw(16) << rng();
    }
    return oss.str();
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct HttpTransport::Impl {
    McpServer& mcp;
    ServerContext& context;
    HttpOptions options;
    httplib::Server server;
    std::atomic<bool> stopping{false};

    Impl(McpServer& m, ServerContext& c, HttpOptions o)
        : mcp(m), context(c), options(std::move(o)) {}

    void InstallRoutes();
    void HandleSse(const httplib::Request& req, httplib::Response& res);
    void HandleMessage(const httplib::Request& req, httplib::Response& res);
    void HandleHealth(const httplib::Request& req, httplib::Response& res);
};

void HttpTransport::Impl::InstallRoutes() {
    server.Get("/sse", [this](const httplib::Request& req, httplib::Response& res) {
        HandleSse(req, res);
    });
    server.Post("/messages", [this](const httplib::Request& req, httplib::Response& res) {
        HandleMessage(req, res);
    });
    server.Post("/messages/", [this](const httplib::Request& req, httplib::Response& res) {
        HandleMessage(req, res);
    });
    server.Get("/healthz", [this](const httplib::Request& req, httplib::Response& res) {
        HandleHealth(req, res);
    });
}

void HttpTransport::Impl::HandleSse(const httplib::Request& req, httplib::Response& res) {
    std::string session_id = req.get_param_value("session_id");
    if (session_id.empty()) {
        session_id = GenerateSessionId();
    }

    // Shared between the provider and the releaser, both of which httplib
    // copies.
    auto subscription = std::make_shared<Subscription>(
        context.Events().Subscribe(session_id));
    const bool resumed = subscription->Resumed();
    LogInfo(kComponent, "SSE stream opened for session " + session_id +
                            (resumed ? " (resumed)" : ""));

    res.set_header("Cache-Control", "no-cache");
    res.set_header("Connection", "keep-alive");

    struct StreamState {
        bool greeted = false;
        std::chrono::steady_clock::time_point last_write = std::chrono::steady_clock::now();
    };
    auto state = std::make_shared<StreamState>();

    res.set_chunked_content_provider(
        "text/event-stream",
        [this, session_id, subscription, state, resumed](std::size_t /*offset*/,
                                                         httplib::DataSink& sink) {
            if (stopping.load()) {
                sink.done();
                return true;
            }

            if (!state->greeted) {
                state->greeted = true;
                if (resumed) {
                    const nlohmann::json payload = {{"session_id", session_id}};
                    if (!WriteFrame(sink, "event: resumed\ndata: " + payload.dump() + "\n\n")) {
                        return false;
                    }
                }
                if (!WriteFrame(sink, "event: endpoint\ndata: /messages?session_id=" +
                                          session_id + "\n\n")) {
                    return false;
                }
                state->last_write = std::chrono::steady_clock::now();
                return true;
            }

            auto event = subscription->Next(options.poll_interval);
            if (!event.has_value()) {
                if (!subscription->Active()) {
                    LogInfo(kComponent, "SSE stream of session " + session_id +
                                            " detached");
                    sink.done();
                    return true;
                }
                const auto now = std::chrono::steady_clock::now();
                if (now - state->last_write >= options.keep_alive) {
                    state->last_write = now;
                    return WriteFrame(sink, ": keep-alive\n\n");
                }
                return true;
            }

            state->last_write = std::chrono::steady_clock::now();
            return WriteFrame(sink, SseFrame(*event));
        },
        [subscription, session_id](bool /*success*/) {
            subscription->Unsubscribe();
            LogDebug(kComponent, "SSE stream closed for session " + session_id);
        });
}

void HttpTransport::Impl::HandleMessage(const httplib::Request& req, httplib::Response& res) {
    const std::string session_id = req.get_param_value("session_id");
    if (session_id.empty()) {
        res.status = 400;
        const nlohmann::json body = {
            {"error", {{"code", "ValidationError"},
                       {"message", "Missing session_id query parameter"}}}};
        res.set_content(body.dump(), "application/json");
        return;
    }

    auto reply = mcp.HandleLine(session_id, req.body);
    if (!reply.has_value()) {
        res.status = 202;
        return;
    }
    res.status = IsParseError(*reply) ? 400 : 200;
    res.set_content(reply->dump(), "application/json");
}

void HttpTransport::Impl::HandleHealth(const httplib::Request& /*req*/,
                                       httplib::Response& res) {
    const nlohmann::json body = {
        {"status", "ok"},
        {"tools", context.Registry().Size()},
        {"sessions", context.Contexts().SessionCount()},
        {"in_flight", context.Engine().InFlight()},
    };
    res.set_content(body.dump(), "application/json");
}

// ---------------------------------------------------------------------------
// HttpTransport
// ---------------------------------------------------------------------------
HttpTransport::HttpTransport(McpServer& mcp, ServerContext& context, HttpOptions options)
    : impl_(std::make_unique<Impl>(mcp, context, std::move(options))) {
    impl_->InstallRoutes();
}

HttpTransport::~HttpTransport() {
    Stop();
}

Result<void, Error> HttpTransport::Start() {
    const auto& host = impl_->options.host;
    const auto port = impl_->options.port;
    if (!impl_->server.bind_to_port(host, port)) {
        return Result<void, Error>::Err(Error{
            "HttpTransport::Start",
            "Failed to bind " + host + ":" + std::to_string(port),
            ErrorCategory::Transport, std::nullopt});
    }
    if (impl_->stopping.load()) {
        return Result<void, Error>::Ok();
    }

    LogInfo(kComponent, "listening on http://" + host + ":" + std::to_string(port));
    if (!impl_->server.listen_after_bind() && !impl_->stopping.load()) {
        return Result<void, Error>::Err(Error{
            "HttpTransport::Start", "HTTP listener terminated unexpectedly",
            ErrorCategory::Transport, std::nullopt});
    }
    LogInfo(kComponent, "listener stopped");
    return Result<void, Error>::Ok();
}

void HttpTransport::Stop() {
    impl_->stopping.store(true);
    impl_->server.stop();
}

bool HttpTransport::IsRunning() const {
    return impl_->server.is_running();
}

} // namespace toolsrv
