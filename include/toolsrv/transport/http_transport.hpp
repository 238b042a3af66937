#pragma once

#include <toolsrv/core/result.hpp>
#include <toolsrv/mcp/mcp_server.hpp>
#include <toolsrv/server/server_context.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace toolsrv {

struct HttpOptions {
    std::string host = "127.0.0.1";
    uint16_t port = 32823;
    // Upper bound on how long an SSE stream waits for an event before it
    // checks for shutdown and sends a keep-alive comment when due.
    std::chrono::milliseconds poll_interval{250};
    std::chrono::seconds keep_alive{15};
};

// ---------------------------------------------------------------------------
// HttpTransport: HTTP/SSE front of the McpServer.
//
//   GET  /sse[?session_id=...]      event stream of one session
//   POST /messages?session_id=...   one JSON-RPC (or core) message
//   GET  /healthz                   liveness and counters
//
// Uses pimpl to keep httplib out of the public header.
// ---------------------------------------------------------------------------
class HttpTransport {
public:
    HttpTransport(McpServer& mcp, ServerContext& context, HttpOptions options);
    ~HttpTransport();

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    // Binds and serves until Stop() is called. Bind failures are reported
    // as Transport errors.
    Result<void, Error> Start();

    // Safe to call from any thread, also before Start().
    void Stop();

    [[nodiscard]] bool IsRunning() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Random 128-bit session id, hex encoded.
std::string GenerateSessionId();

} // namespace toolsrv
