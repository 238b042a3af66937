#include <catch2/catch_test_macros.hpp>

#include <toolsrv/mcp/mcp_server.hpp>
#include <toolsrv/server/server_context.hpp>
#include <toolsrv/tools/builtin_tools.hpp>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <istream>
#include <mutex>
#include <set>
#include <sstream>
#include <streambuf>
#include <string>
#include <thread>

using namespace toolsrv;

namespace {

struct McpFixture {
    McpFixture()
        : context(MakeConfig()),
          router(context, RouterOptionsFrom(context.Config())),
          server(router, context.Events(), MakeOptions(), in, out) {
        REQUIRE(RegisterBuiltinTools(context).IsOk());
    }

    static AppConfig MakeConfig() {
        AppConfig config;
        config.limits.sync_wait_ms = 50;
        return config;
    }

    static McpOptions MakeOptions() {
        McpOptions options;
        options.name = "toolsrv-test";
        options.version = "9.9.9";
        return options;
    }

    nlohmann::json Call(const nlohmann::json& id, const std::string& method,
                        const nlohmann::json& params = nlohmann::json::object()) {
        auto response = server.HandleMessage(
            "s1", {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}});
        REQUIRE(response.has_value());
        return *response;
    }

    std::istringstream in;
    std::ostringstream out;
    ServerContext context;
    MessageRouter router;
    McpServer server;
};

} // anonymous namespace

// ===========================================================================
// HandleMessage
// ===========================================================================

TEST_CASE("McpServer: initialize returns capabilities", "[mcp][server]") {
    McpFixture f;
    auto r = f.Call(1, "initialize", {{"protocolVersion", "2024-11-05"},
                                      {"clientInfo", {{"name", "tester"}}}});

    CHECK(r["jsonrpc"] == "2.0");
    CHECK(r["id"] == 1);
    CHECK(r["result"]["protocolVersion"] == "2024-11-05");
    CHECK(r["result"]["serverInfo"]["name"] == "toolsrv-test");
    CHECK(r["result"]["serverInfo"]["version"] == "9.9.9");
    CHECK(r["result"]["capabilities"].contains("tools"));
}

TEST_CASE("McpServer: ping returns an empty result", "[mcp][server]") {
    McpFixture f;
    auto r = f.Call("p", "ping");
    CHECK(r["id"] == "p");
    CHECK(r["result"] == nlohmann::json::object());
}

TEST_CASE("McpServer: tools/list returns registered tools", "[mcp][server]") {
    McpFixture f;
    auto r = f.Call(2, "tools/list");

    const auto& tools = r["result"]["tools"];
    REQUIRE(tools.size() == 2);
    CHECK(tools[0]["name"] == "echo");
    CHECK(tools[0].contains("inputSchema"));
    CHECK(tools[1]["name"] == "sleep");
    CHECK(tools[1]["inputSchema"]["properties"].contains("ms"));
}

TEST_CASE("McpServer: tools/call returns the tool result", "[mcp][server]") {
    McpFixture f;
    auto r = f.Call(3, "tools/call", {{"name", "echo"}, {"arguments", {{"message", "hello"}}}});

    const auto& result = r["result"];
    CHECK_FALSE(result.contains("isError"));
    CHECK(result["structuredContent"]["message"] == "hello");
    REQUIRE(result["content"].size() == 1);
    CHECK(result["content"][0]["type"] == "text");
    CHECK(nlohmann::json::parse(result["content"][0]["text"].get<std::string>())["message"] ==
          "hello");
}

TEST_CASE("McpServer: tools/call waits past the synchronous window", "[mcp][server]") {
    McpFixture f;
    // sync_wait is 50ms, so the router acknowledges first.
    auto r = f.Call(4, "tools/call", {{"name", "sleep"}, {"arguments", {{"ms", 150}}}});
    CHECK(r["result"]["structuredContent"]["slept_ms"] == 150);
}

TEST_CASE("McpServer: execution failures are tool results with isError", "[mcp][server]") {
    McpFixture f;
    auto r = f.Call(5, "tools/call", {{"name", "sleep"},
                                      {"arguments", {{"ms", 1000}}},
                                      {"_meta", {{"timeout_ms", 20}}}});

    REQUIRE(r.contains("result"));
    CHECK(r["result"]["isError"] == true);
    auto payload =
        nlohmann::json::parse(r["result"]["content"][0]["text"].get<std::string>());
    CHECK(payload["code"] == "ExecutionTimeout");
}

TEST_CASE("McpServer: tools/call of an unknown tool is a protocol error", "[mcp][server]") {
    McpFixture f;
    auto r = f.Call(6, "tools/call", {{"name", "nonexistent"}});

    REQUIRE(r.contains("error"));
    CHECK(r["error"]["code"] == -32001);
    CHECK(r["error"]["data"]["code"] == "ToolNotFound");
}

TEST_CASE("McpServer: tools/call with invalid arguments", "[mcp][server]") {
    McpFixture f;

    SECTION("missing name") {
        auto r = f.Call(7, "tools/call");
        CHECK(r["error"]["code"] == -32602);
    }
    SECTION("arguments not an object") {
        auto r = f.Call(7, "tools/call", {{"name", "echo"}, {"arguments", 5}});
        CHECK(r["error"]["code"] == -32602);
    }
    SECTION("schema mismatch") {
        auto r = f.Call(7, "tools/call", {{"name", "sleep"}, {"arguments", {{"ms", "x"}}}});
        CHECK(r["error"]["code"] == -32602);
        CHECK(r["error"]["data"]["code"] == "ValidationError");
    }
}

TEST_CASE("McpServer: context methods", "[mcp][server]") {
    McpFixture f;

    auto set = f.Call(8, "context/set", {{"key", "user"}, {"value", {{"id", 7}}}});
    CHECK(set["result"]["stored"] == true);

    auto get = f.Call(9, "context/get", {{"key", "user"}});
    CHECK(get["result"]["value"]["id"] == 7);

    auto del = f.Call(10, "context/delete", {{"key", "user"}});
    CHECK(del["result"]["deleted"] == true);

    auto missing = f.Call(11, "context/get", {{"key", "user"}});
    CHECK(missing["error"]["code"] == -32007);

    auto no_key = f.Call(12, "context/get");
    CHECK(no_key["error"]["code"] == -32602);
}

TEST_CASE("McpServer: unknown method returns -32601", "[mcp][server]") {
    McpFixture f;
    auto r = f.Call(13, "nonexistent/method");
    CHECK(r["error"]["code"] == -32601);
}

TEST_CASE("McpServer: wrong jsonrpc version returns -32600", "[mcp][server]") {
    McpFixture f;
    auto r = f.server.HandleMessage("s1", {{"jsonrpc", "1.0"}, {"id", 14}, {"method", "ping"}});
    REQUIRE(r.has_value());
    CHECK((*r)["error"]["code"] == -32600);

    auto not_object = f.server.HandleMessage("s1", nlohmann::json::array());
    REQUIRE(not_object.has_value());
    CHECK((*not_object)["error"]["code"] == -32600);
}

TEST_CASE("McpServer: notifications return no response", "[mcp][server]") {
    McpFixture f;
    CHECK_FALSE(f.server.HandleMessage(
        "s1", {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}).has_value());
    CHECK_FALSE(f.server.HandleMessage(
        "s1", {{"jsonrpc", "2.0"}, {"method", "notifications/cancelled"},
               {"params", {{"requestId", "ghost"}}}}).has_value());
}

TEST_CASE("McpServer: notifications/cancelled cancels a running call", "[mcp][server]") {
    McpFixture f;
    auto started = f.router.Handle({{"kind", "execute"}, {"request_id", "42"},
                                    {"session_id", "s1"}, {"tool", "sleep"},
                                    {"params", {{"ms", 5000}}}});
    REQUIRE(started.pending);

    CHECK_FALSE(f.server.HandleMessage(
        "s1", {{"jsonrpc", "2.0"}, {"method", "notifications/cancelled"},
               {"params", {{"requestId", 42}}}}).has_value());

    auto done = f.router.Await("s1", "42", std::chrono::milliseconds(2000));
    REQUIRE_FALSE(done.ok);
    CHECK(done.error->category == ErrorCategory::Cancelled);
}

TEST_CASE("McpServer: core messages get core responses", "[mcp][server]") {
    McpFixture f;
    auto r = f.server.HandleMessage("s1", {{"kind", "execute"},
                                           {"request_id", "c1"},
                                           {"session_id", "s1"},
                                           {"tool", "echo"},
                                           {"params", {{"a", 1}}}});
    REQUIRE(r.has_value());
    CHECK((*r)["request_id"] == "c1");
    CHECK((*r)["status"] == "ok");
    CHECK((*r)["result"]["a"] == 1);
}

TEST_CASE("McpServer: HandleLine reports parse errors", "[mcp][server]") {
    McpFixture f;
    auto r = f.server.HandleLine("s1", "{not json");
    REQUIRE(r.has_value());
    CHECK((*r)["error"]["code"] == -32700);
    CHECK((*r)["id"].is_null());

    auto ok = f.server.HandleLine("s1", R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    REQUIRE(ok.has_value());
    CHECK((*ok)["result"] == nlohmann::json::object());
}

// ===========================================================================
// Run (stdio loop)
// ===========================================================================

namespace {

// Input that blocks the reader until lines are pushed or Close() is called.
class LineFeed : public std::streambuf {
public:
    void Push(const std::string& line) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_.push_back(line + "\n");
        }
        cv_.notify_all();
    }

    void Close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

protected:
    int_type underflow() override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !pending_.empty() || closed_; });
        if (pending_.empty()) {
            return traits_type::eof();
        }
        current_ = std::move(pending_.front());
        pending_.pop_front();
        setg(&current_[0], &current_[0], &current_[0] + current_.size());
        return traits_type::to_int_type(current_[0]);
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> pending_;
    std::string current_;
    bool closed_ = false;
};

} // anonymous namespace

TEST_CASE("McpServer: Run answers every request line", "[mcp][server][stdio]") {
    AppConfig config;
    ServerContext context(config);
    REQUIRE(RegisterBuiltinTools(context).IsOk());
    MessageRouter router(context, RouterOptionsFrom(config));

    std::istringstream in(
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})" "\n"
        R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n"
        "\n"
        "garbage\n"
        R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"echo","arguments":{"x":1}}})" "\n");
    std::ostringstream out;
    McpServer server(router, context.Events(), McpOptions{}, in, out);

    server.Run();

    std::set<int> ids;
    int parse_errors = 0;
    std::istringstream lines(out.str());
    std::string line;
    while (std::getline(lines, line)) {
        auto message = nlohmann::json::parse(line);
        if (message.contains("method")) {
            CHECK(message["method"] == "notifications/event");
            continue;
        }
        if (message.contains("error") && message["error"]["code"] == -32700) {
            ++parse_errors;
        } else {
            ids.insert(message["id"].get<int>());
        }
    }
    CHECK(parse_errors == 1);
    const std::set<int> expected{1, 2};
    CHECK(ids == expected);
}

TEST_CASE("McpServer: Run cancels a call while every dispatch worker is busy",
          "[mcp][server][stdio]") {
    AppConfig config;
    config.limits.sync_wait_ms = 50;
    ServerContext context(config);
    REQUIRE(RegisterBuiltinTools(context).IsOk());
    MessageRouter router(context, RouterOptionsFrom(config));

    LineFeed feed;
    std::istream in(&feed);
    std::ostringstream out;
    McpOptions options;
    options.dispatch_threads = 1;
    McpServer server(router, context.Events(), options, in, out);
    std::thread runner([&server] { server.Run(); });

    feed.Push(R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"sleep","arguments":{"ms":5000}}})");
    const auto wait_end = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (context.Engine().Find(McpServer::kStdioSession, "1").IsErr() &&
           std::chrono::steady_clock::now() < wait_end) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    auto handle = context.Engine().Find(McpServer::kStdioSession, "1");
    REQUIRE(handle.IsOk());

    // The only dispatch worker is blocked in tools/call id 1.
    const auto start = std::chrono::steady_clock::now();
    feed.Push(R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":1}})");
    auto snapshot = context.Engine().Wait(handle.Value(), std::chrono::seconds(2));
    const auto elapsed = std::chrono::steady_clock::now() - start;

    feed.Close();
    runner.join();

    CHECK(snapshot.state == ExecutionState::Cancelled);
    CHECK(elapsed < std::chrono::seconds(2));

    bool answered = false;
    std::istringstream lines(out.str());
    std::string line;
    while (std::getline(lines, line)) {
        auto message = nlohmann::json::parse(line);
        if (message.contains("id") && message["id"] == 1) {
            answered = true;
            CHECK(message["result"]["isError"] == true);
        }
    }
    CHECK(answered);
}
