#include <catch2/catch_test_macros.hpp>

#include <toolsrv/server/server_context.hpp>
#include <toolsrv/tools/builtin_tools.hpp>

#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace toolsrv;
using namespace std::chrono_literals;

namespace {

ToolCall MakeCall(nlohmann::json params, nlohmann::json settings = nlohmann::json::object()) {
    ToolCall call;
    call.session_id = "s1";
    call.request_id = "r1";
    call.params = std::move(params);
    call.settings = std::move(settings);
    return call;
}

} // anonymous namespace

// ===========================================================================
// echo
// ===========================================================================

TEST_CASE("echo: returns params unchanged", "[tools][echo]") {
    auto tool = MakeEchoTool();
    CHECK(tool.name == "echo");

    const nlohmann::json params = {{"text", "hi"}, {"nested", {{"n", 1}}}, {"list", {1, 2}}};
    auto result = tool.handler(MakeCall(params));
    REQUIRE(result.IsOk());
    CHECK(result.Value() == params);
}

TEST_CASE("echo: empty params", "[tools][echo]") {
    auto result = MakeEchoTool().handler(MakeCall(nlohmann::json::object()));
    REQUIRE(result.IsOk());
    CHECK(result.Value() == nlohmann::json::object());
}

// ===========================================================================
// sleep
// ===========================================================================

TEST_CASE("sleep: descriptor requires ms", "[tools][sleep]") {
    auto tool = MakeSleepTool();
    CHECK(tool.input_schema["required"] == nlohmann::json::array({"ms"}));
    CHECK(tool.settings["max_ms"] == 60000);
}

TEST_CASE("sleep: sleeps and reports progress", "[tools][sleep]") {
    auto tool = MakeSleepTool();
    std::mutex mutex;
    std::vector<nlohmann::json> progress;
    auto call = MakeCall({{"ms", 250}}, tool.settings);
    call.report_progress = [&](const nlohmann::json& p) {
        std::lock_guard<std::mutex> lock(mutex);
        progress.push_back(p);
    };

    const auto start = std::chrono::steady_clock::now();
    auto result = tool.handler(call);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(result.IsOk());
    CHECK(result.Value()["slept_ms"] == 250);
    CHECK(elapsed >= 250ms);
    REQUIRE_FALSE(progress.empty());
    CHECK(progress.front()["total_ms"] == 250);
    CHECK(progress.front()["slept_ms"].get<int>() >= 100);
}

TEST_CASE("sleep: zero returns immediately", "[tools][sleep]") {
    auto result = MakeSleepTool().handler(MakeCall({{"ms", 0}}));
    REQUIRE(result.IsOk());
    CHECK(result.Value()["slept_ms"] == 0);
}

TEST_CASE("sleep: rejects out-of-range durations", "[tools][sleep]") {
    auto tool = MakeSleepTool();

    auto negative = tool.handler(MakeCall({{"ms", -1}}, tool.settings));
    REQUIRE(negative.IsErr());
    CHECK(negative.Error().category == ErrorCategory::ExecutionFailed);

    auto too_long = tool.handler(MakeCall({{"ms", 500}}, {{"max_ms", 100}}));
    REQUIRE(too_long.IsErr());
    CHECK(too_long.Error().category == ErrorCategory::ExecutionFailed);
    CHECK(too_long.Error().message.find("100") != std::string::npos);
}

TEST_CASE("sleep: stops when cancelled", "[tools][sleep]") {
    CancellationSource source;
    auto call = MakeCall({{"ms", 10000}});
    call.cancel = source.Token();

    std::thread canceller([&source] {
        std::this_thread::sleep_for(50ms);
        source.Cancel();
    });
    const auto start = std::chrono::steady_clock::now();
    auto result = MakeSleepTool().handler(call);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "interrupted");
    CHECK(elapsed < 2s);
}

// ===========================================================================
// RegisterBuiltinTools
// ===========================================================================

TEST_CASE("RegisterBuiltinTools: registers echo and sleep", "[tools][server]") {
    ServerContext context(AppConfig{});
    REQUIRE(RegisterBuiltinTools(context).IsOk());
    CHECK(context.Registry().Size() == 2);
    CHECK(context.Registry().Lookup("echo").IsOk());
    CHECK(context.Registry().Lookup("sleep").IsOk());

    auto again = RegisterBuiltinTools(context);
    REQUIRE(again.IsErr());
    CHECK(again.Error().category == ErrorCategory::DuplicateTool);
}

TEST_CASE("RegisterBuiltinTools: configuration overrides apply", "[tools][server]") {
    AppConfig config;
    config.tools["echo"].capacity = 3;
    config.tools["echo"].refill_rate = 1.5;
    config.tools["echo"].mode = "queue";
    config.tools["echo"].queue_depth = 2;
    config.tools["echo"].max_in_flight = 1;
    config.tools["echo"].timeout_ms = 750;
    config.tools["sleep"].settings = {{"max_ms", 1000}, {"extra", true}};

    ServerContext context(config);
    REQUIRE(RegisterBuiltinTools(context).IsOk());

    auto echo = context.Registry().Lookup("echo");
    REQUIRE(echo.IsOk());
    CHECK(echo.Value()->rate_limit.capacity == 3);
    CHECK(echo.Value()->rate_limit.refill_rate == 1.5);
    CHECK(echo.Value()->rate_limit.mode == AdmissionMode::Queue);
    CHECK(echo.Value()->rate_limit.queue_depth == 2);
    CHECK(echo.Value()->max_in_flight == 1);
    CHECK(echo.Value()->timeout == std::optional<std::chrono::milliseconds>(750ms));

    auto sleep = context.Registry().Lookup("sleep");
    REQUIRE(sleep.IsOk());
    CHECK(sleep.Value()->settings["max_ms"] == 1000);
    CHECK(sleep.Value()->settings["extra"] == true);
}

TEST_CASE("RegisterBuiltinTools: disabled tools are skipped", "[tools][server]") {
    AppConfig config;
    config.tools["sleep"].enabled = false;

    ServerContext context(config);
    REQUIRE(RegisterBuiltinTools(context).IsOk());
    CHECK(context.Registry().Lookup("echo").IsOk());
    auto sleep = context.Registry().Lookup("sleep");
    REQUIRE(sleep.IsErr());
    CHECK(sleep.Error().category == ErrorCategory::ToolNotFound);
}
