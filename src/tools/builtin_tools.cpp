#include <toolsrv/tools/builtin_tools.hpp>

#include <toolsrv/core/log.hpp>
#include <toolsrv/registry/schema.hpp>
#include <toolsrv/server/server_context.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>

namespace toolsrv {

namespace {

constexpr std::int64_t kDefaultMaxSleepMs = 60000;
constexpr auto kSleepSlice = std::chrono::milliseconds(10);
constexpr auto kProgressInterval = std::chrono::milliseconds(100);

Result<nlohmann::json, Error> SleepError(const std::string& message) {
    return Result<nlohmann::json, Error>::Err(
        Error{"sleep", message, ErrorCategory::ExecutionFailed, std::nullopt});
}

Result<nlohmann::json, Error> HandleEcho(const ToolCall& call) {
    return Result<nlohmann::json, Error>::Ok(call.params);
}

Result<nlohmann::json, Error> HandleSleep(const ToolCall& call) {
    const auto requested = call.params.at("ms").get<std::int64_t>();
    const auto max_ms = call.settings.is_object()
                            ? call.settings.value("max_ms", kDefaultMaxSleepMs)
                            : kDefaultMaxSleepMs;
    if (requested < 0) {
        return SleepError("ms must not be negative");
    }
    if (requested > max_ms) {
        return SleepError("ms exceeds the limit of " + std::to_string(max_ms));
    }

    using Clock = std::chrono::steady_clock;
    const auto total = std::chrono::milliseconds(requested);
    const auto start = Clock::now();
    auto next_progress = start + kProgressInterval;

    for (;;) {
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
        if (elapsed >= total) {
            break;
        }
        if (call.cancel.WaitFor(std::min<std::chrono::milliseconds>(kSleepSlice,
                                                                    total - elapsed))) {
            return SleepError("interrupted");
        }
        const auto now = Clock::now();
        if (now >= next_progress) {
            next_progress += kProgressInterval;
            const auto slept =
                std::chrono::duration_cast<std::chrono::milliseconds>(now - start);
            call.ReportProgress({{"slept_ms", slept.count()}, {"total_ms", requested}});
        }
    }

    return Result<nlohmann::json, Error>::Ok(nlohmann::json{{"slept_ms", requested}});
}

} // anonymous namespace

ToolDescriptor MakeEchoTool() {
    ToolDescriptor tool;
    tool.name = "echo";
    tool.version = "1.0.0";
    tool.description = "Return the given parameters unchanged.";
    tool.input_schema = MakeSchema(nlohmann::json::object());
    tool.rate_limit.capacity = 10;
    tool.rate_limit.refill_rate = 10.0;
    tool.rate_limit.mode = AdmissionMode::Reject;
    tool.handler = HandleEcho;
    return tool;
}

ToolDescriptor MakeSleepTool() {
    ToolDescriptor tool;
    tool.name = "sleep";
    tool.version = "1.0.0";
    tool.description =
        "Sleep for the given number of milliseconds, reporting progress. "
        "Stops early when cancelled or timed out.";
    tool.input_schema = MakeSchema(
        {{"ms", IntProp("Duration in milliseconds")}},
        {"ms"});
    tool.settings = {{"max_ms", kDefaultMaxSleepMs}};
    tool.handler = HandleSleep;
    return tool;
}

Result<void, Error> RegisterBuiltinTools(ServerContext& context) {
    for (auto&& tool : {MakeEchoTool(), MakeSleepTool()}) {
        auto registered = context.RegisterTool(tool);
        if (registered.IsErr()) {
            return registered;
        }
    }
    LogDebug("tools", "built-in tools registered");
    return Result<void, Error>::Ok();
}

} // namespace toolsrv
