#pragma once

#include <toolsrv/core/log.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace toolsrv {

enum class TransportKind {
    Stdio,
    Http,
};

struct ServerSettings {
    std::string name = "toolsrv";
    TransportKind transport = TransportKind::Stdio;
    std::string host = "127.0.0.1";
    uint16_t port = 32823;
};

struct LimitsConfig {
    int global_max_in_flight = 16;
    int per_tool_max_in_flight = 4;
    int default_timeout_ms = 30000;
    int admission_timeout_ms = 30000;
    int sync_wait_ms = 250;
    int retention_seconds = 300;
};

struct ContextConfig {
    int ttl_seconds = 3600;
    int sweep_interval_seconds = 30;
};

struct EventsConfig {
    int buffer_capacity = 256;
};

struct LoggingConfig {
    LogLevel level = LogLevel::Info;
    bool json = false;
    std::optional<std::string> file;
    std::optional<bool> color;  // unset = auto (tty and NO_COLOR)
};

// Per-tool overrides from `tools.<name>`. Unset fields keep the tool's
// built-in defaults.
struct ToolConfig {
    std::optional<bool> enabled;
    std::optional<int> capacity;
    std::optional<double> refill_rate;
    std::optional<std::string> mode;
    std::optional<int> queue_depth;
    std::optional<int> max_in_flight;
    std::optional<int> timeout_ms;
    nlohmann::json settings = nlohmann::json::object();
};

struct AppConfig {
    ServerSettings server;
    LimitsConfig limits;
    ContextConfig context;
    EventsConfig events;
    LoggingConfig logging;
    std::map<std::string, ToolConfig> tools;
};

} // namespace toolsrv
