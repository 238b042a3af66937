#include <toolsrv/config/config_loader.hpp>

#include <toolsrv/core/version.hpp>
#include <toolsrv/registry/tool_descriptor.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>

extern char** environ;

namespace toolsrv {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", message, ErrorCategory::Config, std::nullopt};
}

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// YAML scalars carry no type; plain scalars are tried as integer, float and
// bool in that order, quoted ones stay strings.
nlohmann::json YamlToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;
        case YAML::NodeType::Sequence: {
            auto array = nlohmann::json::array();
            for (const auto& item : node) {
                array.push_back(YamlToJson(item));
            }
            return array;
        }
        case YAML::NodeType::Map: {
            auto object = nlohmann::json::object();
            for (const auto& entry : node) {
                object[entry.first.as<std::string>()] = YamlToJson(entry.second);
            }
            return object;
        }
        case YAML::NodeType::Scalar:
            break;
    }
    if (node.Tag() != "!") {
        long long integer = 0;
        if (YAML::convert<long long>::decode(node, integer)) {
            return integer;
        }
        double number = 0.0;
        if (YAML::convert<double>::decode(node, number)) {
            return number;
        }
        bool boolean = false;
        if (YAML::convert<bool>::decode(node, boolean)) {
            return boolean;
        }
    }
    return node.Scalar();
}

// Environment values are JSON when they parse as such ("5000", "true"),
// plain strings otherwise.
nlohmann::json EnvValueToJson(const std::string& value) {
    auto parsed = nlohmann::json::parse(value, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) {
        return value;
    }
    return parsed;
}

Result<ToolConfig, Error> ParseYamlTool(const std::string& name, const YAML::Node& node) {
    ToolConfig tool;
    if (!node.IsMap()) {
        return Result<ToolConfig, Error>::Err(
            MakeConfigError("Tool entry '" + name + "' must be a mapping"));
    }
    if (node["enabled"]) {
        tool.enabled = node["enabled"].as<bool>();
    }
    if (const auto& limit = node["rate_limit"]) {
        if (limit["capacity"]) {
            tool.capacity = limit["capacity"].as<int>();
        }
        if (limit["refill_rate"]) {
            tool.refill_rate = limit["refill_rate"].as<double>();
        }
        if (limit["mode"]) {
            tool.mode = limit["mode"].as<std::string>();
        }
        if (limit["queue_depth"]) {
            tool.queue_depth = limit["queue_depth"].as<int>();
        }
    }
    if (node["max_in_flight"]) {
        tool.max_in_flight = node["max_in_flight"].as<int>();
    }
    if (node["timeout_ms"]) {
        tool.timeout_ms = node["timeout_ms"].as<int>();
    }
    if (node["settings"]) {
        auto settings = YamlToJson(node["settings"]);
        if (!settings.is_object()) {
            return Result<ToolConfig, Error>::Err(
                MakeConfigError("settings of tool '" + name + "' must be a mapping"));
        }
        tool.settings = std::move(settings);
    }
    return Result<ToolConfig, Error>::Ok(std::move(tool));
}

} // anonymous namespace

std::optional<TransportKind> ParseTransportKind(std::string_view text) {
    const auto lower = ToLower(std::string(text));
    if (lower == "stdio") return TransportKind::Stdio;
    if (lower == "http" || lower == "sse") return TransportKind::Http;
    return std::nullopt;
}

const char* TransportKindName(TransportKind kind) {
    switch (kind) {
        case TransportKind::Stdio: return "stdio";
        case TransportKind::Http:  return "http";
    }
    return "stdio";
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    AppConfig config;
    try {
        const auto root = YAML::LoadFile(std::string(file_path));

        // -- Server --
        if (const auto& server = root["server"]) {
            if (server["name"]) {
                config.server.name = server["name"].as<std::string>();
            }
            if (server["transport"]) {
                const auto text = server["transport"].as<std::string>();
                auto kind = ParseTransportKind(text);
                if (!kind) {
                    return Result<AppConfig, Error>::Err(
                        MakeConfigError("Unknown transport: " + text));
                }
                config.server.transport = *kind;
            }
            if (server["host"]) {
                config.server.host = server["host"].as<std::string>();
            }
            if (server["port"]) {
                config.server.port = server["port"].as<uint16_t>();
            }
        }

        // -- Limits --
        if (const auto& limits = root["limits"]) {
            if (limits["global_max_in_flight"]) {
                config.limits.global_max_in_flight = limits["global_max_in_flight"].as<int>();
            }
            if (limits["per_tool_max_in_flight"]) {
                config.limits.per_tool_max_in_flight = limits["per_tool_max_in_flight"].as<int>();
            }
            if (limits["default_timeout_ms"]) {
                config.limits.default_timeout_ms = limits["default_timeout_ms"].as<int>();
            }
            if (limits["admission_timeout_ms"]) {
                config.limits.admission_timeout_ms = limits["admission_timeout_ms"].as<int>();
            }
            if (limits["sync_wait_ms"]) {
                config.limits.sync_wait_ms = limits["sync_wait_ms"].as<int>();
            }
            if (limits["retention_seconds"]) {
                config.limits.retention_seconds = limits["retention_seconds"].as<int>();
            }
        }

        // -- Context --
        if (const auto& context = root["context"]) {
            if (context["ttl_seconds"]) {
                config.context.ttl_seconds = context["ttl_seconds"].as<int>();
            }
            if (context["sweep_interval_seconds"]) {
                config.context.sweep_interval_seconds =
                    context["sweep_interval_seconds"].as<int>();
            }
        }

        // -- Events --
        if (const auto& events = root["events"]) {
            if (events["buffer_capacity"]) {
                config.events.buffer_capacity = events["buffer_capacity"].as<int>();
            }
        }

        // -- Logging --
        if (const auto& logging = root["logging"]) {
            if (logging["level"]) {
                const auto text = logging["level"].as<std::string>();
                auto level = ParseLogLevel(text);
                if (!level) {
                    return Result<AppConfig, Error>::Err(
                        MakeConfigError("Unknown log level: " + text));
                }
                config.logging.level = *level;
            }
            if (logging["json"]) {
                config.logging.json = logging["json"].as<bool>();
            }
            if (logging["file"]) {
                config.logging.file = logging["file"].as<std::string>();
            }
            if (logging["color"]) {
                config.logging.color = logging["color"].as<bool>();
            }
        }

        // -- Tools --
        if (const auto& tools = root["tools"]) {
            for (const auto& entry : tools) {
                const auto name = entry.first.as<std::string>();
                auto tool = ParseYamlTool(name, entry.second);
                if (tool.IsErr()) {
                    return Result<AppConfig, Error>::Err(std::move(tool).Error());
                }
                config.tools[name] = std::move(tool).Value();
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("toolsrv", kVersion);

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--transport")
        .help("Transport: stdio or http");
    program.add_argument("--host")
        .help("HTTP bind address");
    program.add_argument("--port")
        .help("HTTP port")
        .scan<'i', int>();
    program.add_argument("--log-level")
        .help("Log level: debug, info, warn, error");
    program.add_argument("--log-json")
        .help("Log JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Append JSON log lines to this file");
    program.add_argument("-v", "--verbose")
        .help("Debug logging")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored logs")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored logs")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliOptions cli;
    if (auto val = program.present("--config")) {
        cli.config_path = *val;
    }
    if (auto val = program.present("--transport")) {
        auto kind = ParseTransportKind(*val);
        if (!kind) {
            return Result<CliOptions, Error>::Err(
                MakeConfigError("Invalid --transport: " + *val));
        }
        cli.transport = *kind;
    }
    if (auto val = program.present("--host")) {
        cli.host = *val;
    }
    if (auto val = program.present<int>("--port")) {
        if (*val <= 0 || *val > std::numeric_limits<uint16_t>::max()) {
            return Result<CliOptions, Error>::Err(
                MakeConfigError("Invalid --port: " + std::to_string(*val)));
        }
        cli.port = static_cast<uint16_t>(*val);
    }
    if (auto val = program.present("--log-level")) {
        auto level = ParseLogLevel(*val);
        if (!level) {
            return Result<CliOptions, Error>::Err(
                MakeConfigError("Invalid --log-level: " + *val));
        }
        cli.log_level = *level;
    }
    cli.log_json = program.get<bool>("--log-json");
    if (auto val = program.present("--log-file")) {
        cli.log_file = *val;
    }
    cli.verbose = program.get<bool>("--verbose");
    if (program.get<bool>("--no-color")) {
        cli.color = false;
    } else if (program.get<bool>("--color")) {
        cli.color = true;
    }

    return Result<CliOptions, Error>::Ok(std::move(cli));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& base, const CliOptions& cli) {
    AppConfig merged = base;

    if (cli.transport) {
        merged.server.transport = *cli.transport;
    }
    if (cli.host) {
        merged.server.host = *cli.host;
    }
    if (cli.port) {
        merged.server.port = *cli.port;
    }
    if (cli.log_level) {
        merged.logging.level = *cli.log_level;
    }
    if (cli.verbose) {
        merged.logging.level = LogLevel::Debug;
    }
    if (cli.log_json) {
        merged.logging.json = true;
    }
    if (cli.log_file) {
        merged.logging.file = cli.log_file;
    }
    if (cli.color) {
        merged.logging.color = cli.color;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ApplyEnvOverrides
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ApplyEnvOverrides(AppConfig config,
                                           const std::map<std::string, std::string>& env) {
    for (const auto& [key, value] : env) {
        if (key == "MCP_SERVER_HOST") {
            config.server.host = value;
        } else if (key == "MCP_SERVER_PORT") {
            int port = 0;
            try {
                port = std::stoi(value);
            } catch (const std::exception&) {
                return Result<AppConfig, Error>::Err(
                    MakeConfigError("MCP_SERVER_PORT is not a number: " + value));
            }
            if (port <= 0 || port > std::numeric_limits<uint16_t>::max()) {
                return Result<AppConfig, Error>::Err(
                    MakeConfigError("MCP_SERVER_PORT out of range: " + value));
            }
            config.server.port = static_cast<uint16_t>(port);
        } else if (key == "MCP_SERVER_NAME") {
            config.server.name = value;
        } else if (key == "DEBUG_MODE") {
            const auto flag = ToLower(value);
            if (flag == "true" || flag == "1" || flag == "yes") {
                config.logging.level = LogLevel::Debug;
            }
        } else {
            // TOOLNAME__KEY=value
            const auto separator = key.find("__");
            if (separator == std::string::npos || separator == 0 ||
                separator + 2 >= key.size()) {
                continue;
            }
            const auto tool = ToLower(key.substr(0, separator));
            const auto setting = ToLower(key.substr(separator + 2));
            config.tools[tool].settings[setting] = EnvValueToJson(value);
        }
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

std::map<std::string, std::string> EnvironmentSnapshot() {
    std::map<std::string, std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string line(*entry);
        const auto eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        env.emplace(line.substr(0, eq), line.substr(eq + 1));
    }
    return env;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    auto positive = [](int value, const std::string& field) -> Result<void, Error> {
        if (value <= 0) {
            return Result<void, Error>::Err(MakeConfigError(
                field + " must be positive, got " + std::to_string(value)));
        }
        return Result<void, Error>::Ok();
    };

    if (config.server.name.empty()) {
        return Result<void, Error>::Err(MakeConfigError("server.name must not be empty"));
    }
    if (config.server.transport == TransportKind::Http) {
        if (config.server.host.empty()) {
            return Result<void, Error>::Err(MakeConfigError("Missing required field: host"));
        }
        if (config.server.port == 0) {
            return Result<void, Error>::Err(MakeConfigError("Invalid port: 0"));
        }
    }

    const std::pair<int, const char*> checks[] = {
        {config.limits.global_max_in_flight, "limits.global_max_in_flight"},
        {config.limits.per_tool_max_in_flight, "limits.per_tool_max_in_flight"},
        {config.limits.default_timeout_ms, "limits.default_timeout_ms"},
        {config.limits.admission_timeout_ms, "limits.admission_timeout_ms"},
        {config.limits.retention_seconds, "limits.retention_seconds"},
        {config.context.ttl_seconds, "context.ttl_seconds"},
        {config.context.sweep_interval_seconds, "context.sweep_interval_seconds"},
    };
    for (const auto& [value, field] : checks) {
        auto checked = positive(value, field);
        if (checked.IsErr()) {
            return checked;
        }
    }
    if (config.limits.sync_wait_ms < 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "limits.sync_wait_ms must not be negative, got " +
            std::to_string(config.limits.sync_wait_ms)));
    }
    if (config.events.buffer_capacity < 2) {
        return Result<void, Error>::Err(MakeConfigError(
            "events.buffer_capacity must be at least 2, got " +
            std::to_string(config.events.buffer_capacity)));
    }

    for (const auto& [name, tool] : config.tools) {
        const auto prefix = "tools." + name + ".";
        if (tool.capacity && *tool.capacity < 1) {
            return Result<void, Error>::Err(
                MakeConfigError(prefix + "rate_limit.capacity must be at least 1"));
        }
        if (tool.refill_rate && !(*tool.refill_rate > 0.0)) {
            return Result<void, Error>::Err(
                MakeConfigError(prefix + "rate_limit.refill_rate must be positive"));
        }
        if (tool.mode) {
            if (!ParseAdmissionMode(*tool.mode)) {
                return Result<void, Error>::Err(MakeConfigError(
                    prefix + "rate_limit.mode must be reject or queue, got " + *tool.mode));
            }
        }
        if (tool.queue_depth && *tool.queue_depth < 0) {
            return Result<void, Error>::Err(
                MakeConfigError(prefix + "rate_limit.queue_depth must not be negative"));
        }
        if (tool.mode && ParseAdmissionMode(*tool.mode) == AdmissionMode::Queue &&
            (!tool.queue_depth || *tool.queue_depth < 1)) {
            return Result<void, Error>::Err(
                MakeConfigError(prefix + "queue mode needs rate_limit.queue_depth >= 1"));
        }
        if (tool.max_in_flight && *tool.max_in_flight < 1) {
            return Result<void, Error>::Err(
                MakeConfigError(prefix + "max_in_flight must be at least 1"));
        }
        if (tool.timeout_ms && *tool.timeout_ms <= 0) {
            return Result<void, Error>::Err(
                MakeConfigError(prefix + "timeout_ms must be positive"));
        }
    }
    return Result<void, Error>::Ok();
}

} // namespace toolsrv
