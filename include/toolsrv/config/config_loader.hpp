#pragma once

#include <toolsrv/config/app_config.hpp>
#include <toolsrv/core/result.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace toolsrv {

// Flags given on the command line. Unset members leave the file/default
// value in place.
struct CliOptions {
    std::optional<std::string> config_path;
    std::optional<TransportKind> transport;
    std::optional<std::string> host;
    std::optional<uint16_t> port;
    std::optional<LogLevel> log_level;
    bool log_json = false;
    std::optional<std::string> log_file;
    bool verbose = false;
    std::optional<bool> color;
};

std::optional<TransportKind> ParseTransportKind(std::string_view text);
const char* TransportKindName(TransportKind kind);

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments.
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv);

// CLI flags take precedence over the file.
AppConfig MergeConfigs(const AppConfig& base, const CliOptions& cli);

// MCP_SERVER_HOST, MCP_SERVER_PORT, MCP_SERVER_NAME, DEBUG_MODE and
// TOOLNAME__KEY (per-tool settings, lowercased).
Result<AppConfig, Error> ApplyEnvOverrides(AppConfig config,
                                           const std::map<std::string, std::string>& env);

// Snapshot of the process environment.
std::map<std::string, std::string> EnvironmentSnapshot();

// Validate that values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace toolsrv
