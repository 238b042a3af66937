#include <catch2/catch_test_macros.hpp>

#include <toolsrv/config/config_loader.hpp>

#include <cstdlib>
#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace toolsrv;

// ===========================================================================
// Helper: path to test data files
// ===========================================================================

namespace {

std::string TestDataPath(const std::string& filename) {
    return std::string(TOOLSRV_TESTDATA_DIR) + "/" + filename;
}

Result<CliOptions, Error> ParseArgs(std::vector<const char*> args) {
    args.insert(args.begin(), "toolsrv");
    return LoadFromCli(static_cast<int>(args.size()), args.data());
}

} // anonymous namespace

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid full config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.server.name == "toolsrv-dev");
    CHECK(config.server.transport == TransportKind::Http);
    CHECK(config.server.host == "0.0.0.0");
    CHECK(config.server.port == 9000);

    CHECK(config.limits.global_max_in_flight == 8);
    CHECK(config.limits.per_tool_max_in_flight == 2);
    CHECK(config.limits.default_timeout_ms == 5000);
    CHECK(config.limits.admission_timeout_ms == 1000);
    CHECK(config.limits.sync_wait_ms == 100);
    CHECK(config.limits.retention_seconds == 60);

    CHECK(config.context.ttl_seconds == 600);
    CHECK(config.context.sweep_interval_seconds == 10);
    CHECK(config.events.buffer_capacity == 64);

    CHECK(config.logging.level == LogLevel::Debug);
    CHECK(config.logging.json);
    CHECK(config.logging.color == std::optional<bool>(false));
    CHECK_FALSE(config.logging.file.has_value());

    REQUIRE(config.tools.size() == 2);
    const auto& echo = config.tools.at("echo");
    CHECK(echo.enabled == std::optional<bool>(true));
    CHECK(echo.capacity == std::optional<int>(2));
    CHECK(echo.refill_rate == std::optional<double>(0.5));
    CHECK(echo.mode == std::optional<std::string>("queue"));
    CHECK(echo.queue_depth == std::optional<int>(4));
    CHECK(echo.max_in_flight == std::optional<int>(1));
    CHECK(echo.timeout_ms == std::optional<int>(250));

    CHECK(config.tools.at("sleep").enabled == std::optional<bool>(false));
}

TEST_CASE("LoadFromYaml: tool settings keep their scalar types", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& settings = result.Value().tools.at("echo").settings;

    CHECK(settings["greeting"] == "42");
    CHECK(settings["retries"] == 3);
    CHECK(settings["ratio"] == 0.25);
    CHECK(settings["verbose"] == true);
    CHECK(settings["tags"] == nlohmann::json::array({"a", "b"}));
}

TEST_CASE("LoadFromYaml: missing sections keep defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("minimal_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    const AppConfig defaults;

    CHECK(config.server.name == "minimal");
    CHECK(config.server.transport == TransportKind::Stdio);
    CHECK(config.server.port == defaults.server.port);
    CHECK(config.limits.sync_wait_ms == defaults.limits.sync_wait_ms);
    CHECK(config.context.ttl_seconds == defaults.context.ttl_seconds);
    CHECK(config.tools.empty());
}

TEST_CASE("LoadFromYaml: errors are config errors", "[config][yaml]") {
    auto check_config_error = [](const std::string& file) {
        auto result = LoadFromYaml(TestDataPath(file));
        REQUIRE(result.IsErr());
        CHECK(result.Error().category == ErrorCategory::Config);
        CHECK(result.Error().ExitCode() == 1);
        return result.Error().message;
    };

    SECTION("nonexistent file") {
        check_config_error("does_not_exist.yaml");
    }
    SECTION("malformed YAML") {
        check_config_error("malformed.yaml");
    }
    SECTION("unknown transport") {
        auto message = check_config_error("invalid_transport.yaml");
        CHECK(message.find("carrier-pigeon") != std::string::npos);
    }
    SECTION("unknown log level") {
        check_config_error("invalid_log_level.yaml");
    }
    SECTION("tool settings not a mapping") {
        auto message = check_config_error("invalid_tool_settings.yaml");
        CHECK(message.find("echo") != std::string::npos);
    }
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: no flags leaves everything unset", "[config][cli]") {
    auto result = ParseArgs({});
    REQUIRE(result.IsOk());
    const auto& cli = result.Value();
    CHECK_FALSE(cli.config_path.has_value());
    CHECK_FALSE(cli.transport.has_value());
    CHECK_FALSE(cli.port.has_value());
    CHECK_FALSE(cli.log_json);
    CHECK_FALSE(cli.verbose);
    CHECK_FALSE(cli.color.has_value());
}

TEST_CASE("LoadFromCli: all flags", "[config][cli]") {
    auto result = ParseArgs({"--config", "server.yaml", "--transport", "sse",
                             "--host", "localhost", "--port", "8080",
                             "--log-level", "warn", "--log-json",
                             "--log-file", "/tmp/toolsrv.log", "--verbose", "--no-color"});
    REQUIRE(result.IsOk());
    const auto& cli = result.Value();
    CHECK(cli.config_path == std::optional<std::string>("server.yaml"));
    CHECK(cli.transport == std::optional<TransportKind>(TransportKind::Http));
    CHECK(cli.host == std::optional<std::string>("localhost"));
    CHECK(cli.port == std::optional<uint16_t>(8080));
    CHECK(cli.log_level == std::optional<LogLevel>(LogLevel::Warn));
    CHECK(cli.log_json);
    CHECK(cli.log_file == std::optional<std::string>("/tmp/toolsrv.log"));
    CHECK(cli.verbose);
    CHECK(cli.color == std::optional<bool>(false));
}

TEST_CASE("LoadFromCli: invalid values", "[config][cli]") {
    SECTION("transport") {
        auto result = ParseArgs({"--transport", "udp"});
        REQUIRE(result.IsErr());
        CHECK(result.Error().category == ErrorCategory::Config);
    }
    SECTION("port out of range") {
        auto result = ParseArgs({"--port", "70000"});
        REQUIRE(result.IsErr());
        CHECK(result.Error().message.find("--port") != std::string::npos);
    }
    SECTION("log level") {
        CHECK(ParseArgs({"--log-level", "chatty"}).IsErr());
    }
    SECTION("unknown flag") {
        CHECK(ParseArgs({"--frobnicate"}).IsErr());
    }
}

// ===========================================================================
// MergeConfigs
// ===========================================================================

TEST_CASE("MergeConfigs: CLI flags override the file", "[config][merge]") {
    AppConfig base;
    base.server.host = "file-host";
    base.server.port = 1111;
    base.logging.level = LogLevel::Warn;

    CliOptions cli;
    cli.port = 2222;
    cli.log_json = true;

    auto merged = MergeConfigs(base, cli);
    CHECK(merged.server.host == "file-host");
    CHECK(merged.server.port == 2222);
    CHECK(merged.logging.level == LogLevel::Warn);
    CHECK(merged.logging.json);
}

TEST_CASE("MergeConfigs: verbose wins over log level", "[config][merge]") {
    CliOptions cli;
    cli.log_level = LogLevel::Error;
    cli.verbose = true;
    CHECK(MergeConfigs(AppConfig{}, cli).logging.level == LogLevel::Debug);
}

// ===========================================================================
// ApplyEnvOverrides
// ===========================================================================

TEST_CASE("ApplyEnvOverrides: server variables", "[config][env]") {
    auto result = ApplyEnvOverrides(AppConfig{}, {{"MCP_SERVER_HOST", "10.0.0.1"},
                                                  {"MCP_SERVER_PORT", "7000"},
                                                  {"MCP_SERVER_NAME", "from-env"},
                                                  {"DEBUG_MODE", "true"},
                                                  {"PATH", "/usr/bin"}});
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    CHECK(config.server.host == "10.0.0.1");
    CHECK(config.server.port == 7000);
    CHECK(config.server.name == "from-env");
    CHECK(config.logging.level == LogLevel::Debug);
    CHECK(config.tools.empty());
}

TEST_CASE("ApplyEnvOverrides: DEBUG_MODE false keeps the level", "[config][env]") {
    auto result = ApplyEnvOverrides(AppConfig{}, {{"DEBUG_MODE", "no"}});
    REQUIRE(result.IsOk());
    CHECK(result.Value().logging.level == LogLevel::Info);
}

TEST_CASE("ApplyEnvOverrides: per-tool settings", "[config][env]") {
    AppConfig base;
    base.tools["echo"].settings["greeting"] = "from-file";
    base.tools["echo"].settings["keep"] = 1;

    auto result = ApplyEnvOverrides(base, {{"ECHO__GREETING", "hello"},
                                           {"SLEEP__MAX_MS", "5000"},
                                           {"SLEEP__STRICT", "true"},
                                           {"__ORPHAN", "x"},
                                           {"TRAILING__", "x"}});
    REQUIRE(result.IsOk());
    const auto& tools = result.Value().tools;
    CHECK(tools.at("echo").settings["greeting"] == "hello");
    CHECK(tools.at("echo").settings["keep"] == 1);
    CHECK(tools.at("sleep").settings["max_ms"] == 5000);
    CHECK(tools.at("sleep").settings["strict"] == true);
    CHECK(tools.size() == 2);
}

TEST_CASE("ApplyEnvOverrides: invalid port", "[config][env]") {
    CHECK(ApplyEnvOverrides(AppConfig{}, {{"MCP_SERVER_PORT", "abc"}}).IsErr());
    CHECK(ApplyEnvOverrides(AppConfig{}, {{"MCP_SERVER_PORT", "0"}}).IsErr());
    CHECK(ApplyEnvOverrides(AppConfig{}, {{"MCP_SERVER_PORT", "65536"}}).IsErr());
}

TEST_CASE("EnvironmentSnapshot: reads the process environment", "[config][env]") {
    setenv("TOOLSRV_TEST_MARKER", "present", 1);
    auto env = EnvironmentSnapshot();
    unsetenv("TOOLSRV_TEST_MARKER");
    REQUIRE(env.count("TOOLSRV_TEST_MARKER") == 1);
    CHECK(env.at("TOOLSRV_TEST_MARKER") == "present");
}

// ===========================================================================
// ValidateConfig
// ===========================================================================

TEST_CASE("ValidateConfig: defaults are valid", "[config][validate]") {
    CHECK(ValidateConfig(AppConfig{}).IsOk());
}

TEST_CASE("ValidateConfig: loaded full config is valid", "[config][validate]") {
    auto loaded = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(loaded.IsOk());
    CHECK(ValidateConfig(loaded.Value()).IsOk());
}

TEST_CASE("ValidateConfig: rejects bad values", "[config][validate]") {
    AppConfig config;

    SECTION("empty server name") {
        config.server.name.clear();
    }
    SECTION("http without host") {
        config.server.transport = TransportKind::Http;
        config.server.host.clear();
    }
    SECTION("http on port 0") {
        config.server.transport = TransportKind::Http;
        config.server.port = 0;
    }
    SECTION("non-positive limit") {
        config.limits.global_max_in_flight = 0;
    }
    SECTION("negative sync wait") {
        config.limits.sync_wait_ms = -1;
    }
    SECTION("zero ttl") {
        config.context.ttl_seconds = 0;
    }
    SECTION("event buffer too small") {
        config.events.buffer_capacity = 1;
    }
    SECTION("tool capacity") {
        config.tools["echo"].capacity = 0;
    }
    SECTION("tool refill rate") {
        config.tools["echo"].refill_rate = 0.0;
    }
    SECTION("tool mode") {
        config.tools["echo"].mode = "drop";
    }
    SECTION("queue mode without depth") {
        config.tools["echo"].mode = "queue";
    }
    SECTION("tool max in flight") {
        config.tools["echo"].max_in_flight = 0;
    }
    SECTION("tool timeout") {
        config.tools["echo"].timeout_ms = -5;
    }

    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("ValidateConfig: stdio ignores the HTTP port", "[config][validate]") {
    AppConfig config;
    config.server.port = 0;
    CHECK(ValidateConfig(config).IsOk());
}

TEST_CASE("ParseTransportKind: names and aliases", "[config]") {
    CHECK(ParseTransportKind("stdio") == std::optional<TransportKind>(TransportKind::Stdio));
    CHECK(ParseTransportKind("HTTP") == std::optional<TransportKind>(TransportKind::Http));
    CHECK(ParseTransportKind("sse") == std::optional<TransportKind>(TransportKind::Http));
    CHECK_FALSE(ParseTransportKind("grpc").has_value());
    CHECK(std::string(TransportKindName(TransportKind::Http)) == "http");
}
