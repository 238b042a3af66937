#include <toolsrv/config/config_loader.hpp>
#include <toolsrv/core/log.hpp>
#include <toolsrv/core/terminal.hpp>
#include <toolsrv/core/version.hpp>
#include <toolsrv/mcp/mcp_server.hpp>
#include <toolsrv/router/message_router.hpp>
#include <toolsrv/server/server_context.hpp>
#include <toolsrv/tools/builtin_tools.hpp>
#include <toolsrv/transport/http_transport.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitInternal = 99;

std::atomic<bool> g_stop_requested{false};

extern "C" void OnStopSignal(int /*signal*/) {
    g_stop_requested.store(true);
}

int Fail(const toolsrv::Error& error) {
    std::cerr << "Error: " << error.ToString() << '\n';
    return error.ExitCode();
}

// Precedence: defaults < YAML < environment < command line.
toolsrv::Result<toolsrv::AppConfig, toolsrv::Error> ResolveConfig(
    const toolsrv::CliOptions& cli) {
    using namespace toolsrv;
    using ConfigResult = Result<AppConfig, Error>;

    AppConfig config;
    if (cli.config_path.has_value()) {
        auto loaded = LoadFromYaml(*cli.config_path);
        if (loaded.IsErr()) {
            return loaded;
        }
        config = std::move(loaded).Value();
    }

    auto with_env = ApplyEnvOverrides(std::move(config), EnvironmentSnapshot());
    if (with_env.IsErr()) {
        return with_env;
    }
    config = MergeConfigs(std::move(with_env).Value(), cli);

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        return ConfigResult::Err(valid.Error());
    }
    return ConfigResult::Ok(std::move(config));
}

void InitLogging(const toolsrv::LoggingConfig& logging) {
    using namespace toolsrv;

    if (logging.file.has_value()) {
        auto sink = std::make_unique<FileSink>(*logging.file);
        if (sink->IsOpen()) {
            InitGlobalLogger(std::move(sink), logging.level);
            return;
        }
        std::cerr << "Warning: cannot open log file " << *logging.file
                  << ", logging to stderr\n";
    }
    if (logging.json) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), logging.level);
        return;
    }
    const bool force_color = logging.color.has_value() && *logging.color;
    const bool force_no_color = logging.color.has_value() && !*logging.color;
    InitGlobalLogger(
        std::make_unique<ConsoleSink>(ResolveLogColor(force_color, force_no_color)),
        logging.level);
}

toolsrv::Result<void, toolsrv::Error> ServeHttp(toolsrv::McpServer& mcp,
                                                toolsrv::ServerContext& context) {
    using namespace toolsrv;

    const auto& server = context.Config().server;
    HttpOptions options;
    options.host = server.host;
    options.port = server.port;
    HttpTransport transport(mcp, context, options);

    std::signal(SIGINT, OnStopSignal);
    std::signal(SIGTERM, OnStopSignal);

    std::atomic<bool> finished{false};
    std::thread watcher([&transport, &finished] {
        while (!finished.load()) {
            if (g_stop_requested.load()) {
                LogInfo("main", "shutdown requested");
                transport.Stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    auto served = transport.Start();
    finished.store(true);
    watcher.join();
    return served;
}

int Run(int argc, const char* const* argv) {
    using namespace toolsrv;

    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        return Fail(cli.Error());
    }

    auto resolved = ResolveConfig(cli.Value());
    if (resolved.IsErr()) {
        return Fail(resolved.Error());
    }
    const auto config = std::move(resolved).Value();

    InitLogging(config.logging);
    LogInfo("main", std::string("toolsrv ") + kVersion + " starting (" +
                        TransportKindName(config.server.transport) + ")");

    ServerContext context(config);
    auto builtins = RegisterBuiltinTools(context);
    if (builtins.IsErr()) {
        return Fail(builtins.Error());
    }

    MessageRouter router(context, RouterOptionsFrom(config));
    McpOptions mcp_options;
    mcp_options.name = config.server.name;
    McpServer mcp(router, context.Events(), mcp_options);

    context.StartMaintenance();

    if (config.server.transport == TransportKind::Http) {
        auto served = ServeHttp(mcp, context);
        if (served.IsErr()) {
            LogError("main", served.Error().ToString());
            return Fail(served.Error());
        }
    } else {
        mcp.Run();
    }

    context.StopMaintenance();
    context.Engine().Shutdown();
    LogInfo("main", "stopped");
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    try {
        return Run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Internal error: " << e.what() << '\n';
        return kExitInternal;
    }
}
