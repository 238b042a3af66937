#pragma once

#include <toolsrv/config/app_config.hpp>
#include <toolsrv/context/context_store.hpp>
#include <toolsrv/core/clock.hpp>
#include <toolsrv/core/result.hpp>
#include <toolsrv/events/event_publisher.hpp>
#include <toolsrv/exec/execution_engine.hpp>
#include <toolsrv/ratelimit/rate_limiter.hpp>
#include <toolsrv/registry/tool_registry.hpp>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string_view>
#include <thread>

namespace toolsrv {

// ---------------------------------------------------------------------------
// ServerContext: owns the registry, rate limiter, context store, event
// publisher and execution engine, wired together from one AppConfig.
//
// Context changes and execution outcomes are published as events of the
// owning session. A maintenance thread (StartMaintenance) sweeps idle
// context sessions, idle event channels and retained execution records.
// ---------------------------------------------------------------------------
class ServerContext {
public:
    explicit ServerContext(const AppConfig& config,
                           std::shared_ptr<const IClock> clock = DefaultClock());
    ~ServerContext();

    ServerContext(const ServerContext&) = delete;
    ServerContext& operator=(const ServerContext&) = delete;

    // Applies `tools.<name>` overrides from the configuration, then
    // registers. A tool disabled by configuration is skipped (Ok).
    Result<void, Error> RegisterTool(ToolDescriptor descriptor);

    // Drops the session's context and event channel.
    void CloseSession(std::string_view session_id);

    void StartMaintenance();
    void StopMaintenance();
    void RunMaintenanceOnce();

    [[nodiscard]] const AppConfig& Config() const noexcept { return config_; }
    [[nodiscard]] ToolRegistry& Registry() noexcept { return registry_; }
    [[nodiscard]] RateLimiter& Limiter() noexcept { return limiter_; }
    [[nodiscard]] ContextStore& Contexts() noexcept { return contexts_; }
    [[nodiscard]] EventPublisher& Events() noexcept { return events_; }
    [[nodiscard]] ExecutionEngine& Engine() noexcept { return engine_; }

private:
    void MaintenanceLoop();

    std::shared_ptr<const IClock> clock_;
    AppConfig config_;
    ToolRegistry registry_;
    RateLimiter limiter_;
    ContextStore contexts_;
    EventPublisher events_;
    ExecutionEngine engine_;

    std::mutex maintenance_mutex_;
    std::condition_variable maintenance_cv_;
    bool maintenance_stop_ = false;
    std::thread maintenance_thread_;
};

// Engine options derived from the `limits` section.
EngineOptions EngineOptionsFrom(const AppConfig& config);

} // namespace toolsrv
