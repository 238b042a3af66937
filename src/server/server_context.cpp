#include <toolsrv/server/server_context.hpp>

#include <toolsrv/core/log.hpp>

#include <chrono>

namespace toolsrv {

namespace {

// Overlay `tools.<name>` onto a descriptor. Settings merge key by key,
// configured values win over the tool's defaults.
ToolDescriptor ApplyToolConfig(ToolDescriptor tool, const ToolConfig& config) {
    if (config.capacity) {
        tool.rate_limit.capacity = static_cast<std::size_t>(*config.capacity);
    }
    if (config.refill_rate) {
        tool.rate_limit.refill_rate = *config.refill_rate;
    }
    if (config.mode) {
        if (auto mode = ParseAdmissionMode(*config.mode)) {
            tool.rate_limit.mode = *mode;
        }
    }
    if (config.queue_depth) {
        tool.rate_limit.queue_depth = static_cast<std::size_t>(*config.queue_depth);
    }
    if (config.max_in_flight) {
        tool.max_in_flight = static_cast<std::size_t>(*config.max_in_flight);
    }
    if (config.timeout_ms) {
        tool.timeout = std::chrono::milliseconds(*config.timeout_ms);
    }
    if (config.settings.is_object()) {
        if (!tool.settings.is_object()) {
            tool.settings = nlohmann::json::object();
        }
        tool.settings.update(config.settings);
    }
    return tool;
}

} // anonymous namespace

EngineOptions EngineOptionsFrom(const AppConfig& config) {
    EngineOptions options;
    options.global_max_in_flight = static_cast<std::size_t>(config.limits.global_max_in_flight);
    options.default_per_tool_max_in_flight =
        static_cast<std::size_t>(config.limits.per_tool_max_in_flight);
    options.default_timeout = std::chrono::milliseconds(config.limits.default_timeout_ms);
    options.retention = std::chrono::seconds(config.limits.retention_seconds);
    return options;
}

ServerContext::ServerContext(const AppConfig& config, std::shared_ptr<const IClock> clock)
    : clock_(std::move(clock)),
      config_(config),
      limiter_(clock_),
      contexts_(std::chrono::seconds(config.context.ttl_seconds), clock_),
      events_(static_cast<std::size_t>(config.events.buffer_capacity)),
      engine_(EngineOptionsFrom(config), limiter_) {
    contexts_.SetChangeListener(
        [this](const std::string& session_id, const nlohmann::json& change) {
            events_.Publish(session_id, EventKind::ContextChanged, change);
        });

    engine_.SetCompletionListener([this](const ExecutionSnapshot& snapshot) {
        if (snapshot.state == ExecutionState::Completed) {
            events_.Publish(snapshot.session_id, EventKind::Completed,
                            {{"request_id", snapshot.request_id},
                             {"tool", snapshot.tool},
                             {"result", snapshot.result.value_or(nullptr)}});
            return;
        }
        nlohmann::json payload = {{"request_id", snapshot.request_id},
                                  {"tool", snapshot.tool},
                                  {"state", ExecutionStateName(snapshot.state)}};
        if (snapshot.error) {
            payload["error"] = snapshot.error->ToJson();
        }
        events_.Publish(snapshot.session_id, EventKind::Failed, std::move(payload));
    });

    engine_.SetProgressListener(
        [this](const ExecutionSnapshot& snapshot, const nlohmann::json& progress) {
            events_.Publish(snapshot.session_id, EventKind::Progress,
                            {{"request_id", snapshot.request_id},
                             {"tool", snapshot.tool},
                             {"progress", progress}});
        });
}

ServerContext::~ServerContext() {
    StopMaintenance();
    engine_.Shutdown();
}

Result<void, Error> ServerContext::RegisterTool(ToolDescriptor descriptor) {
    auto it = config_.tools.find(descriptor.name);
    if (it != config_.tools.end()) {
        if (it->second.enabled.has_value() && !*it->second.enabled) {
            LogInfo("server", "tool " + descriptor.name + " disabled by configuration");
            return Result<void, Error>::Ok();
        }
        descriptor = ApplyToolConfig(std::move(descriptor), it->second);
    }
    return registry_.Register(std::move(descriptor));
}

void ServerContext::CloseSession(std::string_view session_id) {
    contexts_.Close(session_id);
    events_.CloseSession(session_id);
}

void ServerContext::StartMaintenance() {
    std::lock_guard<std::mutex> lock(maintenance_mutex_);
    if (maintenance_thread_.joinable()) {
        return;
    }
    maintenance_stop_ = false;
    maintenance_thread_ = std::thread([this] { MaintenanceLoop(); });
}

void ServerContext::StopMaintenance() {
    {
        std::lock_guard<std::mutex> lock(maintenance_mutex_);
        maintenance_stop_ = true;
    }
    maintenance_cv_.notify_all();
    if (maintenance_thread_.joinable()) {
        maintenance_thread_.join();
    }
}

void ServerContext::RunMaintenanceOnce() {
    const auto expired = contexts_.ExpireSweep();
    const auto channels = events_.SweepIdle(std::chrono::seconds(config_.context.ttl_seconds));
    const auto records = engine_.SweepRetained();
    if (expired + channels + records > 0) {
        LogDebug("server", "maintenance: " + std::to_string(expired) + " session(s), " +
                               std::to_string(channels) + " channel(s), " +
                               std::to_string(records) + " record(s) dropped");
    }
}

void ServerContext::MaintenanceLoop() {
    const auto interval = std::chrono::seconds(config_.context.sweep_interval_seconds);
    std::unique_lock<std::mutex> lock(maintenance_mutex_);
    while (!maintenance_cv_.wait_for(lock, interval, [this] { return maintenance_stop_; })) {
        lock.unlock();
        RunMaintenanceOnce();
        lock.lock();
    }
}

} // namespace toolsrv
