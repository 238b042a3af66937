#pragma once

#include <toolsrv/core/result.hpp>
#include <toolsrv/core/worker_pool.hpp>
#include <toolsrv/exec/concurrency_gate.hpp>
#include <toolsrv/exec/deadline_timer.hpp>
#include <toolsrv/ratelimit/rate_limiter.hpp>
#include <toolsrv/registry/tool_descriptor.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace toolsrv {

// ---------------------------------------------------------------------------
// Execution state machine
//
//   Queued -> Admitted -> Running -> { Completed | Failed | TimedOut | Cancelled }
//
// Any non-terminal state may also move straight to Cancelled. Exactly one
// terminal transition happens per record.
// ---------------------------------------------------------------------------
enum class ExecutionState {
    Queued,
    Admitted,
    Running,
    Completed,
    Failed,
    TimedOut,
    Cancelled,
};

const char* ExecutionStateName(ExecutionState state);
bool IsTerminal(ExecutionState state);

struct ExecutionRequest {
    std::string request_id;
    std::string session_id;
    std::string tool;
    nlohmann::json params = nlohmann::json::object();
    std::chrono::steady_clock::time_point submitted_at = std::chrono::steady_clock::now();
    // Absolute bound on the time spent in gates and the rate-limiter queue.
    std::optional<std::chrono::steady_clock::time_point> admission_deadline;
    // Run timeout, measured from admission. Falls back to the tool's, then
    // the engine default.
    std::optional<std::chrono::milliseconds> timeout;
};

// Copy of an execution record's observable state.
struct ExecutionSnapshot {
    std::string request_id;
    std::string session_id;
    std::string tool;
    std::string tool_version;
    ExecutionState state = ExecutionState::Queued;
    std::optional<nlohmann::json> result;
    std::optional<Error> error;
    std::chrono::steady_clock::time_point submitted_at;
    std::optional<std::chrono::steady_clock::time_point> started_at;
    std::optional<std::chrono::steady_clock::time_point> ended_at;
};

struct EngineOptions {
    std::size_t global_max_in_flight = 16;
    std::size_t default_per_tool_max_in_flight = 4;
    std::chrono::milliseconds default_timeout{30000};
    std::chrono::seconds retention{300};
};

struct ExecutionRecord;

// Opaque reference to a submitted execution.
class ExecutionHandle {
public:
    ExecutionHandle() = default;

    [[nodiscard]] bool Valid() const noexcept { return record_ != nullptr; }
    [[nodiscard]] const std::string& RequestId() const;
    [[nodiscard]] const std::string& SessionId() const;

private:
    friend class ExecutionEngine;
    explicit ExecutionHandle(std::shared_ptr<ExecutionRecord> record)
        : record_(std::move(record)) {}

    std::shared_ptr<ExecutionRecord> record_;
};

// ---------------------------------------------------------------------------
// ExecutionEngine: admits, runs and tracks tool invocations.
//
// Submit() blocks the caller through admission: the per-tool in-flight gate,
// the global in-flight gate and the rate limiter. Admitted invocations run
// on a worker pool sized to the global cap. A deadline thread times out
// invocations that outlive their timeout; the tool is signalled through its
// cancellation token and the record becomes TimedOut immediately.
//
// Listeners must be installed before the first Submit.
// ---------------------------------------------------------------------------
class ExecutionEngine {
public:
    using CompletionListener = std::function<void(const ExecutionSnapshot&)>;
    using ProgressListener =
        std::function<void(const ExecutionSnapshot&, const nlohmann::json& progress)>;

    ExecutionEngine(EngineOptions options, RateLimiter& limiter);
    ~ExecutionEngine();

    ExecutionEngine(const ExecutionEngine&) = delete;
    ExecutionEngine& operator=(const ExecutionEngine&) = delete;

    // Called once per record with its terminal snapshot.
    void SetCompletionListener(CompletionListener listener);
    // Called for each progress report while the record is Running.
    void SetProgressListener(ProgressListener listener);

    // ValidationError for a duplicate request id within the session; gate
    // and rate-limiter errors otherwise. On a non-cancellation admission
    // failure the record is discarded.
    Result<ExecutionHandle, Error> Submit(ExecutionRequest request, ToolDescriptorPtr tool);

    // Blocks until the record is terminal or `timeout` elapses.
    ExecutionSnapshot Wait(const ExecutionHandle& handle,
                           std::chrono::milliseconds timeout) const;

    // Moves a non-terminal record to Cancelled. A record that is already
    // terminal is returned unchanged.
    Result<ExecutionSnapshot, Error> Cancel(std::string_view session_id,
                                            std::string_view request_id);
    [[nodiscard]] Result<ExecutionHandle, Error> Find(std::string_view session_id,
                                                      std::string_view request_id) const;
    [[nodiscard]] Result<ExecutionSnapshot, Error> Snapshot(std::string_view session_id,
                                                            std::string_view request_id) const;

    [[nodiscard]] std::size_t InFlight() const;
    [[nodiscard]] std::size_t InFlight(std::string_view tool) const;
    [[nodiscard]] std::uint64_t AnomalyCount() const noexcept { return anomalies_.load(); }
    [[nodiscard]] std::size_t RecordCount() const;

    // Drops terminal records older than the retention window. Returns how many.
    std::size_t SweepRetained();

    // Cancels every non-terminal record and joins the workers. Idempotent.
    void Shutdown();

private:
    using RecordPtr = std::shared_ptr<ExecutionRecord>;

    std::shared_ptr<ConcurrencyGate> GateFor(const ToolDescriptor& tool);
    RecordPtr FindRecord(std::string_view session_id, std::string_view request_id) const;
    Result<ExecutionHandle, Error> Abandon(const RecordPtr& record, Error error);
    void Run(const RecordPtr& record, const std::shared_ptr<ConcurrencyGate>& tool_gate);
    void OnDeadline(const RecordPtr& record);
    bool TryFinish(const RecordPtr& record, ExecutionState state,
                   std::optional<nlohmann::json> result, std::optional<Error> error);

    EngineOptions options_;
    RateLimiter& limiter_;
    CompletionListener completion_listener_;
    ProgressListener progress_listener_;

    std::shared_ptr<ConcurrencyGate> global_gate_;
    struct ToolGate {
        std::uint64_t generation = 0;
        std::shared_ptr<ConcurrencyGate> gate;
    };

    mutable std::mutex gates_mutex_;
    std::map<std::string, ToolGate, std::less<>> tool_gates_;

    mutable std::mutex records_mutex_;
    std::unordered_map<std::string, RecordPtr> records_;

    std::atomic<std::uint64_t> anomalies_{0};
    std::atomic<bool> shut_down_{false};

    DeadlineTimer timer_;
    WorkerPool pool_;
};

} // namespace toolsrv
