#include <toolsrv/exec/execution_engine.hpp>

#include <toolsrv/core/cancellation.hpp>
#include <toolsrv/core/log.hpp>

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <vector>

namespace toolsrv {

// ---------------------------------------------------------------------------
// ExecutionRecord: owned by the engine, guarded by its own mutex.
// ---------------------------------------------------------------------------
struct ExecutionRecord {
    std::mutex mutex;
    std::condition_variable cv;
    std::string key;
    ExecutionRequest request;
    ToolDescriptorPtr tool;
    ExecutionState state = ExecutionState::Queued;
    std::optional<nlohmann::json> result;
    std::optional<Error> error;
    std::optional<std::chrono::steady_clock::time_point> started_at;
    std::optional<std::chrono::steady_clock::time_point> ended_at;
    std::chrono::steady_clock::time_point deadline;
    CancellationSource cancel;
    // Set when the engine itself fired `cancel` (timeout or cancellation).
    bool interrupted = false;
};

namespace {

std::string RecordKey(std::string_view session_id, std::string_view request_id) {
    std::string key;
    key.reserve(session_id.size() + request_id.size() + 1);
    key.append(session_id);
    key.push_back('\x1f');
    key.append(request_id);
    return key;
}

// Caller holds record.mutex.
ExecutionSnapshot MakeSnapshot(const ExecutionRecord& record) {
    ExecutionSnapshot snapshot;
    snapshot.request_id = record.request.request_id;
    snapshot.session_id = record.request.session_id;
    snapshot.tool = record.tool->name;
    snapshot.tool_version = record.tool->version;
    snapshot.state = record.state;
    snapshot.result = record.result;
    snapshot.error = record.error;
    snapshot.submitted_at = record.request.submitted_at;
    snapshot.started_at = record.started_at;
    snapshot.ended_at = record.ended_at;
    return snapshot;
}

Error EngineError(const std::string& operation, const std::string& message,
                  ErrorCategory category) {
    return Error{operation, message, category, std::nullopt};
}

} // anonymous namespace

const char* ExecutionStateName(ExecutionState state) {
    switch (state) {
        case ExecutionState::Queued:    return "queued";
        case ExecutionState::Admitted:  return "admitted";
        case ExecutionState::Running:   return "running";
        case ExecutionState::Completed: return "completed";
        case ExecutionState::Failed:    return "failed";
        case ExecutionState::TimedOut:  return "timed_out";
        case ExecutionState::Cancelled: return "cancelled";
    }
    return "unknown";
}

bool IsTerminal(ExecutionState state) {
    return state == ExecutionState::Completed ||
           state == ExecutionState::Failed ||
           state == ExecutionState::TimedOut ||
           state == ExecutionState::Cancelled;
}

const std::string& ExecutionHandle::RequestId() const {
    return record_->request.request_id;
}

const std::string& ExecutionHandle::SessionId() const {
    return record_->request.session_id;
}

// ---------------------------------------------------------------------------
// ExecutionEngine
// ---------------------------------------------------------------------------
ExecutionEngine::ExecutionEngine(EngineOptions options, RateLimiter& limiter)
    : options_(options),
      limiter_(limiter),
      global_gate_(std::make_shared<ConcurrencyGate>(options.global_max_in_flight)),
      pool_(std::max<std::size_t>(options.global_max_in_flight, 1), "engine") {}

ExecutionEngine::~ExecutionEngine() {
    Shutdown();
}

void ExecutionEngine::SetCompletionListener(CompletionListener listener) {
    completion_listener_ = std::move(listener);
}

void ExecutionEngine::SetProgressListener(ProgressListener listener) {
    progress_listener_ = std::move(listener);
}

std::shared_ptr<ConcurrencyGate> ExecutionEngine::GateFor(const ToolDescriptor& tool) {
    const auto limit = tool.max_in_flight > 0 ? tool.max_in_flight
                                              : options_.default_per_tool_max_in_flight;
    std::lock_guard<std::mutex> lock(gates_mutex_);
    auto it = tool_gates_.find(tool.name);
    if (it == tool_gates_.end()) {
        ToolGate entry{tool.generation, std::make_shared<ConcurrencyGate>(limit)};
        it = tool_gates_.emplace(tool.name, std::move(entry)).first;
    } else if (tool.generation > it->second.generation) {
        // Only a newer registration may change the limit.
        it->second.generation = tool.generation;
        if (it->second.gate->Limit() != limit) {
            it->second.gate->SetLimit(limit);
        }
    }
    return it->second.gate;
}

ExecutionEngine::RecordPtr ExecutionEngine::FindRecord(std::string_view session_id,
                                                       std::string_view request_id) const {
    std::lock_guard<std::mutex> lock(records_mutex_);
    auto it = records_.find(RecordKey(session_id, request_id));
    if (it == records_.end()) {
        return nullptr;
    }
    return it->second;
}

Result<ExecutionHandle, Error> ExecutionEngine::Submit(ExecutionRequest request,
                                                       ToolDescriptorPtr tool) {
    if (shut_down_.load()) {
        return Result<ExecutionHandle, Error>::Err(
            EngineError("Submit", "engine is shut down", ErrorCategory::Internal));
    }
    if (!tool) {
        return Result<ExecutionHandle, Error>::Err(
            EngineError("Submit", "no tool descriptor", ErrorCategory::Validation));
    }

    auto record = std::make_shared<ExecutionRecord>();
    record->key = RecordKey(request.session_id, request.request_id);
    record->request = std::move(request);
    record->tool = std::move(tool);
    {
        std::lock_guard<std::mutex> lock(records_mutex_);
        if (records_.count(record->key) > 0) {
            return Result<ExecutionHandle, Error>::Err(EngineError(
                "Submit",
                "duplicate request id '" + record->request.request_id + "' in session",
                ErrorCategory::Validation));
        }
        records_.emplace(record->key, record);
    }

    const auto& descriptor = *record->tool;
    const auto token = record->cancel.Token();
    const auto admission_deadline = record->request.admission_deadline;

    // The global slot is taken last so a caller queued on its own tool's
    // limit or bucket never holds capacity other tools could use.
    auto tool_gate = GateFor(descriptor);
    auto entered = tool_gate->Enter(token, admission_deadline);
    if (entered.IsErr()) {
        return Abandon(record, entered.Error());
    }
    auto admitted = limiter_.Acquire(descriptor, token, admission_deadline);
    if (admitted.IsErr()) {
        tool_gate->Leave();
        return Abandon(record, admitted.Error());
    }
    auto global_entered = global_gate_->Enter(token, admission_deadline);
    if (global_entered.IsErr()) {
        tool_gate->Leave();
        return Abandon(record, global_entered.Error());
    }

    std::chrono::steady_clock::time_point deadline;
    {
        std::lock_guard<std::mutex> lock(record->mutex);
        if (record->state != ExecutionState::Queued) {
            // Cancelled between admission and here.
            global_gate_->Leave();
            tool_gate->Leave();
            return Result<ExecutionHandle, Error>::Err(
                record->error.value_or(EngineError("Submit", "execution cancelled",
                                                   ErrorCategory::Cancelled)));
        }
        const auto now = std::chrono::steady_clock::now();
        const auto timeout = record->request.timeout.value_or(
            descriptor.timeout.value_or(options_.default_timeout));
        record->state = ExecutionState::Admitted;
        record->started_at = now;
        record->deadline = now + timeout;
        deadline = record->deadline;
    }

    std::weak_ptr<ExecutionRecord> weak = record;
    timer_.Schedule(deadline, [this, weak] {
        if (auto locked = weak.lock()) {
            OnDeadline(locked);
        }
    });

    if (!pool_.Post([this, record, tool_gate] { Run(record, tool_gate); })) {
        global_gate_->Leave();
        tool_gate->Leave();
        TryFinish(record, ExecutionState::Cancelled, std::nullopt,
                  EngineError("Submit", "engine is shutting down", ErrorCategory::Cancelled));
        return Result<ExecutionHandle, Error>::Err(
            EngineError("Submit", "engine is shutting down", ErrorCategory::Cancelled));
    }

    LogDebug("engine", "admitted " + descriptor.name + " request " +
                           record->request.request_id);
    return Result<ExecutionHandle, Error>::Ok(ExecutionHandle(record));
}

Result<ExecutionHandle, Error> ExecutionEngine::Abandon(const RecordPtr& record,
                                                        Error error) {
    {
        std::lock_guard<std::mutex> lock(record->mutex);
        if (IsTerminal(record->state)) {
            // Cancel() got there first; the record keeps its terminal state.
            return Result<ExecutionHandle, Error>::Err(record->error.value_or(error));
        }
    }
    if (error.category == ErrorCategory::Cancelled) {
        TryFinish(record, ExecutionState::Cancelled, std::nullopt, error);
        return Result<ExecutionHandle, Error>::Err(std::move(error));
    }
    {
        std::lock_guard<std::mutex> lock(records_mutex_);
        auto it = records_.find(record->key);
        if (it != records_.end() && it->second == record) {
            records_.erase(it);
        }
    }
    LogDebug("engine", "admission failed for " + record->tool->name + ": " + error.message);
    return Result<ExecutionHandle, Error>::Err(std::move(error));
}

void ExecutionEngine::Run(const RecordPtr& record,
                          const std::shared_ptr<ConcurrencyGate>& tool_gate) {
    const auto& tool = *record->tool;
    ToolCall call;
    {
        std::lock_guard<std::mutex> lock(record->mutex);
        if (record->state != ExecutionState::Admitted) {
            global_gate_->Leave();
            tool_gate->Leave();
            return;
        }
        record->state = ExecutionState::Running;
        call.session_id = record->request.session_id;
        call.request_id = record->request.request_id;
        call.params = record->request.params;
        call.settings = tool.settings;
        call.cancel = record->cancel.Token();
        call.deadline = record->deadline;
    }

    std::weak_ptr<ExecutionRecord> weak = record;
    call.report_progress = [this, weak](const nlohmann::json& progress) {
        auto locked = weak.lock();
        if (!locked || !progress_listener_) {
            return;
        }
        std::lock_guard<std::mutex> lock(locked->mutex);
        if (locked->state == ExecutionState::Running) {
            progress_listener_(MakeSnapshot(*locked), progress);
        }
    };

    std::optional<Result<nlohmann::json, Error>> outcome;
    std::optional<std::string> thrown;
    try {
        outcome.emplace(tool.handler(call));
    } catch (const std::exception& e) {
        thrown = e.what();
        LogError("engine", "tool " + tool.name + " threw on request " +
                               call.request_id + ": " + e.what());
    } catch (...) {
        thrown = "non-standard exception";
        LogError("engine", "tool " + tool.name + " threw a non-standard exception on request " +
                               call.request_id);
    }

    global_gate_->Leave();
    tool_gate->Leave();

    bool finished = false;
    if (thrown.has_value()) {
        finished = TryFinish(record, ExecutionState::Failed, std::nullopt,
                             Error{"Execute", "Internal error", ErrorCategory::Internal, thrown});
    } else if (outcome->IsOk()) {
        finished = TryFinish(record, ExecutionState::Completed, outcome->Value(), std::nullopt);
    } else {
        auto error = outcome->Error();
        if (error.category != ErrorCategory::Internal) {
            error.category = ErrorCategory::ExecutionFailed;
        } else {
            LogError("engine", "tool " + tool.name + " failed internally: " + error.ToString());
        }
        finished = TryFinish(record, ExecutionState::Failed, std::nullopt, std::move(error));
    }

    if (!finished) {
        bool interrupted = false;
        {
            std::lock_guard<std::mutex> lock(record->mutex);
            interrupted = record->interrupted;
        }
        // An error return after the engine cancelled the call acknowledges
        // the interruption. A result the tool still produced is lost work.
        const bool produced = outcome.has_value() && outcome->IsOk();
        if (interrupted && !produced) {
            LogDebug("engine", "discarded result of interrupted " + tool.name + " request " +
                                   call.request_id);
        } else {
            anomalies_.fetch_add(1);
            LogWarn("engine", "late completion of " + tool.name + " request " +
                                  call.request_id + " discarded");
        }
    }
}

void ExecutionEngine::OnDeadline(const RecordPtr& record) {
    const auto& tool = *record->tool;
    const auto finished = TryFinish(
        record, ExecutionState::TimedOut, std::nullopt,
        EngineError("Execute", "tool '" + tool.name + "' exceeded its timeout",
                    ErrorCategory::ExecutionTimeout));
    if (finished) {
        LogWarn("engine", "request " + record->request.request_id + " on " + tool.name +
                              " timed out");
    }
}

bool ExecutionEngine::TryFinish(const RecordPtr& record, ExecutionState state,
                                std::optional<nlohmann::json> result,
                                std::optional<Error> error) {
    ExecutionSnapshot snapshot;
    {
        std::lock_guard<std::mutex> lock(record->mutex);
        if (IsTerminal(record->state)) {
            return false;
        }
        record->state = state;
        record->result = std::move(result);
        record->error = std::move(error);
        record->ended_at = std::chrono::steady_clock::now();
        record->interrupted = state == ExecutionState::TimedOut ||
                              state == ExecutionState::Cancelled;
        snapshot = MakeSnapshot(*record);
    }
    record->cv.notify_all();

    if (state == ExecutionState::TimedOut || state == ExecutionState::Cancelled) {
        record->cancel.Cancel();
    }
    if (completion_listener_) {
        completion_listener_(snapshot);
    }
    return true;
}

ExecutionSnapshot ExecutionEngine::Wait(const ExecutionHandle& handle,
                                        std::chrono::milliseconds timeout) const {
    auto& record = *handle.record_;
    std::unique_lock<std::mutex> lock(record.mutex);
    record.cv.wait_for(lock, timeout, [&record] { return IsTerminal(record.state); });
    return MakeSnapshot(record);
}

Result<ExecutionSnapshot, Error> ExecutionEngine::Cancel(std::string_view session_id,
                                                         std::string_view request_id) {
    auto record = FindRecord(session_id, request_id);
    if (!record) {
        return Result<ExecutionSnapshot, Error>::Err(EngineError(
            "Cancel", "unknown request id '" + std::string(request_id) + "'",
            ErrorCategory::Validation));
    }
    if (TryFinish(record, ExecutionState::Cancelled, std::nullopt,
                  EngineError("Execute", "execution cancelled by client",
                              ErrorCategory::Cancelled))) {
        LogInfo("engine", "cancelled request " + std::string(request_id));
    }
    std::lock_guard<std::mutex> lock(record->mutex);
    return Result<ExecutionSnapshot, Error>::Ok(MakeSnapshot(*record));
}

Result<ExecutionHandle, Error> ExecutionEngine::Find(std::string_view session_id,
                                                     std::string_view request_id) const {
    auto record = FindRecord(session_id, request_id);
    if (!record) {
        return Result<ExecutionHandle, Error>::Err(EngineError(
            "Find", "unknown request id '" + std::string(request_id) + "'",
            ErrorCategory::Validation));
    }
    return Result<ExecutionHandle, Error>::Ok(ExecutionHandle(record));
}

Result<ExecutionSnapshot, Error> ExecutionEngine::Snapshot(std::string_view session_id,
                                                           std::string_view request_id) const {
    auto record = FindRecord(session_id, request_id);
    if (!record) {
        return Result<ExecutionSnapshot, Error>::Err(EngineError(
            "Snapshot", "unknown request id '" + std::string(request_id) + "'",
            ErrorCategory::Validation));
    }
    std::lock_guard<std::mutex> lock(record->mutex);
    return Result<ExecutionSnapshot, Error>::Ok(MakeSnapshot(*record));
}

std::size_t ExecutionEngine::InFlight() const {
    return global_gate_->InFlight();
}

std::size_t ExecutionEngine::InFlight(std::string_view tool) const {
    std::lock_guard<std::mutex> lock(gates_mutex_);
    auto it = tool_gates_.find(tool);
    return it == tool_gates_.end() ? 0 : it->second.gate->InFlight();
}

std::size_t ExecutionEngine::RecordCount() const {
    std::lock_guard<std::mutex> lock(records_mutex_);
    return records_.size();
}

std::size_t ExecutionEngine::SweepRetained() {
    const auto cutoff = std::chrono::steady_clock::now() - options_.retention;
    std::size_t removed = 0;
    std::lock_guard<std::mutex> lock(records_mutex_);
    for (auto it = records_.begin(); it != records_.end();) {
        bool expired = false;
        {
            std::lock_guard<std::mutex> record_lock(it->second->mutex);
            expired = IsTerminal(it->second->state) &&
                      it->second->ended_at.has_value() &&
                      *it->second->ended_at < cutoff;
        }
        if (expired) {
            it = records_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void ExecutionEngine::Shutdown() {
    if (shut_down_.exchange(true)) {
        return;
    }
    std::vector<RecordPtr> live;
    {
        std::lock_guard<std::mutex> lock(records_mutex_);
        live.reserve(records_.size());
        for (const auto& [key, record] : records_) {
            live.push_back(record);
        }
    }
    std::size_t cancelled = 0;
    for (const auto& record : live) {
        if (TryFinish(record, ExecutionState::Cancelled, std::nullopt,
                      EngineError("Shutdown", "server shutting down",
                                  ErrorCategory::Cancelled))) {
            ++cancelled;
        }
    }
    if (cancelled > 0) {
        LogInfo("engine", "cancelled " + std::to_string(cancelled) +
                              " execution(s) on shutdown");
    }
    pool_.Shutdown();
    timer_.Stop();
}

} // namespace toolsrv
