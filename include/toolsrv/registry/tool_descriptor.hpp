#pragma once

#include <toolsrv/core/cancellation.hpp>
#include <toolsrv/core/result.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace toolsrv {

// ---------------------------------------------------------------------------
// Rate-limit policy
// ---------------------------------------------------------------------------
enum class AdmissionMode {
    Reject,
    Queue,
};

const char* AdmissionModeName(AdmissionMode mode);
std::optional<AdmissionMode> ParseAdmissionMode(std::string_view text);

struct RateLimitPolicy {
    std::size_t capacity = 10;
    double refill_rate = 10.0;  // tokens per second
    AdmissionMode mode = AdmissionMode::Reject;
    std::size_t queue_depth = 0;

    bool operator==(const RateLimitPolicy& other) const {
        return capacity == other.capacity &&
               refill_rate == other.refill_rate &&
               mode == other.mode &&
               queue_depth == other.queue_depth;
    }
    bool operator!=(const RateLimitPolicy& other) const {
        return !(*this == other);
    }
};

// ---------------------------------------------------------------------------
// ToolCall: everything a tool handler gets for one invocation.
// ---------------------------------------------------------------------------
struct ToolCall {
    std::string session_id;
    std::string request_id;
    nlohmann::json params = nlohmann::json::object();
    nlohmann::json settings = nlohmann::json::object();
    CancellationToken cancel;
    std::chrono::steady_clock::time_point deadline =
        std::chrono::steady_clock::time_point::max();
    std::function<void(const nlohmann::json&)> report_progress;

    void ReportProgress(const nlohmann::json& progress) const {
        if (report_progress) {
            report_progress(progress);
        }
    }
};

using ToolHandler = std::function<Result<nlohmann::json, Error>(const ToolCall&)>;

// ---------------------------------------------------------------------------
// ToolDescriptor: immutable once registered.
// ---------------------------------------------------------------------------
struct ToolDescriptor {
    std::string name;
    std::string version = "1.0.0";
    std::string description;
    nlohmann::json input_schema = nlohmann::json::object();
    RateLimitPolicy rate_limit;
    std::size_t max_in_flight = 0;  // 0 = engine default
    std::optional<std::chrono::milliseconds> timeout;
    nlohmann::json settings = nlohmann::json::object();
    ToolHandler handler;
    // Stamped by ToolRegistry::Register; every registration gets a larger
    // value than the one it replaces. 0 = never registered.
    std::uint64_t generation = 0;
};

using ToolDescriptorPtr = std::shared_ptr<const ToolDescriptor>;

/// Client-facing descriptor: name, version, description, input_schema,
/// rate_limit. Settings and handler stay server-side.
nlohmann::json DescriptorToJson(const ToolDescriptor& tool);

} // namespace toolsrv
