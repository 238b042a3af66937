#include <toolsrv/registry/tool_descriptor.hpp>

#include <algorithm>
#include <cctype>

namespace toolsrv {

const char* AdmissionModeName(AdmissionMode mode) {
    switch (mode) {
        case AdmissionMode::Reject: return "reject";
        case AdmissionMode::Queue:  return "queue";
    }
    return "reject";
}

std::optional<AdmissionMode> ParseAdmissionMode(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "reject") return AdmissionMode::Reject;
    if (lower == "queue") return AdmissionMode::Queue;
    return std::nullopt;
}

nlohmann::json DescriptorToJson(const ToolDescriptor& tool) {
    return {
        {"name", tool.name},
        {"version", tool.version},
        {"description", tool.description},
        {"input_schema", tool.input_schema},
        {"rate_limit", {
            {"capacity", tool.rate_limit.capacity},
            {"refill_rate", tool.rate_limit.refill_rate},
            {"mode", AdmissionModeName(tool.rate_limit.mode)},
            {"queue_depth", tool.rate_limit.queue_depth}
        }}
    };
}

} // namespace toolsrv
