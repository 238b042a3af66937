#include <toolsrv/registry/tool_registry.hpp>

#include <toolsrv/core/log.hpp>

#include <memory>
#include <mutex>
#include <utility>

namespace toolsrv {

namespace {

Error RegistryError(const std::string& operation, const std::string& message,
                    ErrorCategory category) {
    return Error{operation, message, category, std::nullopt};
}

Result<void, Error> CheckDescriptor(const ToolDescriptor& tool) {
    if (tool.name.empty()) {
        return Result<void, Error>::Err(RegistryError(
            "Register", "tool name must not be empty", ErrorCategory::Validation));
    }
    if (!tool.input_schema.is_object()) {
        return Result<void, Error>::Err(RegistryError(
            "Register", "input schema of '" + tool.name + "' must be an object",
            ErrorCategory::Validation));
    }
    const auto& policy = tool.rate_limit;
    if (policy.capacity < 1) {
        return Result<void, Error>::Err(RegistryError(
            "Register", "rate limit capacity of '" + tool.name + "' must be >= 1",
            ErrorCategory::Validation));
    }
    if (!(policy.refill_rate > 0.0)) {
        return Result<void, Error>::Err(RegistryError(
            "Register", "refill rate of '" + tool.name + "' must be positive",
            ErrorCategory::Validation));
    }
    if (policy.mode == AdmissionMode::Queue && policy.queue_depth == 0) {
        return Result<void, Error>::Err(RegistryError(
            "Register", "queue mode of '" + tool.name + "' needs a queue depth >= 1",
            ErrorCategory::Validation));
    }
    if (!tool.handler) {
        return Result<void, Error>::Err(RegistryError(
            "Register", "tool '" + tool.name + "' has no handler",
            ErrorCategory::Validation));
    }
    return Result<void, Error>::Ok();
}

} // anonymous namespace

Result<void, Error> ToolRegistry::Register(ToolDescriptor descriptor) {
    auto checked = CheckDescriptor(descriptor);
    if (checked.IsErr()) {
        return checked;
    }

    const auto name = descriptor.name;
    const auto version = descriptor.version;
    std::string replaced_version;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = tools_.find(name);
        if (it != tools_.end() && it->second->version == version) {
            return Result<void, Error>::Err(RegistryError(
                "Register",
                "tool '" + name + "' version " + version + " is already registered",
                ErrorCategory::DuplicateTool));
        }
        descriptor.generation = next_generation_++;
        auto stored = std::make_shared<const ToolDescriptor>(std::move(descriptor));
        if (it != tools_.end()) {
            replaced_version = it->second->version;
            it->second = std::move(stored);
        } else {
            tools_.emplace(name, std::move(stored));
        }
    }

    if (replaced_version.empty()) {
        LogInfo("registry", "registered " + name + " " + version);
    } else {
        LogInfo("registry", "replaced " + name + " " + replaced_version + " with " + version);
    }
    return Result<void, Error>::Ok();
}

Result<ToolDescriptorPtr, Error> ToolRegistry::Lookup(std::string_view name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return Result<ToolDescriptorPtr, Error>::Err(RegistryError(
            "Lookup", "Unknown tool: " + std::string(name), ErrorCategory::ToolNotFound));
    }
    return Result<ToolDescriptorPtr, Error>::Ok(it->second);
}

ToolSequence ToolRegistry::List() const {
    std::vector<ToolDescriptorPtr> snapshot;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        snapshot.reserve(tools_.size());
        for (const auto& [name, tool] : tools_) {
            snapshot.push_back(tool);
        }
    }
    return ToolSequence(std::move(snapshot));
}

Result<void, Error> ToolRegistry::Deregister(std::string_view name) {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = tools_.find(name);
        if (it == tools_.end()) {
            return Result<void, Error>::Err(RegistryError(
                "Deregister", "Unknown tool: " + std::string(name),
                ErrorCategory::ToolNotFound));
        }
        tools_.erase(it);
    }
    LogInfo("registry", "deregistered " + std::string(name));
    return Result<void, Error>::Ok();
}

bool ToolRegistry::HasTool(std::string_view name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return tools_.find(name) != tools_.end();
}

std::size_t ToolRegistry::Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return tools_.size();
}

} // namespace toolsrv
