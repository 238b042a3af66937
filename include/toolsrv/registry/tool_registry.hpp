#pragma once

#include <toolsrv/core/result.hpp>
#include <toolsrv/registry/tool_descriptor.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace toolsrv {

// ---------------------------------------------------------------------------
// ToolSequence: snapshot of the registry taken at List() time. Finite and
// restartable; later registrations are not reflected.
// ---------------------------------------------------------------------------
class ToolSequence {
public:
    using const_iterator = std::vector<ToolDescriptorPtr>::const_iterator;

    ToolSequence() = default;
    explicit ToolSequence(std::vector<ToolDescriptorPtr> tools)
        : tools_(std::move(tools)) {}

    [[nodiscard]] const_iterator begin() const noexcept { return tools_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return tools_.end(); }
    [[nodiscard]] std::size_t size() const noexcept { return tools_.size(); }
    [[nodiscard]] bool empty() const noexcept { return tools_.empty(); }

private:
    std::vector<ToolDescriptorPtr> tools_;
};

// ---------------------------------------------------------------------------
// ToolRegistry: name -> descriptor. Safe for concurrent use; lookups take a
// shared lock, registration swaps a single pointer under the exclusive lock.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    // DuplicateTool when the same name is registered at the same version.
    // A different version replaces the current descriptor. The stored copy
    // carries a fresh generation.
    Result<void, Error> Register(ToolDescriptor descriptor);

    [[nodiscard]] Result<ToolDescriptorPtr, Error> Lookup(std::string_view name) const;
    [[nodiscard]] ToolSequence List() const;
    Result<void, Error> Deregister(std::string_view name);

    [[nodiscard]] bool HasTool(std::string_view name) const;
    [[nodiscard]] std::size_t Size() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, ToolDescriptorPtr, std::less<>> tools_;
    std::uint64_t next_generation_ = 1;
};

} // namespace toolsrv
