#pragma once

#include <toolsrv/core/result.hpp>
#include <toolsrv/registry/tool_descriptor.hpp>

namespace toolsrv {

class ServerContext;

// echo: returns its params unchanged.
ToolDescriptor MakeEchoTool();

// sleep: {ms} sleeps cooperatively, reports progress every 100 ms and
// returns {slept_ms}. Setting `max_ms` (default 60000) bounds `ms`.
ToolDescriptor MakeSleepTool();

// Registers every built-in tool through the context so configuration
// overrides apply.
Result<void, Error> RegisterBuiltinTools(ServerContext& context);

} // namespace toolsrv
