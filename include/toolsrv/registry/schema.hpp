#pragma once

#include <toolsrv/core/result.hpp>

#include <string>

#include <nlohmann/json.hpp>

namespace toolsrv {

/// Check `params` against a tool's input schema. Supports the subset tools
/// declare in practice: top-level object type, `required` members and the
/// primitive `type` of each declared property.
Result<void, Error> ValidateParams(const nlohmann::json& schema,
                                   const nlohmann::json& params);

// ---------------------------------------------------------------------------
// JSON Schema helpers
// ---------------------------------------------------------------------------
nlohmann::json StringProp(const std::string& desc);
nlohmann::json IntProp(const std::string& desc);
nlohmann::json NumberProp(const std::string& desc);
nlohmann::json BoolProp(const std::string& desc);
nlohmann::json MakeSchema(const nlohmann::json& properties,
                          const nlohmann::json& required = nlohmann::json::array());

} // namespace toolsrv
