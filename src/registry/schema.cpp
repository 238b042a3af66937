#include <toolsrv/registry/schema.hpp>

namespace toolsrv {

namespace {

bool MatchesType(const std::string& type, const nlohmann::json& value) {
    if (type == "string") return value.is_string();
    if (type == "integer") return value.is_number_integer();
    if (type == "number") return value.is_number();
    if (type == "boolean") return value.is_boolean();
    if (type == "object") return value.is_object();
    if (type == "array") return value.is_array();
    if (type == "null") return value.is_null();
    // Unknown type keywords are not enforced.
    return true;
}

// `type` may be a single name or a list of alternatives.
bool MatchesTypeSpec(const nlohmann::json& spec, const nlohmann::json& value) {
    if (spec.is_string()) {
        return MatchesType(spec.get<std::string>(), value);
    }
    if (spec.is_array()) {
        for (const auto& alt : spec) {
            if (alt.is_string() && MatchesType(alt.get<std::string>(), value)) {
                return true;
            }
        }
        return false;
    }
    return true;
}

Error ParamError(const std::string& message) {
    return Error{"ValidateParams", message, ErrorCategory::Validation, std::nullopt};
}

} // anonymous namespace

Result<void, Error> ValidateParams(const nlohmann::json& schema,
                                   const nlohmann::json& params) {
    if (!params.is_object()) {
        return Result<void, Error>::Err(ParamError("params must be an object"));
    }
    if (!schema.is_object()) {
        return Result<void, Error>::Ok();
    }

    if (schema.contains("required") && schema["required"].is_array()) {
        for (const auto& name : schema["required"]) {
            if (!name.is_string()) continue;
            const auto key = name.get<std::string>();
            if (!params.contains(key)) {
                return Result<void, Error>::Err(
                    ParamError("Missing required parameter: " + key));
            }
        }
    }

    if (schema.contains("properties") && schema["properties"].is_object()) {
        for (const auto& [key, prop] : schema["properties"].items()) {
            if (!params.contains(key) || !prop.is_object() || !prop.contains("type")) {
                continue;
            }
            if (!MatchesTypeSpec(prop["type"], params[key])) {
                return Result<void, Error>::Err(ParamError(
                    "Parameter '" + key + "' must be of type " + prop["type"].dump()));
            }
        }
    }

    return Result<void, Error>::Ok();
}

nlohmann::json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

nlohmann::json IntProp(const std::string& desc) {
    return {{"type", "integer"}, {"description", desc}};
}

nlohmann::json NumberProp(const std::string& desc) {
    return {{"type", "number"}, {"description", desc}};
}

nlohmann::json BoolProp(const std::string& desc) {
    return {{"type", "boolean"}, {"description", desc}};
}

nlohmann::json MakeSchema(const nlohmann::json& properties,
                          const nlohmann::json& required) {
    return {{"type", "object"},
            {"properties", properties},
            {"required", required}};
}

} // namespace toolsrv
