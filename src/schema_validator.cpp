#include "schema_validator.h"
#include <cstdint>
#include <string>

using json = nlohmann::json;

namespace voxgate {

namespace {

bool matches_type(const std::string& type, const json& value) {
    if (type == "object") return value.is_object();
    if (type == "string") return value.is_string();
    if (type == "number") return value.is_number();
    if (type == "integer") return value.is_number_integer();
    if (type == "boolean") return value.is_boolean();
    if (type == "array") return value.is_array();
    if (type == "null") return value.is_null();
    return true;
}

Error invalid(const std::string& path, const std::string& problem) {
    return make_error(ErrorType::InvalidArgs, (path.empty() ? std::string("arguments") : path) + ": " + problem);
}

VoidResult validate_node(const json& schema, const json& value, const std::string& path) {
    if (!schema.is_object()) {
        return {};
    }

    if (schema.contains("type") && schema["type"].is_string()) {
        std::string type = schema["type"].get<std::string>();
        if (!matches_type(type, value)) {
            return invalid(path, "expected " + type);
        }
    }

    if (schema.contains("enum") && schema["enum"].is_array()) {
        bool found = false;
        for (const auto& allowed : schema["enum"]) {
            if (allowed == value) {
                found = true;
                break;
            }
        }
        if (!found) {
            return invalid(path, "value not in enum " + schema["enum"].dump());
        }
    }

    if (value.is_string()) {
        auto len = static_cast<int64_t>(value.get_ref<const std::string&>().size());
        if (schema.contains("minLength") && schema["minLength"].is_number_integer() &&
            len < schema["minLength"].get<int64_t>()) {
            return invalid(path, "shorter than minLength");
        }
        if (schema.contains("maxLength") && schema["maxLength"].is_number_integer() &&
            len > schema["maxLength"].get<int64_t>()) {
            return invalid(path, "longer than maxLength");
        }
    }

    if (value.is_object()) {
        const json empty = json::object();
        const json& properties = schema.contains("properties") && schema["properties"].is_object()
            ? schema["properties"] : empty;

        if (schema.contains("required") && schema["required"].is_array()) {
            for (const auto& field : schema["required"]) {
                if (field.is_string() && !value.contains(field.get<std::string>())) {
                    return invalid(path, "missing required field '" + field.get<std::string>() + "'");
                }
            }
        }

        bool closed = schema.contains("additionalProperties") &&
                      schema["additionalProperties"].is_boolean() &&
                      !schema["additionalProperties"].get<bool>();

        for (auto it = value.begin(); it != value.end(); ++it) {
            std::string child_path = path.empty() ? it.key() : path + "." + it.key();
            if (properties.contains(it.key())) {
                auto child = validate_node(properties[it.key()], it.value(), child_path);
                if (!child) return child;
            } else if (closed) {
                return invalid(child_path, "unknown property");
            }
        }
    }

    if (value.is_array() && schema.contains("items")) {
        for (size_t i = 0; i < value.size(); ++i) {
            auto child = validate_node(schema["items"], value[i], path + "[" + std::to_string(i) + "]");
            if (!child) return child;
        }
    }

    return {};
}

} // anonymous namespace

VoidResult validate_arguments(const json& schema, const json& args) {
    if (!args.is_object()) {
        return invalid("", "tool arguments must be a JSON object");
    }
    return validate_node(schema, args, "");
}

} // namespace voxgate
