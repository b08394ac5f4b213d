#include "tool_schema.h"
#include <cmath>
#include <string>

using json = nlohmann::json;

namespace parley {

namespace {

bool matches_type(const std::string& type, const json& value) {
    if (type == "object") return value.is_object();
    if (type == "array") return value.is_array();
    if (type == "string") return value.is_string();
    if (type == "boolean") return value.is_boolean();
    if (type == "null") return value.is_null();
    if (type == "integer") {
        if (value.is_number_integer()) return true;
        if (value.is_number_float()) {
            // Whole and inside the range a 64-bit integer can hold
            double d = value.get<double>();
            return std::isfinite(d) && std::trunc(d) == d && std::fabs(d) < 9.2e18;
        }
        return false;
    }
    if (type == "number") return value.is_number();
    return true;  // unknown type names are not enforced
}

VoidResult validate_node(const json& schema, const json& value, const std::string& path) {
    if (!schema.is_object()) {
        return VoidResult();
    }

    if (schema.contains("type")) {
        const json& type = schema["type"];
        bool ok = false;
        std::string expected;
        if (type.is_string()) {
            expected = type.get<std::string>();
            ok = matches_type(expected, value);
        } else if (type.is_array()) {
            for (const auto& t : type) {
                if (!t.is_string()) continue;
                if (!expected.empty()) expected += "|";
                expected += t.get<std::string>();
                ok = ok || matches_type(t.get<std::string>(), value);
            }
        } else {
            ok = true;
        }
        if (!ok) {
            return make_validation_error(path + " must be of type " + expected +
                                         ", got " + std::string(value.type_name()));
        }
    }

    if (schema.contains("enum") && schema["enum"].is_array()) {
        bool found = false;
        for (const auto& option : schema["enum"]) {
            if (option == value) { found = true; break; }
        }
        if (!found) {
            return make_validation_error(path + " must be one of " + schema["enum"].dump());
        }
    }

    if (value.is_string()) {
        size_t len = value.get_ref<const std::string&>().size();
        if (schema.contains("minLength") && len < schema["minLength"].get<size_t>()) {
            return make_validation_error(path + " is shorter than " + schema["minLength"].dump() + " characters");
        }
        if (schema.contains("maxLength") && len > schema["maxLength"].get<size_t>()) {
            return make_validation_error(path + " is longer than " + schema["maxLength"].dump() + " characters");
        }
    }

    if (value.is_number()) {
        double d = value.get<double>();
        if (schema.contains("minimum") && schema["minimum"].is_number() && d < schema["minimum"].get<double>()) {
            return make_validation_error(path + " must be >= " + schema["minimum"].dump());
        }
        if (schema.contains("maximum") && schema["maximum"].is_number() && d > schema["maximum"].get<double>()) {
            return make_validation_error(path + " must be <= " + schema["maximum"].dump());
        }
    }

    if (value.is_object()) {
        if (schema.contains("required") && schema["required"].is_array()) {
            for (const auto& key : schema["required"]) {
                if (key.is_string() && !value.contains(key.get<std::string>())) {
                    return make_validation_error("Missing required argument " + path + "." + key.get<std::string>());
                }
            }
        }
        const json* properties = schema.contains("properties") && schema["properties"].is_object()
                                     ? &schema["properties"] : nullptr;
        bool closed = schema.contains("additionalProperties") &&
                      schema["additionalProperties"].is_boolean() &&
                      !schema["additionalProperties"].get<bool>();
        for (auto it = value.begin(); it != value.end(); ++it) {
            const std::string child = path + "." + it.key();
            if (properties && properties->contains(it.key())) {
                auto r = validate_node((*properties)[it.key()], it.value(), child);
                if (r.is_error()) return r;
            } else if (closed) {
                return make_validation_error("Unexpected argument " + child);
            }
        }
    }

    if (value.is_array() && schema.contains("items")) {
        for (size_t i = 0; i < value.size(); ++i) {
            auto r = validate_node(schema["items"], value[i], path + "[" + std::to_string(i) + "]");
            if (r.is_error()) return r;
        }
    }

    return VoidResult();
}

} // namespace

VoidResult validate_arguments(const json& schema, const json& args) {
    try {
        return validate_node(schema, args, "$");
    } catch (const json::exception& e) {
        // Malformed schema keyword values (e.g. "minLength": "three")
        return make_validation_error(std::string("Schema could not be applied: ") + e.what());
    }
}

} // namespace parley
