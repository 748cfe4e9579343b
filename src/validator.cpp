#include "wxmcp/validator.hpp"
#include <array>
#include <algorithm>

namespace wxmcp {

namespace {

constexpr std::array<const char*, 5> SUPPORTED_TYPES = {
    "number", "string", "object", "array", "boolean"
};

bool is_supported_type(const std::string& type) {
    return std::find(SUPPORTED_TYPES.begin(), SUPPORTED_TYPES.end(), type) != SUPPORTED_TYPES.end();
}

// Declared type of a property, empty when the property accepts anything.
std::string declared_type(const nlohmann::json& properties, const std::string& field) {
    if (!properties.is_object()) return {};
    auto it = properties.find(field);
    if (it == properties.end() || !it->is_object()) return {};
    auto type_it = it->find("type");
    if (type_it == it->end() || !type_it->is_string()) return {};
    return type_it->get<std::string>();
}

} // anonymous namespace

std::string ValidationError::message() const {
    if (actual_type == "missing") {
        return "Invalid arguments: missing required field '" + field
               + "' (expected " + expected_type + ")";
    }
    return "Invalid arguments: field '" + field + "' must be " + expected_type
           + ", got " + actual_type;
}

bool InputValidator::matches_type(const std::string& type, const nlohmann::json& value) {
    if (type.empty()) return true;
    if (type == "number")  return value.is_number();
    if (type == "string")  return value.is_string();
    if (type == "object")  return value.is_object();
    if (type == "array")   return value.is_array();
    if (type == "boolean") return value.is_boolean();
    return false;
}

std::string InputValidator::type_name(const nlohmann::json& value) {
    if (value.is_number())  return "number";
    if (value.is_string())  return "string";
    if (value.is_object())  return "object";
    if (value.is_array())   return "array";
    if (value.is_boolean()) return "boolean";
    return "null";
}

bool InputValidator::is_supported(const nlohmann::json& schema) {
    if (!schema.is_object()) return false;
    if (schema.value("type", std::string("object")) != "object") return false;

    const auto properties = schema.value("properties", nlohmann::json::object());
    if (!properties.is_object()) return false;
    for (const auto& item : properties.items()) {
        const auto& prop = item.value();
        if (!prop.is_object()) return false;
        if (prop.contains("type")
            && (!prop.at("type").is_string() || !is_supported_type(prop.at("type").get<std::string>()))) {
            return false;
        }
    }

    if (schema.contains("required")) {
        const auto& required = schema.at("required");
        if (!required.is_array()) return false;
        for (const auto& field : required) {
            if (!field.is_string()) return false;
        }
    }
    return true;
}

ValidationResult InputValidator::validate(const nlohmann::json& schema,
                                          const nlohmann::json& payload) {
    const nlohmann::json args = payload.is_null() ? nlohmann::json::object() : payload;
    if (!args.is_object()) {
        return ValidationError{"arguments", "object", type_name(args)};
    }

    if (!schema.is_object()) return args;
    const auto properties = schema.value("properties", nlohmann::json::object());
    const auto required = schema.value("required", nlohmann::json::array());

    // Required fields first, in declared order
    for (const auto& field_j : required) {
        if (!field_j.is_string()) continue;
        const auto field = field_j.get<std::string>();
        const auto type = declared_type(properties, field);
        auto it = args.find(field);
        if (it == args.end()) {
            return ValidationError{field, type.empty() ? "any" : type, "missing"};
        }
        if (!matches_type(type, *it)) {
            return ValidationError{field, type, type_name(*it)};
        }
    }

    // Optional fields only need a matching type when present
    if (!properties.is_object()) return args;
    for (const auto& item : properties.items()) {
        const std::string& field = item.key();
        auto it = args.find(field);
        if (it == args.end()) continue;
        const auto type = declared_type(properties, field);
        if (!matches_type(type, *it)) {
            return ValidationError{field, type, type_name(*it)};
        }
    }

    return args;
}

} // namespace wxmcp
