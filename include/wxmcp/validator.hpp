#pragma once
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace wxmcp {

/// First field of a payload that does not satisfy its schema.
struct ValidationError {
    std::string field;
    std::string expected_type;
    std::string actual_type;   // "missing" when a required field is absent

    [[nodiscard]] std::string message() const;

    bool operator==(const ValidationError& o) const {
        return field == o.field && expected_type == o.expected_type
               && actual_type == o.actual_type;
    }
};

/// Checked arguments on success.
using ValidationResult = std::variant<nlohmann::json, ValidationError>;

/// Structural checker for tool input schemas of the form
/// {type: "object", properties: {field: {type, description}}, required: [...]}.
/// Supported primitive types: number, string, object, array, boolean.
/// Fields not declared in the schema are ignored.
class InputValidator {
public:
    [[nodiscard]] static ValidationResult validate(const nlohmann::json& schema,
                                                   const nlohmann::json& payload);

    /// True when every declared type is one the validator can check.
    [[nodiscard]] static bool is_supported(const nlohmann::json& schema);

    [[nodiscard]] static bool matches_type(const std::string& type, const nlohmann::json& value);

    /// Type name of a runtime JSON value in schema vocabulary.
    [[nodiscard]] static std::string type_name(const nlohmann::json& value);
};

} // namespace wxmcp
