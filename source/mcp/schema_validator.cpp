#include "mcp/schema_validator.hpp"

namespace schema_validator {

ValidationOutcome ValidationOutcome::ok() {
    return ValidationOutcome{};
}

ValidationOutcome ValidationOutcome::invalid(const std::string &reason, const std::string &field) {
    ValidationOutcome outcome;
    outcome.valid = false;
    outcome.reason = reason;
    outcome.field = field;
    return outcome;
}

std::string type_name_of(const json &value) {
    switch (value.type()) {
        case json::value_t::null:
            return "null";
        case json::value_t::boolean:
            return "boolean";
        case json::value_t::string:
            return "string";
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
            return "integer";
        case json::value_t::number_float:
            return "number";
        case json::value_t::object:
            return "object";
        case json::value_t::array:
            return "array";
        default:
            return "unknown";
    }
}

bool matches_type(const json &value, const std::string &expected_type) {
    if (expected_type == "string") {
        return value.is_string();
    }
    if (expected_type == "number") {
        return value.is_number();
    }
    if (expected_type == "integer") {
        return value.is_number_integer();
    }
    if (expected_type == "boolean") {
        return value.is_boolean();
    }
    if (expected_type == "object") {
        return value.is_object();
    }
    if (expected_type == "array") {
        return value.is_array();
    }
    if (expected_type == "null") {
        return value.is_null();
    }
    return true;
}

// A property's "type" may be a single name or a list of alternatives.
static bool matches_declared_type(const json &value, const json &declared_type, std::string &expected_out) {
    if (declared_type.is_string()) {
        expected_out = declared_type.get<std::string>();
        return matches_type(value, expected_out);
    }
    if (declared_type.is_array()) {
        expected_out.clear();
        bool any_match = false;
        for (const auto &alternative : declared_type) {
            if (!alternative.is_string()) {
                continue;
            }
            const std::string name = alternative.get<std::string>();
            expected_out += expected_out.empty() ? name : " or " + name;
            any_match = any_match || matches_type(value, name);
        }
        return any_match || expected_out.empty();
    }
    return true;
}

ValidationOutcome validate(const json &schema, const json &arguments) {
    if (!arguments.is_object()) {
        return ValidationOutcome::invalid("arguments must be an object, got " + type_name_of(arguments), "");
    }
    if (!schema.is_object()) {
        return ValidationOutcome::ok();
    }

    auto required_entry = schema.find("required");
    if (required_entry != schema.end() && required_entry->is_array()) {
        for (const auto &required_name : *required_entry) {
            if (!required_name.is_string()) {
                continue;
            }
            const std::string field = required_name.get<std::string>();
            if (!arguments.contains(field)) {
                return ValidationOutcome::invalid("missing required field '" + field + "'", field);
            }
        }
    }

    auto properties_entry = schema.find("properties");
    if (properties_entry == schema.end() || !properties_entry->is_object()) {
        return ValidationOutcome::ok();
    }

    for (auto argument = arguments.begin(); argument != arguments.end(); ++argument) {
        auto property = properties_entry->find(argument.key());
        if (property == properties_entry->end() || !property->is_object()) {
            continue; // undeclared keys pass through
        }
        auto declared_type = property->find("type");
        if (declared_type == property->end()) {
            continue;
        }
        std::string expected_type;
        if (!matches_declared_type(argument.value(), *declared_type, expected_type)) {
            return ValidationOutcome::invalid("field '" + argument.key() + "' expected " + expected_type +
                                                  " but got " + type_name_of(argument.value()),
                                              argument.key());
        }
    }

    return ValidationOutcome::ok();
}

} // namespace schema_validator
