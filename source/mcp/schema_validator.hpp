#ifndef TRMCPS_SCHEMA_VALIDATOR_HPP
#define TRMCPS_SCHEMA_VALIDATOR_HPP

// Validation of tools/call arguments against a tool's declared input schema.
//
// Only the parts of JSON Schema the tool declarations use are checked:
// "required" names must be present, and a property with a primitive "type"
// must hold a value of that type. Keys the schema does not declare are
// accepted and passed through untouched.

#include <nlohmann/json.hpp>
#include <string>

namespace schema_validator {

using json = nlohmann::json;

struct ValidationOutcome {
    bool valid = true;
    std::string reason; // human-readable, empty when valid
    std::string field;  // offending argument name, empty when valid or not field-specific

    static ValidationOutcome ok();
    static ValidationOutcome invalid(const std::string &reason, const std::string &field);
};

// Validate an argument bundle against an object input schema.
ValidationOutcome validate(const json &schema, const json &arguments);

// JSON Schema type name of a value ("string", "integer", "number", ...).
std::string type_name_of(const json &value);

// True if value satisfies the JSON Schema primitive type expected_type.
// Unrecognised type names are treated as satisfied.
bool matches_type(const json &value, const std::string &expected_type);

} // namespace schema_validator

#endif // TRMCPS_SCHEMA_VALIDATOR_HPP
