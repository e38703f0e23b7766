#ifndef TRMCPS_JSON_RPC_HPP
#define TRMCPS_JSON_RPC_HPP

// JSON-RPC 2.0 envelope handling for the MCP channel.

#include <nlohmann/json.hpp>
#include <string>
#include <optional>

namespace json_rpc {

using json = nlohmann::json;

// Standard JSON-RPC error codes.
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

json build_response(const json &request_id, const json &result_payload);

json build_error_response(const json &request_id, int error_code, const std::string &error_message);

// Returns a description of what makes message an unusable JSON-RPC request
// (not an object, no string method, bad id type), or nullopt if it is usable.
std::optional<std::string> find_envelope_problem(const json &message);

// Method name, or empty if missing.
std::string get_method(const json &message);

// The id, or a null json value if missing.
json get_id(const json &message);

// Params object, or an empty object if missing or not an object.
json get_params(const json &message);

// A string member of params, or nullopt if absent or not a string.
std::optional<std::string> get_string_param(const json &params, const std::string &key);

// A message without an id is a notification and gets no response.
bool is_notification(const json &message);

} // namespace json_rpc

#endif // TRMCPS_JSON_RPC_HPP
