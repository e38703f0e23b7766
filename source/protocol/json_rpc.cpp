#include "protocol/json_rpc.hpp"

namespace json_rpc {

json build_response(const json &request_id, const json &result_payload) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = request_id;
    response["result"] = result_payload;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = request_id;
    response["error"]["code"] = error_code;
    response["error"]["message"] = error_message;
    return response;
}

std::optional<std::string> find_envelope_problem(const json &message) {
    if (!message.is_object()) {
        return std::string("Request must be a JSON object");
    }
    auto method = message.find("method");
    if (method == message.end()) {
        return std::string("Missing 'method'");
    }
    if (!method->is_string()) {
        return std::string("'method' must be a string");
    }
    auto id = message.find("id");
    if (id != message.end() && !id->is_string() && !id->is_number_integer() && !id->is_null()) {
        return std::string("'id' must be a string or an integer");
    }
    return std::nullopt;
}

std::string get_method(const json &message) {
    if (message.is_object() && message.contains("method") && message["method"].is_string()) {
        return message["method"].get<std::string>();
    }
    return "";
}

json get_id(const json &message) {
    if (message.is_object() && message.contains("id")) {
        return message["id"];
    }
    return nullptr;
}

json get_params(const json &message) {
    if (message.is_object() && message.contains("params") && message["params"].is_object()) {
        return message["params"];
    }
    return json::object();
}

std::optional<std::string> get_string_param(const json &params, const std::string &key) {
    auto value = params.find(key);
    if (value == params.end() || !value->is_string()) {
        return std::nullopt;
    }
    return value->get<std::string>();
}

bool is_notification(const json &message) {
    return message.is_object() && !message.contains("id");
}

} // namespace json_rpc
