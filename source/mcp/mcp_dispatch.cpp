#include "mcp/mcp_dispatch.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

#include <exception>
#include <optional>
#include <string>

namespace mcp_dispatch {

Dispatcher::Dispatcher(const server_config::ServerConfig &config,
                       const mcp_tools::ToolRegistry &tools,
                       const mcp_resources::ResourceCatalog &catalog,
                       const mcp_resources::ResourceResolver &resolver)
    : config_(config),
      tools_(tools),
      catalog_(catalog),
      resolver_(resolver),
      capabilities_(mcp_types::capabilities_for(tools.size())) {
}

// Handle the "initialize" request.
json Dispatcher::handle_initialize(const json &request_id, const json &params) const {
    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        debug_log::log("initialize from client: " + params["clientInfo"].value("name", std::string("?")));
    }

    json server_info;
    server_info["name"] = config_.server_name;
    server_info["version"] = config_.server_version;

    json result;
    result["protocolVersion"] = config_.protocol_version;
    result["capabilities"] = mcp_types::to_json(capabilities_);
    result["serverInfo"] = server_info;

    return json_rpc::build_response(request_id, result);
}

json Dispatcher::handle_tools_list(const json &request_id) const {
    return json_rpc::build_response(request_id, mcp_tools::build_tools_list_response(tools_));
}

json Dispatcher::handle_tools_call(const json &request_id, const json &params) const {
    std::optional<std::string> tool_name = json_rpc::get_string_param(params, "name");
    if (!tool_name) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                              "Missing or invalid 'name' in tools/call");
    }

    // Absent arguments mean "no arguments"; anything else goes to validation as is.
    json arguments = json::object();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        arguments = params["arguments"];
    }

    mcp_types::ToolResult tool_result = tools_.dispatch(*tool_name, arguments);
    return json_rpc::build_response(request_id, mcp_types::to_json(tool_result));
}

json Dispatcher::handle_resources_list(const json &request_id) const {
    return json_rpc::build_response(request_id, mcp_resources::build_resources_list_response(catalog_));
}

json Dispatcher::handle_resources_read(const json &request_id, const json &params) const {
    std::optional<std::string> uri = json_rpc::get_string_param(params, "uri");
    if (!uri) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                              "Missing or invalid 'uri' in resources/read");
    }
    debug_log::log("resources/read " + *uri);
    return json_rpc::build_response(request_id, mcp_resources::build_resource_read_response(resolver_, *uri));
}

json Dispatcher::route(const std::string &method, const json &request_id, const json &params) const {
    if (method == "initialize") {
        return handle_initialize(request_id, params);
    }
    if (method == "ping") {
        return json_rpc::build_response(request_id, json::object());
    }
    if (method == "tools/list") {
        return handle_tools_list(request_id);
    }
    if (method == "tools/call") {
        return handle_tools_call(request_id, params);
    }
    if (method == "resources/list") {
        return handle_resources_list(request_id);
    }
    if (method == "resources/read") {
        return handle_resources_read(request_id, params);
    }

    return json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND,
                                          "Unknown method: " + method);
}

json Dispatcher::dispatch_message(const json &message) const {
    json request_id = json_rpc::get_id(message);

    if (std::optional<std::string> problem = json_rpc::find_envelope_problem(message)) {
        debug_log::log("Invalid request: " + *problem);
        if (!request_id.is_string() && !request_id.is_number_integer()) {
            request_id = nullptr;
        }
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_REQUEST,
                                              "Invalid request: " + *problem);
    }

    std::string method = json_rpc::get_method(message);

    // Handle notifications (no response expected).
    if (json_rpc::is_notification(message)) {
        // "notifications/initialized" is the only notification we expect; acknowledge silently.
        debug_log::log("notification: " + method);
        return nullptr;
    }

    json params = json_rpc::get_params(message);
    debug_log::log("request: " + method);

    try {
        return route(method, request_id, params);
    } catch (const std::exception &error) {
        debug_log::log("Internal error in " + method + ": " + error.what());
        return json_rpc::build_error_response(request_id, json_rpc::INTERNAL_ERROR,
                                              "Internal error: " + std::string(error.what()));
    }
}

} // namespace mcp_dispatch
