// TRMCPS Server – Tools and Resources Model Context Protocol Server
// Entry point: stdio MCP server loop.
//
// Reads JSON-RPC 2.0 messages from stdin, dispatches them, writes responses to stdout.
// Logs go to stderr (permitted by MCP spec).

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <csignal>

#include "config/server_config.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_stdio.hpp"
#include "mcp/mcp_tools.hpp"
#include "mcp/resource_catalog.hpp"
#include "mcp/resource_resolver.hpp"
#include "protocol/json_rpc.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"

using json = nlohmann::json;

// Global flag for graceful shutdown.
static volatile std::sig_atomic_t shutdown_requested = 0;

static void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested = 1;
}

int main() {
    std::cerr << "[trmcps] trmcps – Tools and Resources MCP Server, build " << __DATE__ << " " << __TIME__ << std::endl;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    const server_config::ServerConfig config = server_config::load_from_environment();

    mcp_tools::ToolRegistry tool_registry;
    tool_handlers::register_all_tools(tool_registry, config);

    mcp_resources::ResourceCatalog resource_catalog(config);
    mcp_resources::ResourceResolver resource_resolver(config, resource_catalog, tool_registry);
    mcp_dispatch::Dispatcher dispatcher(config, tool_registry, resource_catalog, resource_resolver);

    mcp_stdio::log_message("Serving " + std::to_string(tool_registry.size()) + " tools and resources from '" +
                           config.root_directory + "'. Waiting for MCP messages on stdin.");

    // Main message loop: read from stdin, dispatch, write to stdout.
    while (!shutdown_requested) {
        std::string raw_message = mcp_stdio::read_message();

        if (raw_message.empty()) {
            // EOF on stdin means the client disconnected.
            mcp_stdio::log_message("EOF on stdin. Shutting down.");
            break;
        }

        json parsed_message;
        try {
            parsed_message = json::parse(raw_message);
        } catch (const json::parse_error &error) {
            mcp_stdio::log_message("Failed to parse incoming JSON: " + std::string(error.what()));
            // No request id is available for an unparseable message.
            json error_response = json_rpc::build_error_response(nullptr, json_rpc::PARSE_ERROR, "Parse error");
            mcp_stdio::write_message(error_response.dump());
            continue;
        }

        json response = dispatcher.dispatch_message(parsed_message);

        // Notifications return null (no response needed).
        if (response.is_null()) {
            continue;
        }

        // Replace rather than throw on any invalid UTF-8 that slipped through.
        mcp_stdio::write_message(response.dump(-1, ' ', false, json::error_handler_t::replace));
    }

    debug_log::log("Message loop finished.");
    mcp_stdio::log_message("TRMCPS Server shut down.");

    return 0;
}
