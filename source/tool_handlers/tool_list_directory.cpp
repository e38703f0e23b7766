#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "mcp/resource_resolver.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "list_directory".
// Same listing format as the dir://current resource, for any directory.

static mcp_types::ToolResult handle_list_directory(const server_config::ServerConfig &config,
                                                   const json &arguments) {
    std::string requested_path = arguments.value("path", std::string("."));
    std::string directory_path = (requested_path.empty() || requested_path == ".")
                                     ? config.root_directory
                                     : server_config::resolve_path(config, requested_path);

    std::string listing_text;
    std::string error_message;
    if (!mcp_resources::render_directory_listing(directory_path, "Contents of " + requested_path + ":",
                                                 listing_text, error_message)) {
        return mcp_types::make_error_result("Error listing directory: " + error_message);
    }
    return mcp_types::make_text_result(listing_text);
}

namespace tool_list_directory {

bool register_tool(mcp_tools::ToolRegistry &registry, const server_config::ServerConfig &config) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"path", {{"type", "string"}, {"description", "Directory to list (default: the server directory)"}}}
    };

    return registry.register_tool({
        "list_directory",
        "List the files and directories in a directory",
        input_schema
    }, [&config](const json &arguments) { return handle_list_directory(config, arguments); });
}

} // namespace tool_list_directory
