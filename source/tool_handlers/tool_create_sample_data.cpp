#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"
#include "utils/time_format.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "create_sample_data".
// Writes a small users/settings JSON document that then shows up as a
// file:// resource in resources/list.

static json build_sample_document(const server_config::ServerConfig &config) {
    json users = json::array();
    users.push_back({{"id", 1}, {"name", "Alice"}, {"role", "admin"}});
    users.push_back({{"id", 2}, {"name", "Bob"}, {"role", "user"}});
    users.push_back({{"id", 3}, {"name", "Charlie"}, {"role", "user"}});

    json document;
    document["created_at"] = time_format::now_iso8601();
    document["server"] = config.server_name;
    document["data"]["users"] = users;
    document["data"]["settings"] = {
        {"theme", "dark"},
        {"notifications", true},
        {"language", "en"}
    };
    return document;
}

static mcp_types::ToolResult handle_create_sample_data(const server_config::ServerConfig &config,
                                                       const json &arguments) {
    std::string file_name = arguments.at("filename").get<std::string>();
    const std::string extension = ".json";
    if (file_name.size() < extension.size() ||
        file_name.compare(file_name.size() - extension.size(), extension.size(), extension) != 0) {
        file_name += extension;
    }

    std::string path = server_config::resolve_path(config, file_name);
    platform::FileWriteResult write_result =
        platform::write_file_contents(path, build_sample_document(config).dump(2));

    if (!write_result.success) {
        debug_log::log("create_sample_data failed: " + write_result.error_message);
        return mcp_types::make_error_result("Error creating file: " + write_result.error_message);
    }

    return mcp_types::make_text_result("Created sample data file: " + file_name);
}

namespace tool_create_sample_data {

bool register_tool(mcp_tools::ToolRegistry &registry, const server_config::ServerConfig &config) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"filename", {{"type", "string"}, {"description", "Name for the JSON file"}}}
    };
    input_schema["required"] = json::array({"filename"});

    return registry.register_tool({
        "create_sample_data",
        "Create sample JSON data files for testing resources",
        input_schema
    }, [&config](const json &arguments) { return handle_create_sample_data(config, arguments); });
}

} // namespace tool_create_sample_data
