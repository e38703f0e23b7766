#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"
#include "utils/utf8_sanitize.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "read_file".
// Returns a file's text; a missing file is an error result, not a fault.

static mcp_types::ToolResult handle_read_file(const server_config::ServerConfig &config, const json &arguments) {
    std::string file_name = arguments.at("filename").get<std::string>();

    platform::FileReadResult read_result =
        platform::read_file_contents(server_config::resolve_path(config, file_name));

    if (!read_result.success) {
        debug_log::log("read_file failed: " + read_result.error_message);
        if (read_result.error == platform::FileError::NotFound) {
            return mcp_types::make_error_result("File not found: " + file_name);
        }
        return mcp_types::make_error_result("Error reading file: " + read_result.error_message);
    }

    utf8_sanitize::sanitize(read_result.contents);
    return mcp_types::make_text_result(read_result.contents);
}

namespace tool_read_file {

bool register_tool(mcp_tools::ToolRegistry &registry, const server_config::ServerConfig &config) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"filename", {{"type", "string"}, {"description", "File to read"}}}
    };
    input_schema["required"] = json::array({"filename"});

    return registry.register_tool({
        "read_file",
        "Read the contents of a text file",
        input_schema
    }, [&config](const json &arguments) { return handle_read_file(config, arguments); });
}

} // namespace tool_read_file
