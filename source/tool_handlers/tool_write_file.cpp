#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "write_file".
// Writes the content argument verbatim, so file://<filename> reads it back unchanged.

static mcp_types::ToolResult handle_write_file(const server_config::ServerConfig &config, const json &arguments) {
    std::string file_name = arguments.at("filename").get<std::string>();
    std::string content = arguments.at("content").get<std::string>();

    platform::FileWriteResult write_result =
        platform::write_file_contents(server_config::resolve_path(config, file_name), content);

    if (!write_result.success) {
        debug_log::log("write_file failed: " + write_result.error_message);
        return mcp_types::make_error_result("Error writing file: " + write_result.error_message);
    }

    return mcp_types::make_text_result("Wrote " + std::to_string(write_result.bytes_written) +
                                       " bytes to " + file_name);
}

namespace tool_write_file {

bool register_tool(mcp_tools::ToolRegistry &registry, const server_config::ServerConfig &config) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"filename", {{"type", "string"}, {"description", "File to create or overwrite"}}},
        {"content", {{"type", "string"}, {"description", "Text to write"}}}
    };
    input_schema["required"] = json::array({"filename", "content"});

    return registry.register_tool({
        "write_file",
        "Create or overwrite a file with the given content",
        input_schema
    }, [&config](const json &arguments) { return handle_write_file(config, arguments); });
}

} // namespace tool_write_file
