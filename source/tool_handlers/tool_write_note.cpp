#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"
#include "utils/time_format.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "write_note".
// Saves the content under a "Note created: <time>" header.

static mcp_types::ToolResult handle_write_note(const server_config::ServerConfig &config, const json &arguments) {
    std::string file_name = arguments.at("filename").get<std::string>();
    std::string content = arguments.at("content").get<std::string>();

    std::string note = "Note created: " + time_format::now_human_readable() + "\n\n" + content;
    platform::FileWriteResult write_result =
        platform::write_file_contents(server_config::resolve_path(config, file_name), note);

    if (!write_result.success) {
        debug_log::log("write_note failed: " + write_result.error_message);
        return mcp_types::make_error_result("Error writing note: " + write_result.error_message);
    }

    return mcp_types::make_text_result("Note saved to: " + file_name);
}

namespace tool_write_note {

bool register_tool(mcp_tools::ToolRegistry &registry, const server_config::ServerConfig &config) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"filename", {{"type", "string"}}},
        {"content", {{"type", "string"}}}
    };
    input_schema["required"] = json::array({"filename", "content"});

    return registry.register_tool({
        "write_note",
        "Write a note to a text file",
        input_schema
    }, [&config](const json &arguments) { return handle_write_note(config, arguments); });
}

} // namespace tool_write_note
