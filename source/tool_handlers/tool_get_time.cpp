#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/time_format.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "get_time".
// Returns the current local time as an ISO-8601 timestamp.

static mcp_types::ToolResult handle_get_time(const json &arguments) {
    (void)arguments;
    return mcp_types::make_text_result(time_format::now_iso8601());
}

namespace tool_get_time {

bool register_tool(mcp_tools::ToolRegistry &registry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();

    return registry.register_tool({
        "get_time",
        "Get the server's current local time as an ISO-8601 timestamp",
        input_schema
    }, handle_get_time);
}

} // namespace tool_get_time
