#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "say_hello".
// Greets the person named in the "name" argument.

static mcp_types::ToolResult handle_say_hello(const json &arguments) {
    std::string person_name = arguments.at("name").get<std::string>();
    return mcp_types::make_text_result("Hello, " + person_name + "!");
}

namespace tool_say_hello {

bool register_tool(mcp_tools::ToolRegistry &registry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["name"] = {
        {"type", "string"},
        {"description", "Name of the person to greet"}
    };
    input_schema["required"] = json::array({"name"});

    return registry.register_tool({
        "say_hello",
        "Says hello to someone",
        input_schema
    }, handle_say_hello);
}

} // namespace tool_say_hello
