#ifndef TRMCPS_MCP_TOOLS_HPP
#define TRMCPS_MCP_TOOLS_HPP

// MCP tool registry: registration, listing, and dispatch of tool calls.
// One registry is built by the entry point at startup and handed to the
// dispatcher; there is no process-wide instance.

#include <nlohmann/json.hpp>
#include <string>
#include <functional>
#include <vector>

#include "mcp/mcp_types.hpp"

namespace mcp_tools {

using json = nlohmann::json;

// A tool handler function: receives the validated arguments, returns the result.
// A handler may throw std::exception; the registry converts it to an error result.
using ToolHandler = std::function<mcp_types::ToolResult(const json &arguments)>;

class ToolRegistry {
public:
    // Register a tool. Returns false (and registers nothing) if the descriptor
    // is malformed, the handler is empty, or the name is already taken.
    bool register_tool(const mcp_types::ToolDescriptor &descriptor, ToolHandler handler);

    // Descriptors in registration order.
    std::vector<mcp_types::ToolDescriptor> list() const;

    // Validate the arguments and run the named tool at most once.
    // Never throws: unknown tools, invalid arguments and handler failures all
    // come back as results with is_error set.
    mcp_types::ToolResult dispatch(const std::string &tool_name, const json &arguments) const;

    bool contains(const std::string &tool_name) const;
    std::size_t size() const { return entries_.size(); }

private:
    struct Entry {
        mcp_types::ToolDescriptor descriptor;
        ToolHandler handler;
    };

    const Entry *find(const std::string &tool_name) const;

    std::vector<Entry> entries_;
};

// Build the response payload for tools/list.
json build_tools_list_response(const ToolRegistry &registry);

} // namespace mcp_tools

#endif // TRMCPS_MCP_TOOLS_HPP
