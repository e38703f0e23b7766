#ifndef TRMCPS_TOOL_HANDLERS_HPP
#define TRMCPS_TOOL_HANDLERS_HPP

// Tool handler registration.
// Each tool_*.cpp file provides a register function that is called during startup.

#include "config/server_config.hpp"
#include "mcp/mcp_tools.hpp"

namespace tool_handlers {

// Register all available tool handlers with the given registry, in the order
// tools/list reports them. config must outlive the registry.
void register_all_tools(mcp_tools::ToolRegistry &registry, const server_config::ServerConfig &config);

} // namespace tool_handlers

#endif // TRMCPS_TOOL_HANDLERS_HPP
