#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"

#include <string>

// Forward declarations of individual tool registration functions.
// Each tool_*.cpp defines its own namespace with a register_tool() function.

namespace tool_say_hello { bool register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_get_time { bool register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_create_sample_data { bool register_tool(mcp_tools::ToolRegistry &registry, const server_config::ServerConfig &config); }
namespace tool_write_note { bool register_tool(mcp_tools::ToolRegistry &registry, const server_config::ServerConfig &config); }
namespace tool_write_file { bool register_tool(mcp_tools::ToolRegistry &registry, const server_config::ServerConfig &config); }
namespace tool_read_file { bool register_tool(mcp_tools::ToolRegistry &registry, const server_config::ServerConfig &config); }
namespace tool_list_directory { bool register_tool(mcp_tools::ToolRegistry &registry, const server_config::ServerConfig &config); }
namespace tool_create_report { bool register_tool(mcp_tools::ToolRegistry &registry, const server_config::ServerConfig &config); }

namespace tool_handlers {

void register_all_tools(mcp_tools::ToolRegistry &registry, const server_config::ServerConfig &config) {
    bool all_registered = true;
    all_registered &= tool_say_hello::register_tool(registry);
    all_registered &= tool_get_time::register_tool(registry);
    all_registered &= tool_create_sample_data::register_tool(registry, config);
    all_registered &= tool_write_note::register_tool(registry, config);
    all_registered &= tool_write_file::register_tool(registry, config);
    all_registered &= tool_read_file::register_tool(registry, config);
    all_registered &= tool_list_directory::register_tool(registry, config);
    all_registered &= tool_create_report::register_tool(registry, config);

    if (!all_registered) {
        debug_log::log("Some tools were rejected by the registry; see messages above.");
    }
    debug_log::log("Registered " + std::to_string(registry.size()) + " tools.");
}

} // namespace tool_handlers
