#ifndef TRMCPS_MCP_DISPATCH_HPP
#define TRMCPS_MCP_DISPATCH_HPP

// MCP JSON-RPC method dispatch.
// Routes incoming MCP messages to the tool registry, the resource catalog and
// the resource resolver, and wraps their results in JSON-RPC responses.

#include <nlohmann/json.hpp>

#include "config/server_config.hpp"
#include "mcp/mcp_tools.hpp"
#include "mcp/mcp_types.hpp"
#include "mcp/resource_catalog.hpp"
#include "mcp/resource_resolver.hpp"

namespace mcp_dispatch {

using json = nlohmann::json;

class Dispatcher {
public:
    // The capability set is fixed here, from what the registry and catalog
    // hold at construction time.
    Dispatcher(const server_config::ServerConfig &config,
               const mcp_tools::ToolRegistry &tools,
               const mcp_resources::ResourceCatalog &catalog,
               const mcp_resources::ResourceResolver &resolver);

    // Dispatch a single JSON-RPC message. Returns the response JSON, or a null
    // json value for notifications (which require no response). Never throws.
    json dispatch_message(const json &message) const;

    const mcp_types::CapabilitySet &capabilities() const { return capabilities_; }

private:
    json route(const std::string &method, const json &request_id, const json &params) const;

    json handle_initialize(const json &request_id, const json &params) const;
    json handle_tools_list(const json &request_id) const;
    json handle_tools_call(const json &request_id, const json &params) const;
    json handle_resources_list(const json &request_id) const;
    json handle_resources_read(const json &request_id, const json &params) const;

    const server_config::ServerConfig &config_;
    const mcp_tools::ToolRegistry &tools_;
    const mcp_resources::ResourceCatalog &catalog_;
    const mcp_resources::ResourceResolver &resolver_;
    const mcp_types::CapabilitySet capabilities_;
};

} // namespace mcp_dispatch

#endif // TRMCPS_MCP_DISPATCH_HPP
