#ifndef TRMCPS_MCP_TYPES_HPP
#define TRMCPS_MCP_TYPES_HPP

// Capability descriptor model: the value types that describe tools, resources
// and the content they produce, plus their MCP wire representation.
// Uniqueness of names and URIs is enforced by the registries, not here.

#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace mcp_types {

using json = nlohmann::json;

// A tool as advertised by tools/list.
struct ToolDescriptor {
    std::string name;
    std::string description;
    json input_schema; // JSON Schema object ({"type": "object", ...})
};

// A resource as advertised by resources/list.
struct ResourceDescriptor {
    std::string uri;
    std::string name;
    std::string description;
    std::string mime_type;
};

// One item of a tools/call result. Only text content is produced.
struct ContentItem {
    std::string type = "text";
    std::string text;
};

// Result of a tool invocation (content array + isError flag, as per MCP spec).
struct ToolResult {
    std::vector<ContentItem> content;
    bool is_error = false;
};

// One item of a resources/read result.
struct ResourceContentItem {
    std::string uri;
    std::string mime_type; // omitted on the wire when empty
    std::string text;
};

// Result of a resource read.
struct ResourceContent {
    std::vector<ResourceContentItem> contents;
};

// Which capability kinds the server supports. Fixed for the process lifetime.
struct CapabilitySet {
    bool tools = false;
    bool resources = false;
};

// A tool descriptor is well formed when its name is non-empty and its schema is
// an object schema. A resource descriptor needs a name and a "<scheme>://<rest>"
// URI without control characters.
bool is_well_formed(const ToolDescriptor &descriptor);
bool is_well_formed(const ResourceDescriptor &descriptor);

// Capabilities of a server holding tool_count tools; resources are always
// supported because the synthetic resources always exist.
CapabilitySet capabilities_for(std::size_t tool_count);

// Names of the supported kinds, e.g. ["tools", "resources"].
json capability_names(const CapabilitySet &capabilities);

// Single-item results.
ToolResult make_text_result(const std::string &text);
ToolResult make_error_result(const std::string &text);
ResourceContent make_resource_content(const std::string &uri, const std::string &text,
                                      const std::string &mime_type = "");

// Wire representations.
json to_json(const ToolDescriptor &descriptor);
json to_json(const ResourceDescriptor &descriptor);
json to_json(const ToolResult &result);
json to_json(const ResourceContent &content);
json to_json(const CapabilitySet &capabilities);

} // namespace mcp_types

#endif // TRMCPS_MCP_TYPES_HPP
