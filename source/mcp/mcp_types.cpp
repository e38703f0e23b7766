#include "mcp/mcp_types.hpp"

namespace mcp_types {

bool is_well_formed(const ToolDescriptor &descriptor) {
    if (descriptor.name.empty()) {
        return false;
    }
    const json &schema = descriptor.input_schema;
    if (!schema.is_object()) {
        return false;
    }
    auto type_entry = schema.find("type");
    if (type_entry == schema.end() || !type_entry->is_string() || *type_entry != "object") {
        return false;
    }
    auto properties_entry = schema.find("properties");
    if (properties_entry != schema.end() && !properties_entry->is_object()) {
        return false;
    }
    auto required_entry = schema.find("required");
    if (required_entry != schema.end() && !required_entry->is_array()) {
        return false;
    }
    return true;
}

bool is_well_formed(const ResourceDescriptor &descriptor) {
    if (descriptor.name.empty()) {
        return false;
    }
    // "<scheme>://<rest>" with both parts non-empty.
    std::string::size_type separator = descriptor.uri.find("://");
    if (separator == std::string::npos || separator == 0 || separator + 3 >= descriptor.uri.size()) {
        return false;
    }
    for (unsigned char character : descriptor.uri) {
        if (character < 0x20u || character == 0x7Fu) {
            return false;
        }
    }
    return true;
}

CapabilitySet capabilities_for(std::size_t tool_count) {
    CapabilitySet capabilities;
    capabilities.tools = tool_count > 0;
    capabilities.resources = true;
    return capabilities;
}

json capability_names(const CapabilitySet &capabilities) {
    json names = json::array();
    if (capabilities.tools) {
        names.push_back("tools");
    }
    if (capabilities.resources) {
        names.push_back("resources");
    }
    return names;
}

ToolResult make_text_result(const std::string &text) {
    ToolResult result;
    result.content.push_back({"text", text});
    result.is_error = false;
    return result;
}

ToolResult make_error_result(const std::string &text) {
    ToolResult result;
    result.content.push_back({"text", text});
    result.is_error = true;
    return result;
}

ResourceContent make_resource_content(const std::string &uri, const std::string &text,
                                      const std::string &mime_type) {
    ResourceContent content;
    content.contents.push_back({uri, mime_type, text});
    return content;
}

json to_json(const ToolDescriptor &descriptor) {
    json tool_entry;
    tool_entry["name"] = descriptor.name;
    tool_entry["description"] = descriptor.description;
    tool_entry["inputSchema"] = descriptor.input_schema;
    return tool_entry;
}

json to_json(const ResourceDescriptor &descriptor) {
    json resource_entry;
    resource_entry["uri"] = descriptor.uri;
    resource_entry["name"] = descriptor.name;
    resource_entry["description"] = descriptor.description;
    resource_entry["mimeType"] = descriptor.mime_type;
    return resource_entry;
}

json to_json(const ToolResult &result) {
    json content_array = json::array();
    for (const auto &item : result.content) {
        json content_entry;
        content_entry["type"] = item.type;
        content_entry["text"] = item.text;
        content_array.push_back(content_entry);
    }

    json payload;
    payload["content"] = content_array;
    payload["isError"] = result.is_error;
    return payload;
}

json to_json(const ResourceContent &content) {
    json contents_array = json::array();
    for (const auto &item : content.contents) {
        json contents_entry;
        contents_entry["uri"] = item.uri;
        if (!item.mime_type.empty()) {
            contents_entry["mimeType"] = item.mime_type;
        }
        contents_entry["text"] = item.text;
        contents_array.push_back(contents_entry);
    }

    json payload;
    payload["contents"] = contents_array;
    return payload;
}

json to_json(const CapabilitySet &capabilities) {
    // MCP advertises a capability by the presence of its (possibly empty) object.
    json capabilities_object = json::object();
    if (capabilities.tools) {
        capabilities_object["tools"] = json::object();
    }
    if (capabilities.resources) {
        capabilities_object["resources"] = json::object();
    }
    return capabilities_object;
}

} // namespace mcp_types
