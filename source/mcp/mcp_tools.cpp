#include "mcp/mcp_tools.hpp"
#include "mcp/schema_validator.hpp"
#include "utils/debug_log.hpp"

#include <exception>
#include <utility>

namespace mcp_tools {

bool ToolRegistry::register_tool(const mcp_types::ToolDescriptor &descriptor, ToolHandler handler) {
    if (!mcp_types::is_well_formed(descriptor)) {
        debug_log::log("Rejected tool with malformed descriptor: '" + descriptor.name + "'");
        return false;
    }
    if (!handler) {
        debug_log::log("Rejected tool without handler: " + descriptor.name);
        return false;
    }
    if (contains(descriptor.name)) {
        debug_log::log("Rejected duplicate tool registration: " + descriptor.name);
        return false;
    }

    entries_.push_back({descriptor, std::move(handler)});
    return true;
}

std::vector<mcp_types::ToolDescriptor> ToolRegistry::list() const {
    std::vector<mcp_types::ToolDescriptor> descriptors;
    descriptors.reserve(entries_.size());
    for (const auto &entry : entries_) {
        descriptors.push_back(entry.descriptor);
    }
    return descriptors;
}

mcp_types::ToolResult ToolRegistry::dispatch(const std::string &tool_name, const json &arguments) const {
    const Entry *entry = find(tool_name);
    if (entry == nullptr) {
        debug_log::log("tools/call for unknown tool: " + tool_name);
        return mcp_types::make_error_result("Unknown tool: " + tool_name);
    }

    schema_validator::ValidationOutcome outcome =
        schema_validator::validate(entry->descriptor.input_schema, arguments);
    if (!outcome.valid) {
        debug_log::log("Validation failed for " + tool_name + ": " + outcome.reason);
        return mcp_types::make_error_result("Invalid arguments for tool '" + tool_name + "': " + outcome.reason);
    }

    debug_log::log(tool_name + " invoked");
    try {
        return entry->handler(arguments);
    } catch (const std::exception &error) {
        debug_log::log(tool_name + " threw: " + error.what());
        return mcp_types::make_error_result("Error executing tool '" + tool_name + "': " + error.what());
    }
}

bool ToolRegistry::contains(const std::string &tool_name) const {
    return find(tool_name) != nullptr;
}

const ToolRegistry::Entry *ToolRegistry::find(const std::string &tool_name) const {
    for (const auto &entry : entries_) {
        if (entry.descriptor.name == tool_name) {
            return &entry;
        }
    }
    return nullptr;
}

json build_tools_list_response(const ToolRegistry &registry) {
    json tools_array = json::array();
    for (const auto &descriptor : registry.list()) {
        tools_array.push_back(mcp_types::to_json(descriptor));
    }

    json result;
    result["tools"] = tools_array;
    return result;
}

} // namespace mcp_tools
