#include "mcp/resource_catalog.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

namespace mcp_resources {

const mcp_types::ResourceDescriptor &descriptor_of(const ResourceEntry &entry) {
    return std::visit([](const auto &resource) -> const mcp_types::ResourceDescriptor & {
        return resource.descriptor;
    }, entry);
}

ResourceCatalog::ResourceCatalog(const server_config::ServerConfig &config)
    : config_(config) {
}

std::vector<ResourceEntry> ResourceCatalog::synthetic_entries() {
    std::vector<ResourceEntry> entries;
    entries.push_back(SyntheticResource{
        SyntheticKind::DirectoryListing,
        {DIRECTORY_LISTING_URI, "Current Directory", "List of files in the current directory", "text/plain"}
    });
    entries.push_back(SyntheticResource{
        SyntheticKind::ServerStatus,
        {SERVER_STATUS_URI, "Server Status", "Current server status and information", "application/json"}
    });
    return entries;
}

static bool has_suffix(const std::string &text, const std::string &suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<ResourceEntry> ResourceCatalog::scan_directory() const {
    std::vector<ResourceEntry> entries;

    platform::DirectoryListResult listing = platform::list_directory(config_.root_directory);
    if (!listing.success) {
        debug_log::log("Resource scan failed: " + listing.error_message);
        return entries;
    }

    for (const auto &directory_entry : listing.entries) {
        if (directory_entry.is_directory) {
            continue;
        }
        for (const auto &extension : config_.scan_extensions) {
            if (!has_suffix(directory_entry.name, extension.extension)) {
                continue;
            }
            const std::string &file_name = directory_entry.name;
            ScannedResource scanned{
                file_name,
                {FILE_SCHEME_PREFIX + file_name,
                 extension.name_prefix + ": " + file_name,
                 extension.description_prefix + " " + file_name,
                 extension.mime_type}
            };
            if (mcp_types::is_well_formed(scanned.descriptor)) {
                entries.push_back(scanned);
            } else {
                debug_log::log("Skipping file that cannot be addressed by URI: " + file_name);
            }
            break;
        }
    }

    return entries;
}

std::vector<ResourceEntry> ResourceCatalog::build() const {
    std::vector<ResourceEntry> entries = synthetic_entries();
    std::vector<ResourceEntry> scanned = scan_directory();
    entries.insert(entries.end(), scanned.begin(), scanned.end());
    return entries;
}

std::vector<mcp_types::ResourceDescriptor> ResourceCatalog::list() const {
    std::vector<mcp_types::ResourceDescriptor> descriptors;
    for (const auto &entry : build()) {
        descriptors.push_back(descriptor_of(entry));
    }
    return descriptors;
}

std::size_t ResourceCatalog::count() const {
    return build().size();
}

json build_resources_list_response(const ResourceCatalog &catalog) {
    json resources_array = json::array();
    for (const auto &descriptor : catalog.list()) {
        resources_array.push_back(mcp_types::to_json(descriptor));
    }

    json result;
    result["resources"] = resources_array;
    return result;
}

} // namespace mcp_resources
