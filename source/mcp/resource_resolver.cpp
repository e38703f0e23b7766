#include "mcp/resource_resolver.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"
#include "utils/time_format.hpp"
#include "utils/utf8_sanitize.hpp"

namespace mcp_resources {

using json = nlohmann::json;

std::string normalize_uri(const std::string &uri) {
    std::string::size_type last_kept = uri.find_last_not_of("/\\");
    if (last_kept == std::string::npos) {
        return "";
    }
    return uri.substr(0, last_kept + 1);
}

bool render_directory_listing(const std::string &directory_path, const std::string &heading,
                              std::string &output_text, std::string &error_message) {
    platform::DirectoryListResult listing = platform::list_directory(directory_path);
    if (!listing.success) {
        error_message = listing.error_message;
        return false;
    }

    output_text = heading;
    for (const auto &entry : listing.entries) {
        output_text += "\n";
        output_text += entry.is_directory ? "[dir]  " + entry.name + "/" : "[file] " + entry.name;
    }
    utf8_sanitize::sanitize(output_text);
    return true;
}

ResourceResolver::ResourceResolver(const server_config::ServerConfig &config,
                                   const ResourceCatalog &catalog,
                                   const mcp_tools::ToolRegistry &tools)
    : config_(config), catalog_(catalog), tools_(tools) {
}

ResourceTarget ResourceResolver::resolve(const std::string &uri) const {
    const std::string normalized = normalize_uri(uri);

    if (normalized == DIRECTORY_LISTING_URI) {
        return DirectoryListingTarget{};
    }
    if (normalized == SERVER_STATUS_URI) {
        return ServerStatusTarget{};
    }
    if (normalized.compare(0, FILE_SCHEME_PREFIX.size(), FILE_SCHEME_PREFIX) == 0 &&
        normalized.size() > FILE_SCHEME_PREFIX.size()) {
        FileTarget target;
        target.file_name = normalized.substr(FILE_SCHEME_PREFIX.size());
        target.path = server_config::resolve_path(config_, target.file_name);
        return target;
    }
    return UnknownTarget{};
}

mcp_types::ResourceContent ResourceResolver::read(const std::string &uri) const {
    ResourceTarget target = resolve(uri);

    if (std::holds_alternative<DirectoryListingTarget>(target)) {
        return read_directory_listing(uri);
    }
    if (std::holds_alternative<ServerStatusTarget>(target)) {
        return read_server_status(uri);
    }
    if (const FileTarget *file_target = std::get_if<FileTarget>(&target)) {
        return read_file(uri, *file_target);
    }

    debug_log::log("resources/read for unknown URI: " + uri);
    return mcp_types::make_resource_content(uri, "Unknown resource URI: " + uri);
}

mcp_types::ResourceContent ResourceResolver::read_directory_listing(const std::string &uri) const {
    std::string listing_text;
    std::string error_message;
    if (!render_directory_listing(config_.root_directory, "Current Directory Contents:",
                                  listing_text, error_message)) {
        return mcp_types::make_resource_content(uri, "Error listing directory: " + error_message);
    }
    return mcp_types::make_resource_content(uri, listing_text, "text/plain");
}

json ResourceResolver::build_status_document() const {
    json status;
    status["server_name"] = config_.server_name;
    status["version"] = config_.server_version;
    status["status"] = "running";
    status["uptime"] = "active";
    status["capabilities"] = mcp_types::capability_names(mcp_types::capabilities_for(tools_.size()));
    status["tools_count"] = tools_.size();
    status["resources_available"] = catalog_.count();
    status["current_time"] = time_format::now_iso8601();
    return status;
}

mcp_types::ResourceContent ResourceResolver::read_server_status(const std::string &uri) const {
    return mcp_types::make_resource_content(uri, build_status_document().dump(2), "application/json");
}

mcp_types::ResourceContent ResourceResolver::read_file(const std::string &uri, const FileTarget &target) const {
    platform::FileReadResult read_result = platform::read_file_contents(target.path);

    if (!read_result.success) {
        if (read_result.error == platform::FileError::NotFound) {
            debug_log::log("Resource file not found: " + target.path);
            return mcp_types::make_resource_content(uri, "File not found: " + target.file_name);
        }
        debug_log::log("Resource file read failed: " + read_result.error_message);
        return mcp_types::make_resource_content(uri, "Error reading file: " + read_result.error_message);
    }

    utf8_sanitize::sanitize(read_result.contents);
    return mcp_types::make_resource_content(uri, read_result.contents, mime_type_for(target.file_name));
}

std::string ResourceResolver::mime_type_for(const std::string &file_name) const {
    for (const auto &extension : config_.scan_extensions) {
        if (file_name.size() >= extension.extension.size() &&
            file_name.compare(file_name.size() - extension.extension.size(),
                              extension.extension.size(), extension.extension) == 0) {
            return extension.mime_type;
        }
    }
    return "";
}

json build_resource_read_response(const ResourceResolver &resolver, const std::string &uri) {
    return mcp_types::to_json(resolver.read(uri));
}

} // namespace mcp_resources
