#ifndef TRMCPS_RESOURCE_RESOLVER_HPP
#define TRMCPS_RESOURCE_RESOLVER_HPP

// Resource URI resolution for resources/read.
//
// A URI is normalized (trailing '/' and '\' removed) and matched, first match
// wins, against:
//   1. dir://current    -> listing of the watched directory
//   2. status://server  -> live server status document
//   3. file://<path>    -> contents of <path> (relative to the watched directory)
//   4. anything else    -> "Unknown resource URI" content
// Reading never throws; failures come back as text content.

#include <string>
#include <variant>

#include "config/server_config.hpp"
#include "mcp/mcp_tools.hpp"
#include "mcp/mcp_types.hpp"
#include "mcp/resource_catalog.hpp"

namespace mcp_resources {

struct DirectoryListingTarget {};

struct ServerStatusTarget {};

struct FileTarget {
    std::string file_name; // as written after the scheme, normalized
    std::string path;      // file_name resolved against the watched directory
};

struct UnknownTarget {};

using ResourceTarget = std::variant<DirectoryListingTarget, ServerStatusTarget, FileTarget, UnknownTarget>;

// Strip trailing path separators.
std::string normalize_uri(const std::string &uri);

// Text of a directory listing: heading line, then one line per entry with
// directories suffixed by '/'. Returns false and sets error_message on failure.
bool render_directory_listing(const std::string &directory_path, const std::string &heading,
                              std::string &output_text, std::string &error_message);

class ResourceResolver {
public:
    ResourceResolver(const server_config::ServerConfig &config,
                     const ResourceCatalog &catalog,
                     const mcp_tools::ToolRegistry &tools);

    // Decide which handler serves uri.
    ResourceTarget resolve(const std::string &uri) const;

    // Resolve and read. Every content item carries uri exactly as given.
    mcp_types::ResourceContent read(const std::string &uri) const;

    // The server status document, computed now.
    nlohmann::json build_status_document() const;

private:
    mcp_types::ResourceContent read_directory_listing(const std::string &uri) const;
    mcp_types::ResourceContent read_server_status(const std::string &uri) const;
    mcp_types::ResourceContent read_file(const std::string &uri, const FileTarget &target) const;

    std::string mime_type_for(const std::string &file_name) const;

    const server_config::ServerConfig &config_;
    const ResourceCatalog &catalog_;
    const mcp_tools::ToolRegistry &tools_;
};

// Build the response payload for resources/read.
nlohmann::json build_resource_read_response(const ResourceResolver &resolver, const std::string &uri);

} // namespace mcp_resources

#endif // TRMCPS_RESOURCE_RESOLVER_HPP
