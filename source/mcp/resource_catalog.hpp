#ifndef TRMCPS_RESOURCE_CATALOG_HPP
#define TRMCPS_RESOURCE_CATALOG_HPP

// Resource catalog: the list behind resources/list.
//
// Every build starts with the synthetic resources (directory listing, then
// server status) and continues with the files of the watched directory whose
// extension is configured for scanning, in directory enumeration order.
// Nothing is cached; each call reflects the filesystem at that moment.

#include <nlohmann/json.hpp>
#include <string>
#include <variant>
#include <vector>

#include "config/server_config.hpp"
#include "mcp/mcp_types.hpp"

namespace mcp_resources {

using json = nlohmann::json;

// Fixed URIs of the synthetic resources.
inline const std::string DIRECTORY_LISTING_URI = "dir://current";
inline const std::string SERVER_STATUS_URI = "status://server";
inline const std::string FILE_SCHEME_PREFIX = "file://";

enum class SyntheticKind {
    DirectoryListing,
    ServerStatus,
};

// A resource computed by the server itself.
struct SyntheticResource {
    SyntheticKind kind;
    mcp_types::ResourceDescriptor descriptor;
};

// A resource backed by a file found in the watched directory.
struct ScannedResource {
    std::string file_name;
    mcp_types::ResourceDescriptor descriptor;
};

using ResourceEntry = std::variant<SyntheticResource, ScannedResource>;

// Descriptor of either kind of entry.
const mcp_types::ResourceDescriptor &descriptor_of(const ResourceEntry &entry);

class ResourceCatalog {
public:
    explicit ResourceCatalog(const server_config::ServerConfig &config);

    // Synthetic entries followed by scanned entries.
    std::vector<ResourceEntry> build() const;

    // Descriptors of build(), same order.
    std::vector<mcp_types::ResourceDescriptor> list() const;

    // Number of entries a build() would return right now.
    std::size_t count() const;

    // The synthetic entries alone, in their fixed order.
    static std::vector<ResourceEntry> synthetic_entries();

private:
    std::vector<ResourceEntry> scan_directory() const;

    const server_config::ServerConfig &config_;
};

// Build the response payload for resources/list.
json build_resources_list_response(const ResourceCatalog &catalog);

} // namespace mcp_resources

#endif // TRMCPS_RESOURCE_CATALOG_HPP
