#ifndef TRMCPS_SERVER_CONFIG_HPP
#define TRMCPS_SERVER_CONFIG_HPP

// Server identity and the filesystem location the server exposes.
// Built once by the entry point and handed to the components that need it.

#include <string>
#include <vector>

namespace server_config {

// Maps a file extension (including the dot) to the media type advertised for
// scanned resources with that extension, plus the labels used in the catalog.
struct ScanExtension {
    std::string extension;    // e.g. ".json"
    std::string mime_type;    // e.g. "application/json"
    std::string name_prefix;  // e.g. "JSON Data"
    std::string description_prefix; // e.g. "JSON data from"
};

struct ServerConfig {
    std::string server_name = "trmcps";
    std::string server_version = "1.0.0";
    std::string protocol_version = "2024-11-05";

    // Directory scanned for resources and used as the base for relative
    // file names in tools and file:// URIs.
    std::string root_directory = ".";

    std::vector<ScanExtension> scan_extensions = {
        {".json", "application/json", "JSON Data", "JSON data from"},
        {".txt", "text/plain", "Text File", "Text content from"},
    };
};

// Defaults, with root_directory overridden by TRMCPS_ROOT when it is set.
ServerConfig load_from_environment();

// Resolve a caller-supplied file name against root_directory. Absolute paths
// are returned unchanged.
std::string resolve_path(const ServerConfig &config, const std::string &file_name);

} // namespace server_config

#endif // TRMCPS_SERVER_CONFIG_HPP
