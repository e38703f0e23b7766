#include "config/server_config.hpp"
#include "utils/debug_log.hpp"

#include <cstdlib>
#include <filesystem>

namespace server_config {

ServerConfig load_from_environment() {
    ServerConfig config;

    const char *root_override = std::getenv("TRMCPS_ROOT");
    if (root_override != nullptr && root_override[0] != '\0') {
        config.root_directory = root_override;
        debug_log::log("Using TRMCPS_ROOT as watched directory: " + config.root_directory);
    }

    return config;
}

std::string resolve_path(const ServerConfig &config, const std::string &file_name) {
    std::filesystem::path requested(file_name);
    if (requested.is_absolute() || config.root_directory.empty() || config.root_directory == ".") {
        return requested.string();
    }
    return (std::filesystem::path(config.root_directory) / requested).string();
}

} // namespace server_config
