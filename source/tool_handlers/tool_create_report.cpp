#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"
#include "utils/time_format.hpp"

#include <nlohmann/json.hpp>
#include <cctype>
#include <sstream>

using json = nlohmann::json;

// Tool handler for "create_report".
// Summarizes the watched directory into report_<slug>.txt.

namespace tool_create_report {

// "Q3 Sales / Draft" -> "q3_sales_draft". Empty input yields "untitled".
std::string make_slug(const std::string &title) {
    std::string slug;
    for (unsigned char character : title) {
        if (std::isalnum(character)) {
            slug += static_cast<char>(std::tolower(character));
        } else if (!slug.empty() && slug.back() != '_') {
            slug += '_';
        }
    }
    while (!slug.empty() && slug.back() == '_') {
        slug.pop_back();
    }
    return slug.empty() ? "untitled" : slug;
}

} // namespace tool_create_report

static mcp_types::ToolResult handle_create_report(const server_config::ServerConfig &config, const json &arguments) {
    std::string title = arguments.at("title").get<std::string>();

    platform::DirectoryListResult listing = platform::list_directory(config.root_directory);
    if (!listing.success) {
        return mcp_types::make_error_result("Error creating report: " + listing.error_message);
    }

    std::size_t file_count = 0;
    std::size_t directory_count = 0;
    for (const auto &entry : listing.entries) {
        if (entry.is_directory) {
            directory_count++;
        } else {
            file_count++;
        }
    }

    std::ostringstream report;
    report << title << "\n"
           << std::string(title.size(), '=') << "\n\n"
           << "Generated: " << time_format::now_iso8601() << "\n"
           << "Server: " << config.server_name << " " << config.server_version << "\n"
           << "Directory: " << config.root_directory << "\n"
           << "Files: " << file_count << "\n"
           << "Directories: " << directory_count << "\n\n"
           << "Entries:\n";
    for (const auto &entry : listing.entries) {
        report << "  - " << entry.name << (entry.is_directory ? "/" : "") << "\n";
    }

    std::string file_name = "report_" + tool_create_report::make_slug(title) + ".txt";
    platform::FileWriteResult write_result =
        platform::write_file_contents(server_config::resolve_path(config, file_name), report.str());

    if (!write_result.success) {
        debug_log::log("create_report failed: " + write_result.error_message);
        return mcp_types::make_error_result("Error creating report: " + write_result.error_message);
    }

    return mcp_types::make_text_result("Report created: " + file_name);
}

namespace tool_create_report {

bool register_tool(mcp_tools::ToolRegistry &registry, const server_config::ServerConfig &config) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"title", {{"type", "string"}, {"description", "Report title"}}}
    };
    input_schema["required"] = json::array({"title"});

    return registry.register_tool({
        "create_report",
        "Generate a text report summarizing the server directory",
        input_schema
    }, [&config](const json &arguments) { return handle_create_report(config, arguments); });
}

} // namespace tool_create_report
