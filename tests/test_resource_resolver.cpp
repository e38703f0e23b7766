// Tests for resources/read URI resolution and content.

#include "config/server_config.hpp"
#include "mcp/mcp_tools.hpp"
#include "mcp/resource_catalog.hpp"
#include "mcp/resource_resolver.hpp"
#include "platform/platform_abi.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>
#include <variant>

using json = nlohmann::json;
using test_support::report;
using test_support::ScratchDirectory;

namespace test_resource_resolver {

// Everything a resolver needs, over one scratch directory.
struct ResolverFixture {
    explicit ResolverFixture(const std::string &label)
        : directory(label),
          config(make_config(directory)),
          catalog(config),
          resolver(config, catalog, tools) {
    }

    static server_config::ServerConfig make_config(const ScratchDirectory &scratch) {
        server_config::ServerConfig result;
        result.root_directory = scratch.path();
        return result;
    }

    ScratchDirectory directory;
    server_config::ServerConfig config;
    mcp_tools::ToolRegistry tools;
    mcp_resources::ResourceCatalog catalog;
    mcp_resources::ResourceResolver resolver;
};

static std::string single_text(const mcp_types::ResourceContent &content) {
    return content.contents.size() == 1 ? content.contents[0].text : "<" + std::to_string(content.contents.size()) + " items>";
}

static bool test_normalize_uri() {
    bool success = mcp_resources::normalize_uri("status://server/") == "status://server" &&
                   mcp_resources::normalize_uri("file://notes.txt\\") == "file://notes.txt" &&
                   mcp_resources::normalize_uri("dir://current//") == "dir://current" &&
                   mcp_resources::normalize_uri("dir://current") == "dir://current" &&
                   mcp_resources::normalize_uri("///") == "";
    return report(success, "Trailing separators are stripped");
}

static bool test_resolve_precedence() {
    ResolverFixture fixture("resolver_precedence");
    const auto &resolver = fixture.resolver;

    bool success =
        std::holds_alternative<mcp_resources::DirectoryListingTarget>(resolver.resolve("dir://current")) &&
        std::holds_alternative<mcp_resources::DirectoryListingTarget>(resolver.resolve("dir://current/")) &&
        std::holds_alternative<mcp_resources::ServerStatusTarget>(resolver.resolve("status://server")) &&
        std::holds_alternative<mcp_resources::ServerStatusTarget>(resolver.resolve("status://server/")) &&
        std::holds_alternative<mcp_resources::FileTarget>(resolver.resolve("file://notes.txt")) &&
        std::holds_alternative<mcp_resources::UnknownTarget>(resolver.resolve("dir://elsewhere")) &&
        std::holds_alternative<mcp_resources::UnknownTarget>(resolver.resolve("file://")) &&
        std::holds_alternative<mcp_resources::UnknownTarget>(resolver.resolve("https://example.com"));
    return report(success, "URIs resolve by exact match, then file:// prefix, then unknown");
}

static bool test_file_target_path_is_relative_to_root() {
    ResolverFixture fixture("resolver_paths");
    auto relative = std::get<mcp_resources::FileTarget>(fixture.resolver.resolve("file://notes.txt/"));
    auto absolute = std::get<mcp_resources::FileTarget>(fixture.resolver.resolve("file:///etc/hostname"));

    bool success = relative.file_name == "notes.txt" &&
                   relative.path == fixture.directory.path_of("notes.txt") &&
                   absolute.file_name == "/etc/hostname" && absolute.path == "/etc/hostname";
    return report(success, "file:// paths resolve against the watched directory unless absolute",
                  relative.path + " | " + absolute.path);
}

static bool test_status_with_and_without_trailing_slash() {
    ResolverFixture fixture("resolver_status");
    fixture.directory.write_file("one.json", "{}");
    fixture.directory.write_file("two.txt", "2");

    auto plain = fixture.resolver.read("status://server");
    auto slashed = fixture.resolver.read("status://server/");

    json plain_document = json::parse(single_text(plain));
    json slashed_document = json::parse(single_text(slashed));
    plain_document.erase("current_time");
    slashed_document.erase("current_time");

    bool success = plain_document == slashed_document &&
                   plain_document["resources_available"] == 4 &&
                   plain_document["server_name"] == "trmcps" &&
                   plain.contents[0].uri == "status://server" &&
                   slashed.contents[0].uri == "status://server/";
    return report(success, "status://server with and without trailing slash match apart from the timestamp",
                  plain_document.dump());
}

static bool test_status_count_is_live() {
    ResolverFixture fixture("resolver_status_live");
    json before = fixture.resolver.build_status_document();
    fixture.directory.write_file("later.txt", "x");
    json after = fixture.resolver.build_status_document();

    return report(before["resources_available"] == 2 && after["resources_available"] == 3 &&
                      after.contains("current_time") && after["tools_count"] == 0,
                  "Status document recounts the catalog on every read");
}

static bool test_status_capabilities_follow_registry() {
    ResolverFixture fixture("resolver_status_capabilities");
    json without_tools = fixture.resolver.build_status_document();

    json schema = {{"type", "object"}, {"properties", json::object()}};
    fixture.tools.register_tool({"noop", "does nothing", schema},
                                [](const json &) { return mcp_types::make_text_result("ok"); });
    json with_tools = fixture.resolver.build_status_document();

    bool success = without_tools["capabilities"] == json::array({"resources"}) &&
                   with_tools["capabilities"] == json::array({"tools", "resources"}) &&
                   with_tools["tools_count"] == 1;
    return report(success, "Status capabilities list tools only when tools are registered",
                  without_tools["capabilities"].dump() + " | " + with_tools["capabilities"].dump());
}

static bool test_directory_listing() {
    ResolverFixture fixture("resolver_listing");
    fixture.directory.write_file("alpha.txt", "a");
    fixture.directory.make_directory("nested");

    auto content = fixture.resolver.read("dir://current");
    std::string text = single_text(content);
    bool success = text.rfind("Current Directory Contents:", 0) == 0 &&
                   text.find("[file] alpha.txt") != std::string::npos &&
                   text.find("[dir]  nested/") != std::string::npos &&
                   content.contents[0].mime_type == "text/plain";
    return report(success, "dir://current lists files and directories", text);
}

static bool test_existing_file_is_read() {
    ResolverFixture fixture("resolver_read");
    fixture.directory.write_file("users.json", "{\"users\": [1, 2]}\n");

    auto content = fixture.resolver.read("file://users.json");
    bool success = single_text(content) == "{\"users\": [1, 2]}\n" &&
                   content.contents[0].uri == "file://users.json" &&
                   content.contents[0].mime_type == "application/json";
    return report(success, "file:// returns the file contents with the URI echoed");
}

static bool test_missing_file_is_handled() {
    ResolverFixture fixture("resolver_missing");
    auto content = fixture.resolver.read("file://ghost.txt");
    return report(single_text(content) == "File not found: ghost.txt",
                  "Missing file yields a handled 'File not found' item naming the file", single_text(content));
}

static bool test_directory_as_file_is_handled_error() {
    ResolverFixture fixture("resolver_dir_as_file");
    fixture.directory.make_directory("sub");
    auto content = fixture.resolver.read("file://sub");
    std::string text = single_text(content);
    return report(text.rfind("Error reading file: ", 0) == 0,
                  "Non-not-found read failure yields a handled error item", text);
}

static bool test_symlink_loop_is_error_not_missing() {
    ResolverFixture fixture("resolver_symlink_loop");
    std::filesystem::create_symlink("loop", fixture.directory.path_of("loop"));

    std::string text = single_text(fixture.resolver.read("file://loop"));
    return report(text.rfind("Error reading file: ", 0) == 0,
                  "Self-referencing symlink is a read error, not a missing file", text);
}

static bool test_overlong_name_is_error_not_missing() {
    ResolverFixture fixture("resolver_long_name");
    std::string long_name(300, 'n');

    platform::FileReadResult read_result = platform::read_file_contents(fixture.directory.path_of(long_name));
    std::string text = single_text(fixture.resolver.read("file://" + long_name));
    return report(!read_result.success && read_result.error == platform::FileError::Other &&
                      text.rfind("Error reading file: ", 0) == 0,
                  "File name longer than NAME_MAX is a read error, not a missing file", text);
}

static bool test_unknown_uri_is_handled() {
    ResolverFixture fixture("resolver_unknown");
    auto content = fixture.resolver.read("ftp://somewhere/");
    return report(single_text(content) == "Unknown resource URI: ftp://somewhere/" &&
                      content.contents[0].uri == "ftp://somewhere/",
                  "Unknown scheme yields a handled 'Unknown resource URI' item");
}

static bool test_invalid_utf8_is_replaced() {
    ResolverFixture fixture("resolver_utf8");
    fixture.directory.write_file("latin1.txt", std::string("caf\xE9"));
    std::string text = single_text(fixture.resolver.read("file://latin1.txt"));
    return report(text == "caf\xEF\xBF\xBD", "Invalid UTF-8 in files is replaced with U+FFFD");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_normalize_uri();
    all_passed &= test_resolve_precedence();
    all_passed &= test_file_target_path_is_relative_to_root();
    all_passed &= test_status_with_and_without_trailing_slash();
    all_passed &= test_status_count_is_live();
    all_passed &= test_status_capabilities_follow_registry();
    all_passed &= test_directory_listing();
    all_passed &= test_existing_file_is_read();
    all_passed &= test_missing_file_is_handled();
    all_passed &= test_directory_as_file_is_handled_error();
    all_passed &= test_symlink_loop_is_error_not_missing();
    all_passed &= test_overlong_name_is_error_not_missing();
    all_passed &= test_unknown_uri_is_handled();
    all_passed &= test_invalid_utf8_is_replaced();
    return all_passed;
}

} // namespace test_resource_resolver
