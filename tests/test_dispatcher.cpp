// Tests for JSON-RPC routing through the dispatcher, using the real tool set
// over a scratch directory.

#include "config/server_config.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_tools.hpp"
#include "mcp/resource_catalog.hpp"
#include "mcp/resource_resolver.hpp"
#include "protocol/json_rpc.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>
#include <regex>
#include <string>

using json = nlohmann::json;
using test_support::report;
using test_support::ScratchDirectory;

namespace test_dispatcher {

struct ServerFixture {
    explicit ServerFixture(const std::string &label)
        : directory(label),
          config(make_config(directory)),
          catalog(config),
          resolver(config, catalog, tools),
          dispatcher(make_dispatcher()) {
    }

    static server_config::ServerConfig make_config(const ScratchDirectory &scratch) {
        server_config::ServerConfig result;
        result.root_directory = scratch.path();
        return result;
    }

    // Tools must be registered before the dispatcher fixes its capability set.
    mcp_dispatch::Dispatcher make_dispatcher() {
        tool_handlers::register_all_tools(tools, config);
        return mcp_dispatch::Dispatcher(config, tools, catalog, resolver);
    }

    json request(int id, const std::string &method, const json &params = json::object()) const {
        json message = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
        return dispatcher.dispatch_message(message);
    }

    json call_tool(const std::string &name, const json &arguments) const {
        return request(7, "tools/call", {{"name", name}, {"arguments", arguments}});
    }

    ScratchDirectory directory;
    server_config::ServerConfig config;
    mcp_tools::ToolRegistry tools;
    mcp_resources::ResourceCatalog catalog;
    mcp_resources::ResourceResolver resolver;
    mcp_dispatch::Dispatcher dispatcher;
};

static std::string first_text(const json &response) {
    if (!response.contains("result") || !response["result"].contains("content") ||
        response["result"]["content"].empty()) {
        return "<no content: " + response.dump() + ">";
    }
    return response["result"]["content"][0]["text"].get<std::string>();
}

static bool test_initialize_reports_identity_and_capabilities() {
    ServerFixture fixture("dispatch_init");
    json response = fixture.request(1, "initialize", {{"protocolVersion", "2024-11-05"},
                                                      {"clientInfo", {{"name", "tester"}}}});
    const json &result = response["result"];
    bool success = response["id"] == 1 && response["jsonrpc"] == "2.0" &&
                   result["serverInfo"]["name"] == "trmcps" &&
                   result["serverInfo"]["version"] == "1.0.0" &&
                   result["protocolVersion"] == "2024-11-05" &&
                   result["capabilities"].contains("tools") &&
                   result["capabilities"].contains("resources") &&
                   fixture.dispatcher.capabilities().tools &&
                   fixture.dispatcher.capabilities().resources;
    return report(success, "initialize returns server identity and tools+resources capabilities", response.dump());
}

static bool test_notification_gets_no_response() {
    ServerFixture fixture("dispatch_notify");
    json response = fixture.dispatcher.dispatch_message({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    return report(response.is_null(), "Notifications produce no response");
}

static bool test_tools_list_is_stable() {
    ServerFixture fixture("dispatch_tools_list");
    json first = fixture.request(2, "tools/list");
    json second = fixture.request(3, "tools/list");

    const json &tools = first["result"]["tools"];
    bool success = tools.size() == 8 && tools[0]["name"] == "say_hello" && tools[1]["name"] == "get_time" &&
                   first["result"] == second["result"];
    return report(success, "tools/list returns every tool in registration order on each call");
}

static bool test_say_hello_scenario() {
    ServerFixture fixture("dispatch_hello");

    json missing = fixture.call_tool("say_hello", json::object());
    bool missing_ok = missing["result"]["isError"] == true &&
                      first_text(missing).find("'name'") != std::string::npos;

    json greeted = fixture.call_tool("say_hello", {{"name", "Alice"}});
    bool greeted_ok = greeted["result"]["isError"] == false && first_text(greeted) == "Hello, Alice!";

    json wrong_type = fixture.call_tool("say_hello", {{"name", 5}});
    bool wrong_type_ok = wrong_type["result"]["isError"] == true && !wrong_type.contains("error");

    return report(missing_ok && greeted_ok && wrong_type_ok,
                  "say_hello validates 'name' and greets when it is present",
                  first_text(missing) + " | " + first_text(greeted));
}

static bool test_get_time_returns_iso8601() {
    ServerFixture fixture("dispatch_time");
    json response = fixture.call_tool("get_time", json::object());
    std::string text = first_text(response);
    std::regex iso8601(R"(^\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}(\.\d+)?$)");
    return report(std::regex_match(text, iso8601), "get_time returns an ISO-8601 timestamp", text);
}

static bool test_unknown_tool_is_a_normal_response() {
    ServerFixture fixture("dispatch_unknown_tool");
    json response = fixture.call_tool("teleport", json::object());
    bool success = !response.contains("error") && response["result"]["content"].size() == 1 &&
                   first_text(response) == "Unknown tool: teleport";
    return report(success, "tools/call for an unknown tool answers 'Unknown tool: <name>'");
}

static bool test_missing_arguments_default_to_empty() {
    ServerFixture fixture("dispatch_no_args");
    json response = fixture.request(4, "tools/call", {{"name", "get_time"}});
    return report(response["result"]["isError"] == false, "tools/call without arguments uses an empty bundle");
}

static bool test_protocol_fatal_requests() {
    ServerFixture fixture("dispatch_fatal");

    json no_name = fixture.request(5, "tools/call", {{"arguments", json::object()}});
    json no_uri = fixture.request(6, "resources/read", json::object());
    json unknown_method = fixture.request(8, "tools/delete");
    json no_method = fixture.dispatcher.dispatch_message({{"jsonrpc", "2.0"}, {"id", 9}});
    json not_object = fixture.dispatcher.dispatch_message(json::array({1, 2, 3}));

    bool success = no_name["error"]["code"] == json_rpc::INVALID_PARAMS && no_name["id"] == 5 &&
                   no_uri["error"]["code"] == json_rpc::INVALID_PARAMS &&
                   unknown_method["error"]["code"] == json_rpc::METHOD_NOT_FOUND &&
                   no_method["error"]["code"] == json_rpc::INVALID_REQUEST && no_method["id"] == 9 &&
                   not_object["error"]["code"] == json_rpc::INVALID_REQUEST && not_object["id"].is_null();

    // The dispatcher keeps serving after protocol errors.
    success = success && fixture.request(10, "ping")["result"] == json::object();
    return report(success, "Malformed requests get JSON-RPC errors and the dispatcher keeps serving");
}

static bool test_resources_list_counts_files() {
    ServerFixture fixture("dispatch_resources");
    fixture.directory.write_file("a.json", "{}");
    fixture.directory.write_file("b.txt", "b");

    json resources = fixture.request(11, "resources/list")["result"]["resources"];
    bool success = resources.size() == 4 && resources[0]["uri"] == "dir://current" &&
                   resources[1]["uri"] == "status://server";
    return report(success, "resources/list returns synthetic resources then scanned files");
}

static bool test_write_then_read_round_trip() {
    ServerFixture fixture("dispatch_round_trip");
    const std::string content = "line one\nline two with \"quotes\" and unicode \xE2\x9C\x93\n";

    json written = fixture.call_tool("write_file", {{"filename", "round.txt"}, {"content", content}});
    json read = fixture.request(12, "resources/read", {{"uri", "file://round.txt"}});

    const json &contents = read["result"]["contents"];
    bool success = written["result"]["isError"] == false && contents.size() == 1 &&
                   contents[0]["uri"] == "file://round.txt" && contents[0]["text"] == content;
    return report(success, "Content written by write_file reads back unchanged via file://", read.dump());
}

static bool test_created_sample_data_appears_as_resource() {
    ServerFixture fixture("dispatch_sample");
    json created = fixture.call_tool("create_sample_data", {{"filename", "users"}});
    json resources = fixture.request(13, "resources/list")["result"]["resources"];
    json read = fixture.request(14, "resources/read", {{"uri", "file://users.json"}});

    json document = json::parse(read["result"]["contents"][0]["text"].get<std::string>());
    bool success = first_text(created) == "Created sample data file: users.json" &&
                   resources.size() == 3 && resources[2]["uri"] == "file://users.json" &&
                   document["data"]["users"].size() == 3;
    return report(success, "create_sample_data output is listed and readable as a resource");
}

static bool test_read_missing_resource_is_handled() {
    ServerFixture fixture("dispatch_missing");
    json read = fixture.request(15, "resources/read", {{"uri", "file://nope.json"}});
    bool success = !read.contains("error") &&
                   read["result"]["contents"][0]["text"] == "File not found: nope.json";
    return report(success, "resources/read of a missing file answers with a handled item");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_initialize_reports_identity_and_capabilities();
    all_passed &= test_notification_gets_no_response();
    all_passed &= test_tools_list_is_stable();
    all_passed &= test_say_hello_scenario();
    all_passed &= test_get_time_returns_iso8601();
    all_passed &= test_unknown_tool_is_a_normal_response();
    all_passed &= test_missing_arguments_default_to_empty();
    all_passed &= test_protocol_fatal_requests();
    all_passed &= test_resources_list_counts_files();
    all_passed &= test_write_then_read_round_trip();
    all_passed &= test_created_sample_data_appears_as_resource();
    all_passed &= test_read_missing_resource_is_handled();
    return all_passed;
}

} // namespace test_dispatcher
