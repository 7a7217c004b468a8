// Tests for the MCP surface: tools/call routing, result envelopes,
// resources, and JSON-RPC method dispatch. Runs against the in-memory browser.

#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_tools.hpp"
#include "protocol/json_rpc.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "fake_browser.hpp"

#include <nlohmann/json.hpp>
#include <iostream>
#include <set>
#include <string>

using json = nlohmann::json;

namespace test_tool_dispatch {

static bool expect(bool condition, const std::string &description) {
    if (condition) {
        std::cout << "  OK: " << description << std::endl;
    } else {
        std::cout << "  FAIL: " << description << std::endl;
    }
    return condition;
}

// One server instance over a fake browser.
struct Fixture {
    fake_browser::FakeWorld world;
    fake_browser::FakeLauncher launcher{world};
    server_config::ServerConfig config;
    capture::EventCapture event_capture{config.console_capacity, config.network_capacity};
    capture::ArtifactStore artifacts;
    session::SessionManager session_manager{launcher, event_capture};
    mcp_server::ServerContext context{session_manager, event_capture, artifacts, config};

    Fixture() {
        config.fill_delay_milliseconds = 0;
        tool_handlers::register_all_tools();
    }

    json call(const std::string &name, const json &arguments) {
        return mcp_tools::dispatch_tool_call(context, name, arguments);
    }

    json request(const std::string &method, const json &params) {
        json message;
        message["jsonrpc"] = "2.0";
        message["id"] = 1;
        message["method"] = method;
        message["params"] = params;
        return mcp_dispatch::dispatch_message(context, message);
    }
};

static std::string first_text(const json &result) {
    if (!result.contains("content") || result["content"].empty()) {
        return "";
    }
    return result["content"][0].value("text", "");
}

static bool is_error(const json &result) {
    return result.value("isError", false);
}

static bool test_tools_list() {
    Fixture fixture;
    json response = fixture.request("tools/list", json::object());
    std::set<std::string> names;
    for (const auto &tool : response["result"]["tools"]) {
        names.insert(tool["name"].get<std::string>());
    }
    std::set<std::string> expected = {
        "browser_launch", "browser_close", "browser_navigate", "browser_screenshot",
        "browser_click", "browser_click_text", "browser_fill", "browser_select",
        "browser_select_text", "browser_hover", "browser_hover_text", "browser_evaluate",
        "browser_get_logs"};
    return expect(names == expected, "tools/list lists the thirteen browser tools");
}

static bool test_unknown_tool() {
    Fixture fixture;
    json result = fixture.call("browser_teleport", json::object());
    return expect(is_error(result) && first_text(result) == "Unknown tool: browser_teleport" &&
                      fixture.world.launch_count == 0,
                  "An unknown tool is a failure result and starts nothing");
}

static bool test_implicit_session() {
    Fixture fixture;
    fixture.world.match_counts["button.primary"] = 3;
    json result = fixture.call("browser_click", json{{"selector", "button.primary"}});
    return expect(!is_error(result) && first_text(result) == "Clicked: button.primary" &&
                      fixture.world.launch_count == 1 &&
                      fixture.session_manager.state() == session::SessionState::Active,
                  "A non-lifecycle tool with no session launches one implicitly");
}

static bool test_session_start_failure() {
    Fixture fixture;
    fixture.world.launch_fails = true;
    json result = fixture.call("browser_navigate", json{{"url", "https://example.com"}});
    return expect(is_error(result) &&
                      first_text(result) == "Failed to start browser session: no browser executable found",
                  "A session that cannot start fails the tool call");
}

static bool test_close_tool() {
    Fixture fixture;
    json nothing_open = fixture.call("browser_close", json::object());
    fixture.call("browser_navigate", json{{"url", "https://example.com"}});
    json closed = fixture.call("browser_close", json::object());
    json again = fixture.call("browser_close", json::object());
    return expect(!is_error(nothing_open) && first_text(nothing_open) == "No browser is currently open" &&
                      first_text(closed) == "Browser closed" && !is_error(again) &&
                      fixture.world.launch_count == 1,
                  "browser_close is idempotent and never launches a browser");
}

static bool test_launch_tool() {
    Fixture fixture;
    json rejected = fixture.call("browser_launch", json{{"browserType", "firefox"},
                                                        {"cdpEndpoint", "http://127.0.0.1:9222"}});
    json unknown_engine = fixture.call("browser_launch", json{{"browserType", "netscape"}});
    json launched = fixture.call("browser_launch", json{{"headless", true},
                                                        {"viewport", {{"width", 1280}, {"height", 720}}}});
    return expect(is_error(rejected) && first_text(rejected) == "CDP connection only works with chromium" &&
                      is_error(unknown_engine) && !is_error(launched) &&
                      first_text(launched) == "Launched chromium (headless: true)" &&
                      fixture.world.launch_count == 1 && fixture.world.last_launch_options.headless &&
                      fixture.world.last_context_options.viewport.has_value(),
                  "browser_launch validates its arguments and launches with the given options");
}

static bool test_missing_argument() {
    Fixture fixture;
    json result = fixture.call("browser_fill", json{{"selector", "#name"}});
    return expect(is_error(result) && first_text(result) == "browser_fill requires a string 'value'.",
                  "A missing argument is named in the failure result");
}

static bool test_screenshot_tool_and_resources() {
    Fixture fixture;
    json result = fixture.call("browser_screenshot", json{{"name", "landing"}, {"fullPage", "true"}});
    bool image_returned = !is_error(result) && result["content"].size() == 2 &&
                          result["content"][1]["type"] == "image" &&
                          result["content"][1]["mimeType"] == "image/png" &&
                          fixture.world.last_screenshot_full_page;

    fixture.call("browser_close", json::object());

    json listing = fixture.request("resources/list", json::object());
    bool listed = false;
    for (const auto &resource : listing["result"]["resources"]) {
        if (resource["uri"] == "screenshot://landing") {
            listed = true;
        }
    }
    json read = fixture.request("resources/read", json{{"uri", "screenshot://landing"}});
    bool readable = read.contains("result") &&
                    read["result"]["contents"][0]["blob"] == fixture.world.screenshot_data;

    return expect(image_returned && listed && readable,
                  "Screenshots are returned inline and stay readable after browser_close");
}

static bool test_unknown_resource() {
    Fixture fixture;
    json response = fixture.request("resources/read", json{{"uri", "screenshot://missing"}});
    return expect(response.contains("error") && response["error"]["code"] == json_rpc::RESOURCE_NOT_FOUND,
                  "Reading an unknown resource is a -32002 error");
}

static bool test_console_resource() {
    Fixture fixture;
    fixture.call("browser_navigate", json{{"url", "https://example.com"}});
    browser_driver::ConsoleMessage first;
    first.type = "log";
    first.text = "ready";
    browser_driver::ConsoleMessage second;
    second.type = "error";
    second.text = "oops";
    fixture.world.sink->on_console_message(first);
    fixture.world.sink->on_console_message(second);

    json read = fixture.request("resources/read", json{{"uri", "console://logs"}});
    return expect(read["result"]["contents"][0]["text"] == "[log] ready\n[error] oops",
                  "console://logs renders one line per console entry");
}

static bool test_get_logs_tool() {
    Fixture fixture;
    fixture.call("browser_navigate", json{{"url", "https://example.com"}});
    browser_driver::ConsoleMessage message;
    for (const std::string &text : {"a", "b", "c"}) {
        message.type = (text == "b") ? "error" : "info";
        message.text = text;
        fixture.world.sink->on_console_message(message);
    }

    json filtered = fixture.call("browser_get_logs", json{{"logTypes", {"console"}},
                                                          {"filter", {{"types", {"error"}}}}});
    json document = json::parse(first_text(filtered));
    bool filter_ok = !is_error(filtered) && !document.contains("network") &&
                     document["console"]["entries"].size() == 1 &&
                     document["console"]["entries"][0]["text"] == "b" && fixture.world.pump_count >= 1;

    json cleared = fixture.call("browser_get_logs", json{{"clear", true}});
    json cleared_document = json::parse(first_text(cleared));
    json after = fixture.call("browser_get_logs", json::object());
    json after_document = json::parse(first_text(after));
    bool clear_ok = cleared_document["console"]["filtered"] == 3 && cleared_document["cleared"] == true &&
                    after_document["console"]["total"] == 0 && after_document["network"]["total"] == 0;

    json invalid = fixture.call("browser_get_logs", json{{"filter", {{"urlPattern", "("}}}});

    return expect(filter_ok && clear_ok && is_error(invalid),
                  "browser_get_logs filters, clears, and rejects an invalid pattern");
}

static bool test_protocol_methods() {
    Fixture fixture;
    json initialize = fixture.request("initialize", json::object());
    json ping = fixture.request("ping", json::object());
    json unknown = fixture.request("tools/teleport", json::object());

    json notification = {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}};
    json notification_response = mcp_dispatch::dispatch_message(fixture.context, notification);

    json invalid = mcp_dispatch::dispatch_message(fixture.context, json{{"id", 4}, {"method", "ping"}});

    return expect(initialize["result"]["serverInfo"]["name"] == "webmcps" &&
                      initialize["result"]["capabilities"].contains("tools") &&
                      initialize["result"]["capabilities"].contains("resources") &&
                      ping["result"].is_object() && unknown["error"]["code"] == json_rpc::METHOD_NOT_FOUND &&
                      notification_response.is_null() && invalid["error"]["code"] == json_rpc::INVALID_REQUEST &&
                      invalid["id"] == 4,
                  "initialize, ping, unknown methods, notifications and malformed envelopes");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_tools_list();
    all_passed &= test_unknown_tool();
    all_passed &= test_implicit_session();
    all_passed &= test_session_start_failure();
    all_passed &= test_close_tool();
    all_passed &= test_launch_tool();
    all_passed &= test_missing_argument();
    all_passed &= test_screenshot_tool_and_resources();
    all_passed &= test_unknown_resource();
    all_passed &= test_console_resource();
    all_passed &= test_get_logs_tool();
    all_passed &= test_protocol_methods();
    return all_passed;
}

} // namespace test_tool_dispatch
