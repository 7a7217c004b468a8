#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_arguments.hpp"
#include "mcp/mcp_tools.hpp"
#include "session/session_manager.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "browser_launch".
// Launches a fresh browser, or attaches to a running one when cdpEndpoint is
// given. Any existing session is torn down first.

// Read an {a, b} integer pair such as viewport {width, height}.
static bool read_integer_pair(const json &arguments, const std::string &name, const std::string &first_key,
                              const std::string &second_key, int &first, int &second, std::string &error_text) {
    const json &value = arguments[name];
    if (!value.is_object() || !value.contains(first_key) || !value.contains(second_key) ||
        !value[first_key].is_number_integer() || !value[second_key].is_number_integer()) {
        error_text = "browser_launch: '" + name + "' must be an object with integer '" + first_key + "' and '" +
                     second_key + "'.";
        return false;
    }
    first = value[first_key].get<int>();
    second = value[second_key].get<int>();
    return true;
}

static json handle_browser_launch(const mcp_tools::ToolCall &call) {
    const json &arguments = call.arguments;
    session::LaunchRequest request;

    if (arguments.contains("browserType")) {
        if (!arguments["browserType"].is_string() ||
            !browser_driver::parse_engine_kind(arguments["browserType"].get<std::string>(), request.engine)) {
            return mcp_tools::build_text_result(
                "browser_launch: 'browserType' must be one of chromium, firefox, webkit.", true);
        }
    }
    request.headless = tool_arguments::get_flag(arguments, "headless", false);

    if (arguments.contains("cdpEndpoint")) {
        if (!arguments["cdpEndpoint"].is_string()) {
            return mcp_tools::build_text_result("browser_launch: 'cdpEndpoint' must be a string.", true);
        }
        request.remote_debug_url = arguments["cdpEndpoint"].get<std::string>();
    }
    if (arguments.contains("debugPort")) {
        if (!arguments["debugPort"].is_number_integer()) {
            return mcp_tools::build_text_result("browser_launch: 'debugPort' must be an integer.", true);
        }
        request.debug_port = arguments["debugPort"].get<int>();
    }

    std::string error_text;
    if (arguments.contains("viewport")) {
        browser_driver::Viewport viewport;
        if (!read_integer_pair(arguments, "viewport", "width", "height", viewport.width, viewport.height,
                               error_text)) {
            return mcp_tools::build_text_result(error_text, true);
        }
        request.viewport = viewport;
    }
    if (arguments.contains("windowPosition")) {
        browser_driver::WindowPosition position;
        if (!read_integer_pair(arguments, "windowPosition", "x", "y", position.x, position.y, error_text)) {
            return mcp_tools::build_text_result(error_text, true);
        }
        request.window_position = position;
    }

    session::SessionResult launch_result = call.context.session_manager.launch_or_connect(request);
    if (!launch_result.success) {
        debug_log::warn("browser_launch: " + launch_result.message);
    }
    return mcp_tools::build_text_result(launch_result.message, !launch_result.success);
}

namespace tool_browser_launch {

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["browserType"] = {
        {"type", "string"},
        {"enum", json::array({"chromium", "firefox", "webkit"})},
        {"description", "Browser engine to launch. Default chromium."}
    };
    input_schema["properties"]["headless"] = {
        {"type", "boolean"},
        {"description", "Run without a visible window. Default false."}
    };
    input_schema["properties"]["cdpEndpoint"] = {
        {"type", "string"},
        {"description", "Attach to a running Chromium instead of launching one "
                        "(ws://host:port/devtools/browser/... or http://host:port)."}
    };
    input_schema["properties"]["debugPort"] = {
        {"type", "integer"},
        {"description", "Fixed remote debugging port for the launched Chromium. Not allowed with cdpEndpoint."}
    };
    input_schema["properties"]["viewport"] = {
        {"type", "object"},
        {"properties", {
            {"width", {{"type", "integer"}}},
            {"height", {{"type", "integer"}}}
        }},
        {"description", "Page viewport size in CSS pixels."}
    };
    input_schema["properties"]["windowPosition"] = {
        {"type", "object"},
        {"properties", {
            {"x", {{"type", "integer"}}},
            {"y", {{"type", "integer"}}}
        }},
        {"description", "Screen position of the browser window (ignored when headless)."}
    };
    input_schema["required"] = json::array();

    mcp_tools::ToolDefinition definition{
        "browser_launch",
        "Launch a browser, or connect to a running Chromium over CDP. "
        "Replaces any open browser session. Other tools start a default session on demand, "
        "so calling this is only needed for non-default options.",
        input_schema,
        handle_browser_launch
    };
    definition.lifecycle = true;
    mcp_tools::register_tool(definition);
}

} // namespace tool_browser_launch
