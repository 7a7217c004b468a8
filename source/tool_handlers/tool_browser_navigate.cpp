#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_arguments.hpp"
#include "mcp/mcp_tools.hpp"
#include "actions/action_executor.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "browser_navigate".
// Navigates the session page and waits for its load event.

static json handle_browser_navigate(const mcp_tools::ToolCall &call) {
    std::string url;
    json error_result;
    if (!tool_arguments::get_required_string(call.arguments, "url", "browser_navigate", url, error_result)) {
        return error_result;
    }

    debug_log::log("Navigating to URL: " + url);
    return tool_arguments::action_result_to_json(action_executor::navigate(*call.page, url));
}

namespace tool_browser_navigate {

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["url"] = {
        {"type", "string"},
        {"description", "The URL to navigate to (e.g. https://example.com)"}
    };
    input_schema["required"] = json::array({"url"});

    mcp_tools::register_tool({
        "browser_navigate",
        "Navigate the browser page to the specified URL and wait for it to load.",
        input_schema,
        handle_browser_navigate
    });
}

} // namespace tool_browser_navigate
