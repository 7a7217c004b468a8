#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_arguments.hpp"
#include "mcp/mcp_tools.hpp"
#include "actions/action_executor.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "browser_screenshot".
// Captures the viewport, the full page, or one element, stores it under
// `name` (exposed as screenshot://<name>) and returns it inline.

static json handle_browser_screenshot(const mcp_tools::ToolCall &call) {
    std::string name;
    json error_result;
    if (!tool_arguments::get_required_string(call.arguments, "name", "browser_screenshot", name, error_result)) {
        return error_result;
    }

    std::string selector;
    if (call.arguments.contains("selector") && !call.arguments["selector"].is_null()) {
        if (!tool_arguments::get_required_string(call.arguments, "selector", "browser_screenshot", selector,
                                                 error_result)) {
            return error_result;
        }
    }
    bool full_page = tool_arguments::get_flag(call.arguments, "fullPage", false);

    return tool_arguments::action_result_to_json(
        action_executor::screenshot(*call.page, call.context.artifacts, name, selector, full_page));
}

namespace tool_browser_screenshot {

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["name"] = {
        {"type", "string"},
        {"description", "Name to store the screenshot under. An existing screenshot with this name is replaced."}
    };
    input_schema["properties"]["selector"] = {
        {"type", "string"},
        {"description", "CSS selector of an element to capture. When several elements match, the first is used."}
    };
    input_schema["properties"]["fullPage"] = {
        {"type", "boolean"},
        {"description", "Capture the whole scrollable page instead of the viewport. Default false."}
    };
    input_schema["required"] = json::array({"name"});

    mcp_tools::register_tool({
        "browser_screenshot",
        "Take a PNG screenshot of the page or of one element. "
        "The image is returned inline and kept as the resource screenshot://<name>.",
        input_schema,
        handle_browser_screenshot
    });
}

} // namespace tool_browser_screenshot
