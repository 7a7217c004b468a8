#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_arguments.hpp"
#include "mcp/mcp_tools.hpp"
#include "actions/action_executor.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "browser_click".
// Clicks the element matched by a CSS selector (first match when ambiguous).

static json handle_browser_click(const mcp_tools::ToolCall &call) {
    std::string selector;
    json error_result;
    if (!tool_arguments::get_required_string(call.arguments, "selector", "browser_click", selector, error_result)) {
        return error_result;
    }

    action_executor::ActionResult click_result =
        action_executor::click(*call.page, browser_driver::selector_locator(selector));
    return tool_arguments::action_result_to_json(click_result);
}

namespace tool_browser_click {

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["selector"] = {
        {"type", "string"},
        {"description", "CSS selector of the element to click"}
    };
    input_schema["required"] = json::array({"selector"});

    mcp_tools::register_tool({
        "browser_click",
        "Click an element by CSS selector. If several elements match, the first one is clicked.",
        input_schema,
        handle_browser_click
    });
}

} // namespace tool_browser_click
