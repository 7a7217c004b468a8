#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_arguments.hpp"
#include "mcp/mcp_tools.hpp"
#include "actions/action_executor.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "browser_hover".
// Moves the mouse over the element center without pressing a button.

static json handle_browser_hover(const mcp_tools::ToolCall &call) {
    std::string selector;
    json error_result;
    if (!tool_arguments::get_required_string(call.arguments, "selector", "browser_hover", selector, error_result)) {
        return error_result;
    }

    return tool_arguments::action_result_to_json(
        action_executor::hover(*call.page, browser_driver::selector_locator(selector)));
}

namespace tool_browser_hover {

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["selector"] = {
        {"type", "string"},
        {"description", "CSS selector of the element to hover"}
    };
    input_schema["required"] = json::array({"selector"});

    mcp_tools::register_tool({
        "browser_hover",
        "Hover the mouse over an element by CSS selector. If several elements match, the first one is used.",
        input_schema,
        handle_browser_hover
    });
}

} // namespace tool_browser_hover
