#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_arguments.hpp"
#include "mcp/mcp_tools.hpp"
#include "actions/action_executor.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "browser_fill".
// Types the value into an input one character at a time, so pages that
// listen for key events see ordinary typing.

static json handle_browser_fill(const mcp_tools::ToolCall &call) {
    std::string selector;
    std::string value;
    json error_result;
    if (!tool_arguments::get_required_string(call.arguments, "selector", "browser_fill", selector, error_result)) {
        return error_result;
    }
    if (!tool_arguments::get_required_string(call.arguments, "value", "browser_fill", value, error_result)) {
        return error_result;
    }

    debug_log::log("browser_fill selector=" + selector);
    action_executor::ActionResult fill_result =
        action_executor::fill(*call.page, browser_driver::selector_locator(selector), value,
                              call.context.config.fill_delay_milliseconds);
    return tool_arguments::action_result_to_json(fill_result);
}

namespace tool_browser_fill {

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["selector"] = {
        {"type", "string"},
        {"description", "CSS selector of the input or textarea"}
    };
    input_schema["properties"]["value"] = {
        {"type", "string"},
        {"description", "Text to type"}
    };
    input_schema["required"] = json::array({"selector", "value"});

    mcp_tools::register_tool({
        "browser_fill",
        "Type text into an input field, one character at a time. "
        "If several elements match the selector, the first one is used.",
        input_schema,
        handle_browser_fill
    });
}

} // namespace tool_browser_fill
