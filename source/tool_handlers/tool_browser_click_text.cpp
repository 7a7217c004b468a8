#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_arguments.hpp"
#include "mcp/mcp_tools.hpp"
#include "actions/action_executor.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "browser_click_text".

static json handle_browser_click_text(const mcp_tools::ToolCall &call) {
    std::string text;
    json error_result;
    if (!tool_arguments::get_required_string(call.arguments, "text", "browser_click_text", text, error_result)) {
        return error_result;
    }

    return tool_arguments::action_result_to_json(
        action_executor::click(*call.page, browser_driver::text_locator(text)));
}

namespace tool_browser_click_text {

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["text"] = {
        {"type", "string"},
        {"description", "Visible text of the element to click"}
    };
    input_schema["required"] = json::array({"text"});

    mcp_tools::register_tool({
        "browser_click_text",
        "Click the innermost element whose visible text contains the given text. "
        "If several elements match, the first one is clicked.",
        input_schema,
        handle_browser_click_text
    });
}

} // namespace tool_browser_click_text
