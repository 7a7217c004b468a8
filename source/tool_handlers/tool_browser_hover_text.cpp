#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_arguments.hpp"
#include "mcp/mcp_tools.hpp"
#include "actions/action_executor.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static json handle_browser_hover_text(const mcp_tools::ToolCall &call) {
    std::string text;
    json error_result;
    if (!tool_arguments::get_required_string(call.arguments, "text", "browser_hover_text", text, error_result)) {
        return error_result;
    }

    return tool_arguments::action_result_to_json(
        action_executor::hover(*call.page, browser_driver::text_locator(text)));
}

namespace tool_browser_hover_text {

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["text"] = {
        {"type", "string"},
        {"description", "Visible text of the element to hover"}
    };
    input_schema["required"] = json::array({"text"});

    mcp_tools::register_tool({
        "browser_hover_text",
        "Hover the mouse over the innermost element whose visible text contains the given text.",
        input_schema,
        handle_browser_hover_text
    });
}

} // namespace tool_browser_hover_text
