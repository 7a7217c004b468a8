#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_arguments.hpp"
#include "mcp/mcp_tools.hpp"
#include "actions/action_executor.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "browser_select_text".
// Same as browser_select, but the <select> is located by its visible text.

static json handle_browser_select_text(const mcp_tools::ToolCall &call) {
    std::string text;
    std::string value;
    json error_result;
    if (!tool_arguments::get_required_string(call.arguments, "text", "browser_select_text", text, error_result)) {
        return error_result;
    }
    if (!tool_arguments::get_required_string(call.arguments, "value", "browser_select_text", value, error_result)) {
        return error_result;
    }

    return tool_arguments::action_result_to_json(
        action_executor::select_option(*call.page, browser_driver::text_locator(text), value));
}

namespace tool_browser_select_text {

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["text"] = {
        {"type", "string"},
        {"description", "Visible text of the <select> element"}
    };
    input_schema["properties"]["value"] = {
        {"type", "string"},
        {"description", "Option value, or option label when no value matches"}
    };
    input_schema["required"] = json::array({"text", "value"});

    mcp_tools::register_tool({
        "browser_select_text",
        "Choose an option in a <select> element found by its visible text.",
        input_schema,
        handle_browser_select_text
    });
}

} // namespace tool_browser_select_text
