#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_arguments.hpp"
#include "mcp/mcp_tools.hpp"
#include "actions/action_executor.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "browser_select".

static json handle_browser_select(const mcp_tools::ToolCall &call) {
    std::string selector;
    std::string value;
    json error_result;
    if (!tool_arguments::get_required_string(call.arguments, "selector", "browser_select", selector, error_result)) {
        return error_result;
    }
    if (!tool_arguments::get_required_string(call.arguments, "value", "browser_select", value, error_result)) {
        return error_result;
    }

    return tool_arguments::action_result_to_json(
        action_executor::select_option(*call.page, browser_driver::selector_locator(selector), value));
}

namespace tool_browser_select {

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["selector"] = {
        {"type", "string"},
        {"description", "CSS selector of the <select> element"}
    };
    input_schema["properties"]["value"] = {
        {"type", "string"},
        {"description", "Option value, or option label when no value matches"}
    };
    input_schema["required"] = json::array({"selector", "value"});

    mcp_tools::register_tool({
        "browser_select",
        "Choose an option in a <select> element found by CSS selector.",
        input_schema,
        handle_browser_select
    });
}

} // namespace tool_browser_select
