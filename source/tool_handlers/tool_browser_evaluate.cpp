#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_arguments.hpp"
#include "mcp/mcp_tools.hpp"
#include "actions/action_executor.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

// Tool handler for "browser_evaluate".
// Runs a script in the page; console output produced while it runs is
// returned together with the result.

static json handle_browser_evaluate(const mcp_tools::ToolCall &call) {
    std::string script;
    json error_result;
    if (!tool_arguments::get_required_string(call.arguments, "script", "browser_evaluate", script, error_result)) {
        return error_result;
    }

    debug_log::log("browser_evaluate script length=" + std::to_string(script.size()));
    return tool_arguments::action_result_to_json(action_executor::evaluate(*call.page, script));
}

namespace tool_browser_evaluate {

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["script"] = {
        {"type", "string"},
        {"description", "JavaScript to execute in the page. The value of the last expression is returned."}
    };
    input_schema["required"] = json::array({"script"});

    mcp_tools::register_tool({
        "browser_evaluate",
        "Execute JavaScript in the browser page and return its result as JSON "
        "plus any console.log/info/warn/error output it produced.",
        input_schema,
        handle_browser_evaluate
    });
}

} // namespace tool_browser_evaluate
