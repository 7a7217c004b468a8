#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "session/session_manager.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

// Tool handler for "browser_close". Safe to call with no session open.

static json handle_browser_close(const mcp_tools::ToolCall &call) {
    session::CloseResult close_result = call.context.session_manager.close();
    if (!close_result.was_active) {
        return mcp_tools::build_text_result("No browser is currently open", false);
    }
    if (close_result.failed_steps > 0) {
        debug_log::warn("browser_close: " + std::to_string(close_result.failed_steps) +
                        " teardown step(s) failed; session released anyway.");
    }
    return mcp_tools::build_text_result("Browser closed", false);
}

namespace tool_browser_close {

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["required"] = json::array();

    mcp_tools::ToolDefinition definition{
        "browser_close",
        "Close the browser session (page, context and browser). "
        "An attached browser is disconnected, not terminated. Stored screenshots are kept.",
        input_schema,
        handle_browser_close
    };
    definition.lifecycle = true;
    mcp_tools::register_tool(definition);
}

} // namespace tool_browser_close
