#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "capture/log_query.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "browser_get_logs".
// Returns captured console messages and network events, newest first,
// filtered and limited. Optionally clears the returned kinds afterwards.

static json handle_browser_get_logs(const mcp_tools::ToolCall &call) {
    capture::LogQuery query;
    std::string error_detail;
    if (!capture::parse_log_query(call.arguments, query, error_detail)) {
        return mcp_tools::build_text_result("browser_get_logs: " + error_detail, true);
    }

    // Let events already queued on the connection reach the buffers.
    call.page->pump_events(call.context.config.event_drain_milliseconds);

    capture::LogQueryResult query_result = call.context.event_capture.query(query);
    if (!query_result.success) {
        return mcp_tools::build_text_result("browser_get_logs: " + query_result.error_detail, true);
    }
    if (query_result.cleared) {
        debug_log::log("browser_get_logs: buffers cleared");
    }

    json document = capture::log_query_result_to_json(query_result);
    return mcp_tools::build_text_result(document.dump(2, ' ', false, json::error_handler_t::replace), false);
}

namespace tool_browser_get_logs {

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["logTypes"] = {
        {"type", "array"},
        {"items", {{"type", "string"}, {"enum", json::array({"console", "network"})}}},
        {"description", "Which logs to return. Default both."}
    };
    input_schema["properties"]["clear"] = {
        {"type", "boolean"},
        {"description", "Clear the returned log kinds after reading. Default false."}
    };
    input_schema["properties"]["limit"] = {
        {"type", "integer"},
        {"description", "Maximum entries per kind, newest first. Default 100."}
    };
    input_schema["properties"]["filter"] = {
        {"type", "object"},
        {"properties", {
            {"types", {{"type", "array"}, {"items", {{"type", "string"}}},
                       {"description", "Console message types (log, info, warning, error, ...)"}}},
            {"search", {{"type", "string"},
                        {"description", "Case-insensitive substring of the console text"}}},
            {"methods", {{"type", "array"}, {"items", {{"type", "string"}}},
                         {"description", "HTTP methods"}}},
            {"statusCodes", {{"type", "array"}, {"items", {{"type", "integer"}}},
                             {"description", "Exact HTTP status codes"}}},
            {"statusRange", {{"type", "object"},
                             {"properties", {{"min", {{"type", "integer"}}}, {"max", {{"type", "integer"}}}}},
                             {"description", "Inclusive HTTP status range"}}},
            {"urlPattern", {{"type", "string"},
                            {"description", "Regular expression searched in the request URL"}}},
            {"resourceTypes", {{"type", "array"}, {"items", {{"type", "string"}}},
                               {"description", "Resource types (document, script, xhr, fetch, image, ...)"}}},
            {"failedOnly", {{"type", "boolean"},
                            {"description", "Only failed requests"}}}
        }},
        {"description", "All given criteria must match."}
    };
    input_schema["required"] = json::array();

    mcp_tools::register_tool({
        "browser_get_logs",
        "Get captured browser console messages and network events, newest first. "
        "Supports filtering, a per-kind limit, and clearing.",
        input_schema,
        handle_browser_get_logs
    });
}

} // namespace tool_browser_get_logs
