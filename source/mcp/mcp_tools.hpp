#ifndef WEBMCPS_MCP_TOOLS_HPP
#define WEBMCPS_MCP_TOOLS_HPP

// MCP tool registry: registration, listing, and dispatch of tool calls.

#include <nlohmann/json.hpp>
#include <string>
#include <functional>
#include <vector>

#include "browser/browser_driver_abi.hpp"
#include "mcp/server_context.hpp"

namespace mcp_tools {

using json = nlohmann::json;

// What a handler receives. page is the active page for non-lifecycle tools
// and nullptr for lifecycle tools.
struct ToolCall {
    mcp_server::ServerContext &context;
    browser_driver::Page *page;
    const json &arguments;
};

// A tool handler function: returns the result JSON (content array + isError
// flag, the MCP tool result shape).
using ToolHandler = std::function<json(const ToolCall &call)>;

// Description of a registered tool, matching the MCP tool schema.
struct ToolDefinition {
    std::string name;
    std::string description;
    json input_schema; // JSON Schema object
    ToolHandler handler;
    // Lifecycle tools (launch, close) run without an active session.
    bool lifecycle = false;
};

// Register a tool. A definition with the same name replaces the earlier one.
void register_tool(const ToolDefinition &definition);

// Build the response payload for tools/list.
json build_tools_list_response();

// Dispatch a tools/call request. Non-lifecycle tools get an active page
// first (starting a default session if needed). Returns the result payload
// (content + isError); never throws.
json dispatch_tool_call(mcp_server::ServerContext &context, const std::string &tool_name, const json &arguments);

// Get all registered tool definitions (for testing or introspection).
const std::vector<ToolDefinition> &get_registered_tools();

// {content: [{type: "text", text}], isError}
json build_text_result(const std::string &text, bool is_error);

// {content: [{type: "text", text}, {type: "image", data, mimeType}], isError: false}
json build_image_result(const std::string &text, const std::string &image_base64, const std::string &mime_type);

} // namespace mcp_tools

#endif // WEBMCPS_MCP_TOOLS_HPP
