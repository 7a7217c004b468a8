#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"

#include <exception>

namespace mcp_tools {

// Global tool registry (module-level, not class-based). Holds definitions
// only; session state lives in the ServerContext.
static std::vector<ToolDefinition> registered_tools;

void register_tool(const ToolDefinition &definition) {
    for (auto &existing : registered_tools) {
        if (existing.name == definition.name) {
            existing = definition;
            return;
        }
    }
    registered_tools.push_back(definition);
}

json build_tools_list_response() {
    json tools_array = json::array();
    for (const auto &tool : registered_tools) {
        json tool_entry;
        tool_entry["name"] = tool.name;
        tool_entry["description"] = tool.description;
        tool_entry["inputSchema"] = tool.input_schema;
        tools_array.push_back(tool_entry);
    }

    json result;
    result["tools"] = tools_array;
    return result;
}

json build_text_result(const std::string &text, bool is_error) {
    json text_content;
    text_content["type"] = "text";
    text_content["text"] = text;

    json result;
    result["content"] = json::array({text_content});
    result["isError"] = is_error;
    return result;
}

json build_image_result(const std::string &text, const std::string &image_base64, const std::string &mime_type) {
    json text_content;
    text_content["type"] = "text";
    text_content["text"] = text;

    json image_content;
    image_content["type"] = "image";
    image_content["data"] = image_base64;
    image_content["mimeType"] = mime_type;

    json result;
    result["content"] = json::array({text_content, image_content});
    result["isError"] = false;
    return result;
}

json dispatch_tool_call(mcp_server::ServerContext &context, const std::string &tool_name, const json &arguments) {
    const ToolDefinition *tool = nullptr;
    for (const auto &candidate : registered_tools) {
        if (candidate.name == tool_name) {
            tool = &candidate;
            break;
        }
    }
    if (tool == nullptr) {
        return build_text_result("Unknown tool: " + tool_name, true);
    }

    browser_driver::Page *page = nullptr;
    if (!tool->lifecycle) {
        session::PageAccess access = context.session_manager.ensure_active();
        if (!access.success) {
            return build_text_result("Failed to start browser session: " + access.error_detail, true);
        }
        if (access.page_recreated) {
            debug_log::log(tool_name + ": page was replaced before the call.");
        }
        page = access.page;
    }

    debug_log::log(tool_name + " invoked");
    try {
        return tool->handler(ToolCall{context, page, arguments});
    } catch (const json::exception &error) {
        return build_text_result("Invalid arguments for " + tool_name + ": " + std::string(error.what()), true);
    } catch (const std::exception &error) {
        return build_text_result(tool_name + " failed: " + std::string(error.what()), true);
    }
}

const std::vector<ToolDefinition> &get_registered_tools() {
    return registered_tools;
}

} // namespace mcp_tools
