#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_tools.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

#include <string>

// Routes incoming MCP messages to the appropriate handler.

namespace mcp_dispatch {

const char CONSOLE_LOGS_URI[15] = "console://logs";

// Protocol version we support.
static const std::string PROTOCOL_VERSION = "2024-11-05";

// Server info.
static const std::string SERVER_NAME = "webmcps";
static const std::string SERVER_VERSION = "0.1.0";
static const std::string SERVER_DESCRIPTION =
    "Browser automation MCP server: launches or attaches to a Chromium browser over CDP. "
    "Use it to navigate, click, fill and select form fields, hover, take screenshots, "
    "evaluate JavaScript, and read captured console and network logs.";

static const std::string SCREENSHOT_URI_PREFIX = "screenshot://";

static json handle_initialize(const json &request_id, const json &params) {
    (void)params; // Any client capabilities are accepted.

    json capabilities;
    capabilities["tools"] = json::object();
    capabilities["resources"] = json::object();

    json server_info;
    server_info["name"] = SERVER_NAME;
    server_info["version"] = SERVER_VERSION;
    server_info["description"] = SERVER_DESCRIPTION;

    json result;
    result["protocolVersion"] = PROTOCOL_VERSION;
    result["capabilities"] = capabilities;
    result["serverInfo"] = server_info;

    return json_rpc::build_response(request_id, result);
}

static json handle_tools_list(const json &request_id) {
    return json_rpc::build_response(request_id, mcp_tools::build_tools_list_response());
}

static json handle_tools_call(mcp_server::ServerContext &context, const json &request_id, const json &params) {
    if (!params.contains("name") || !params["name"].is_string()) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                              "Missing or invalid 'name' in tools/call");
    }
    std::string tool_name = params["name"].get<std::string>();

    json arguments = json::object();
    if (params.contains("arguments") && params["arguments"].is_object()) {
        arguments = params["arguments"];
    }

    json tool_result = mcp_tools::dispatch_tool_call(context, tool_name, arguments);
    return json_rpc::build_response(request_id, tool_result);
}

static json handle_resources_list(mcp_server::ServerContext &context, const json &request_id) {
    json resources = json::array();

    json console_resource;
    console_resource["uri"] = CONSOLE_LOGS_URI;
    console_resource["mimeType"] = "text/plain";
    console_resource["name"] = "Browser console logs";
    resources.push_back(console_resource);

    for (const auto &name : context.artifacts.names()) {
        json screenshot_resource;
        screenshot_resource["uri"] = SCREENSHOT_URI_PREFIX + name;
        screenshot_resource["mimeType"] = "image/png";
        screenshot_resource["name"] = "Screenshot: " + name;
        resources.push_back(screenshot_resource);
    }

    json result;
    result["resources"] = resources;
    return json_rpc::build_response(request_id, result);
}

static json handle_resources_read(mcp_server::ServerContext &context, const json &request_id, const json &params) {
    if (!params.contains("uri") || !params["uri"].is_string()) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                              "Missing or invalid 'uri' in resources/read");
    }
    std::string uri = params["uri"].get<std::string>();

    json content;
    content["uri"] = uri;

    if (uri == CONSOLE_LOGS_URI) {
        std::string text;
        for (const auto &entry : context.event_capture.console_snapshot()) {
            if (!text.empty()) {
                text += "\n";
            }
            text += "[" + entry.type + "] " + entry.text;
        }
        content["mimeType"] = "text/plain";
        content["text"] = text;
    } else if (uri.rfind(SCREENSHOT_URI_PREFIX, 0) == 0) {
        std::string name = uri.substr(SCREENSHOT_URI_PREFIX.size());
        std::optional<capture::ScreenshotArtifact> artifact = context.artifacts.get(name);
        if (!artifact.has_value()) {
            return json_rpc::build_error_response(request_id, json_rpc::RESOURCE_NOT_FOUND,
                                                  "Resource not found: " + uri, json{{"uri", uri}});
        }
        content["mimeType"] = artifact->mime_type;
        content["blob"] = artifact->image_base64;
    } else {
        return json_rpc::build_error_response(request_id, json_rpc::RESOURCE_NOT_FOUND,
                                              "Resource not found: " + uri, json{{"uri", uri}});
    }

    json result;
    result["contents"] = json::array({content});
    return json_rpc::build_response(request_id, result);
}

json dispatch_message(mcp_server::ServerContext &context, const json &message) {
    std::string envelope_error;
    if (!json_rpc::is_valid_request(message, envelope_error)) {
        json request_id = message.is_object() ? json_rpc::get_id(message) : json(nullptr);
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_REQUEST, envelope_error);
    }

    std::string method = json_rpc::get_method(message);
    json request_id = json_rpc::get_id(message);
    json params = json_rpc::get_params(message);

    // Notifications ("notifications/initialized", "notifications/cancelled") need no response.
    if (json_rpc::is_notification(message)) {
        debug_log::log("notification: " + method);
        return nullptr;
    }

    if (method == "initialize") {
        return handle_initialize(request_id, params);
    }
    if (method == "ping") {
        return json_rpc::build_response(request_id, json::object());
    }
    if (method == "tools/list") {
        return handle_tools_list(request_id);
    }
    if (method == "tools/call") {
        return handle_tools_call(context, request_id, params);
    }
    if (method == "resources/list") {
        return handle_resources_list(context, request_id);
    }
    if (method == "resources/read") {
        return handle_resources_read(context, request_id, params);
    }

    return json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND,
                                          "Unknown method: " + method);
}

} // namespace mcp_dispatch
