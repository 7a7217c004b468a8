// webmcps – Browser automation Model Context Protocol server
// Entry point: stdio MCP server loop.
//
// Reads JSON-RPC 2.0 messages from stdin, dispatches them, writes responses to stdout.
// Logs go to stderr; stdout carries only protocol traffic.

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <csignal>

#include "browser/cdp/cdp_driver.hpp"
#include "capture/artifact_store.hpp"
#include "capture/event_capture.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_stdio.hpp"
#include "mcp/server_context.hpp"
#include "protocol/json_rpc.hpp"
#include "session/session_manager.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"
#include "utils/server_config.hpp"

using json = nlohmann::json;

// Global flag for graceful shutdown.
static volatile std::sig_atomic_t shutdown_requested = 0;

static void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested = 1;
}

int main() {
    debug_log::warn("webmcps - browser automation MCP server, build " + std::string(__DATE__) + " " + __TIME__);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    server_config::ServerConfig config = server_config::load_from_environment();

    capture::EventCapture event_capture(config.console_capacity, config.network_capacity);
    capture::ArtifactStore artifacts;
    cdp_driver::CdpLauncher launcher(config);
    session::SessionManager session_manager(launcher, event_capture);
    mcp_server::ServerContext context{session_manager, event_capture, artifacts, config};

    event_capture.set_console_updated_callback([]() {
        json params;
        params["uri"] = mcp_dispatch::CONSOLE_LOGS_URI;
        mcp_stdio::write_notification("notifications/resources/updated", params);
    });
    artifacts.set_list_changed_callback([]() {
        mcp_stdio::write_notification("notifications/resources/list_changed", json::object());
    });

    tool_handlers::register_all_tools();

    debug_log::warn("Server started. Waiting for MCP messages on stdin.");

    while (!shutdown_requested) {
        std::string raw_message = mcp_stdio::read_message(std::cin);

        if (raw_message.empty()) {
            // EOF on stdin means the client disconnected.
            debug_log::log("EOF on stdin. Shutting down.");
            break;
        }

        json parsed_message;
        try {
            parsed_message = json::parse(raw_message);
        } catch (const json::parse_error &error) {
            debug_log::warn("Failed to parse incoming JSON: " + std::string(error.what()));
            mcp_stdio::write_message(json_rpc::build_error_response(nullptr, json_rpc::PARSE_ERROR, "Parse error"));
            continue;
        }

        json response = mcp_dispatch::dispatch_message(context, parsed_message);

        // Notifications return null (no response needed).
        if (response.is_null()) {
            continue;
        }
        mcp_stdio::write_message(response);
    }

    session::CloseResult close_result = session_manager.close();
    if (close_result.was_active) {
        debug_log::log("Session closed on shutdown (" + std::to_string(close_result.failed_steps) +
                       " step(s) failed).");
    }
    debug_log::warn("Server shut down.");

    return 0;
}
